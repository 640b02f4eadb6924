// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace typofix {

///@brief A correctly spelled word and one way it was actually typed.
struct TrainingPair {
    std::string correct;
    std::string typed;
};

///@brief Boundary marker placed before a correct word when counting transitions.
constexpr char StartSentinel = '^';

///@brief Boundary marker placed after a correct word when counting transitions.
constexpr char EndSentinel = '$';

///@brief Conditional probabilities P(to | from), stored row by row.
///
/// A missing row or a missing entry means "no data" and is never
/// a zero probability.
class ProbabilityTable final {
public:
    using Row = std::map<char, double>;

    ///@brief Returns P(to | from), or `fallback` if the pair was never observed.
    double GetProbability(char from, char to, double fallback) const noexcept;

    ///@brief Returns the row for `from`, or `nullptr` if it has no observations.
    const Row* FindRow(char from) const noexcept;

    std::size_t GetRowCount() const noexcept { return rows.size(); }

    bool Empty() const noexcept { return rows.empty(); }

private:
    friend class FrequencyTable;

    std::map<char, Row> rows;
};

///@brief Integer pair counts that are later normalized into a ProbabilityTable.
class FrequencyTable final {
public:
    void Increment(char from, char to);

    ///@brief Divides each row by its total count.
    ProbabilityTable Normalize() const;

private:
    std::map<char, std::map<char, int>> counts;
};

struct ChannelModel {
    ///@brief P(typed character | correct character).
    ProbabilityTable emissions;

    ///@brief P(next correct character | previous correct character), with sentinels.
    ProbabilityTable transitions;
};

///@brief Estimates how correct characters are typed.
///
/// Characters are paired position by position over the shorter of the two
/// strings. Trailing characters of the longer string are not counted.
ProbabilityTable ComputeEmissions(const std::vector<TrainingPair>& pairs);

///@brief Estimates letter-to-letter transitions over `^` + correct + `$`.
ProbabilityTable ComputeTransitions(const std::vector<TrainingPair>& pairs);

ChannelModel TrainChannelModel(const std::vector<TrainingPair>& pairs);

} // namespace typofix
