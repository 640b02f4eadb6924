// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "ChannelModel.h"
#include <algorithm>
#include <cassert>
#include <utility>

namespace typofix {

const ProbabilityTable::Row* ProbabilityTable::FindRow(char from) const noexcept
{
    auto iter = rows.find(from);
    if (iter == std::end(rows)) {
        return nullptr;
    }
    return &iter->second;
}

double ProbabilityTable::GetProbability(char from, char to, double fallback) const noexcept
{
    auto row = FindRow(from);
    if (row == nullptr) {
        return fallback;
    }
    auto iter = row->find(to);
    if (iter == std::end(*row)) {
        return fallback;
    }
    return iter->second;
}

void FrequencyTable::Increment(char from, char to)
{
    auto rowIter = counts.find(from);
    if (rowIter == std::end(counts)) {
        rowIter = counts.emplace(from, std::map<char, int>{}).first;
    }
    assert(rowIter != std::end(counts));

    auto & row = rowIter->second;
    auto iter = row.find(to);
    if (iter == std::end(row)) {
        iter = row.emplace(to, 0).first;
    }
    ++iter->second;
}

ProbabilityTable FrequencyTable::Normalize() const
{
    ProbabilityTable table;
    for (auto & rowPair : counts) {
        auto & row = rowPair.second;

        int total = 0;
        for (auto & countPair : row) {
            total += countPair.second;
        }
        assert(total > 0);

        ProbabilityTable::Row probabilities;
        for (auto & countPair : row) {
            probabilities.emplace(
                countPair.first,
                static_cast<double>(countPair.second) / static_cast<double>(total));
        }
        table.rows.emplace(rowPair.first, std::move(probabilities));
    }
    return table;
}

ProbabilityTable ComputeEmissions(const std::vector<TrainingPair>& pairs)
{
    FrequencyTable frequencies;
    for (auto & pair : pairs) {
        // NOTE: No alignment search. Insertions and deletions at the tail
        // are simply dropped.
        const auto length = std::min(pair.correct.size(), pair.typed.size());
        for (std::size_t i = 0; i < length; ++i) {
            frequencies.Increment(pair.correct[i], pair.typed[i]);
        }
    }
    return frequencies.Normalize();
}

ProbabilityTable ComputeTransitions(const std::vector<TrainingPair>& pairs)
{
    FrequencyTable frequencies;
    std::string word;
    for (auto & pair : pairs) {
        word.clear();
        word += StartSentinel;
        word += pair.correct;
        word += EndSentinel;

        assert(word.size() >= 2);
        for (std::size_t i = 0; i + 1 < word.size(); ++i) {
            frequencies.Increment(word[i], word[i + 1]);
        }
    }
    return frequencies.Normalize();
}

ChannelModel TrainChannelModel(const std::vector<TrainingPair>& pairs)
{
    ChannelModel model;
    model.emissions = ComputeEmissions(pairs);
    model.transitions = ComputeTransitions(pairs);
    return model;
}

} // namespace typofix
