// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#pragma once

#include "ChannelModel.h"
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace typofix {

constexpr std::size_t AlphabetSize = 26;

///@brief Hidden states of the decoder, in tie-breaking order.
constexpr std::array<char, AlphabetSize> Alphabet = {{
    'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
    'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
}};

///@brief Probability substituted for any transition or emission pair
/// missing from the trained tables.
///
/// Keeps log() finite and charges unseen combinations a fixed, steep penalty.
constexpr double FloorProbability = 1e-6;

///@brief First-order HMM decoder over the 26 lowercase letters.
///
/// The log probabilities are computed once at construction; Decode() does not
/// modify the decoder, so one instance may serve any number of threads.
class ViterbiDecoder final {
public:
    ViterbiDecoder(const ProbabilityTable& transitions, const ProbabilityTable& emissions);

    explicit ViterbiDecoder(const ChannelModel& model);

    ///@brief Returns the most probable correct letters for `observed`.
    ///@param observed a lowercase word
    ///@return a string of the same length as `observed`
    std::string Decode(const std::string& observed) const;

private:
    using StateScores = std::array<double, AlphabetSize>;

    const StateScores& GetEmissionScores(char observed) const;

    StateScores logStart;
    StateScores logEnd;

    ///@brief logTransitions[from][to]
    std::array<StateScores, AlphabetSize> logTransitions;

    ///@brief logEmissions[observed byte][state]
    std::vector<StateScores> logEmissions;
};

///@brief Decodes a single word without keeping a decoder around.
std::string DecodeViterbi(
    const std::string& observed,
    const ProbabilityTable& transitions,
    const ProbabilityTable& emissions);

} // namespace typofix
