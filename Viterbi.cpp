// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "Viterbi.h"
#include <cassert>
#include <cmath>
#include <limits>

namespace typofix {
namespace {

constexpr int NoState = -1;

constexpr std::size_t ByteValueCount = 256;

double LogProbability(const ProbabilityTable& table, char from, char to)
{
    const auto probability = table.GetProbability(from, to, FloorProbability);
    assert(probability > 0.0);
    return std::log(probability);
}

} // end anonymous namespace

ViterbiDecoder::ViterbiDecoder(
    const ProbabilityTable& transitions,
    const ProbabilityTable& emissions)
    : logEmissions(ByteValueCount)
{
    for (std::size_t s = 0; s < AlphabetSize; ++s) {
        logStart[s] = LogProbability(transitions, StartSentinel, Alphabet[s]);
        logEnd[s] = LogProbability(transitions, Alphabet[s], EndSentinel);
    }

    for (std::size_t from = 0; from < AlphabetSize; ++from) {
        for (std::size_t to = 0; to < AlphabetSize; ++to) {
            logTransitions[from][to] = LogProbability(transitions, Alphabet[from], Alphabet[to]);
        }
    }

    // NOTE: Observed words may contain any byte, so the emission scores are
    // tabulated for all of them rather than just the alphabet.
    for (std::size_t c = 0; c < ByteValueCount; ++c) {
        auto & scores = logEmissions[c];
        const auto observed = static_cast<char>(static_cast<unsigned char>(c));
        for (std::size_t s = 0; s < AlphabetSize; ++s) {
            scores[s] = LogProbability(emissions, Alphabet[s], observed);
        }
    }
}

ViterbiDecoder::ViterbiDecoder(const ChannelModel& model)
    : ViterbiDecoder(model.transitions, model.emissions)
{
}

const ViterbiDecoder::StateScores& ViterbiDecoder::GetEmissionScores(char observed) const
{
    const auto index = static_cast<unsigned char>(observed);
    assert(index < logEmissions.size());
    return logEmissions[index];
}

std::string ViterbiDecoder::Decode(const std::string& observed) const
{
    if (observed.empty()) {
        return {};
    }

    constexpr auto negativeInfinity = -std::numeric_limits<double>::infinity();
    const auto length = observed.size();

    // NOTE: backPointers[t][s] is the state at t - 1 on the best path ending
    // in state s at t. Row 0 is unused.
    std::vector<std::array<int, AlphabetSize>> backPointers(length);

    StateScores scores;
    {
        auto & emissionScores = GetEmissionScores(observed[0]);
        for (std::size_t s = 0; s < AlphabetSize; ++s) {
            scores[s] = logStart[s] + emissionScores[s];
        }
    }

    for (std::size_t t = 1; t < length; ++t) {
        auto & emissionScores = GetEmissionScores(observed[t]);
        auto & pointers = backPointers[t];
        StateScores nextScores;

        for (std::size_t s = 0; s < AlphabetSize; ++s) {
            auto bestScore = negativeInfinity;
            int bestPrevious = NoState;
            for (std::size_t s0 = 0; s0 < AlphabetSize; ++s0) {
                const auto score = scores[s0] + logTransitions[s0][s] + emissionScores[s];
                // NOTE: Strict comparison so that the first letter in
                // alphabetic order wins a tie.
                if (score > bestScore) {
                    bestScore = score;
                    bestPrevious = static_cast<int>(s0);
                }
            }
            nextScores[s] = bestScore;
            pointers[s] = bestPrevious;
        }
        scores = nextScores;
    }

    auto bestScore = negativeInfinity;
    int bestState = NoState;
    for (std::size_t s = 0; s < AlphabetSize; ++s) {
        const auto score = scores[s] + logEnd[s];
        if (score > bestScore) {
            bestScore = score;
            bestState = static_cast<int>(s);
        }
    }

    if (bestState == NoState) {
        return observed;
    }

    std::string decoded(length, Alphabet.front());
    int state = bestState;
    for (std::size_t t = length; t-- > 0;) {
        if (state == NoState) {
            return observed;
        }
        decoded[t] = Alphabet[static_cast<std::size_t>(state)];
        if (t > 0) {
            state = backPointers[t][static_cast<std::size_t>(state)];
        }
    }
    return decoded;
}

std::string DecodeViterbi(
    const std::string& observed,
    const ProbabilityTable& transitions,
    const ProbabilityTable& emissions)
{
    if (observed.empty()) {
        return {};
    }
    ViterbiDecoder decoder(transitions, emissions);
    return decoder.Decode(observed);
}

} // namespace typofix
