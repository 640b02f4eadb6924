// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#pragma once

#include "ChannelModel.h"
#include "Viterbi.h"
#include "Vocabulary.h"
#include <string>
#include <vector>

namespace typofix {

struct CorrectionResult {
    ///@brief The word as it was typed, lowercased.
    std::string observed;

    ///@brief The raw Viterbi candidate, same length as `observed`.
    std::string decoded;

    ///@brief The vocabulary word closest to `decoded`.
    std::string corrected;

    ///@brief `true` if `corrected` differs from `observed`; `false` otherwise.
    bool changed;
};

class SpellCorrector final {
public:
    ///@brief Train the channel model and build the vocabulary.
    ///@param pairs (correct, typed) pairs in corpus order
    explicit SpellCorrector(const std::vector<TrainingPair>& pairs);

    ///@brief Correct a single word.
    CorrectionResult CorrectWord(const std::string& word) const;

    ///@brief Correct every whitespace-separated word of `text` independently.
    std::vector<CorrectionResult> CorrectText(const std::string& text) const;

    const ChannelModel& GetModel() const noexcept { return model; }

    const Vocabulary& GetVocabulary() const noexcept { return vocabulary; }

private:
    ChannelModel model;
    ViterbiDecoder decoder;
    Vocabulary vocabulary;
};

///@brief Split `text` on ASCII whitespace.
std::vector<std::string> SplitWords(const std::string& text);

///@brief tolower() for ASCII letters only. Other bytes are left as they are.
std::string ToLowerAscii(const std::string& text);

///@brief Join corrected words with single spaces.
std::string JoinCorrections(const std::vector<CorrectionResult>& results);

} // namespace typofix
