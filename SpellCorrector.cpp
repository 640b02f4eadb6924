// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "SpellCorrector.h"
#include <cassert>
#include <cstddef>
#include <utility>

namespace typofix {
namespace {

bool IsSpaceAscii(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

Vocabulary BuildVocabulary(const std::vector<TrainingPair>& pairs)
{
    Vocabulary vocabulary;
    for (auto & pair : pairs) {
        vocabulary.AddWord(pair.correct);
    }
    return vocabulary;
}

} // end anonymous namespace

SpellCorrector::SpellCorrector(const std::vector<TrainingPair>& pairs)
    : model(TrainChannelModel(pairs))
    , decoder(model)
    , vocabulary(BuildVocabulary(pairs))
{
}

CorrectionResult SpellCorrector::CorrectWord(const std::string& word) const
{
    CorrectionResult result;
    result.observed = ToLowerAscii(word);
    result.decoded = decoder.Decode(result.observed);
    assert(result.decoded.size() == result.observed.size());
    result.corrected = SnapToVocabulary(result.decoded, vocabulary);
    result.changed = (result.corrected != result.observed);
    return result;
}

std::vector<CorrectionResult> SpellCorrector::CorrectText(const std::string& text) const
{
    std::vector<CorrectionResult> results;
    for (auto & word : SplitWords(text)) {
        results.push_back(CorrectWord(word));
    }
    return results;
}

std::vector<std::string> SplitWords(const std::string& text)
{
    std::vector<std::string> words;
    std::string word;
    for (auto c : text) {
        if (IsSpaceAscii(c)) {
            if (!word.empty()) {
                words.push_back(std::move(word));
                word.clear();
            }
            continue;
        }
        word += c;
    }
    if (!word.empty()) {
        words.push_back(std::move(word));
    }
    return words;
}

std::string ToLowerAscii(const std::string& text)
{
    std::string result = text;
    for (auto & c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

std::string JoinCorrections(const std::vector<CorrectionResult>& results)
{
    std::string text;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += results[i].corrected;
    }
    return text;
}

} // namespace typofix
