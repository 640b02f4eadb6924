// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "Vocabulary.h"
#include <algorithm>
#include <cassert>
#include <limits>

namespace typofix {
namespace {

std::size_t ComputeGapSize(std::size_t a, std::size_t b)
{
    if (a > b) {
        assert((a - b) <= a);
        return a - b;
    }
    assert((b - a) <= b);
    return b - a;
}

} // end anonymous namespace

Vocabulary::Vocabulary(const std::vector<std::string>& wordsIn)
{
    for (auto & word : wordsIn) {
        AddWord(word);
    }
}

void Vocabulary::AddWord(const std::string& word)
{
    if (!index.insert(word).second) {
        // NOTE: The word already exists in the vocabulary.
        return;
    }
    words.push_back(word);
    assert(words.size() == index.size());
}

bool Vocabulary::Contains(const std::string& word) const
{
    return index.find(word) != std::end(index);
}

std::size_t ComputeSnapDistance(const std::string& a, const std::string& b)
{
    auto distance = ComputeGapSize(a.size(), b.size());
    const auto minSize = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < minSize; ++i) {
        if (a[i] != b[i]) {
            ++distance;
        }
    }
    return distance;
}

std::string SnapToVocabulary(const std::string& candidate, const Vocabulary& vocabulary)
{
    if (vocabulary.Contains(candidate)) {
        return candidate;
    }

    const std::string* best = &candidate;
    auto bestDistance = std::numeric_limits<std::size_t>::max();

    for (auto & word : vocabulary.GetWords()) {
        const auto distance = ComputeSnapDistance(word, candidate);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = &word;
        }
    }
    return *best;
}

} // namespace typofix
