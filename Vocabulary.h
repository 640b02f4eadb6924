// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace typofix {

///@brief Known correct words, kept in order of first appearance.
class Vocabulary final {
public:
    Vocabulary() = default;

    explicit Vocabulary(const std::vector<std::string>& words);

    ///@brief Add a word to the vocabulary. Duplicates are ignored.
    void AddWord(const std::string& word);

    bool Contains(const std::string& word) const;

    const std::vector<std::string>& GetWords() const noexcept { return words; }

    std::size_t GetSize() const noexcept { return words.size(); }

    bool Empty() const noexcept { return words.empty(); }

private:
    std::vector<std::string> words;
    std::unordered_set<std::string> index;
};

///@brief Length difference plus mismatches at the same index.
///
/// This is not an edit distance: "abc" and "bc" are 3 apart, not 1.
std::size_t ComputeSnapDistance(const std::string& a, const std::string& b);

///@brief Returns the vocabulary word closest to `candidate`.
///
/// An exact hit is returned as is. Otherwise the first word with the smallest
/// ComputeSnapDistance() wins. With an empty vocabulary, `candidate` itself is
/// returned.
std::string SnapToVocabulary(const std::string& candidate, const Vocabulary& vocabulary);

} // namespace typofix
