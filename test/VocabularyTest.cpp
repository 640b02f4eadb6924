// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "Vocabulary.h"
#include <catch2/catch.hpp>

using typofix::Vocabulary;

TEST_CASE("Vocabulary keeps the first appearance of each word", "[Vocabulary]")
{
    Vocabulary vocabulary;
    REQUIRE(vocabulary.Empty());

    vocabulary.AddWord("b");
    vocabulary.AddWord("a");
    vocabulary.AddWord("b");
    vocabulary.AddWord("c");

    REQUIRE(vocabulary.GetSize() == 3);
    const std::vector<std::string> expected = {"b", "a", "c"};
    REQUIRE(vocabulary.GetWords() == expected);
    REQUIRE(vocabulary.Contains("a"));
    REQUIRE_FALSE(vocabulary.Contains("d"));
}

TEST_CASE("Snap distance is length gap plus positional mismatches", "[Vocabulary]")
{
    REQUIRE(typofix::ComputeSnapDistance("cat", "cat") == 0);
    REQUIRE(typofix::ComputeSnapDistance("cat", "cot") == 1);
    REQUIRE(typofix::ComputeSnapDistance("abc", "abcd") == 1);
    REQUIRE(typofix::ComputeSnapDistance("", "abc") == 3);
    REQUIRE(typofix::ComputeSnapDistance("abc", "bc") == 3);
    REQUIRE(typofix::ComputeSnapDistance("bc", "abc") == 3);
}

TEST_CASE("Exact hits are returned unchanged", "[Vocabulary]")
{
    Vocabulary vocabulary({"cat", "car", "bat"});
    REQUIRE(typofix::SnapToVocabulary("cat", vocabulary) == "cat");
}

TEST_CASE("Ties go to the earliest vocabulary word", "[Vocabulary]")
{
    Vocabulary vocabulary({"cat", "cot", "cap"});
    REQUIRE(typofix::SnapToVocabulary("cet", vocabulary) == "cat");

    Vocabulary reordered({"cot", "cat", "cot"});
    REQUIRE(typofix::SnapToVocabulary("cet", reordered) == "cot");
}

TEST_CASE("Snapping is not an edit distance search", "[Vocabulary]")
{
    // NOTE: "abc" is one deletion away from "bc", but every position differs.
    Vocabulary vocabulary({"abc", "xy"});
    REQUIRE(typofix::SnapToVocabulary("bc", vocabulary) == "xy");
}

TEST_CASE("Snapping prefers words of similar length", "[Vocabulary]")
{
    Vocabulary vocabulary({"separate", "sepia", "sep"});
    REQUIRE(typofix::SnapToVocabulary("seperate", vocabulary) == "separate");
    REQUIRE(typofix::SnapToVocabulary("sepa", vocabulary) == "sep");
}

TEST_CASE("An empty vocabulary returns the candidate", "[Vocabulary]")
{
    Vocabulary vocabulary;
    REQUIRE(typofix::SnapToVocabulary("xyz", vocabulary) == "xyz");
    REQUIRE(typofix::SnapToVocabulary("", vocabulary) == "");
}
