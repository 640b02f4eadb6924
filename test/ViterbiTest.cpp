// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "Viterbi.h"
#include <catch2/catch.hpp>

using typofix::TrainingPair;
using typofix::ViterbiDecoder;

TEST_CASE("Alphabet lists the 26 lowercase letters in order", "[Viterbi]")
{
    REQUIRE(typofix::Alphabet.size() == 26);
    REQUIRE(typofix::Alphabet.front() == 'a');
    REQUIRE(typofix::Alphabet.back() == 'z');
    for (std::size_t i = 1; i < typofix::Alphabet.size(); ++i) {
        REQUIRE(typofix::Alphabet[i - 1] + 1 == typofix::Alphabet[i]);
    }
}

TEST_CASE("An empty word decodes to an empty word", "[Viterbi]")
{
    auto model = typofix::TrainChannelModel({{"cat", "cat"}});
    ViterbiDecoder decoder(model);
    REQUIRE(decoder.Decode("").empty());
    REQUIRE(typofix::DecodeViterbi("", model.transitions, model.emissions).empty());
}

TEST_CASE("A model trained on one word reproduces it", "[Viterbi]")
{
    SECTION("single pair") {
        auto model = typofix::TrainChannelModel({{"cat", "cat"}});
        REQUIRE(ViterbiDecoder(model).Decode("cat") == "cat");
    }
    SECTION("repeated pairs") {
        std::vector<TrainingPair> pairs(5, TrainingPair{"cat", "cat"});
        auto model = typofix::TrainChannelModel(pairs);
        REQUIRE(ViterbiDecoder(model).Decode("cat") == "cat");
    }
}

TEST_CASE("Decoding undoes a trained substitution", "[Viterbi]")
{
    std::vector<TrainingPair> pairs = {
        {"cat", "cat"},
        {"cat", "cat"},
        {"cat", "cat"},
        {"cat", "cet"},
    };
    auto model = typofix::TrainChannelModel(pairs);
    REQUIRE(ViterbiDecoder(model).Decode("cet") == "cat");
}

TEST_CASE("Unseen observations fall back to the transition model", "[Viterbi]")
{
    auto model = typofix::TrainChannelModel({{"a", "a"}});
    ViterbiDecoder decoder(model);
    REQUIRE(decoder.Decode("a") == "a");
    REQUIRE(decoder.Decode("z") == "a");
}

TEST_CASE("Ties go to the first letter in alphabetic order", "[Viterbi]")
{
    // NOTE: Without any statistics every path scores the same.
    typofix::ProbabilityTable empty;
    ViterbiDecoder decoder(empty, empty);
    REQUIRE(decoder.Decode("q") == "a");
    REQUIRE(decoder.Decode("zzzz") == "aaaa");
}

TEST_CASE("Decoded words keep the length of the input", "[Viterbi]")
{
    std::vector<TrainingPair> pairs = {
        {"receive", "recieve"},
        {"separate", "seperate"},
        {"believe", "beleive"},
    };
    auto model = typofix::TrainChannelModel(pairs);
    ViterbiDecoder decoder(model);

    for (auto word : {"r", "recieve", "seperat", "xyzzy", "h3llo!", "BELIEVE"}) {
        const std::string observed = word;
        auto decoded = decoder.Decode(observed);
        REQUIRE(decoded.size() == observed.size());
        for (auto c : decoded) {
            REQUIRE(c >= 'a');
            REQUIRE(c <= 'z');
        }
    }
}

TEST_CASE("Decoding one word does not affect the next", "[Viterbi]")
{
    std::vector<TrainingPair> pairs = {
        {"abc", "abd"},
        {"xyz", "xzz"},
        {"abc", "abc"},
    };
    auto model = typofix::TrainChannelModel(pairs);
    ViterbiDecoder decoder(model);

    const auto abcFirst = decoder.Decode("abc");
    const auto xyzSecond = decoder.Decode("xyz");
    const auto xyzFirst = decoder.Decode("xyz");
    const auto abcSecond = decoder.Decode("abc");

    REQUIRE(abcFirst == abcSecond);
    REQUIRE(xyzFirst == xyzSecond);
}

TEST_CASE("DecodeViterbi matches a long-lived decoder", "[Viterbi]")
{
    std::vector<TrainingPair> pairs = {
        {"accommodate", "acommodate"},
        {"address", "adress"},
        {"calendar", "calender"},
    };
    auto model = typofix::TrainChannelModel(pairs);
    ViterbiDecoder decoder(model);

    for (auto word : {"adress", "calender", "acommodate", "zz"}) {
        REQUIRE(typofix::DecodeViterbi(word, model.transitions, model.emissions) == decoder.Decode(word));
    }
}
