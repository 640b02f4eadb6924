#include "SpellCorrector.h"
#include <iostream>

int main()
{
    std::vector<typofix::TrainingPair> pairs = {
        {"hello", "helo"},
        {"hello", "hellp"},
        {"hello", "hello"},
        {"world", "wprld"},
        {"world", "world"},
        {"would", "woudl"},
    };
    typofix::SpellCorrector corrector(pairs);

    auto result = corrector.CorrectWord("hrllo");
    if (!result.changed) {
        // NOTE: 'hrllo' is already a known word.
        std::cout << result.corrected << std::endl;
        return 0;
    }

    // NOTE: 'hrllo' is probably a misspelled word.
    std::cout << result.observed << " => " << result.corrected
        << " (decoded as '" << result.decoded << "')" << std::endl;

    return 0;
}
