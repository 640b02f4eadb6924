#include "CorpusLoader.h"
#include "SpellCorrector.h"
#include "llvm/Support/raw_ostream.h"

int main()
{
    // NOTE: Please specify your corpus file
    std::string filePath = "aspell.txt";

    // NOTE: Each line looks like "correct: typed1 typed2 ..."
    auto pairs = typofix::LoadCorpusFile(filePath);
    if (!pairs) {
        llvm::errs() << "error: " << llvm::toString(pairs.takeError()) << "\n";
        return 1;
    }

    // NOTE: Train the model
    typofix::SpellCorrector corrector(*pairs);

    // NOTE: Correct a sentence word by word
    auto text = "Teh quikc brwon fox";
    auto results = corrector.CorrectText(text);

    // NOTE: Show the result
    for (auto & result : results) {
        if (!result.changed) {
            llvm::outs() << "'" << result.observed << "' is a known word.\n";
        }
        else {
            llvm::outs() << "'" << result.observed << "' Did you mean '"
                << result.corrected << "'?\n";
        }
    }
    llvm::outs() << "Corrected: " << typofix::JoinCorrections(results) << "\n";

    return 0;
}
