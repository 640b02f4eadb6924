// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "CorpusLoader.h"
#include "SpellCorrector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/LineIterator.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Signals.h"
#include "llvm/Support/raw_ostream.h"
#include <iostream>
#include <string>
#include <vector>

using namespace llvm;

static cl::OptionCategory TypofixCategory("typofix options");

static cl::opt<std::string> CorpusPath(
    "corpus",
    cl::desc("Corpus of 'correct: typed1 typed2 ...' lines"),
    cl::value_desc("path"),
    cl::init("aspell.txt"),
    cl::cat(TypofixCategory));

static cl::list<std::string> InputPaths(
    cl::Positional,
    cl::desc("[input file ...]"),
    cl::cat(TypofixCategory));

static cl::opt<bool> ShowDecoded(
    "show-decoded",
    cl::desc("Also print the raw Viterbi candidates"),
    cl::cat(TypofixCategory));

static cl::opt<bool> Highlight(
    "highlight",
    cl::desc("Print corrected words in color"),
    cl::cat(TypofixCategory));

static cl::opt<bool> Verbose(
    "verbose",
    cl::desc("Print training statistics"),
    cl::cat(TypofixCategory));

namespace {

void printVersion(raw_ostream& stream)
{
    stream << "typofix version 0.1.0 (October 18, 2026)\n";
}

void printStatistics(
    const std::vector<typofix::TrainingPair>& pairs,
    const typofix::SpellCorrector& corrector)
{
    auto & model = corrector.GetModel();
    errs() << "training pairs:   " << pairs.size() << "\n"
           << "vocabulary size:  " << corrector.GetVocabulary().GetSize() << "\n"
           << "emission rows:    " << model.emissions.GetRowCount() << "\n"
           << "transition rows:  " << model.transitions.GetRowCount() << "\n";
}

std::string formatDecoded(const std::vector<typofix::CorrectionResult>& results)
{
    std::string text;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += results[i].decoded;
    }
    return text;
}

void showCorrections(
    const std::vector<typofix::CorrectionResult>& results,
    StringRef prefix)
{
    if (ShowDecoded) {
        outs() << "Decoded: " << formatDecoded(results) << "\n";
    }
    outs() << prefix;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            outs() << ' ';
        }
        auto & result = results[i];
        if (result.changed) {
            // NOTE: No effect unless colors were enabled by -highlight.
            outs().changeColor(raw_ostream::GREEN, true);
            outs() << result.corrected;
            outs().resetColor();
        }
        else {
            outs() << result.corrected;
        }
    }
    outs() << "\n";
}

bool correctFile(const typofix::SpellCorrector& corrector, StringRef path)
{
    auto bufferOrError = MemoryBuffer::getFileOrSTDIN(path);
    if (std::error_code errorCode = bufferOrError.getError()) {
        errs() << "error: Cannot open the file '" << path << "': "
               << errorCode.message() << "\n";
        return false;
    }

    for (line_iterator iter(**bufferOrError, true), end; iter != end; ++iter) {
        auto results = corrector.CorrectText(iter->str());
        showCorrections(results, "");
    }
    return true;
}

void runInteractiveLoop(const typofix::SpellCorrector& corrector)
{
    std::string line;
    for (;;) {
        outs() << "\nEnter text: ";
        outs().flush();
        if (!std::getline(std::cin, line)) {
            outs() << "\n";
            break;
        }
        auto text = StringRef(line).trim();
        if (text.empty()) {
            break;
        }
        auto results = corrector.CorrectText(text.str());
        showCorrections(results, "Corrected: ");
    }
}

} // end anonymous namespace

int main(int argc, char *argv[])
{
    sys::PrintStackTraceOnErrorSignal(argv[0]);
    cl::HideUnrelatedOptions(TypofixCategory);
    cl::SetVersionPrinter(printVersion);
    cl::ParseCommandLineOptions(argc, argv, "typofix - noisy-channel spelling corrector\n");
    outs().enable_colors(Highlight);

    outs() << "Loading data and training model...\n";
    outs().flush();

    auto pairsOrError = typofix::LoadCorpusFile(CorpusPath);
    if (!pairsOrError) {
        errs() << "error: " << toString(pairsOrError.takeError()) << "\n";
        return 1;
    }
    auto & pairs = *pairsOrError;
    if (pairs.empty()) {
        errs() << "warning: No training pairs found in '" << CorpusPath << "'.\n";
    }

    typofix::SpellCorrector corrector(pairs);
    if (Verbose) {
        printStatistics(pairs, corrector);
    }

    if (!InputPaths.empty()) {
        for (auto & path : InputPaths) {
            if (!correctFile(corrector, path)) {
                return 1;
            }
        }
        return 0;
    }

    outs() << "Model ready. Type something (blank line to quit).\n";
    runInteractiveLoop(corrector);
    return 0;
}
