// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#include "CorpusLoader.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/LineIterator.h"
#include "llvm/Support/MemoryBuffer.h"
#include <memory>
#include <system_error>
#include <tuple>
#include <utility>

namespace typofix {

void ParseCorpusLine(llvm::StringRef line, std::vector<TrainingPair>& pairs)
{
    const auto colon = line.find(':');
    if (colon == llvm::StringRef::npos) {
        return;
    }

    auto correct = line.substr(0, colon).trim().lower();

    // NOTE: Only the first colon separates the correct word; anything after
    // it, colons included, belongs to the typed forms.
    llvm::SmallVector<llvm::StringRef, 8> typedWords;
    llvm::SplitString(line.substr(colon + 1), typedWords);

    for (auto & typedWord : typedWords) {
        TrainingPair pair;
        pair.correct = correct;
        pair.typed = typedWord.lower();
        pairs.push_back(std::move(pair));
    }
}

std::vector<TrainingPair> ParseCorpus(llvm::StringRef text)
{
    std::vector<TrainingPair> pairs;
    llvm::StringRef rest = text;
    while (!rest.empty()) {
        llvm::StringRef line;
        std::tie(line, rest) = rest.split('\n');
        ParseCorpusLine(line, pairs);
    }
    return pairs;
}

llvm::Expected<std::vector<TrainingPair>> LoadCorpusFile(llvm::StringRef path)
{
    auto bufferOrError = llvm::MemoryBuffer::getFileOrSTDIN(path);
    if (std::error_code errorCode = bufferOrError.getError()) {
        return llvm::createStringError(
            errorCode,
            "cannot open corpus file '%s': %s",
            path.str().c_str(),
            errorCode.message().c_str());
    }
    std::unique_ptr<llvm::MemoryBuffer> buffer = std::move(*bufferOrError);

    std::vector<TrainingPair> pairs;
    for (llvm::line_iterator iter(*buffer, true), end; iter != end; ++iter) {
        ParseCorpusLine(*iter, pairs);
    }
    return std::move(pairs);
}

} // namespace typofix
