// Copyright (c) 2026 typofix authors. Distributed under the MIT license.

#pragma once

#include "ChannelModel.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <vector>

namespace typofix {

///@brief Parse one `correct: typed1 typed2 ...` line and append its pairs.
///
/// Lines without a colon are ignored. An empty correct word is kept, so it
/// contributes a start-to-end transition and an empty vocabulary entry.
/// Both sides are lowercased.
void ParseCorpusLine(llvm::StringRef line, std::vector<TrainingPair>& pairs);

///@brief Parse a whole corpus held in memory.
std::vector<TrainingPair> ParseCorpus(llvm::StringRef text);

///@brief Read a corpus file, or standard input if `path` is "-".
llvm::Expected<std::vector<TrainingPair>> LoadCorpusFile(llvm::StringRef path);

} // namespace typofix
