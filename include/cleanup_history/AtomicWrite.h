#ifndef ATOMIC_WRITE_H
#define ATOMIC_WRITE_H

#include <filesystem> // Requires C++17
#include <iostream>   // For std::cerr default argument
#include <iosfwd>     // For forward declaration of std::ostream
#include <string>

namespace fs = std::filesystem;

// Replace 'target' with 'contents' without ever exposing a partially written file.
//
// The data goes to a fresh temp file (TMP_PREFIX + random) in the target's
// directory, which gets the target's permission bits, is fsync'ed and then
// rename()d over the target. While the temp file exists its path is stored in
// 'tempPath' so a signal handler can remove it; it is cleared once the rename
// succeeds. Throws HistoryError (IO_FAILURE) with the cause on any failure,
// after removing the temp file. Logs warnings to the provided ostream.
void atomicReplace(const fs::path& target, const std::string& contents,
                   fs::path& tempPath, std::ostream& log = std::cerr);

#endif // ATOMIC_WRITE_H
