#ifndef UTILS_H
#define UTILS_H

#include <cstddef>
#include <filesystem> // Requires C++17
#include <signal.h>   // For sigset_t
#include <string>

namespace fs = std::filesystem;

// Print error message and exit
[[noreturn]] void errorExit(const std::string& message, int exitCode = 1);

// Remove leading and trailing whitespace (" \t\n\r\f\v")
std::string trimWhitespace(const std::string& text);

// Collapse every run of whitespace into a single space and trim both ends
std::string collapseWhitespace(const std::string& text);

// Number of UTF-8 code points (bytes that are not 0x80-0xBF continuation bytes)
size_t utf8Length(const std::string& text);

// Read a whole file into memory. Throws HistoryError (IO_FAILURE) on failure.
std::string readFileToString(const fs::path& path);

// Random [0-9A-Za-z] string, used for backup file names
std::string randomAlnum(size_t length);

// Blocks SIGINT, SIGTERM and SIGHUP for its lifetime, restoring the previous
// mask on destruction. Signals arriving meanwhile are delivered afterwards.
class ScopedSignalBlock {
public:
    ScopedSignalBlock();
    ~ScopedSignalBlock();

    ScopedSignalBlock(const ScopedSignalBlock&) = delete;
    ScopedSignalBlock& operator=(const ScopedSignalBlock&) = delete;

private:
    sigset_t previous_;
};

#endif // UTILS_H
