#include "../../include/cleanup_history/Utils.h"
#include "../../include/cleanup_history/HistoryError.h"

#include <iostream>
#include <cstdlib>      // For std::exit
#include <cctype>       // For std::isspace with unsigned char cast
#include <cerrno>       // For errno
#include <cstring>      // For strerror
#include <fstream>
#include <random>       // For random_device, mt19937
#include <sstream>
#include <signal.h>     // For sigprocmask
#include <string>

namespace {
const char* const kWhitespace = " \t\n\r\f\v";
}

// Print error message and exit
[[noreturn]] void errorExit(const std::string& message, int exitCode) {
    std::cerr << "Error: " << message << std::endl;
    // Temp files are removed by the HistoryCleaner destructor or signal handler,
    // nothing else needs unwinding here.
    std::exit(exitCode);
}

std::string trimWhitespace(const std::string& text) {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) { // Empty or all whitespace
        return std::string();
    }
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string collapseWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool pendingSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !result.empty(); // Never emit leading space
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

size_t utf8Length(const std::string& text) {
    size_t length = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            length++;
        }
    }
    return length;
}

std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw HistoryError::ioFailure(path.string(),
                                      std::string("Cannot open history file for reading (") + std::strerror(errno) + ")");
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw HistoryError::ioFailure(path.string(), "Error reading history file");
    }
    return contents.str();
}

std::string randomAlnum(size_t length) {
    std::random_device rd;
    std::mt19937 gen(rd());
    const char charset[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string randomStr;
    randomStr.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        randomStr += charset[dist(gen)];
    }
    return randomStr;
}

ScopedSignalBlock::ScopedSignalBlock() {
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    sigaddset(&blocked, SIGHUP);
    sigprocmask(SIG_BLOCK, &blocked, &previous_);
}

ScopedSignalBlock::~ScopedSignalBlock() {
    sigprocmask(SIG_SETMASK, &previous_, nullptr);
}
