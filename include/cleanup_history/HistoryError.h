#ifndef HISTORY_ERROR_H
#define HISTORY_ERROR_H

#include <cstdint>
#include <optional>
#include <stdexcept> // For runtime_error
#include <string>

// Every failure the cleaner can report. The first four are per-entry and
// non-fatal; the rest abort the run.
enum class ErrorKind {
    MALFORMED_TIMESTAMP,      // Marker digits do not fit in 32 bits
    EMPTY_COMMAND,            // Marker with no command text before the next marker / EOF
    ORPHAN_COMMAND,           // Command text with no preceding marker
    MARKER_LIKE_COMMAND,      // Command that would be read back as a marker ("  #123")
    RULE_COMPILATION_FAILURE, // A classification pattern is not a valid regex
    IO_FAILURE,               // Read, temp-file, write or rename failure
    NO_VALID_COMMANDS         // Nothing left to write back
};

// Human readable name of an ErrorKind (used in diagnostics).
const char* errorKindName(ErrorKind kind);

class HistoryError : public std::runtime_error {
public:
    HistoryError(ErrorKind kind, const std::string& context,
                 std::optional<std::uint32_t> timestamp = std::nullopt,
                 unsigned long long line = 0);

    // --- Factories for the per-entry errors ---
    static HistoryError malformedTimestamp(const std::string& markerText, const std::string& command,
                                           unsigned long long line = 0);
    static HistoryError emptyCommand(std::uint32_t timestamp, unsigned long long line = 0);
    static HistoryError orphanCommand(const std::string& command, unsigned long long line = 0);
    static HistoryError markerLikeCommand(const std::string& command, std::uint32_t timestamp,
                                          unsigned long long line = 0);

    // Fatal I/O error on 'path'; 'what' describes the failed operation and cause.
    static HistoryError ioFailure(const std::string& path, const std::string& what);

    ErrorKind kind() const { return kind_; }

    // Offending text: the command, the regex pattern, or the path involved.
    const std::string& context() const { return context_; }

    // Parsed timestamp, when the error relates to one.
    std::optional<std::uint32_t> timestamp() const { return timestamp_; }

    // 1-based input line where the entry was closed (0 if not applicable).
    unsigned long long line() const { return line_; }

    bool isFatal() const;

private:
    HistoryError(ErrorKind kind, const std::string& message, const std::string& context,
                 std::optional<std::uint32_t> timestamp, unsigned long long line);

    static std::string formatMessage(ErrorKind kind, const std::string& context,
                                     std::optional<std::uint32_t> timestamp);

    ErrorKind kind_;
    std::string context_;
    std::optional<std::uint32_t> timestamp_;
    unsigned long long line_;
};

#endif // HISTORY_ERROR_H
