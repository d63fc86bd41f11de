#include "../../include/cleanup_history/HistoryError.h"

#include <string>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_TIMESTAMP:      return "malformed timestamp";
        case ErrorKind::EMPTY_COMMAND:            return "empty command";
        case ErrorKind::ORPHAN_COMMAND:           return "orphan command";
        case ErrorKind::MARKER_LIKE_COMMAND:      return "marker-like command";
        case ErrorKind::RULE_COMPILATION_FAILURE: return "rule compilation failure";
        case ErrorKind::IO_FAILURE:               return "I/O failure";
        case ErrorKind::NO_VALID_COMMANDS:        return "no valid commands";
    }
    return "unknown error";
}

HistoryError::HistoryError(ErrorKind kind, const std::string& context,
                           std::optional<std::uint32_t> timestamp,
                           unsigned long long line)
    : HistoryError(kind, formatMessage(kind, context, timestamp), context, timestamp, line) {}

HistoryError::HistoryError(ErrorKind kind, const std::string& message, const std::string& context,
                           std::optional<std::uint32_t> timestamp, unsigned long long line)
    : std::runtime_error(message),
      kind_(kind),
      context_(context),
      timestamp_(timestamp),
      line_(line) {}

HistoryError HistoryError::malformedTimestamp(const std::string& markerText, const std::string& command,
                                              unsigned long long line) {
    // The command stays the context so the dropped entry can be identified.
    return HistoryError(ErrorKind::MALFORMED_TIMESTAMP,
                        "invalid timestamp '" + markerText + "' for command: " + command,
                        command, std::nullopt, line);
}

HistoryError HistoryError::emptyCommand(std::uint32_t timestamp, unsigned long long line) {
    return HistoryError(ErrorKind::EMPTY_COMMAND, "", timestamp, line);
}

HistoryError HistoryError::orphanCommand(const std::string& command, unsigned long long line) {
    return HistoryError(ErrorKind::ORPHAN_COMMAND, command, std::nullopt, line);
}

HistoryError HistoryError::ioFailure(const std::string& path, const std::string& what) {
    return HistoryError(ErrorKind::IO_FAILURE, what + ": " + path, path, std::nullopt, 0);
}

HistoryError HistoryError::markerLikeCommand(const std::string& command, std::uint32_t timestamp,
                                             unsigned long long line) {
    return HistoryError(ErrorKind::MARKER_LIKE_COMMAND, command, timestamp, line);
}

bool HistoryError::isFatal() const {
    switch (kind_) {
        case ErrorKind::MALFORMED_TIMESTAMP:
        case ErrorKind::EMPTY_COMMAND:
        case ErrorKind::ORPHAN_COMMAND:
        case ErrorKind::MARKER_LIKE_COMMAND:
            return false;
        default:
            return true;
    }
}

std::string HistoryError::formatMessage(ErrorKind kind, const std::string& context,
                                        std::optional<std::uint32_t> timestamp) {
    switch (kind) {
        case ErrorKind::MALFORMED_TIMESTAMP:
            return "invalid timestamp for command: " + context;
        case ErrorKind::EMPTY_COMMAND:
            return "command was empty for timestamp " + (timestamp ? std::to_string(*timestamp) : std::string("?"));
        case ErrorKind::ORPHAN_COMMAND:
            return "missing timestamp for command: " + context;
        case ErrorKind::MARKER_LIKE_COMMAND:
            return "command looks like a timestamp marker: " + context;
        case ErrorKind::RULE_COMPILATION_FAILURE:
            return "failed to compile classification rule '" + context + "'";
        case ErrorKind::IO_FAILURE:
            return context;
        case ErrorKind::NO_VALID_COMMANDS:
            return context.empty() ? std::string("no valid commands") : "no valid commands in " + context;
    }
    return context;
}
