#include "../../include/cleanup_history/EntryParser.h"
#include "../../include/cleanup_history/Constants.h"
#include "../../include/cleanup_history/Utils.h"

#include <cstdint>
#include <limits>       // For numeric_limits
#include <regex>
#include <stdexcept>
#include <string>

EntryParser::EntryParser() {
    try {
        markerRegex_ = std::regex(TIMESTAMP_MARKER_PATTERN);
    } catch (const std::regex_error&) {
        throw HistoryError(ErrorKind::RULE_COMPILATION_FAILURE, TIMESTAMP_MARKER_PATTERN);
    }
}

bool EntryParser::isTimestampMarker(const std::string& line) const {
    return std::regex_match(line, markerRegex_);
}

std::optional<EntryResult> EntryParser::feed(const std::string& rawLine) {
    lineNum_++;

    // Handle potential \r line endings (Windows/mixed environments)
    std::string line = rawLine;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (isTimestampMarker(line)) {
        if (buffer_.empty()) {
            // New or duplicate timestamp, keep the last one
            pendingTimestamp_ = line;
            return std::nullopt;
        }
        // New timestamp closes the accumulated command
        EntryResult result = closeEntry(pendingTimestamp_);
        pendingTimestamp_ = line;
        buffer_.clear();
        return result;
    }

    std::string trimmed = trimWhitespace(line);
    if (!trimmed.empty()) {
        buffer_ += trimmed;
        buffer_ += COMMAND_SEPARATOR;
    }
    return std::nullopt;
}

std::optional<EntryResult> EntryParser::finish() {
    std::optional<EntryResult> result;
    if (pendingTimestamp_ || !buffer_.empty()) {
        result = closeEntry(pendingTimestamp_);
    }

    pendingTimestamp_.reset();
    buffer_.clear();
    return result;
}

std::string EntryParser::normalizeCommand(const std::string& buffer) {
    std::string command = collapseWhitespace(buffer);
    while (!command.empty() && command.back() == ';') {
        command.pop_back();
    }
    return trimWhitespace(command);
}

EntryResult EntryParser::closeEntry(const std::optional<std::string>& timestampText) const {
    EntryResult result;
    std::string command = normalizeCommand(buffer_);

    if (!timestampText) {
        // Command text before the first marker of the file
        result.error = HistoryError::orphanCommand(command.empty() ? trimWhitespace(buffer_) : command, lineNum_);
        return result;
    }

    unsigned long long value = 0;
    try {
        value = std::stoull(timestampText->substr(1)); // Skip '#'
    } catch (const std::out_of_range&) {
        result.error = HistoryError::malformedTimestamp(*timestampText, command, lineNum_);
        return result;
    } catch (const std::invalid_argument&) {
        result.error = HistoryError::malformedTimestamp(*timestampText, command, lineNum_);
        return result;
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        result.error = HistoryError::malformedTimestamp(*timestampText, command, lineNum_);
        return result;
    }

    auto timestamp = static_cast<std::uint32_t>(value);
    if (command.empty()) {
        result.error = HistoryError::emptyCommand(timestamp, lineNum_);
        return result;
    }

    // Written back on its own line it would be parsed as a marker next time
    if (isTimestampMarker(command)) {
        result.error = HistoryError::markerLikeCommand(command, timestamp, lineNum_);
        return result;
    }

    result.record = HistoryRecord{timestamp, command};
    return result;
}

EntryStream::EntryStream(const std::string& text) : input_(text) {}

std::optional<EntryResult> EntryStream::next() {
    std::string line;
    while (std::getline(input_, line)) {
        if (auto result = parser_.feed(line)) {
            return result;
        }
    }

    if (finished_) {
        return std::nullopt;
    }
    finished_ = true;
    return parser_.finish();
}
