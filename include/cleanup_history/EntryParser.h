#ifndef ENTRY_PARSER_H
#define ENTRY_PARSER_H

#include "HistoryError.h"
#include "HistoryRecord.h"

#include <optional>
#include <regex>
#include <sstream>
#include <string>

// Outcome of closing one history entry: either a record or the reason it was dropped.
struct EntryResult {
    std::optional<HistoryRecord> record;
    std::optional<HistoryError> error;

    bool ok() const { return record.has_value(); }
};

// Line-driven state machine that splits bash history text into entries.
//
// A line of the form "#<digits>" is a timestamp marker; every other non-blank
// line is command text belonging to the most recent marker. Markers seen
// before any command text replace each other, so only the last one counts.
// An entry is closed either by the next marker (feed) or by end of input
// (finish); both paths go through the same emission rules.
class EntryParser {
public:
    enum class State { AWAITING_TIMESTAMP, ACCUMULATING };

    EntryParser();

    // Consume one line (without its '\n'). Returns the entry closed by this
    // line, if any.
    std::optional<EntryResult> feed(const std::string& line);

    // Signal end of input. Returns the final entry, if there is one, and
    // clears the pending timestamp and buffer.
    std::optional<EntryResult> finish();

    State state() const { return buffer_.empty() ? State::AWAITING_TIMESTAMP : State::ACCUMULATING; }
    const std::optional<std::string>& pendingTimestamp() const { return pendingTimestamp_; }
    unsigned long long linesFed() const { return lineNum_; }

    bool isTimestampMarker(const std::string& line) const;

    // Collapse whitespace and drop the trailing "; " separators of a command buffer.
    static std::string normalizeCommand(const std::string& buffer);

private:
    EntryResult closeEntry(const std::optional<std::string>& timestampText) const;

    std::regex markerRegex_;                      // Matches "#<digits>"
    std::optional<std::string> pendingTimestamp_; // Last marker seen before command text
    std::string buffer_;                          // Trimmed command lines, each followed by "; "
    unsigned long long lineNum_ = 0;
};

// Lazy, single-pass sequence of entries over an in-memory history text.
class EntryStream {
public:
    explicit EntryStream(const std::string& text);

    // Next entry, or std::nullopt once the input is exhausted.
    std::optional<EntryResult> next();

    unsigned long long linesRead() const { return parser_.linesFed(); }

private:
    std::istringstream input_;
    EntryParser parser_;
    bool finished_ = false;
};

#endif // ENTRY_PARSER_H
