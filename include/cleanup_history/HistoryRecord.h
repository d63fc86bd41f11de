#ifndef HISTORY_RECORD_H
#define HISTORY_RECORD_H

#include <cstdint>
#include <string>
#include <tuple>

// One command from the history file together with the time it was last run.
struct HistoryRecord {
    std::uint32_t timestamp = 0; // Seconds since epoch, as written after the '#'
    std::string command;         // Whitespace-normalized, never empty
};

// Records are ordered by timestamp, then alphabetically by command.
inline bool operator<(const HistoryRecord& lhs, const HistoryRecord& rhs) {
    return std::tie(lhs.timestamp, lhs.command) < std::tie(rhs.timestamp, rhs.command);
}

inline bool operator==(const HistoryRecord& lhs, const HistoryRecord& rhs) {
    return lhs.timestamp == rhs.timestamp && lhs.command == rhs.command;
}

inline bool operator!=(const HistoryRecord& lhs, const HistoryRecord& rhs) {
    return !(lhs == rhs);
}

#endif // HISTORY_RECORD_H
