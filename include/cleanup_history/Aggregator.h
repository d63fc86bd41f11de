#ifndef AGGREGATOR_H
#define AGGREGATOR_H

#include "HistoryRecord.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Deduplicates records by command text, remembering the most recent timestamp.
class HistoryAggregator {
public:
    // Adds a record. Returns true if the command was already known (the
    // timestamp is raised only when the new one is strictly greater).
    bool add(const HistoryRecord& record);

    // All unique commands, sorted by timestamp then command.
    std::vector<HistoryRecord> sortedRecords() const;

    size_t size() const { return latest_.size(); }
    bool empty() const { return latest_.empty(); }

private:
    std::unordered_map<std::string, std::uint32_t> latest_; // command -> max timestamp
};

#endif // AGGREGATOR_H
