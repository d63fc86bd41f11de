#include "../../include/cleanup_history/Aggregator.h"

#include <algorithm>

bool HistoryAggregator::add(const HistoryRecord& record) {
    auto [it, inserted] = latest_.emplace(record.command, record.timestamp);
    if (!inserted && it->second < record.timestamp) {
        it->second = record.timestamp;
    }
    return !inserted;
}

std::vector<HistoryRecord> HistoryAggregator::sortedRecords() const {
    std::vector<HistoryRecord> records;
    records.reserve(latest_.size());
    for (const auto& [command, timestamp] : latest_) {
        records.push_back(HistoryRecord{timestamp, command});
    }
    std::sort(records.begin(), records.end());
    return records;
}
