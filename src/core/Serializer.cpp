#include "../../include/cleanup_history/Serializer.h"

#include <ostream>
#include <sstream>

void writeHistory(std::ostream& out, const std::vector<HistoryRecord>& records) {
    for (const auto& record : records) {
        out << '#' << record.timestamp << '\n'
            << record.command << '\n';
    }
}

std::string serializeHistory(const std::vector<HistoryRecord>& records) {
    std::ostringstream out;
    writeHistory(out, records);
    return out.str();
}
