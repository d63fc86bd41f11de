#ifndef SERIALIZER_H
#define SERIALIZER_H

#include "HistoryRecord.h"

#include <iosfwd>      // For std::ostream forward declaration
#include <string>
#include <vector>

// Writes records in bash history format: "#<timestamp>\n<command>\n" each.
void writeHistory(std::ostream& out, const std::vector<HistoryRecord>& records);

// Same as writeHistory, into a string. Empty input gives an empty string.
std::string serializeHistory(const std::vector<HistoryRecord>& records);

#endif // SERIALIZER_H
