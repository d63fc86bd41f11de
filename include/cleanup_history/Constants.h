#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <string>
#include <cstddef> // For size_t

// --- Configuration Constants ---
const std::string TMP_PREFIX = ".cleanup_history_";     // Prefix for temp file (created next to the target)
const std::string BACKUP_INFIX = ".backup_";            // <history>.backup_<random>
const size_t RANDOM_NAME_LENGTH = 15;                   // Length of random suffix for backup names
const std::string TIMESTAMP_MARKER_PATTERN = R"(^#\d+$)"; // "#" followed only by digits
const std::string COMMAND_SEPARATOR = "; ";             // Joins the lines of a multi-line command

#endif // CONSTANTS_H
