#ifndef HISTORY_CLEANER_H
#define HISTORY_CLEANER_H

#include "Classifier.h"
#include "HistoryRecord.h"

#include <filesystem> // Requires C++17
#include <string>
#include <vector>
#include <iostream>    // For std::cout / std::cerr default arguments
#include <iosfwd>      // For std::ostream forward declaration

namespace fs = std::filesystem;

// Counters collected while cleaning, reported in the final summary.
struct CleanupStats {
    unsigned long long linesRead = 0;
    unsigned long long recordsParsed = 0;    // Entries that produced a record
    unsigned long long parseErrors = 0;      // Entries dropped as malformed
    unsigned long long recordsIgnored = 0;   // Records rejected by the classifier
    unsigned long long duplicatesMerged = 0; // Records folded into an existing command
    unsigned long long recordsWritten = 0;
};

// Result of command-line parsing.
struct CleanupOptions {
    fs::path historyFile;
    bool dryRun = false;    // Print the result instead of replacing the file
    bool backup = false;    // Copy the original before replacing it
    bool showHelp = false;  // -h / --help was given
};

// Parses "[--dry-run] [--backup] <historyfile>". Throws std::invalid_argument
// with a user facing message on a usage error. When -h/--help is present only
// showHelp is meaningful.
CleanupOptions parseArguments(int argc, char* argv[]);

// Prints usage instructions.
void usage(std::ostream& os, const std::string& progName);

// Core pipeline: parse, classify, deduplicate and sort the history text.
// Malformed entries are reported to 'log' as warnings and skipped. Returns
// the surviving records in output order (possibly none).
std::vector<HistoryRecord> cleanHistory(const std::string& input, const Classifier& classifier,
                                        std::ostream& log = std::cerr, CleanupStats* stats = nullptr);

class HistoryCleaner {
public:
    // Validates the history file (exists, regular, readable, directory
    // writable) and installs signal handlers. Throws HistoryError on an
    // unusable path or rule set.
    explicit HistoryCleaner(const CleanupOptions& options,
                            const RuleSet& rules = RuleSet::defaults(),
                            std::ostream& out = std::cout,
                            std::ostream& log = std::cerr);

    // Destructor: Ensures cleanup, especially of temporary files.
    ~HistoryCleaner();

    // Prevent copy/move operations to avoid issues with resource management (temp files, signals)
    HistoryCleaner(const HistoryCleaner&) = delete;
    HistoryCleaner& operator=(const HistoryCleaner&) = delete;
    HistoryCleaner(HistoryCleaner&&) = delete;
    HistoryCleaner& operator=(HistoryCleaner&&) = delete;

    // Reads, cleans and rewrites the history file (or prints it in dry-run
    // mode). Throws HistoryError on I/O failure or when nothing would remain.
    void run();

    const CleanupStats& stats() const { return stats_; }
    const fs::path& historyFile() const { return effectiveHistoryFilePath_; }
    const fs::path& backupFile() const { return backupFilePath_; }

    // Public signal handler callback (static version needed for C-style signal registration)
    static void staticSignalHandler(int signal);

private:
    // Resolves the history file path to an absolute path.
    void resolveHistoryPath();

    // Validates necessary permissions (read history, write directory).
    void checkPermissions();

    // Sets up signal handlers for SIGINT, SIGTERM, SIGHUP.
    void setupSignalHandlers();

    // Removes the temp file, then re-raises the signal with the default handler.
    void cleanupAndExit(int signal);

    // Cleanup any temporary files or resources
    void cleanup();

    // Copies the original history file next to itself.
    void backupHistoryFile();

    // Progress messages go to stderr in dry-run mode so stdout only carries history.
    std::ostream& info() { return dryRun_ ? log_ : out_; }

    fs::path historyFilePath_;          // Path provided by user
    fs::path effectiveHistoryFilePath_; // Resolved absolute path of the history file
    fs::path tempFilePath_;             // Temp file being written (if any)
    fs::path backupFilePath_;           // Path to backup file (if created)
    bool doBackup_ = false;
    bool dryRun_ = false;

    Classifier classifier_;
    CleanupStats stats_;
    std::ostream& out_;
    std::ostream& log_;

    // Static pointer to the current instance for the static signal handler.
    static HistoryCleaner* g_cleaner_instance;
};

#endif // HISTORY_CLEANER_H
