#include "../../include/cleanup_history/HistoryCleaner.h"
#include "../../include/cleanup_history/Aggregator.h"
#include "../../include/cleanup_history/AtomicWrite.h"
#include "../../include/cleanup_history/Constants.h"
#include "../../include/cleanup_history/EntryParser.h"
#include "../../include/cleanup_history/HistoryError.h"
#include "../../include/cleanup_history/Serializer.h"
#include "../../include/cleanup_history/Utils.h"

#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <csignal>
#include <signal.h>     // For sigaction
#include <cstdlib>      // For _Exit
#include <unistd.h>     // For access, write
#include <cstring>      // For strerror, strlen
#include <cerrno>       // For errno

namespace fs = std::filesystem;

// Define the static member variable
HistoryCleaner* HistoryCleaner::g_cleaner_instance = nullptr;

// --- Command line ---
CleanupOptions parseArguments(int argc, char* argv[]) {
    CleanupOptions options;
    std::vector<std::string> positional;
    std::vector<std::string> args(argv + 1, argv + argc);

    for (const std::string& arg : args) {
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            return options;
        } else if (arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "--backup") {
            options.backup = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: '" + arg + "'. Use -h or --help for usage.");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        throw std::invalid_argument("please supply the path to the bash_history file");
    }
    if (positional.size() > 1) {
        throw std::invalid_argument("this script only accepts one argument");
    }
    if (options.dryRun && options.backup) {
        std::cerr << "Warning: --backup is ignored with --dry-run." << std::endl;
        options.backup = false;
    }

    options.historyFile = positional.front();
    return options;
}

void usage(std::ostream& os, const std::string& progName) {
    os << "cleanup_history :: Deduplicate bash history file\n\n"
       << "Usage: " << progName << " [OPTIONS] <historyfile>\n\n"
       << "Merges duplicate commands (keeping the most recent timestamp), drops\n"
       << "noise and sensitive looking entries, sorts by time and rewrites the file.\n\n"
       << "Options:\n"
       << " --dry-run            Print the cleaned history to stdout, leave the file untouched.\n"
       << " --backup             Copy the original file to <historyfile>.backup_<random> first.\n"
       << " -h, --help           Show this help message and exit.\n\n"
       << "Notes:\n"
       << "- Expects HISTTIMEFORMAT style history: a '#<epoch>' line before each command.\n"
       << "- Dropped: commands of 1-3 characters, cd/ls to relative paths, reboot/shutdown/halt,\n"
       << "  lines starting with '0' or a space, and anything mentioning api, token, key,\n"
       << "  secret or pass (except 'pass -c').\n"
       << "- The file is replaced atomically; an empty result is refused.\n";
}

// --- Core pipeline ---
std::vector<HistoryRecord> cleanHistory(const std::string& input, const Classifier& classifier,
                                        std::ostream& log, CleanupStats* stats) {
    CleanupStats local;
    CleanupStats& counts = stats ? *stats : local;

    HistoryAggregator aggregator;
    EntryStream entries(input);

    while (auto entry = entries.next()) {
        if (!entry->ok()) {
            const HistoryError& err = *entry->error;
            log << "Warning: " << err.what() << " near line " << err.line() << ". Dropping entry." << std::endl;
            counts.parseErrors++;
            continue;
        }

        const HistoryRecord& record = *entry->record;
        counts.recordsParsed++;
        if (!classifier.isRetained(record.command)) {
            counts.recordsIgnored++;
            continue;
        }
        if (aggregator.add(record)) {
            counts.duplicatesMerged++;
        }
    }

    std::vector<HistoryRecord> records = aggregator.sortedRecords();
    counts.linesRead = entries.linesRead();
    counts.recordsWritten = records.size();
    return records;
}

// --- Constructor ---
HistoryCleaner::HistoryCleaner(const CleanupOptions& options, const RuleSet& rules,
                               std::ostream& out, std::ostream& log)
    : historyFilePath_(options.historyFile),
      doBackup_(options.backup),
      dryRun_(options.dryRun),
      classifier_(rules), // Compile rules before touching any file
      out_(out),
      log_(log) {
    resolveHistoryPath();
    checkPermissions(); // Check permissions early before reading anything

    {
        ScopedSignalBlock block;
        g_cleaner_instance = this; // Set global instance for signal handler
    }
    setupSignalHandlers();
}

// --- Destructor ---
HistoryCleaner::~HistoryCleaner() {
    cleanup();
    ScopedSignalBlock block;
    if (g_cleaner_instance == this) {
        g_cleaner_instance = nullptr; // Clear global instance
    }
}

// --- Resource Management ---
void HistoryCleaner::cleanup() {
    // Backups are never removed here, they exist for recovery
    std::error_code ec;
    std::string removed;
    {
        ScopedSignalBlock block; // staticSignalHandler reads tempFilePath_
        if (!tempFilePath_.empty() && fs::exists(tempFilePath_, ec)) {
            removed = tempFilePath_.string();
            fs::remove(tempFilePath_, ec);
        }
        tempFilePath_.clear();
    }
    if (ec) {
        log_ << "Warning: Failed to remove temporary file: " << removed
             << " (" << ec.message() << ")" << std::endl;
    }
}

namespace {

// Signal-safe stderr output; a failed write has nowhere to be reported
void writeStderr(const char* text, size_t length) {
    ssize_t rc = write(STDERR_FILENO, text, length);
    (void)rc;
}

} // namespace

void HistoryCleaner::cleanupAndExit(int signal) {
    const char* signame = "";
    switch (signal) {
        case SIGINT:  signame = "SIGINT";  break;
        case SIGTERM: signame = "SIGTERM"; break;
        case SIGHUP:  signame = "SIGHUP";  break;
        default:      signame = "Unknown";  break;
    }

    // Use write() for signal safety
    const char msg[] = "\nReceived signal: ";
    const char tail[] = "\nCleaning up...\n";
    writeStderr(msg, sizeof(msg) - 1);
    writeStderr(signame, strlen(signame));
    writeStderr(tail, sizeof(tail) - 1);

    // unlink() is async-signal-safe, the filesystem wrappers are not
    if (!tempFilePath_.empty()) {
        unlink(tempFilePath_.c_str());
    }

    // Reset signal to default handler and re-raise
    std::signal(signal, SIG_DFL);
    raise(signal);
}

// --- Signal Handling ---
void HistoryCleaner::setupSignalHandlers() {
    // Each handler runs with all three signals blocked so handlers never nest
    struct sigaction action {};
    action.sa_handler = HistoryCleaner::staticSignalHandler;
    sigemptyset(&action.sa_mask);
    sigaddset(&action.sa_mask, SIGINT);
    sigaddset(&action.sa_mask, SIGTERM);
    sigaddset(&action.sa_mask, SIGHUP);

    sigaction(SIGINT, &action, nullptr);  // Ctrl+C
    sigaction(SIGTERM, &action, nullptr); // Termination request
    sigaction(SIGHUP, &action, nullptr);  // Hangup
}

void HistoryCleaner::staticSignalHandler(int signal) {
    if (g_cleaner_instance) {
        g_cleaner_instance->cleanupAndExit(signal);
    } else {
        const char msg[] = "\nTermination signal received, but no active cleaner instance. Forcing exit.\n";
        writeStderr(msg, sizeof(msg) - 1);
        _Exit(128 + signal); // Use _Exit for signal safety
    }
}

// --- Path checks ---
void HistoryCleaner::resolveHistoryPath() {
    std::error_code ec;

    // The file must exist, so canonical() both resolves symlinks and proves existence
    effectiveHistoryFilePath_ = fs::canonical(historyFilePath_, ec);
    if (ec) {
        throw HistoryError::ioFailure(historyFilePath_.string(),
                                      "History file does not exist or cannot be resolved (" + ec.message() + ")");
    }
}

void HistoryCleaner::checkPermissions() {
    std::error_code ec;
    const std::string path = effectiveHistoryFilePath_.string();

    auto status = fs::status(effectiveHistoryFilePath_, ec);
    if (ec) {
        throw HistoryError::ioFailure(path, "Error getting status of history file (" + ec.message() + ")");
    }
    if (!fs::is_regular_file(status)) {
        throw HistoryError::ioFailure(path, "History file path exists but is not a regular file");
    }

    // Check read permission on the history file itself using access()
    if (access(effectiveHistoryFilePath_.c_str(), R_OK) != 0) {
        throw HistoryError::ioFailure(path, std::string("Cannot read history file (") + strerror(errno) + ")");
    }

    if (dryRun_) {
        return; // Nothing will be written
    }

    // The temp file (and backup) are created beside the history file
    fs::path parentDir = effectiveHistoryFilePath_.parent_path();
    if (access(parentDir.c_str(), W_OK) != 0) {
        throw HistoryError::ioFailure(parentDir.string(),
                                      std::string("Cannot write to history file directory (") + strerror(errno) + ")");
    }
}

// --- Core Logic ---
void HistoryCleaner::run() {
    info() << "History file: " << effectiveHistoryFilePath_.string() << std::endl;

    std::string input = readFileToString(effectiveHistoryFilePath_);

    stats_ = CleanupStats{};
    std::vector<HistoryRecord> records = cleanHistory(input, classifier_, log_, &stats_);

    info() << "Processing complete. Lines read: " << stats_.linesRead
           << ", Entries parsed: " << stats_.recordsParsed
           << ", Malformed: " << stats_.parseErrors
           << ", Ignored: " << stats_.recordsIgnored
           << ", Duplicates merged: " << stats_.duplicatesMerged
           << ", Commands kept: " << stats_.recordsWritten << std::endl;

    // Never replace a history file with nothing
    if (records.empty()) {
        throw HistoryError(ErrorKind::NO_VALID_COMMANDS, effectiveHistoryFilePath_.string());
    }

    if (dryRun_) {
        writeHistory(out_, records);
        out_.flush();
        info() << "Dry run: No changes made." << std::endl;
        return;
    }

    if (doBackup_) {
        backupHistoryFile(); // Throws, leaving the original untouched
    }

    atomicReplace(effectiveHistoryFilePath_, serializeHistory(records), tempFilePath_, log_);
    info() << "History cleaning complete." << std::endl;
}

void HistoryCleaner::backupHistoryFile() {
    backupFilePath_ = effectiveHistoryFilePath_.parent_path() /
                      (effectiveHistoryFilePath_.filename().string() + BACKUP_INFIX + randomAlnum(RANDOM_NAME_LENGTH));

    std::error_code ec;
    fs::copy_file(effectiveHistoryFilePath_, backupFilePath_, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::string failed = backupFilePath_.string();
        backupFilePath_.clear(); // Clear the path since backup failed
        throw HistoryError::ioFailure(failed, "Failed to create backup file (" + ec.message() + ")");
    }
    info() << "Backup created: " << backupFilePath_.string() << std::endl;
}
