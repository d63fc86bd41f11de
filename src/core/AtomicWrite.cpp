#include "../../include/cleanup_history/AtomicWrite.h"
#include "../../include/cleanup_history/Constants.h" // For TMP_PREFIX
#include "../../include/cleanup_history/HistoryError.h"
#include "../../include/cleanup_history/Utils.h"      // For ScopedSignalBlock

#include <iostream>    // For std::endl, std::ostream
#include <vector>
#include <system_error>// For std::error_code
#include <cerrno>      // For errno
#include <cstdlib>     // For mkstemp
#include <cstring>     // For strerror
#include <unistd.h>    // For write, fsync, close
#include <sys/stat.h>  // For fchmod, mode bits

namespace fs = std::filesystem;

namespace {

// RAII class for file descriptor management
class FileHandle {
public:
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle() { if (fd_ != -1) ::close(fd_); }

    int get() const { return fd_; }
    bool isValid() const { return fd_ != -1; }

    // Close explicitly so the caller sees the error (deferred write errors surface here).
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

    // Prevent copying
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

private:
    int fd_;
};

std::string errnoMessage(const std::string& what) {
    return what + " (" + std::strerror(errno) + ")";
}

// Remove the temp file and report the failure
[[noreturn]] void failAndRemove(const fs::path& target, fs::path& tempPath,
                                const std::string& message, std::ostream& log) {
    std::error_code ec;
    {
        ScopedSignalBlock block; // The signal handler reads tempPath
        if (!tempPath.empty()) {
            fs::remove(tempPath, ec);
            tempPath.clear();
        }
    }
    if (ec) {
        log << "Warning: Failed to remove temporary file (" << ec.message() << ")" << std::endl;
    }
    throw HistoryError::ioFailure(target.string(), message);
}

} // namespace

void atomicReplace(const fs::path& target, const std::string& contents,
                   fs::path& tempPath, std::ostream& log) {
    fs::path parentDir = target.parent_path();
    if (parentDir.empty()) {
        parentDir = ".";
    }

    // 1. Create the temp file next to the target so rename() stays on one filesystem
    std::string templ = (parentDir / (TMP_PREFIX + "XXXXXX")).string();
    std::vector<char> nameBuf(templ.begin(), templ.end());
    nameBuf.push_back('\0');

    // Creating and publishing the name happen with signals held back, so a
    // handler either sees no file or sees its path
    int rawFd = -1;
    int createErrno = 0;
    {
        ScopedSignalBlock block;
        rawFd = mkstemp(nameBuf.data());
        createErrno = errno;
        if (rawFd != -1) {
            tempPath = fs::path(nameBuf.data());
        }
    }
    FileHandle fd(rawFd);
    if (!fd.isValid()) {
        errno = createErrno;
        throw HistoryError::ioFailure(target.string(), errnoMessage("Cannot create temporary file in " + parentDir.string()));
    }

    // 2. Carry over the permissions of the file being replaced (mkstemp uses 0600)
    std::error_code ec;
    auto status = fs::status(target, ec);
    if (!ec && fs::exists(status)) {
        auto mode = static_cast<mode_t>(status.permissions() & fs::perms::mask);
        if (fchmod(fd.get(), mode) == -1) {
            log << "Warning: " << errnoMessage("Failed to copy permissions to temporary file") << std::endl;
        }
    }

    // 3. Write everything
    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd.get(), data, remaining);
        if (written == -1) {
            if (errno == EINTR) continue;
            failAndRemove(target, tempPath, errnoMessage("Write to temporary file failed"), log);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    // 4. Flush to disk before the rename makes it visible
    if (fsync(fd.get()) == -1) {
        failAndRemove(target, tempPath, errnoMessage("fsync of temporary file failed"), log);
    }
    if (fd.close() == -1) {
        failAndRemove(target, tempPath, errnoMessage("Closing temporary file failed"), log);
    }

    // 5. Atomically swap it in
    {
        ScopedSignalBlock block;
        fs::rename(tempPath, target, ec);
        if (!ec) {
            tempPath.clear(); // Successfully renamed, nothing left to clean up
        }
    }
    if (ec) {
        failAndRemove(target, tempPath, "Failed to replace history file (" + ec.message() + ")", log);
    }
}
