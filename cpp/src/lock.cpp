#include "internal.h"
#include "blobstrip/error.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#ifdef BLOBSTRIP_POSIX_LOCK
#  include <fcntl.h>
#  include <sys/file.h>
#  include <unistd.h>
#  include <errno.h>
#  include <cstring>
#endif

#ifdef _WIN32
#  include <windows.h>
#endif

namespace blobstrip {
namespace lock {

#ifdef BLOBSTRIP_POSIX_LOCK

namespace {

/// RAII POSIX flock guard.
class FlockGuard : public StoreLock {
public:
    explicit FlockGuard(int f) : fd_(f) {}
    ~FlockGuard() override {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }
    FlockGuard(const FlockGuard&) = delete;
    FlockGuard& operator=(const FlockGuard&) = delete;

private:
    int fd_;
};

} // anonymous namespace

/// Acquire an advisory file lock on `lock_path`. In Wait mode retry every
/// 50 ms until `timeout`; in Try mode give up at once.
std::unique_ptr<StoreLock> acquire_file_lock(const std::filesystem::path& lock_path,
                                             LockMode mode,
                                             std::chrono::milliseconds timeout) {
    auto lock_str = lock_path.string();

    int fd = ::open(lock_str.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw IoError("cannot open lock file: " + lock_str +
                      ": " + std::strerror(errno));
    }

    using namespace std::chrono;
    auto deadline = steady_clock::now() + timeout;
    while (true) {
        int rc = ::flock(fd, LOCK_EX | LOCK_NB);
        if (rc == 0) break; // acquired

        if (errno != EWOULDBLOCK) {
            int err = errno;
            ::close(fd);
            throw IoError(std::string("flock failed: ") + std::strerror(err));
        }

        if (mode == LockMode::Try || steady_clock::now() >= deadline) {
            ::close(fd);
            throw StoreUnavailableError("repository is locked: " + lock_str);
        }

        std::this_thread::sleep_for(milliseconds(50));
    }

    return std::make_unique<FlockGuard>(fd);
}

#elif defined(_WIN32)

namespace {

class FileHandleLock : public StoreLock {
public:
    explicit FileHandleLock(HANDLE h) : h_(h) {}
    ~FileHandleLock() override {
        OVERLAPPED ov = {};
        UnlockFileEx(h_, 0, MAXDWORD, MAXDWORD, &ov);
        CloseHandle(h_);
    }
    FileHandleLock(const FileHandleLock&) = delete;
    FileHandleLock& operator=(const FileHandleLock&) = delete;

private:
    HANDLE h_;
};

} // anonymous namespace

std::unique_ptr<StoreLock> acquire_file_lock(const std::filesystem::path& lock_path,
                                             LockMode mode,
                                             std::chrono::milliseconds timeout) {
    auto lock_str = lock_path.string();

    using namespace std::chrono;
    auto deadline = steady_clock::now() + timeout;

    HANDLE h = INVALID_HANDLE_VALUE;
    while (true) {
        h = CreateFileA(lock_str.c_str(),
                        GENERIC_WRITE, 0 /* exclusive */, nullptr,
                        OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h != INVALID_HANDLE_VALUE) break;

        if (mode == LockMode::Try || steady_clock::now() >= deadline) {
            throw StoreUnavailableError("repository is locked: " + lock_str);
        }

        std::this_thread::sleep_for(milliseconds(50));
    }

    OVERLAPPED ov = {};
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0,
                    MAXDWORD, MAXDWORD, &ov)) {
        CloseHandle(h);
        throw StoreUnavailableError("repository is locked: " + lock_str);
    }
    return std::make_unique<FileHandleLock>(h);
}

#else
// Fallback: no cross-process exclusion (single-process use only)
std::unique_ptr<StoreLock> acquire_file_lock(const std::filesystem::path& /*lock_path*/,
                                             LockMode /*mode*/,
                                             std::chrono::milliseconds /*timeout*/) {
    return std::make_unique<StoreLock>();
}
#endif

} // namespace lock
} // namespace blobstrip
