#include "tagreg/file_lock.hpp"
#include "tagreg/registry_error.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace tagreg {

namespace {

constexpr auto MIN_POLL = std::chrono::milliseconds(1);
constexpr auto MAX_POLL = std::chrono::milliseconds(50);

std::string errnoText(int err) {
    return std::strerror(err);
}

// Directory can't take a new lock file, so it can't take a new store either
bool isReadOnlyError(int err) {
    return err == EACCES || err == EPERM || err == EROFS || err == ENOENT;
}

int openShared(const std::filesystem::path& lockPath, const std::filesystem::path& storePath) {
    int fd = ::open(lockPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) {
        return fd;
    }
    if (errno != ENOENT) {
        throw StoreUnwritable("cannot open lock file " + lockPath.string() + ": " + errnoText(errno),
                              storePath);
    }

    // No writer has run yet; create the file if the directory allows it
    fd = ::open(lockPath.c_str(), O_RDONLY | O_CREAT | O_CLOEXEC, 0666);
    if (fd < 0 && !isReadOnlyError(errno)) {
        throw StoreUnwritable("cannot create lock file " + lockPath.string() + ": " + errnoText(errno),
                              storePath);
    }
    return fd;
}

int openExclusive(const std::filesystem::path& lockPath, const std::filesystem::path& storePath) {
    auto parent = lockPath.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreUnwritable("cannot create directory " + parent.string() + ": " + ec.message(),
                                  storePath);
        }
    }

    int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
    if (fd < 0) {
        throw StoreUnwritable("cannot open lock file " + lockPath.string() + ": " + errnoText(errno),
                              storePath);
    }
    return fd;
}

}  // anonymous namespace

FileLock::FileLock(const std::filesystem::path& lockPath, LockMode mode,
                   std::chrono::milliseconds timeout,
                   const std::filesystem::path& storePath)
    : mode_(mode) {
    int fd = mode == LockMode::Shared ? openShared(lockPath, storePath)
                                      : openExclusive(lockPath, storePath);
    if (fd < 0) {
        return;
    }

    const int op = (mode == LockMode::Shared ? LOCK_SH : LOCK_EX) | LOCK_NB;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto delay = MIN_POLL;

    while (::flock(fd, op) != 0) {
        int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err != EWOULDBLOCK) {
            ::close(fd);
            throw StoreUnwritable("cannot lock " + lockPath.string() + ": " + errnoText(err),
                                  storePath);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            throw StoreUnwritable("timed out after " + std::to_string(timeout.count()) +
                                  " ms waiting for lock " + lockPath.string(), storePath);
        }
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, MAX_POLL);
    }

    fd_ = fd;
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(other.fd_), mode_(other.mode_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        mode_ = other.mode_;
        other.fd_ = -1;
    }
    return *this;
}

void FileLock::release() {
    if (fd_ >= 0) {
        // Closing the descriptor drops the flock
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace tagreg
