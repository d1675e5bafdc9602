#pragma once

/**
 * @file file_lock.hpp
 * @brief Cross-process advisory lock on a sidecar file
 *
 * The store itself is replaced by rename on every write, so the lock lives on
 * a separate "<store>.lock" file whose inode never changes. Readers take a
 * shared lock, writers an exclusive one. Separate FileLock objects exclude
 * each other even within one process (each holds its own descriptor).
 *
 * Only an exclusive lock creates anything (parent directories, the lock file).
 * A shared lock opens an existing lock file read-only. If there is no lock
 * file and the directory doesn't allow creating one, no writer can replace the
 * store either, so the shared lock is granted without a descriptor (held()
 * is false).
 *
 * POSIX only (flock).
 */

#include <chrono>
#include <filesystem>

namespace tagreg {

enum class LockMode {
    Shared,
    Exclusive
};

class FileLock {
public:
    /// Block until the lock is held or timeout expires.
    /// Throws StoreUnwritable on timeout or if the lock file can't be opened
    /// (see above for shared locks in read-only directories).
    /// storePath is only used in error messages.
    FileLock(const std::filesystem::path& lockPath, LockMode mode,
             std::chrono::milliseconds timeout,
             const std::filesystem::path& storePath = {});
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] LockMode mode() const { return mode_; }
    [[nodiscard]] bool held() const { return fd_ >= 0; }

    /// Release early (destructor does this otherwise)
    void release();

private:
    int fd_ = -1;
    LockMode mode_;
};

}  // namespace tagreg
