#include "tagreg/tag_store.hpp"
#include "tagreg/registry_error.hpp"
#include "tagreg/store_format.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace tagreg {

namespace {

std::atomic<uint64_t> tempCounter{0};

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

std::filesystem::path tempPathFor(const std::filesystem::path& path) {
    auto temp = path;
    temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(tempCounter.fetch_add(1));
    return temp;
}

void writeAll(int fd, std::string_view content, const std::filesystem::path& temp) {
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throwErrno("write " + temp.string());
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
}

// Make the rename itself durable. Runs after the rename has committed the new
// contents, so a failure here is reported but not thrown.
void syncDirectory(const std::filesystem::path& dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        std::cerr << "[TagStore] WARNING: cannot open directory " << dir.string()
                  << " to sync: " << std::strerror(errno) << "\n";
        return;
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    // Some filesystems refuse fsync on directories
    if (rc != 0 && err != EINVAL && err != EROFS) {
        std::cerr << "[TagStore] WARNING: fsync of directory " << dir.string()
                  << " failed: " << std::strerror(err) << "\n";
    }
}

bool isTemporaryOf(const std::string& name, const std::string& target) {
    const std::string prefix = target + ".tmp.";
    return name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0;
}

}  // anonymous namespace

void writeFileAtomically(const std::filesystem::path& path, std::string_view content) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    auto temp = tempPathFor(path);
    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throwErrno("create " + temp.string());
    }

    try {
        writeAll(fd, content, temp);
        if (::fsync(fd) != 0) {
            throwErrno("fsync " + temp.string());
        }
        if (::close(fd) != 0) {
            fd = -1;
            throwErrno("close " + temp.string());
        }
        fd = -1;
        if (::rename(temp.c_str(), path.c_str()) != 0) {
            throwErrno("rename " + temp.string() + " -> " + path.string());
        }
    } catch (...) {
        if (fd >= 0) {
            ::close(fd);
        }
        ::unlink(temp.c_str());
        throw;
    }

    syncDirectory(parent);
}

// ============================================================================
// TagStore
// ============================================================================

TagStore::TagStore(std::filesystem::path path)
    : path_(std::move(path)) {
}

std::filesystem::path TagStore::lockPath() const {
    auto lock = path_;
    lock += ".lock";
    return lock;
}

bool TagStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

RegistryState TagStore::read() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        if (!exists()) {
            return RegistryState{};
        }
        throw RegistryError("cannot read tag store " + path_.string(), path_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw RegistryError("error reading tag store " + path_.string(), path_);
    }

    return parseStore(buffer.str(), path_);
}

size_t TagStore::removeStaleTemporaries() const {
    auto dir = path_.parent_path();
    const std::string target = path_.filename().string();

    std::error_code ec;
    std::filesystem::directory_iterator it(dir.empty() ? "." : dir, ec);
    if (ec) {
        return 0;  // directory doesn't exist yet
    }

    size_t removed = 0;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!isTemporaryOf(it->path().filename().string(), target)) continue;
        std::error_code removeEc;
        if (std::filesystem::remove(it->path(), removeEc)) {
            ++removed;
        } else if (removeEc) {
            std::cerr << "[TagStore] WARNING: cannot remove stale " << it->path().string()
                      << ": " << removeEc.message() << "\n";
        }
    }
    return removed;
}

void TagStore::write(const RegistryState& state) const {
    try {
        writeFileAtomically(path_, formatStore(state));
    } catch (const std::system_error& e) {
        // Also covers std::filesystem::filesystem_error from create_directories
        throw StoreUnwritable("cannot write tag store " + path_.string() + ": " + e.what(), path_);
    }
}

}  // namespace tagreg
