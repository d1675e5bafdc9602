#pragma once

/**
 * @file tag_store.hpp
 * @brief The on-disk tag store file
 *
 * The store is opened per call and never held open. Writes go to a unique
 * temporary file in the same directory, are flushed to disk, then renamed
 * over the store, so a reader (or a crash) sees either the old or the new
 * complete file.
 *
 * TagStore does no locking of its own; Registry wraps calls in a FileLock on
 * lockPath().
 */

#include "tagreg/registry_state.hpp"

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace tagreg {

class TagStore {
public:
    explicit TagStore(std::filesystem::path path);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // Sidecar file used for cross-process locking ("<store>.lock")
    [[nodiscard]] std::filesystem::path lockPath() const;

    [[nodiscard]] bool exists() const;

    /// Read and parse the store. A missing store is an empty state.
    /// Throws StoreCorrupt on unparsable contents, RegistryError if the file
    /// exists but can't be read.
    [[nodiscard]] RegistryState read() const;

    /// Atomically replace the store with the serialized state.
    /// Creates parent directories. Throws StoreUnwritable, in which case the
    /// store still holds its previous contents.
    void write(const RegistryState& state) const;

    /// Delete "<store>.tmp.*" files left by writers that died mid-write.
    /// Call only while holding the exclusive lock: every writer creates its
    /// temp file under that lock, so none of these belongs to a live write.
    /// Returns the number removed.
    size_t removeStaleTemporaries() const;

private:
    std::filesystem::path path_;
};

/// Write content to path via temp file + fsync + rename (+ directory fsync).
/// Leaves no temp file behind on failure. Throws std::system_error, only ever
/// before the rename; a failed directory fsync after it is logged, not thrown.
void writeFileAtomically(const std::filesystem::path& path, std::string_view content);

}  // namespace tagreg
