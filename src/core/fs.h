#pragma once

#include "core/error.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace core::fs {

/// Convenience alias so callers don't need to spell out std::filesystem::path.
using path = std::filesystem::path;

/// Creates the directory (and parents) if it does not exist.
/// Returns true on success or if the directory already exists.
bool ensure_directory(const path& dir);

/// Returns true if `p` refers to an existing regular file.
bool file_exists(const path& p);

/// Attempts an atomic rename from `src` to `dst` (rename(2)).
bool rename_safe(const path& src, const path& dst);

/// Reads the entire contents of `p` into a string.
/// Returns std::nullopt if the file cannot be opened or read.
std::optional<std::string> read_file(const path& p);

/// Writes `content` to `p` atomically: the data goes to a temporary file in
/// the same directory, is fsync'ed, then renamed over `p`. A crash leaves
/// either the previous or the new content, never a partial file.
Result<void> write_file(const path& p, std::string_view content);

// ---------------------------------------------------------------------------
// FileLock - POSIX advisory lock (flock) on a dedicated lock file.
// ---------------------------------------------------------------------------

class FileLock {
public:
    /// Does NOT acquire the lock; call try_lock() or lock().
    explicit FileLock(const path& p);

    /// Releases the lock if held and closes the descriptor.
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /// Non-blocking attempt. Returns false if another descriptor holds the
    /// lock or the lock file cannot be opened.
    bool try_lock();

    /// Blocks until the lock is acquired.
    Result<void> lock();

    /// Releases the lock if currently held.
    void unlock();

    [[nodiscard]] bool is_locked() const noexcept { return locked_; }
    [[nodiscard]] const path& lock_path() const noexcept { return lock_path_; }

private:
    Result<void> open_fd();

    path lock_path_;
    bool locked_{false};
    int fd_{-1};
};

// ---------------------------------------------------------------------------
// ScopedFileLock - holds a FileLock for the lifetime of the guard.
// ---------------------------------------------------------------------------

class ScopedFileLock {
public:
    explicit ScopedFileLock(FileLock& lock) noexcept : lock_(lock) {}
    ~ScopedFileLock() { lock_.unlock(); }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    FileLock& lock_;
};

} // namespace core::fs
