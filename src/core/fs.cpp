#include "core/fs.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace core::fs {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Generates a short random suffix for temporary file names.
static std::string random_suffix()
{
    static constexpr char CHARS[] =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr int SUFFIX_LEN = 8;

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(
        0, static_cast<int>(sizeof(CHARS) - 2));

    std::string suffix;
    suffix.reserve(SUFFIX_LEN);
    for (int i = 0; i < SUFFIX_LEN; ++i) {
        suffix.push_back(CHARS[dist(rng)]);
    }
    return suffix;
}

/// Returns a temporary path adjacent to `target` (same parent directory).
static path temp_path_for(const path& target)
{
    return target.parent_path() /
           (target.filename().string() + ".tmp." + random_suffix());
}

static std::string errno_text(const std::string& what, const path& p)
{
    return what + " '" + p.string() + "': " + std::strerror(errno);
}

// ---------------------------------------------------------------------------
// Directory / path utilities
// ---------------------------------------------------------------------------

bool ensure_directory(const path& dir)
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    return std::filesystem::create_directories(dir, ec) || !ec;
}

bool file_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

bool rename_safe(const path& src, const path& dst)
{
    // rename(2) is atomic on the same filesystem and replaces the target.
    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    return !ec;
}

// ---------------------------------------------------------------------------
// Read / write
// ---------------------------------------------------------------------------

std::optional<std::string> read_file(const path& p)
{
    std::ifstream ifs(p, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        return std::nullopt;
    }

    auto size = ifs.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    ifs.seekg(0, std::ios::beg);

    std::string content;
    content.resize(static_cast<size_t>(size));
    if (!ifs.read(content.data(), size)) {
        return std::nullopt;
    }
    return content;
}

Result<void> write_file(const path& p, std::string_view content)
{
    if (p.has_parent_path() && !ensure_directory(p.parent_path())) {
        return make_error(ErrorCode::STORAGE_ERROR,
                          "cannot create directory for '" + p.string() + "'");
    }

    path tmp = temp_path_for(p);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_error(ErrorCode::STORAGE_ERROR, errno_text("open", tmp));
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = make_error(ErrorCode::STORAGE_ERROR,
                                  errno_text("write", tmp));
            ::close(fd);
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return err;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        auto err = make_error(ErrorCode::STORAGE_ERROR, errno_text("fsync", tmp));
        ::close(fd);
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return err;
    }
    ::close(fd);

    if (!rename_safe(tmp, p)) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return make_error(ErrorCode::STORAGE_ERROR,
                          "cannot rename '" + tmp.string() + "' to '" +
                          p.string() + "'");
    }
    return make_ok();
}

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::FileLock(const path& p)
    : lock_path_(p)
{
}

FileLock::~FileLock()
{
    unlock();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

FileLock::FileLock(FileLock&& other) noexcept
    : lock_path_(std::move(other.lock_path_))
    , locked_(other.locked_)
    , fd_(other.fd_)
{
    other.locked_ = false;
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept
{
    if (this != &other) {
        unlock();
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        other.fd_ = -1;

        lock_path_ = std::move(other.lock_path_);
        locked_ = other.locked_;
        other.locked_ = false;
    }
    return *this;
}

Result<void> FileLock::open_fd()
{
    if (fd_ >= 0) {
        return make_ok();
    }
    fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return make_error(ErrorCode::STORAGE_ERROR,
                          errno_text("open lock file", lock_path_));
    }
    return make_ok();
}

bool FileLock::try_lock()
{
    if (locked_) {
        return true;
    }
    if (!open_fd().ok()) {
        return false;
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        return false;
    }
    locked_ = true;
    return true;
}

Result<void> FileLock::lock()
{
    if (locked_) {
        return make_ok();
    }
    CHAINBOARD_TRY_VOID(open_fd());

    while (::flock(fd_, LOCK_EX) != 0) {
        if (errno != EINTR) {
            return make_error(ErrorCode::STORAGE_LOCKED,
                              errno_text("flock", lock_path_));
        }
    }
    locked_ = true;
    return make_ok();
}

void FileLock::unlock()
{
    if (!locked_) {
        return;
    }
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
    }
    locked_ = false;
}

} // namespace core::fs
