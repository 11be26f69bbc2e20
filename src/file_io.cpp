// ============================================================================
// file_io.cpp: implementation for file_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file file_io.cpp
 */

#include "file_io.hpp"

#include <fcntl.h>         // ::open flags (O_RDONLY, O_CREAT, O_TRUNC, O_CLOEXEC)
#include <unistd.h>        // ::read, ::write, ::fsync, ::close
#include <sys/stat.h>      // ::stat, ::fchmod: carry the old file's mode over
#include <cerrno>          // errno, EINTR
#include <filesystem>      // std::filesystem::rename for the atomic swap
#include <system_error>

namespace pngme {

static std::string with_errno(const char* reason, int e) {
    return std::string(reason) + " errno=" + std::to_string(e);
}

// ---------------------------------------------------------------------------
// read_file()
// -----------
// Read until EOF in 64 KiB steps. EINTR is retried; any other read error
// fails the whole call and leaves 'out' empty.
// ---------------------------------------------------------------------------
bool read_file(const std::string& path, std::vector<uint8_t>& out, std::string& err) {
    out.clear();
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        err = with_errno("open_failed", errno);
        return false;
    }

    uint8_t chunk[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n == 0) break;                              // EOF
        if (n < 0) {
            if (errno == EINTR) continue;
            err = with_errno("read_failed", errno);
            out.clear();
            ::close(fd);
            return false;
        }
        out.insert(out.end(), chunk, chunk + n);
    }

    ::close(fd);
    return true;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// ::write may accept fewer bytes than asked; loop until everything is out.
// ---------------------------------------------------------------------------
static bool write_all(int fd, const uint8_t* p, size_t n) {
    while (n > 0) {
        ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}


// ---------------------------------------------------------------------------
// write_file_atomic()
// -------------------
// Symlinks in <path> are resolved first so the link stays a link and its
// target receives the new bytes. <target>.tmp is written with the target's
// permission bits (0644 for a new file), fsync'd, then renamed over <target>.
// The temp file is removed again on any failure.
// ---------------------------------------------------------------------------
bool write_file_atomic(const std::string& path, const std::vector<uint8_t>& bytes, std::string& err) {
    std::error_code ec;
    const std::string target = std::filesystem::weakly_canonical(path, ec).string();
    if (ec) {
        err = with_errno("resolve_failed", ec.value());
        return false;
    }
    const std::string tmp = target + ".tmp";

    struct stat st{};
    const bool existed = ::stat(target.c_str(), &st) == 0;

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        err = with_errno("open_failed", errno);
        return false;
    }

    auto fail = [&](const char* reason) {
        err = with_errno(reason, errno);
        ::close(fd);
        ::unlink(tmp.c_str());
        return false;
    };

    // fchmod is not subject to the umask, so 0600 stays 0600.
    if (existed && ::fchmod(fd, st.st_mode & 07777) != 0) return fail("chmod_failed");
    if (!write_all(fd, bytes.data(), bytes.size()))         return fail("write_failed");
    if (::fsync(fd) != 0)                                    return fail("sync_failed");
    ::close(fd);

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        err = with_errno("rename_failed", ec.value());
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

} // namespace pngme
