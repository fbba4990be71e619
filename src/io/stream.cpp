#include "gatefile/io/stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace gatefile {

// ============================================================================
// MemorySource
// ============================================================================

expected<size_t, Error> MemorySource::read(char* dst, size_t len) {
    if (pos_ >= data_.size()) {
        return unexpected(Error::end_of_stream());
    }
    size_t n = std::min(len, data_.size() - pos_);
    std::memcpy(dst, data_.data() + pos_, n);
    pos_ += n;
    return n;
}

expected<int64_t, Error> MemorySource::seek(int64_t offset) {
    if (offset < 0) {
        return unexpected(Error::io(IoError::InvalidArgument, "seek: negative position"));
    }
    pos_ = static_cast<size_t>(offset);
    return offset;
}

// ============================================================================
// FileSource
// ============================================================================

FileSource::~FileSource() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

expected<std::unique_ptr<FileSource>, Error> FileSource::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return unexpected(Error::file(FileError::InvalidPath, "no such file " + path));
        }
        return unexpected(Error::last_system_error("open " + path));
    }

    std::unique_ptr<FileSource> source(new FileSource(fd, path));

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return unexpected(Error::last_system_error("stat " + path));
    }

    source->directory_ = S_ISDIR(st.st_mode);
    source->size_ = static_cast<int64_t>(st.st_size);
    source->mod_time_ = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) +
            std::chrono::nanoseconds(st.st_mtim.tv_nsec)));

    return std::move(source);
}

expected<size_t, Error> FileSource::read(char* dst, size_t len) {
    if (len == 0) {
        return size_t{0};
    }
    for (;;) {
        ssize_t n = ::read(fd_, dst, len);
        if (n > 0) {
            return static_cast<size_t>(n);
        }
        if (n == 0) {
            return unexpected(Error::end_of_stream());
        }
        if (errno != EINTR) {
            return unexpected(Error::last_system_error("read " + path_));
        }
    }
}

expected<int64_t, Error> FileSource::seek(int64_t offset) {
    off_t pos = ::lseek(fd_, static_cast<off_t>(offset), SEEK_SET);
    if (pos < 0) {
        return unexpected(Error::last_system_error("seek " + path_));
    }
    return static_cast<int64_t>(pos);
}

std::string FileSource::name() const {
    std::string_view p = path_;
    while (p.size() > 1 && p.back() == '/') {
        p.remove_suffix(1);
    }
    auto slash = p.rfind('/');
    if (slash != std::string_view::npos && p.size() > 1) {
        p.remove_prefix(slash + 1);
    }
    return std::string(p);
}

// ============================================================================
// Transfer Helpers
// ============================================================================

namespace io {

namespace {
constexpr size_t kCopyBufferSize = 32 * 1024;
}

expected<int64_t, Error> copy_n(ByteWriter& dst, ByteReader& src, int64_t n) {
    std::string buffer(kCopyBufferSize, '\0');
    int64_t copied = 0;

    while (copied < n) {
        size_t want = static_cast<size_t>(
            std::min<int64_t>(static_cast<int64_t>(buffer.size()), n - copied));
        auto got = src.read(buffer.data(), want);
        if (!got) {
            if (got.error().is_end_of_stream()) {
                return unexpected(Error::io(IoError::EndOfStream, "unexpected end of content"));
            }
            return unexpected(got.error());
        }
        auto written = dst.write(std::string_view(buffer.data(), *got));
        if (!written) {
            return unexpected(written.error());
        }
        copied += static_cast<int64_t>(*got);
    }
    return copied;
}

expected<size_t, Error> read_full(ByteReader& src, char* dst, size_t len) {
    size_t total = 0;
    while (total < len) {
        auto got = src.read(dst + total, len - total);
        if (!got) {
            if (got.error().is_end_of_stream()) {
                break;
            }
            return unexpected(got.error());
        }
        total += *got;
    }
    return total;
}

expected<std::string, Error> read_all(ByteReader& src) {
    std::string out;
    char buffer[4096];
    for (;;) {
        auto got = src.read(buffer, sizeof(buffer));
        if (!got) {
            if (got.error().is_end_of_stream()) {
                return std::move(out);
            }
            return unexpected(got.error());
        }
        out.append(buffer, *got);
    }
}

} // namespace io

} // namespace gatefile
