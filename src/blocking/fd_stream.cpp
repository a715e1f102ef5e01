#include "cancelio/blocking/fd_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <fcntl.h>
#include <sys/uio.h>
#include <unistd.h>
#include <vector>

namespace cancelio::blocking {

namespace {

constexpr mode_t default_permissions = 0644;
constexpr std::size_t max_iovecs = IOV_MAX;

int to_open_flags(open_mode mode) noexcept {
    switch (mode) {
    case open_mode::read_only:
        return O_RDONLY;
    case open_mode::write_truncate:
        return O_WRONLY | O_CREAT | O_TRUNC;
    case open_mode::read_write:
        return O_RDWR | O_CREAT;
    case open_mode::append:
        return O_WRONLY | O_CREAT | O_APPEND;
    }
    return O_RDONLY;
}

int to_whence(io::seek_from::origin origin) noexcept {
    switch (origin) {
    case io::seek_from::origin::start:
        return SEEK_SET;
    case io::seek_from::origin::current:
        return SEEK_CUR;
    case io::seek_from::origin::end:
        return SEEK_END;
    }
    return SEEK_SET;
}

} // namespace

fd_stream::fd_stream(int fd) noexcept : fd_(fd) {}

fd_stream::~fd_stream() noexcept {
    reset();
}

fd_stream::fd_stream(fd_stream&& other) noexcept : fd_(other.release()) {}

fd_stream& fd_stream::operator=(fd_stream&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

result<fd_stream> fd_stream::open(const std::filesystem::path& path,
                                  open_mode mode) noexcept {
    const int fd =
        ::open(path.c_str(), to_open_flags(mode) | O_CLOEXEC, default_permissions);
    if (fd < 0) {
        return err<fd_stream>(error::from_errno());
    }
    return fd_stream{fd};
}

result<std::pair<fd_stream, fd_stream>> fd_stream::pipe() noexcept {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return err<std::pair<fd_stream, fd_stream>>(error::from_errno());
    }
    return std::pair<fd_stream, fd_stream>{fd_stream{fds[0]}, fd_stream{fds[1]}};
}

result<std::size_t> fd_stream::read(std::span<std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t read_count = ::read(fd_, buffer.data(), buffer.size());
    if (read_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(read_count);
}

result<std::size_t>
fd_stream::read_vectored(std::span<const std::span<std::byte>> buffers) {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }

    std::vector<iovec> vecs;
    vecs.reserve(std::min(buffers.size(), max_iovecs));
    for (const auto buffer : buffers) {
        if (vecs.size() == max_iovecs) {
            break;
        }
        vecs.push_back(iovec{buffer.data(), buffer.size()});
    }

    const ssize_t read_count =
        ::readv(fd_, vecs.data(), static_cast<int>(vecs.size()));
    if (read_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(read_count);
}

result<std::size_t>
fd_stream::write(std::span<const std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t write_count = ::write(fd_, buffer.data(), buffer.size());
    if (write_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(write_count);
}

result<std::size_t>
fd_stream::write_vectored(std::span<const std::span<const std::byte>> buffers) {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }

    std::vector<iovec> vecs;
    vecs.reserve(std::min(buffers.size(), max_iovecs));
    for (const auto buffer : buffers) {
        if (vecs.size() == max_iovecs) {
            break;
        }
        // writev never writes through iov_base.
        vecs.push_back(iovec{const_cast<std::byte*>(buffer.data()), buffer.size()});
    }

    const ssize_t write_count =
        ::writev(fd_, vecs.data(), static_cast<int>(vecs.size()));
    if (write_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(write_count);
}

result<void> fd_stream::flush() noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    return ok();
}

result<void> fd_stream::sync() noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    if (::fsync(fd_) == 0) {
        return ok();
    }
    return err<void>(error::from_errno());
}

result<std::uint64_t> fd_stream::seek(io::seek_from target) noexcept {
    if (!valid()) {
        return err<std::uint64_t>(make_error_from_errno(EBADF));
    }

    const off_t position =
        ::lseek(fd_, static_cast<off_t>(target.offset), to_whence(target.whence));
    if (position < 0) {
        return err<std::uint64_t>(error::from_errno());
    }
    return static_cast<std::uint64_t>(position);
}

int fd_stream::native_handle() const noexcept {
    return fd_;
}

bool fd_stream::valid() const noexcept {
    return fd_ >= 0;
}

fd_stream::operator bool() const noexcept {
    return valid();
}

int fd_stream::release() noexcept {
    const int old_fd = fd_;
    fd_ = -1;
    return old_fd;
}

void fd_stream::reset(int fd) noexcept {
    if (fd_ == fd) {
        return;
    }
    if (valid()) {
        (void)::close(fd_);
    }
    fd_ = fd;
}

void fd_stream::swap(fd_stream& other) noexcept {
    std::swap(fd_, other.fd_);
}

result<void> close_fd(int fd) noexcept {
    if (fd < 0) {
        return err<void>(make_error_from_errno(EBADF));
    }

    if (::close(fd) == 0) {
        return ok();
    }

    return err<void>(error::from_errno());
}

} // namespace cancelio::blocking
