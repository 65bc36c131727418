#include "printer/OutputSink.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <unistd.h>

namespace thermo::printer {

namespace {
    constexpr int WRITE_POLL_TIMEOUT_MS = 100;

    // Device nodes are never created: a missing printer must fail to open
    bool is_device_path(const std::filesystem::path& path) {
        auto normal = path.lexically_normal();
        auto first = normal.begin();
        return normal.is_absolute() && first != normal.end() && ++first != normal.end() && *first == "dev";
    }
}

std::unique_ptr<FileDescriptorSink> FileDescriptorSink::open(const std::filesystem::path& path) {
    if (path == "-") {
        util::Logger::info("FileDescriptorSink: Writing to stdout");
        return std::make_unique<FileDescriptorSink>(STDOUT_FILENO, false, "stdout");
    }

    // Plain files are created on demand so output can be captured to disk
    int flags = O_WRONLY | O_APPEND | O_CLOEXEC;
    if (!is_device_path(path)) {
        flags |= O_CREAT;
    }
    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        util::Logger::error(std::format("FileDescriptorSink: Cannot open {}: {}",
                                        path.string(), std::strerror(errno)));
        return nullptr;
    }

    util::Logger::info("FileDescriptorSink: Opened " + path.string());
    return std::make_unique<FileDescriptorSink>(fd, true, path.string());
}

FileDescriptorSink::FileDescriptorSink(int fd, bool owns_fd, std::string name)
    : fd_(fd), owns_fd_(owns_fd), name_(std::move(name)) {}

FileDescriptorSink::~FileDescriptorSink() {
    if (owns_fd_ && fd_ >= 0) {
        ::close(fd_);
    }
}

bool FileDescriptorSink::write(std::string_view bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;

        // Non-blocking device with a full buffer: wait for it to drain
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfd = {fd_, POLLOUT, 0};
            poll(&pfd, 1, WRITE_POLL_TIMEOUT_MS);
            continue;
        }

        last_error_ = (n < 0) ? std::strerror(errno) : "device accepted no data";
        util::Logger::error(std::format("FileDescriptorSink: Write to {} failed after {}/{} bytes: {}",
                                        name_, written, bytes.size(), last_error_));
        return false;
    }

    if (bytes.size() > 100) {
        util::Logger::debug(std::format("FileDescriptorSink: Wrote {} bytes to {}", written, name_));
    }
    return true;
}

bool FileDescriptorSink::flush() {
    // Character devices and pipes have nothing to sync
    if (::fsync(fd_) < 0 && errno != EINVAL && errno != EROFS && errno != ENOTSUP) {
        last_error_ = std::strerror(errno);
        util::Logger::error(std::format("FileDescriptorSink: Flush of {} failed: {}", name_, last_error_));
        return false;
    }
    return true;
}

bool BufferSink::write(std::string_view bytes) {
    data_.append(bytes);
    return true;
}

bool BufferSink::flush() {
    ++flush_count_;
    return true;
}

}  // namespace thermo::printer
