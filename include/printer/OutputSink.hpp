#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace thermo::printer {

/**
 * Destination for rendered printer bytes.
 *
 * write() must either accept every byte or return false. flush() pushes
 * anything the sink itself buffers down to the device.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual bool write(std::string_view bytes) = 0;
    virtual bool flush() = 0;

    // Human-readable description of the last failure, empty if none
    virtual std::string last_error() const { return {}; }
};

/**
 * Writes to a file descriptor: a printer device node (/dev/usb/lp0), a
 * serial port, a regular file, or stdout.
 */
class FileDescriptorSink : public OutputSink {
public:
    // "-" opens stdout. Missing files are created, except under /dev.
    // Returns nullptr (and logs) if the path cannot be opened.
    static std::unique_ptr<FileDescriptorSink> open(const std::filesystem::path& path);

    // Takes ownership of `fd` when `owns_fd` is true
    FileDescriptorSink(int fd, bool owns_fd, std::string name);
    ~FileDescriptorSink() override;

    FileDescriptorSink(const FileDescriptorSink&) = delete;
    FileDescriptorSink& operator=(const FileDescriptorSink&) = delete;

    bool write(std::string_view bytes) override;
    bool flush() override;
    std::string last_error() const override { return last_error_; }

    const std::string& name() const { return name_; }

private:
    int fd_ = -1;
    bool owns_fd_ = false;
    std::string name_;
    std::string last_error_;
};

// Collects bytes in memory; used for previews and tests
class BufferSink : public OutputSink {
public:
    bool write(std::string_view bytes) override;
    bool flush() override;

    const std::string& data() const { return data_; }
    size_t flush_count() const { return flush_count_; }
    void clear() { data_.clear(); }

private:
    std::string data_;
    size_t flush_count_ = 0;
};

}  // namespace thermo::printer
