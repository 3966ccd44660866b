#include "bulkxfer/storage/block_storage.h"
#include "bulkxfer/base/error_code.h"
#include "bulkxfer/base/logger.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bulkxfer {

namespace {

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

} // anonymous namespace

// FileStorage implementation
FileStorage::FileStorage(const std::string& path, Mode mode)
    : path_(path) {
    int flags = (mode == Mode::ReadOnly) ? O_RDONLY : (O_RDWR | O_CREAT);
    fd_ = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw BulkXferError(ErrorCode::IOError, errno_message("cannot open", path));
    }
}

FileStorage::~FileStorage() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void FileStorage::write(uint64_t offset, const uint8_t* data, size_t length) {
    size_t written = 0;
    while (written < length) {
        ssize_t n = ::pwrite(fd_, data + written, length - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw BulkXferError(ErrorCode::IOError, errno_message("pwrite failed on", path_));
        }
        written += static_cast<size_t>(n);
    }
}

void FileStorage::read(uint64_t offset, uint8_t* data, size_t length) {
    size_t done = 0;
    while (done < length) {
        ssize_t n = ::pread(fd_, data + done, length - done,
                            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw BulkXferError(ErrorCode::IOError, errno_message("pread failed on", path_));
        }
        if (n == 0) {
            throw BulkXferError(ErrorCode::IOError,
                                "unexpected end of file reading " + std::to_string(length) +
                                " bytes at offset " + std::to_string(offset) + " of " + path_);
        }
        done += static_cast<size_t>(n);
    }
}

uint64_t FileStorage::size() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw BulkXferError(ErrorCode::IOError, errno_message("fstat failed on", path_));
    }
    return static_cast<uint64_t>(st.st_size);
}

void FileStorage::resize(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        throw BulkXferError(ErrorCode::IOError, errno_message("ftruncate failed on", path_));
    }
}

void FileStorage::sync() {
    if (::fsync(fd_) != 0) {
        throw BulkXferError(ErrorCode::IOError, errno_message("fsync failed on", path_));
    }
}

// MemoryStorage implementation
MemoryStorage::MemoryStorage(uint64_t size)
    : buffer_(static_cast<size_t>(size), 0) {}

void MemoryStorage::check_range(uint64_t offset, size_t length) const {
    if (offset > buffer_.size() || length > buffer_.size() - offset) {
        throw BulkXferError(ErrorCode::IOError,
                            "range " + std::to_string(offset) + "+" + std::to_string(length) +
                            " outside " + std::to_string(buffer_.size()) + " bytes");
    }
}

void MemoryStorage::write(uint64_t offset, const uint8_t* data, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_range(offset, length);
    std::memcpy(buffer_.data() + offset, data, length);
}

void MemoryStorage::read(uint64_t offset, uint8_t* data, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_range(offset, length);
    std::memcpy(data, buffer_.data() + offset, length);
}

uint64_t MemoryStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

std::vector<uint8_t> MemoryStorage::contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

// StorageFactory implementation
std::unique_ptr<BlockStorage> StorageFactory::create(const StorageConfig& config, uint64_t total_size) {
    if (config.type == "memory") {
        return std::make_unique<MemoryStorage>(total_size);
    }

    if (config.type != "file") {
        Logger::instance().error("Unknown storage type: {}", config.type);
        return nullptr;
    }

    try {
        auto storage = std::make_unique<FileStorage>(config.path);
        if (config.truncate) {
            storage->resize(total_size);
        }
        Logger::instance().debug("Opened {} for {} bytes", storage->describe(), total_size);
        return storage;
    } catch (const BulkXferError& e) {
        Logger::instance().error("Failed to create file storage: {}", e.what());
        return nullptr;
    }
}

} // namespace bulkxfer
