#ifndef BULKXFER_STORAGE_BLOCK_STORAGE_H
#define BULKXFER_STORAGE_BLOCK_STORAGE_H

#include "bulkxfer/base/config.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bulkxfer {

// Random-access byte storage backing one transfer.
// Failures throw BulkXferError(IOError). Implementations must tolerate concurrent
// calls at disjoint offsets.
class BlockStorage {
public:
    virtual ~BlockStorage() = default;

    virtual void write(uint64_t offset, const uint8_t* data, size_t length) = 0;
    virtual void read(uint64_t offset, uint8_t* data, size_t length) = 0;

    virtual uint64_t size() const = 0;
    virtual std::string describe() const = 0;
};

// File-backed storage using pwrite/pread
class FileStorage : public BlockStorage {
public:
    enum class Mode {
        ReadWrite,  // create if missing
        ReadOnly
    };

    // Throws BulkXferError(IOError) if the file cannot be opened
    FileStorage(const std::string& path, Mode mode = Mode::ReadWrite);
    ~FileStorage() override;

    FileStorage(const FileStorage&) = delete;
    FileStorage& operator=(const FileStorage&) = delete;

    void write(uint64_t offset, const uint8_t* data, size_t length) override;
    void read(uint64_t offset, uint8_t* data, size_t length) override;

    uint64_t size() const override;
    std::string describe() const override { return "file:" + path_; }

    // Grow or shrink the file to exactly size bytes
    void resize(uint64_t size);

    // Flush written data to the device
    void sync();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

// In-memory storage of a fixed size
class MemoryStorage : public BlockStorage {
public:
    explicit MemoryStorage(uint64_t size);

    void write(uint64_t offset, const uint8_t* data, size_t length) override;
    void read(uint64_t offset, uint8_t* data, size_t length) override;

    uint64_t size() const override;
    std::string describe() const override { return "memory"; }

    std::vector<uint8_t> contents() const;

private:
    void check_range(uint64_t offset, size_t length) const;

    std::vector<uint8_t> buffer_;
    mutable std::mutex mutex_;
};

class StorageFactory {
public:
    // Build the storage described by config, sized for total_size bytes.
    // Returns nullptr (after logging) for an unknown type or an unopenable file.
    static std::unique_ptr<BlockStorage> create(const StorageConfig& config, uint64_t total_size);
};

} // namespace bulkxfer

#endif // BULKXFER_STORAGE_BLOCK_STORAGE_H
