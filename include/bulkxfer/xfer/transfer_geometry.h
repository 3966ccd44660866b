#ifndef BULKXFER_XFER_TRANSFER_GEOMETRY_H
#define BULKXFER_XFER_TRANSFER_GEOMETRY_H

#include <cstdint>
#include <functional>
#include <limits>

namespace bulkxfer {

// Wire overhead of one bulk block packet, on top of the block payload
static constexpr uint32_t BULK_PACKET_MESSAGE_OVERHEAD = 4 + 4 + 8;  // uid, block number, length prefix
// Link-layer headers around a packet carrying exactly one message
static constexpr uint32_t FULL_HEADERS_LENGTH_ONE_MESSAGE = 56;

// Block indices travel as signed 32-bit integers on the wire
static constexpr uint64_t MAX_BLOCK_COUNT = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());

using PacketSizeFunction = std::function<uint32_t(uint32_t block_size)>;

// On-wire size of a message carrying one block of block_size bytes
uint32_t bulk_packet_transmit_size(uint32_t block_size);

// Default packet size: one bulk message plus full link headers
uint32_t default_packet_size(uint32_t block_size);

// Immutable size and block arithmetic of one transfer.
// Throws BulkXferError(InvalidArgument) when block_size is zero or the
// block count exceeds MAX_BLOCK_COUNT.
class TransferGeometry {
public:
    TransferGeometry(uint64_t total_size, uint32_t block_size,
                     const PacketSizeFunction& packet_size_fn = default_packet_size);

    uint64_t total_size() const { return total_size_; }
    uint32_t block_size() const { return block_size_; }
    uint32_t block_count() const { return block_count_; }
    uint32_t packet_size() const { return packet_size_; }

    // Byte offset of a block in the payload
    uint64_t block_offset(uint32_t block) const {
        return static_cast<uint64_t>(block) * block_size_;
    }

    // Length of a block; only the last one can be shorter than block_size
    uint32_t block_length(uint32_t block) const;

    bool contains(uint32_t block) const { return block < block_count_; }

    // ceil(total_size / block_size), without the range check
    static uint64_t compute_block_count(uint64_t total_size, uint32_t block_size);

private:
    uint64_t total_size_;
    uint32_t block_size_;
    uint32_t block_count_;
    uint32_t packet_size_;
};

} // namespace bulkxfer

#endif // BULKXFER_XFER_TRANSFER_GEOMETRY_H
