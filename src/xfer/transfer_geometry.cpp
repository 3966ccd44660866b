#include "bulkxfer/xfer/transfer_geometry.h"
#include "bulkxfer/base/error_code.h"
#include <algorithm>
#include <string>

namespace bulkxfer {

uint32_t bulk_packet_transmit_size(uint32_t block_size) {
    return block_size + BULK_PACKET_MESSAGE_OVERHEAD;
}

uint32_t default_packet_size(uint32_t block_size) {
    return bulk_packet_transmit_size(block_size) + FULL_HEADERS_LENGTH_ONE_MESSAGE;
}

uint64_t TransferGeometry::compute_block_count(uint64_t total_size, uint32_t block_size) {
    return total_size / block_size + (total_size % block_size > 0 ? 1 : 0);
}

TransferGeometry::TransferGeometry(uint64_t total_size, uint32_t block_size,
                                   const PacketSizeFunction& packet_size_fn)
    : total_size_(total_size), block_size_(block_size), block_count_(0), packet_size_(0) {
    if (block_size == 0) {
        throw BulkXferError(ErrorCode::InvalidArgument, "block size must be greater than zero");
    }

    uint64_t blocks = compute_block_count(total_size, block_size);
    if (blocks > MAX_BLOCK_COUNT) {
        throw BulkXferError(ErrorCode::InvalidArgument,
                            "transfer of " + std::to_string(total_size) + " bytes needs " +
                            std::to_string(blocks) + " blocks, too big");
    }
    block_count_ = static_cast<uint32_t>(blocks);
    packet_size_ = packet_size_fn ? packet_size_fn(block_size) : default_packet_size(block_size);
}

uint32_t TransferGeometry::block_length(uint32_t block) const {
    if (block >= block_count_) {
        return 0;
    }
    uint64_t remaining = total_size_ - block_offset(block);
    return static_cast<uint32_t>(std::min<uint64_t>(block_size_, remaining));
}

} // namespace bulkxfer
