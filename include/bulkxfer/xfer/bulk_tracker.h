#ifndef BULKXFER_XFER_BULK_TRACKER_H
#define BULKXFER_XFER_BULK_TRACKER_H

#include "bulkxfer/base/error_code.h"
#include "bulkxfer/storage/block_storage.h"
#include "bulkxfer/xfer/listener_registry.h"
#include "bulkxfer/xfer/reception_bitmap.h"
#include "bulkxfer/xfer/transfer_geometry.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bulkxfer {

enum class InitialState {
    NoneReceived,
    AllReceived   // this side already holds the whole file and re-offers it
};

struct TrackerStats {
    uint64_t blocks_accepted = 0;
    uint64_t duplicate_blocks = 0;
    uint64_t bytes_written = 0;
    uint64_t bytes_read = 0;
    uint64_t write_failures = 0;
    uint64_t read_failures = 0;
};

/**
 * Tracks which blocks of a bulk transfer have arrived, writes each block through to
 * storage and tells registered transmitters about every arrival.
 *
 * One mutex guards the bitmap, the listener registry and the abort state. It is held
 * only for bookkeeping: storage calls and listener callbacks happen after it has been
 * released, so a listener may call back into the tracker.
 *
 * A block is marked received before its write is issued. has_whole_file() can thus
 * report true while the last writes are still in flight; a failing write aborts the
 * transfer right after.
 */
class BulkTransferTracker {
public:
    // The storage must outlive the tracker
    BulkTransferTracker(const TransferGeometry& geometry, BlockStorage& storage,
                        InitialState initial_state = InitialState::NoneReceived);

    // Throws BulkXferError(InvalidArgument) for an unrepresentable geometry
    BulkTransferTracker(uint64_t total_size, uint32_t block_size, BlockStorage& storage,
                        InitialState initial_state = InitialState::NoneReceived,
                        const PacketSizeFunction& packet_size_fn = default_packet_size);

    ~BulkTransferTracker();

    BulkTransferTracker(const BulkTransferTracker&) = delete;
    BulkTransferTracker& operator=(const BulkTransferTracker&) = delete;

    // Store a block that arrived from the network. data must hold at least
    // block_length(block) bytes. Duplicates are ignored. Storage failures abort the
    // transfer instead of propagating. Throws BulkXferError(InvalidArgument) for an
    // out of range block or a short buffer, before touching any state.
    void received(uint32_t block, const uint8_t* data, size_t length);
    void received(uint32_t block, const std::vector<uint8_t>& buffer, size_t offset = 0);

    // Read a stored block back. nullopt if the block has not been received, or if the
    // read failed (which also aborts the transfer).
    std::optional<std::vector<uint8_t>> get_block_data(uint32_t block);

    // Abort the transfer and notify every listener once. Only the first call has an
    // effect; it returns true.
    bool abort(ErrorCode reason, const std::string& description);

    bool is_aborted() const;
    ErrorCode abort_reason() const;
    std::string abort_description() const;

    bool has_whole_file() const;

    // Register a transmitter. Returns the blocks present at registration, taken under
    // the same lock, so later arrivals are exactly those announced by callback.
    // If already aborted, a newly attached receiver gets on_aborted() before this returns.
    ReceptionBitmap add_transmitter(const TransmitterPtr& transmitter);
    bool remove_transmitter(const TransmitterListener* transmitter);

    // Throws BulkXferError(ProtocolViolation) if another receiver is attached.
    // If already aborted, a newly attached receiver gets on_aborted() before this returns.
    void set_receiver(const std::shared_ptr<ReceiverListener>& receiver);
    void clear_receiver();

    ReceptionBitmap clone_blocks_received() const;
    bool is_received(uint32_t block) const;
    uint32_t blocks_received() const;
    size_t transmitter_count() const;

    const TransferGeometry& geometry() const;
    uint32_t block_count() const;
    uint32_t packet_size() const;

    TrackerStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bulkxfer

#endif // BULKXFER_XFER_BULK_TRACKER_H
