#include "bulkxfer/xfer/bulk_tracker.h"
#include "bulkxfer/base/logger.h"
#include "bulkxfer/xfer/abort_state.h"
#include <atomic>
#include <mutex>

namespace bulkxfer {

struct BulkTransferTracker::Impl {
    TransferGeometry geometry;
    BlockStorage& storage;

    // Everything below is guarded by mutex
    mutable std::mutex mutex;
    ReceptionBitmap bitmap;
    ListenerRegistry listeners;
    AbortState abort_state;
    uint64_t blocks_accepted = 0;
    uint64_t duplicate_blocks = 0;

    std::atomic<uint64_t> bytes_written{0};
    std::atomic<uint64_t> bytes_read{0};
    std::atomic<uint64_t> write_failures{0};
    std::atomic<uint64_t> read_failures{0};

    Impl(const TransferGeometry& geo, BlockStorage& st, InitialState initial_state)
        : geometry(geo),
          storage(st),
          bitmap(geo.block_count(), initial_state == InitialState::AllReceived) {}

    std::string describe() const {
        return std::to_string(geometry.total_size()) + " bytes/" +
               std::to_string(geometry.block_count()) + " blocks on " + storage.describe();
    }
};

BulkTransferTracker::BulkTransferTracker(const TransferGeometry& geometry, BlockStorage& storage,
                                         InitialState initial_state)
    : impl_(std::make_unique<Impl>(geometry, storage, initial_state)) {
    Logger::instance().debug("Tracking bulk transfer of {} ({} bytes per block, packet size {})",
                             impl_->describe(), geometry.block_size(), geometry.packet_size());
}

BulkTransferTracker::BulkTransferTracker(uint64_t total_size, uint32_t block_size, BlockStorage& storage,
                                         InitialState initial_state,
                                         const PacketSizeFunction& packet_size_fn)
    : BulkTransferTracker(TransferGeometry(total_size, block_size, packet_size_fn), storage, initial_state) {}

BulkTransferTracker::~BulkTransferTracker() = default;

void BulkTransferTracker::received(uint32_t block, const uint8_t* data, size_t length) {
    const TransferGeometry& geometry = impl_->geometry;
    if (!geometry.contains(block)) {
        throw BulkXferError(ErrorCode::InvalidArgument,
                            "block " + std::to_string(block) + " out of range (" +
                            std::to_string(geometry.block_count()) + " blocks)");
    }
    uint32_t block_length = geometry.block_length(block);
    if (data == nullptr || length < block_length) {
        throw BulkXferError(ErrorCode::InvalidArgument,
                            "block " + std::to_string(block) + " needs " + std::to_string(block_length) +
                            " bytes, got " + std::to_string(data ? length : 0));
    }

    std::shared_ptr<const TransmitterList> notify;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->bitmap.is_set(block)) {
            // Marked before the write, assuming it succeeds
            impl_->bitmap.set_bit(block);
            ++impl_->blocks_accepted;
            notify = impl_->listeners.transmitters();
        } else {
            ++impl_->duplicate_blocks;
        }
    }
    if (!notify) {
        Logger::instance().debug("Ignoring duplicate block {}", block);
        return;
    }

    try {
        impl_->storage.write(geometry.block_offset(block), data, block_length);
        impl_->bytes_written += block_length;
    } catch (const std::exception& e) {
        ++impl_->write_failures;
        Logger::instance().error("Failed to store received block {} of {}: {}",
                                 block, impl_->describe(), e.what());
        abort(ErrorCode::IOError, e.what());
    }

    ListenerRegistry::notify_block_received(notify, block);
}

void BulkTransferTracker::received(uint32_t block, const std::vector<uint8_t>& buffer, size_t offset) {
    if (offset > buffer.size()) {
        throw BulkXferError(ErrorCode::InvalidArgument,
                            "offset " + std::to_string(offset) + " beyond buffer of " +
                            std::to_string(buffer.size()) + " bytes");
    }
    received(block, buffer.data() + offset, buffer.size() - offset);
}

std::optional<std::vector<uint8_t>> BulkTransferTracker::get_block_data(uint32_t block) {
    const TransferGeometry& geometry = impl_->geometry;
    if (!geometry.contains(block)) {
        Logger::instance().warning("Requested block {} out of range ({} blocks)", block, geometry.block_count());
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->bitmap.is_set(block)) {
            Logger::instance().warning("Requested block {} has not been received yet", block);
            return std::nullopt;
        }
    }

    std::vector<uint8_t> data(geometry.block_length(block));
    try {
        impl_->storage.read(geometry.block_offset(block), data.data(), data.size());
        impl_->bytes_read += data.size();
    } catch (const std::exception& e) {
        ++impl_->read_failures;
        Logger::instance().error("Failed to read stored block {} of {}: {}",
                                 block, impl_->describe(), e.what());
        abort(ErrorCode::IOError, e.what());
        return std::nullopt;
    }
    return data;
}

bool BulkTransferTracker::abort(ErrorCode reason, const std::string& description) {
    ListenerSnapshot notify;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->abort_state.abort(reason, description)) {
            return false;
        }
        notify = impl_->listeners.snapshot();
    }

    Logger::instance().warning("Aborting bulk transfer of {}: {} ({})",
                               impl_->describe(), to_string(reason), description);
    ListenerRegistry::notify_aborted(notify);
    return true;
}

bool BulkTransferTracker::is_aborted() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->abort_state.is_aborted();
}

ErrorCode BulkTransferTracker::abort_reason() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->abort_state.reason();
}

std::string BulkTransferTracker::abort_description() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->abort_state.description();
}

bool BulkTransferTracker::has_whole_file() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->bitmap.count() >= impl_->geometry.block_count();
}

ReceptionBitmap BulkTransferTracker::add_transmitter(const TransmitterPtr& transmitter) {
    if (!transmitter) {
        throw BulkXferError(ErrorCode::InvalidArgument, "null transmitter");
    }

    bool aborted;
    ReceptionBitmap present;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->listeners.add_transmitter(transmitter);
        present = impl_->bitmap;
        aborted = impl_->abort_state.is_aborted();
    }

    Logger::instance().debug("Transmitter registered with {} of {} blocks present",
                             present.count(), present.size());
    // An abort that completed earlier did not see this transmitter
    if (aborted) {
        transmitter->on_aborted();
    }
    return present;
}

bool BulkTransferTracker::remove_transmitter(const TransmitterListener* transmitter) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->listeners.remove_transmitter(transmitter);
}

void BulkTransferTracker::set_receiver(const std::shared_ptr<ReceiverListener>& receiver) {
    if (!receiver) {
        throw BulkXferError(ErrorCode::InvalidArgument, "null receiver");
    }

    bool attached;
    bool aborted;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        attached = impl_->listeners.set_receiver(receiver);
        aborted = impl_->abort_state.is_aborted();
    }
    // A receiver that was already attached has been told
    if (attached && aborted) {
        receiver->on_aborted();
    }
}

void BulkTransferTracker::clear_receiver() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->listeners.clear_receiver();
}

ReceptionBitmap BulkTransferTracker::clone_blocks_received() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->bitmap;
}

bool BulkTransferTracker::is_received(uint32_t block) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->bitmap.is_set(block);
}

uint32_t BulkTransferTracker::blocks_received() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->bitmap.count();
}

size_t BulkTransferTracker::transmitter_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->listeners.transmitter_count();
}

const TransferGeometry& BulkTransferTracker::geometry() const {
    return impl_->geometry;
}

uint32_t BulkTransferTracker::block_count() const {
    return impl_->geometry.block_count();
}

uint32_t BulkTransferTracker::packet_size() const {
    return impl_->geometry.packet_size();
}

TrackerStats BulkTransferTracker::stats() const {
    TrackerStats stats;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        stats.blocks_accepted = impl_->blocks_accepted;
        stats.duplicate_blocks = impl_->duplicate_blocks;
    }
    stats.bytes_written = impl_->bytes_written.load();
    stats.bytes_read = impl_->bytes_read.load();
    stats.write_failures = impl_->write_failures.load();
    stats.read_failures = impl_->read_failures.load();
    return stats;
}

} // namespace bulkxfer
