#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "bulkxfer/base/config.h"
#include "bulkxfer/base/logger.h"
#include "bulkxfer/storage/block_storage.h"
#include "bulkxfer/xfer/bulk_tracker.h"

using namespace bulkxfer;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

// Re-serves every announced block by reading it back through the tracker,
// optionally checking it against the source.
class RelayTransmitter : public TransmitterListener {
public:
    RelayTransmitter(uint32_t id, BulkTransferTracker& tracker, BlockStorage* source)
        : id_(id), tracker_(tracker), source_(source) {}

    void serve_present(const ReceptionBitmap& present) {
        for (uint32_t block = present.next_set(0); block != ReceptionBitmap::npos;
             block = present.next_set(block + 1)) {
            on_block_received(block);
        }
    }

    void on_block_received(uint32_t block) override {
        auto data = tracker_.get_block_data(block);
        if (!data) {
            ++failed_;
            return;
        }
        if (source_) {
            std::vector<uint8_t> expected(data->size());
            try {
                source_->read(tracker_.geometry().block_offset(block), expected.data(), expected.size());
            } catch (const std::exception& e) {
                Logger::instance().error("Relay {}: cannot read source block {}: {}", id_, block, e.what());
                ++failed_;
                return;
            }
            if (expected != *data) {
                Logger::instance().error("Relay {}: block {} differs from the source", id_, block);
                ++mismatched_;
                return;
            }
        }
        ++relayed_;
    }

    void on_aborted() override {
        aborted_ = true;
        Logger::instance().info("Relay {} stopped: transfer aborted", id_);
    }

    uint32_t id() const { return id_; }
    uint64_t relayed() const { return relayed_.load(); }
    uint64_t mismatched() const { return mismatched_.load(); }
    uint64_t failed() const { return failed_.load(); }
    bool aborted() const { return aborted_.load(); }

private:
    uint32_t id_;
    BulkTransferTracker& tracker_;
    BlockStorage* source_;
    std::atomic<uint64_t> relayed_{0};
    std::atomic<uint64_t> mismatched_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<bool> aborted_{false};
};

class CompletionReceiver : public ReceiverListener {
public:
    void on_aborted() override { aborted_ = true; }
    bool aborted() const { return aborted_.load(); }

private:
    std::atomic<bool> aborted_{false};
};

class RelayApplication {
public:
    bool initialize(int argc, char* argv[]) {
        if (!Config::instance().load_from_env()) {
            return false;
        }
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            return false;
        }
        Config::instance().print();

        const auto& config = Config::instance().get();
        try {
            source_ = std::make_unique<FileStorage>(config.relay.source_path, FileStorage::Mode::ReadOnly);
            uint64_t total_size = source_->size();

            destination_ = StorageFactory::create(config.storage, total_size);
            if (!destination_) {
                return false;
            }

            InitialState initial = config.transfer.initially_complete ? InitialState::AllReceived
                                                                      : InitialState::NoneReceived;
            tracker_ = std::make_unique<BulkTransferTracker>(total_size, config.transfer.block_size,
                                                             *destination_, initial);
        } catch (const BulkXferError& e) {
            Logger::instance().error("Failed to set up transfer: {}", e.what());
            return false;
        }

        receiver_ = std::make_shared<CompletionReceiver>();
        tracker_->set_receiver(receiver_);

        for (uint32_t i = 0; i < config.relay.relay_count; ++i) {
            auto relay = std::make_shared<RelayTransmitter>(i, *tracker_,
                                                            config.relay.verify ? source_.get() : nullptr);
            relay->serve_present(tracker_->add_transmitter(relay));
            relays_.push_back(relay);
        }

        Logger::instance().info("Transferring {} bytes in {} blocks of {} bytes (packet size {})",
                                tracker_->geometry().total_size(), tracker_->block_count(),
                                tracker_->geometry().block_size(), tracker_->packet_size());
        return true;
    }

    int run() {
        const auto& config = Config::instance().get();
        auto started = std::chrono::steady_clock::now();

        std::vector<uint32_t> order = missing_blocks();
        uint32_t seed = config.relay.shuffle_seed ? config.relay.shuffle_seed : std::random_device{}();
        std::shuffle(order.begin(), order.end(), std::mt19937(seed));

        std::atomic<size_t> next{0};
        std::vector<std::thread> workers;
        for (uint32_t i = 0; i < config.relay.worker_threads; ++i) {
            workers.emplace_back([this, &order, &next]() { deliver(order, next); });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        if (!g_running) {
            tracker_->abort(ErrorCode::Cancelled, "interrupted");
        }

        if (auto* file = dynamic_cast<FileStorage*>(destination_.get())) {
            try {
                file->sync();
            } catch (const BulkXferError& e) {
                tracker_->abort(ErrorCode::IOError, e.what());
            }
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        return report(elapsed);
    }

    void shutdown() {
        if (!tracker_) return;
        for (const auto& relay : relays_) {
            tracker_->remove_transmitter(relay.get());
        }
        tracker_->clear_receiver();
    }

private:
    std::vector<uint32_t> missing_blocks() const {
        ReceptionBitmap present = tracker_->clone_blocks_received();
        std::vector<uint32_t> blocks;
        blocks.reserve(present.size() - present.count());
        for (uint32_t block = present.next_clear(0); block != ReceptionBitmap::npos;
             block = present.next_clear(block + 1)) {
            blocks.push_back(block);
        }
        return blocks;
    }

    void deliver(const std::vector<uint32_t>& order, std::atomic<size_t>& next) {
        const TransferGeometry& geometry = tracker_->geometry();
        std::vector<uint8_t> buffer(geometry.block_size());

        while (g_running && !tracker_->is_aborted()) {
            size_t i = next++;
            if (i >= order.size()) {
                break;
            }
            uint32_t block = order[i];
            uint32_t length = geometry.block_length(block);
            try {
                source_->read(geometry.block_offset(block), buffer.data(), length);
            } catch (const BulkXferError& e) {
                tracker_->abort(ErrorCode::IOError, e.what());
                break;
            }
            tracker_->received(block, buffer.data(), length);
        }
    }

    int report(long long elapsed_ms) const {
        TrackerStats stats = tracker_->stats();
        Logger::instance().info("Blocks received: {}/{}, duplicates: {}, written: {} bytes, read back: {} bytes, {} ms",
                                tracker_->blocks_received(), tracker_->block_count(), stats.duplicate_blocks,
                                stats.bytes_written, stats.bytes_read, elapsed_ms);

        bool ok = true;
        for (const auto& relay : relays_) {
            Logger::instance().info("Relay {}: relayed {}, mismatched {}, failed {}",
                                    relay->id(), relay->relayed(), relay->mismatched(), relay->failed());
            if (relay->mismatched() || relay->failed()) {
                ok = false;
            }
        }

        if (tracker_->is_aborted()) {
            Logger::instance().error("Transfer aborted: {} ({})",
                                     to_string(tracker_->abort_reason()), tracker_->abort_description());
            return 1;
        }
        if (!tracker_->has_whole_file()) {
            Logger::instance().error("Transfer incomplete");
            return 1;
        }
        if (!ok) {
            return 1;
        }
        Logger::instance().info("Transfer complete");
        return 0;
    }

    std::unique_ptr<FileStorage> source_;
    std::unique_ptr<BlockStorage> destination_;
    std::unique_ptr<BulkTransferTracker> tracker_;
    std::shared_ptr<CompletionReceiver> receiver_;
    std::vector<std::shared_ptr<RelayTransmitter>> relays_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    RelayApplication app;
    if (!app.initialize(argc, argv)) {
        return 1;
    }

    int rc = app.run();
    app.shutdown();
    return rc;
}
