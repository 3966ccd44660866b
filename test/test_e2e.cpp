#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "bulkxfer/storage/block_storage.h"
#include "bulkxfer/xfer/bulk_tracker.h"
#include "test_helpers.h"

using namespace bulkxfer;
using bulkxfer::test::RecordingReceiver;
using bulkxfer::test::make_payload;

namespace fs = std::filesystem;

namespace {

// Forwards every announced block into a second tracker, as a node relaying a
// download to another peer would.
class ForwardingTransmitter : public TransmitterListener {
public:
    ForwardingTransmitter(BulkTransferTracker& upstream, BulkTransferTracker& downstream)
        : upstream_(upstream), downstream_(downstream) {}

    void on_block_received(uint32_t block) override {
        auto data = upstream_.get_block_data(block);
        if (data) {
            downstream_.received(block, *data);
        }
    }

    void on_aborted() override {
        downstream_.abort(ErrorCode::Cancelled, "upstream aborted");
    }

    void forward(const ReceptionBitmap& present) {
        for (uint32_t block = present.next_set(0); block != ReceptionBitmap::npos;
             block = present.next_set(block + 1)) {
            on_block_received(block);
        }
    }

private:
    BulkTransferTracker& upstream_;
    BulkTransferTracker& downstream_;
};

std::string temp_path(const std::string& name) {
    return (fs::temp_directory_path() /
            ("bulkxfer_e2e_" + std::to_string(::getpid()) + "_" + name)).string();
}

} // anonymous namespace

TEST_CASE("Shuffled multi-threaded transfer into a file", "[e2e][file]") {
    const uint64_t total = 1024 * 1024 + 123;
    const uint32_t block_size = 4096;
    auto payload = make_payload(total, 3);

    std::string path = temp_path("download.bin");
    fs::remove(path);
    FileStorage storage(path);
    storage.resize(total);

    BulkTransferTracker tracker(total, block_size, storage);
    auto receiver = std::make_shared<RecordingReceiver>();
    tracker.set_receiver(receiver);

    std::vector<uint32_t> order(tracker.block_count());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), std::mt19937(1234));

    std::atomic<size_t> next{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&]() {
            for (size_t i = next++; i < order.size(); i = next++) {
                uint32_t block = order[i];
                tracker.received(block, payload, tracker.geometry().block_offset(block));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    REQUIRE(tracker.has_whole_file());
    REQUIRE_FALSE(tracker.is_aborted());
    REQUIRE(receiver->aborts() == 0);

    std::vector<uint8_t> written(total);
    storage.read(0, written.data(), written.size());
    REQUIRE(written == payload);

    fs::remove(path);
}

TEST_CASE("Relay forwards a download to a second tracker", "[e2e][relay]") {
    const uint64_t total = 50000;
    const uint32_t block_size = 1000;
    auto payload = make_payload(total, 9);

    MemoryStorage upstream_storage(total);
    MemoryStorage downstream_storage(total);
    BulkTransferTracker upstream(total, block_size, upstream_storage);
    BulkTransferTracker downstream(total, block_size, downstream_storage);

    // Some blocks arrive before the relay starts
    for (uint32_t block = 0; block < 10; ++block) {
        upstream.received(block, payload, upstream.geometry().block_offset(block));
    }

    auto relay = std::make_shared<ForwardingTransmitter>(upstream, downstream);
    relay->forward(upstream.add_transmitter(relay));
    REQUIRE(downstream.blocks_received() == 10);

    for (uint32_t block = upstream.block_count(); block-- > 10;) {
        upstream.received(block, payload, upstream.geometry().block_offset(block));
    }

    REQUIRE(upstream.has_whole_file());
    REQUIRE(downstream.has_whole_file());
    REQUIRE(downstream_storage.contents() == payload);
}

TEST_CASE("Upstream abort propagates through the relay", "[e2e][relay][abort]") {
    MemoryStorage upstream_storage(10000);
    MemoryStorage downstream_storage(10000);
    BulkTransferTracker upstream(10000, 1000, upstream_storage);
    BulkTransferTracker downstream(10000, 1000, downstream_storage);
    auto downstream_receiver = std::make_shared<RecordingReceiver>();
    downstream.set_receiver(downstream_receiver);

    auto relay = std::make_shared<ForwardingTransmitter>(upstream, downstream);
    upstream.add_transmitter(relay);

    upstream.abort(ErrorCode::Timeout, "peer stopped sending");
    REQUIRE(downstream.is_aborted());
    REQUIRE(downstream.abort_reason() == ErrorCode::Cancelled);
    REQUIRE(downstream_receiver->aborts() == 1);
}
