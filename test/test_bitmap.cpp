#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "bulkxfer/base/error_code.h"
#include "bulkxfer/xfer/reception_bitmap.h"

using namespace bulkxfer;

TEST_CASE("Bitmap starts clear or full", "[bitmap]") {
    ReceptionBitmap clear(100);
    REQUIRE(clear.size() == 100);
    REQUIRE(clear.count() == 0);
    REQUIRE(clear.none_set());
    REQUIRE_FALSE(clear.is_set(0));

    ReceptionBitmap full(100, true);
    REQUIRE(full.count() == 100);
    REQUIRE(full.all_set());
    for (uint32_t i = 0; i < 100; ++i) {
        REQUIRE(full.is_set(i));
    }
    // Bits past the end stay clear
    REQUIRE_FALSE(full.is_set(100));
    REQUIRE(full.next_clear(0) == ReceptionBitmap::npos);
}

TEST_CASE("Setting a bit is idempotent", "[bitmap]") {
    ReceptionBitmap bitmap(10);
    REQUIRE(bitmap.set_bit(3));
    REQUIRE(bitmap.count() == 1);
    REQUIRE_FALSE(bitmap.set_bit(3));
    REQUIRE(bitmap.count() == 1);
    REQUIRE(bitmap.is_set(3));
    REQUIRE_FALSE(bitmap.is_set(2));
}

TEST_CASE("Out of range bits", "[bitmap][error]") {
    ReceptionBitmap bitmap(10);
    REQUIRE_FALSE(bitmap.is_set(10));
    REQUIRE_THROWS_AS(bitmap.set_bit(10), BulkXferError);
    REQUIRE(bitmap.count() == 0);
}

TEST_CASE("Snapshot is independent of the original", "[bitmap]") {
    ReceptionBitmap bitmap(200);
    bitmap.set_bit(5);
    bitmap.set_bit(130);

    ReceptionBitmap snapshot = bitmap;
    bitmap.set_bit(6);

    REQUIRE(snapshot.count() == 2);
    REQUIRE_FALSE(snapshot.is_set(6));
    REQUIRE(bitmap.count() == 3);
    REQUIRE(snapshot != bitmap);
}

TEST_CASE("Scanning across word boundaries", "[bitmap][scan]") {
    ReceptionBitmap bitmap(150);
    bitmap.set_bit(0);
    bitmap.set_bit(63);
    bitmap.set_bit(64);
    bitmap.set_bit(149);

    std::vector<uint32_t> found;
    for (uint32_t i = bitmap.next_set(0); i != ReceptionBitmap::npos; i = bitmap.next_set(i + 1)) {
        found.push_back(i);
    }
    REQUIRE(found == std::vector<uint32_t>{0, 63, 64, 149});

    REQUIRE(bitmap.next_clear(0) == 1);
    REQUIRE(bitmap.next_clear(63) == 65);
    REQUIRE(bitmap.next_set(65) == 149);
    REQUIRE(bitmap.next_set(150) == ReceptionBitmap::npos);
}

TEST_CASE("Packed byte form is MSB first", "[bitmap][wire]") {
    ReceptionBitmap bitmap(10);
    bitmap.set_bit(0);
    bitmap.set_bit(7);
    bitmap.set_bit(9);

    std::vector<uint8_t> bytes = bitmap.to_bytes();
    REQUIRE(bytes == std::vector<uint8_t>{0x81, 0x40});

    ReceptionBitmap parsed = ReceptionBitmap::from_bytes(bytes, 10);
    REQUIRE(parsed == bitmap);
    REQUIRE(parsed.count() == 3);

    REQUIRE_THROWS_AS(ReceptionBitmap::from_bytes(bytes, 17), BulkXferError);
}

TEST_CASE("Set all and clear all keep the count", "[bitmap]") {
    ReceptionBitmap bitmap(70);
    bitmap.set_bit(1);
    bitmap.set_all();
    REQUIRE(bitmap.count() == 70);
    REQUIRE(bitmap.all_set());
    bitmap.clear_all();
    REQUIRE(bitmap.count() == 0);
    REQUIRE(bitmap.next_set(0) == ReceptionBitmap::npos);
}
