#include "bulkxfer/xfer/reception_bitmap.h"
#include "bulkxfer/base/error_code.h"
#include <string>

namespace bulkxfer {

namespace {

constexpr uint32_t WORD_BITS = 64;

inline uint32_t word_count(uint32_t bits) {
    return bits / WORD_BITS + (bits % WORD_BITS ? 1 : 0);
}

} // anonymous namespace

ReceptionBitmap::ReceptionBitmap(uint32_t size, bool all_set)
    : words_(word_count(size), 0), size_(size), count_(0) {
    if (all_set) {
        set_all();
    }
}

bool ReceptionBitmap::is_set(uint32_t index) const {
    if (index >= size_) {
        return false;
    }
    return (words_[index / WORD_BITS] >> (index % WORD_BITS)) & 1U;
}

bool ReceptionBitmap::set_bit(uint32_t index) {
    if (index >= size_) {
        throw BulkXferError(ErrorCode::InvalidArgument,
                            "block " + std::to_string(index) + " out of range (" +
                            std::to_string(size_) + " blocks)");
    }
    uint64_t mask = uint64_t{1} << (index % WORD_BITS);
    uint64_t& word = words_[index / WORD_BITS];
    if (word & mask) {
        return false;
    }
    word |= mask;
    ++count_;
    return true;
}

void ReceptionBitmap::set_all() {
    for (auto& word : words_) {
        word = ~uint64_t{0};
    }
    mask_tail();
    count_ = size_;
}

void ReceptionBitmap::clear_all() {
    for (auto& word : words_) {
        word = 0;
    }
    count_ = 0;
}

void ReceptionBitmap::mask_tail() {
    uint32_t tail = size_ % WORD_BITS;
    if (tail && !words_.empty()) {
        words_.back() &= (uint64_t{1} << tail) - 1;
    }
}

uint32_t ReceptionBitmap::scan(uint32_t from, bool want_set) const {
    while (from < size_) {
        uint64_t word = words_[from / WORD_BITS];
        if (!want_set) {
            word = ~word;
        }
        word >>= (from % WORD_BITS);
        if (word == 0) {
            from = (from / WORD_BITS + 1) * WORD_BITS;
            continue;
        }
        while (!(word & 1U)) {
            word >>= 1;
            ++from;
        }
        return from < size_ ? from : npos;
    }
    return npos;
}

uint32_t ReceptionBitmap::next_set(uint32_t from) const {
    return scan(from, true);
}

uint32_t ReceptionBitmap::next_clear(uint32_t from) const {
    return scan(from, false);
}

std::vector<uint8_t> ReceptionBitmap::to_bytes() const {
    std::vector<uint8_t> bytes(size_ / 8 + (size_ % 8 ? 1 : 0), 0);
    for (uint32_t i = next_set(0); i != npos; i = next_set(i + 1)) {
        bytes[i / 8] |= static_cast<uint8_t>(0x80U >> (i % 8));
    }
    return bytes;
}

ReceptionBitmap ReceptionBitmap::from_bytes(const std::vector<uint8_t>& bytes, uint32_t size) {
    if (static_cast<uint64_t>(bytes.size()) * 8 < size) {
        throw BulkXferError(ErrorCode::InvalidArgument,
                            std::to_string(bytes.size()) + " bytes cannot hold " +
                            std::to_string(size) + " bits");
    }
    ReceptionBitmap bitmap(size);
    for (uint32_t i = 0; i < size; ++i) {
        if (bytes[i / 8] & (0x80U >> (i % 8))) {
            bitmap.set_bit(i);
        }
    }
    return bitmap;
}

} // namespace bulkxfer
