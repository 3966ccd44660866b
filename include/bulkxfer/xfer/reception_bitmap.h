#ifndef BULKXFER_XFER_RECEPTION_BITMAP_H
#define BULKXFER_XFER_RECEPTION_BITMAP_H

#include <cstdint>
#include <vector>

namespace bulkxfer {

// Presence set over block indices with a cached count of set bits.
// Copying yields an independent snapshot.
class ReceptionBitmap {
public:
    static constexpr uint32_t npos = UINT32_MAX;

    explicit ReceptionBitmap(uint32_t size = 0, bool all_set = false);

    uint32_t size() const { return size_; }
    uint32_t count() const { return count_; }
    bool all_set() const { return count_ == size_; }
    bool none_set() const { return count_ == 0; }

    // Out of range indices read as clear
    bool is_set(uint32_t index) const;

    // Returns true if the bit was clear. Throws BulkXferError(InvalidArgument) when out of range.
    bool set_bit(uint32_t index);

    void set_all();
    void clear_all();

    // First set/clear bit at or after from, npos if none
    uint32_t next_set(uint32_t from) const;
    uint32_t next_clear(uint32_t from) const;

    // Packed MSB-first form, bit 0 is the high bit of byte 0
    std::vector<uint8_t> to_bytes() const;
    static ReceptionBitmap from_bytes(const std::vector<uint8_t>& bytes, uint32_t size);

    bool operator==(const ReceptionBitmap& other) const {
        return size_ == other.size_ && words_ == other.words_;
    }
    bool operator!=(const ReceptionBitmap& other) const { return !(*this == other); }

private:
    uint32_t scan(uint32_t from, bool want_set) const;
    void mask_tail();

    std::vector<uint64_t> words_;
    uint32_t size_;
    uint32_t count_;
};

} // namespace bulkxfer

#endif // BULKXFER_XFER_RECEPTION_BITMAP_H
