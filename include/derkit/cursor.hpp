#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "derkit/error.hpp"

namespace derkit {

// ============================================================================
// ByteView
// ============================================================================

// Non-owning view over a contiguous range of bytes.
class ByteView {
public:
    ByteView() = default;
    ByteView(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    ByteView(const std::vector<uint8_t>& bytes) : data_(bytes.data()), size_(bytes.size()) {}

    template <size_t N>
    ByteView(const std::array<uint8_t, N>& bytes) : data_(bytes.data()), size_(N) {}

    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const uint8_t* begin() const { return data_; }
    const uint8_t* end() const { return data_ + size_; }

    uint8_t operator[](size_t i) const { return data_[i]; }

    // Caller guarantees offset + count <= size()
    ByteView subview(size_t offset, size_t count) const { return ByteView(data_ + offset, count); }
    ByteView subview(size_t offset) const { return ByteView(data_ + offset, size_ - offset); }

    std::vector<uint8_t> to_vector() const { return std::vector<uint8_t>(begin(), end()); }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

bool operator==(const ByteView& a, const ByteView& b);
inline bool operator!=(const ByteView& a, const ByteView& b) { return !(a == b); }

// ============================================================================
// Cursor
// ============================================================================

/**
 * @brief Bounds-checked reader over an immutable buffer.
 *
 * A cursor never reads past the end of its buffer; every short read is
 * reported as ErrorCode::Truncated. Positions are relative to the cursor's
 * own buffer, `offset()` is relative to the root buffer the cursor was
 * (transitively) opened on.
 *
 * @example
 * ```cpp
 * derkit::Cursor cursor(bytes);
 * auto mark = cursor.position();
 * auto b = cursor.read_byte();
 * cursor.restore(mark);  // back to where we started
 * ```
 */
class Cursor {
public:
    Cursor() = default;
    explicit Cursor(ByteView buffer, size_t base_offset = 0)
        : buffer_(buffer), base_(base_offset) {}

    // Next byte without consuming it, or nullopt at end
    std::optional<uint8_t> peek() const;

    // Consume exactly one byte
    DecodeResult<uint8_t> read_byte();

    // Consume exactly n bytes; the returned view borrows the buffer
    DecodeResult<ByteView> read_n(size_t n);

    size_t position() const { return pos_; }
    void restore(size_t position) { pos_ = position; }

    size_t remaining() const { return buffer_.size() - pos_; }
    bool at_end() const { return pos_ >= buffer_.size(); }

    // Absolute offset of the current position in the root buffer
    size_t offset() const { return base_ + pos_; }

private:
    ByteView buffer_;
    size_t pos_ = 0;
    size_t base_ = 0;
};

} // namespace derkit
