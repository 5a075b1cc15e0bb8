#include "derkit/cursor.hpp"

#include <cstring>

namespace derkit {

bool operator==(const ByteView& a, const ByteView& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return std::memcmp(a.data(), b.data(), a.size()) == 0;
}

std::optional<uint8_t> Cursor::peek() const {
    if (at_end()) return std::nullopt;
    return buffer_[pos_];
}

DecodeResult<uint8_t> Cursor::read_byte() {
    if (at_end()) return failure<uint8_t>(ErrorCode::Truncated, offset());
    return success(buffer_[pos_++]);
}

DecodeResult<ByteView> Cursor::read_n(size_t n) {
    // Compare against remaining() so a huge n cannot overflow pos_ + n
    if (n > remaining()) return failure<ByteView>(ErrorCode::Truncated, offset());
    ByteView out = buffer_.subview(pos_, n);
    pos_ += n;
    return success(out);
}

} // namespace derkit
