#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace shpkit {

// Little-endian readers
inline std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0]) |
           (static_cast<std::uint16_t>(p[1]) << 8);
}

inline std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

// Little-endian writers (append)
inline void write_le16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

inline void write_le32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

// Bounds-checked sequential reader. Every read fails instead of running past
// the end of the buffer; a failed read leaves the position unchanged.
class byte_reader {
public:
    byte_reader(std::span<const std::uint8_t> data, std::size_t pos = 0) noexcept
        : data_(data), pos_(pos) {}

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept {
        return pos_ < data_.size() ? data_.size() - pos_ : 0;
    }

    [[nodiscard]] bool read_u8(std::uint8_t& v) noexcept {
        if (remaining() < 1) return false;
        v = data_[pos_++];
        return true;
    }

    [[nodiscard]] bool read_u16(std::uint16_t& v) noexcept {
        if (remaining() < 2) return false;
        v = read_le16(data_.data() + pos_);
        pos_ += 2;
        return true;
    }

    [[nodiscard]] bool read_u32(std::uint32_t& v) noexcept {
        if (remaining() < 4) return false;
        v = read_le32(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    [[nodiscard]] bool skip(std::size_t count) noexcept {
        if (remaining() < count) return false;
        pos_ += count;
        return true;
    }

    // View of the next count bytes, advancing past them
    [[nodiscard]] bool read_bytes(std::size_t count, std::span<const std::uint8_t>& out) noexcept {
        if (remaining() < count) return false;
        out = data_.subspan(pos_, count);
        pos_ += count;
        return true;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_;
};

} // namespace shpkit
