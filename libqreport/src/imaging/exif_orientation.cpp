#include "../../include/exif_orientation.hpp"
#include <cstdint>
#include <cstring>

namespace qreport::imaging {

namespace {

constexpr uint16_t kOrientationTag = 0x0112;
constexpr uint16_t kTypeShort = 3;

struct TiffReader {
    std::span<const unsigned char> data;
    bool little_endian = true;

    [[nodiscard]] bool has(const size_t offset, const size_t len) const noexcept {
        return offset <= data.size() && len <= data.size() - offset;
    }

    [[nodiscard]] uint16_t u16(const size_t offset) const noexcept {
        const auto a = data[offset];
        const auto b = data[offset + 1];
        return little_endian ? static_cast<uint16_t>(a | (b << 8))
                             : static_cast<uint16_t>((a << 8) | b);
    }

    [[nodiscard]] uint32_t u32(const size_t offset) const noexcept {
        const uint32_t lo = u16(offset);
        const uint32_t hi = u16(offset + 2);
        return little_endian ? (lo | (hi << 16)) : ((lo << 16) | hi);
    }
};

} // namespace

int parse_exif_orientation(const std::span<const unsigned char> app1) noexcept {
    static constexpr unsigned char kExifHeader[6] = {'E', 'x', 'i', 'f', 0, 0};
    if (app1.size() < 6 + 8 || std::memcmp(app1.data(), kExifHeader, 6) != 0) {
        return 1;
    }

    TiffReader tiff{app1.subspan(6)};
    if (tiff.data[0] == 'I' && tiff.data[1] == 'I') {
        tiff.little_endian = true;
    } else if (tiff.data[0] == 'M' && tiff.data[1] == 'M') {
        tiff.little_endian = false;
    } else {
        return 1;
    }
    if (tiff.u16(2) != 42) {
        return 1;
    }

    const uint32_t ifd0 = tiff.u32(4);
    if (!tiff.has(ifd0, 2)) {
        return 1;
    }
    const uint16_t count = tiff.u16(ifd0);
    for (uint16_t i = 0; i < count; ++i) {
        const size_t entry = static_cast<size_t>(ifd0) + 2 + static_cast<size_t>(i) * 12;
        if (!tiff.has(entry, 12)) {
            return 1;
        }
        if (tiff.u16(entry) != kOrientationTag) {
            continue;
        }
        if (tiff.u16(entry + 2) != kTypeShort) {
            return 1;
        }
        const uint16_t value = tiff.u16(entry + 8);
        return value >= 1 && value <= 8 ? value : 1;
    }
    return 1;
}

} // namespace qreport::imaging
