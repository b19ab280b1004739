#include "../../include/watermark.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace qreport::imaging {

namespace {

constexpr uint32_t kGlyphWidth = 5;
constexpr uint32_t kGlyphHeight = 7;
constexpr unsigned kTextAlpha = 200;
constexpr unsigned kBandAlpha = 110;

using Glyph = std::array<unsigned char, kGlyphHeight>;

// rows top to bottom, bit 4 is the leftmost column
const Glyph& glyph_for(const char ch) {
    static constexpr Glyph kDigits[10] = {
        {0x0E, 0x11, 0x13, 0x15, 0x19, 0x11, 0x0E}, {0x04, 0x0C, 0x04, 0x04, 0x04, 0x04, 0x0E},
        {0x0E, 0x11, 0x01, 0x02, 0x04, 0x08, 0x1F}, {0x1F, 0x02, 0x04, 0x02, 0x01, 0x11, 0x0E},
        {0x02, 0x06, 0x0A, 0x12, 0x1F, 0x02, 0x02}, {0x1F, 0x10, 0x1E, 0x01, 0x01, 0x11, 0x0E},
        {0x06, 0x08, 0x10, 0x1E, 0x11, 0x11, 0x0E}, {0x1F, 0x01, 0x02, 0x04, 0x08, 0x08, 0x08},
        {0x0E, 0x11, 0x11, 0x0E, 0x11, 0x11, 0x0E}, {0x0E, 0x11, 0x11, 0x0F, 0x01, 0x02, 0x0C},
    };
    static constexpr Glyph kLetters[26] = {
        {0x0E, 0x11, 0x11, 0x11, 0x1F, 0x11, 0x11}, {0x1E, 0x11, 0x11, 0x1E, 0x11, 0x11, 0x1E},
        {0x0E, 0x11, 0x10, 0x10, 0x10, 0x11, 0x0E}, {0x1C, 0x12, 0x11, 0x11, 0x11, 0x12, 0x1C},
        {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x1F}, {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x10},
        {0x0E, 0x11, 0x10, 0x17, 0x11, 0x11, 0x0F}, {0x11, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11},
        {0x0E, 0x04, 0x04, 0x04, 0x04, 0x04, 0x0E}, {0x07, 0x02, 0x02, 0x02, 0x02, 0x12, 0x0C},
        {0x11, 0x12, 0x14, 0x18, 0x14, 0x12, 0x11}, {0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x1F},
        {0x11, 0x1B, 0x15, 0x15, 0x11, 0x11, 0x11}, {0x11, 0x11, 0x19, 0x15, 0x13, 0x11, 0x11},
        {0x0E, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}, {0x1E, 0x11, 0x11, 0x1E, 0x10, 0x10, 0x10},
        {0x0E, 0x11, 0x11, 0x11, 0x15, 0x12, 0x0D}, {0x1E, 0x11, 0x11, 0x1E, 0x14, 0x12, 0x11},
        {0x0F, 0x10, 0x10, 0x0E, 0x01, 0x01, 0x1E}, {0x1F, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04},
        {0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}, {0x11, 0x11, 0x11, 0x11, 0x11, 0x0A, 0x04},
        {0x11, 0x11, 0x11, 0x15, 0x15, 0x15, 0x0A}, {0x11, 0x11, 0x0A, 0x04, 0x0A, 0x11, 0x11},
        {0x11, 0x11, 0x11, 0x0A, 0x04, 0x04, 0x04}, {0x1F, 0x01, 0x02, 0x04, 0x08, 0x10, 0x1F},
    };
    static constexpr Glyph kSpace{};
    static constexpr Glyph kDash{0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00};
    static constexpr Glyph kColon{0x00, 0x0C, 0x0C, 0x00, 0x0C, 0x0C, 0x00};
    static constexpr Glyph kSlash{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x00};
    static constexpr Glyph kDot{0x00, 0x00, 0x00, 0x00, 0x00, 0x0C, 0x0C};
    static constexpr Glyph kUnderscore{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x1F};
    static constexpr Glyph kUnknown{0x0E, 0x11, 0x01, 0x02, 0x04, 0x00, 0x04};

    const auto c = static_cast<unsigned char>(ch);
    if (c >= '0' && c <= '9') return kDigits[c - '0'];
    if (c < 0x80 && std::isalpha(c)) return kLetters[std::toupper(c) - 'A'];
    switch (ch) {
        case ' ': return kSpace;
        case '-': return kDash;
        case ':': return kColon;
        case '/': return kSlash;
        case '.': return kDot;
        case '_': return kUnderscore;
        default:  return kUnknown;
    }
}

void blend(unsigned char* px, const unsigned char value, const unsigned alpha) {
    for (int c = 0; c < 3; ++c) {
        px[c] = static_cast<unsigned char>((value * alpha + px[c] * (255 - alpha) + 127) / 255);
    }
}

} // namespace

uint32_t watermark_scale(const uint32_t image_width) noexcept {
    uint32_t text_size = 64;
    if (image_width < 600) text_size = 24;
    else if (image_width < 1200) text_size = 36;
    else if (image_width < 2000) text_size = 48;
    return std::max<uint32_t>(1, text_size / 8);
}

void draw_watermark(RasterImage& image, const std::string_view text) {
    if (image.empty() || text.empty()) {
        return;
    }

    const uint32_t margin = std::min(kWatermarkMargin, std::min(image.width, image.height) / 8);
    const uint32_t usable = image.width > 2 * margin ? image.width - 2 * margin : image.width;

    uint32_t scale = watermark_scale(image.width);
    auto text_width = [&](const uint32_t s, const size_t chars) {
        return static_cast<uint32_t>(chars) * (kGlyphWidth + 1) * s + 2 * 2 * s;
    };
    while (scale > 1 && text_width(scale, text.size()) > usable) {
        --scale;
    }
    size_t chars = text.size();
    while (chars > 0 && text_width(scale, chars) > usable) {
        --chars;
    }
    if (chars == 0) {
        return;
    }

    const uint32_t pad = 2 * scale;
    const uint32_t band_w = text_width(scale, chars);
    const uint32_t band_h = kGlyphHeight * scale + 2 * pad;
    if (band_h + margin > image.height) {
        return;
    }
    const uint32_t x0 = image.width - margin - band_w;
    const uint32_t y0 = image.height - margin - band_h;

    for (uint32_t y = y0; y < y0 + band_h; ++y) {
        for (uint32_t x = x0; x < x0 + band_w; ++x) {
            blend(image.at(x, y), 0, kBandAlpha);
        }
    }

    uint32_t pen_x = x0 + pad;
    const uint32_t pen_y = y0 + pad;
    for (size_t i = 0; i < chars; ++i) {
        const Glyph& g = glyph_for(text[i]);
        for (uint32_t row = 0; row < kGlyphHeight; ++row) {
            for (uint32_t col = 0; col < kGlyphWidth; ++col) {
                if (!(g[row] & (0x10 >> col))) continue;
                for (uint32_t dy = 0; dy < scale; ++dy) {
                    for (uint32_t dx = 0; dx < scale; ++dx) {
                        blend(image.at(pen_x + col * scale + dx, pen_y + row * scale + dy), 255, kTextAlpha);
                    }
                }
            }
        }
        pen_x += (kGlyphWidth + 1) * scale;
    }
}

} // namespace qreport::imaging
