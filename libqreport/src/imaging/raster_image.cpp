#include "../../include/raster_image.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace qreport::imaging {

RasterImage apply_orientation(RasterImage image, const int orientation) {
    if (orientation <= 1 || orientation > 8 || image.empty()) {
        return image;
    }
    const uint32_t w = image.width;
    const uint32_t h = image.height;
    RasterImage out = swaps_axes(orientation) ? RasterImage(h, w) : RasterImage(w, h);

    for (uint32_t y = 0; y < out.height; ++y) {
        for (uint32_t x = 0; x < out.width; ++x) {
            uint32_t sx = x;
            uint32_t sy = y;
            switch (orientation) {
                case 2: sx = w - 1 - x; sy = y; break;             // mirror horizontal
                case 3: sx = w - 1 - x; sy = h - 1 - y; break;     // rotate 180
                case 4: sx = x; sy = h - 1 - y; break;             // mirror vertical
                case 5: sx = y; sy = x; break;                     // transpose
                case 6: sx = y; sy = h - 1 - x; break;             // rotate 90 cw
                case 7: sx = w - 1 - y; sy = h - 1 - x; break;     // transverse
                case 8: sx = w - 1 - y; sy = x; break;             // rotate 90 ccw
                default: break;
            }
            std::memcpy(out.at(x, y), image.at(sx, sy), 3);
        }
    }
    return out;
}

uint32_t scaled_height(const uint32_t width, const uint32_t height, const uint32_t target_width) noexcept {
    if (width == 0) return 0;
    const double h = std::round(static_cast<double>(target_width) * static_cast<double>(height) /
                                static_cast<double>(width));
    return std::max<uint32_t>(1, static_cast<uint32_t>(h));
}

RasterImage fit_to_width(RasterImage image, const uint32_t max_width) {
    if (image.empty() || max_width == 0 || image.width <= max_width) {
        return image;
    }
    const uint32_t dw = max_width;
    const uint32_t dh = scaled_height(image.width, image.height, max_width);
    RasterImage out(dw, dh);

    const double fx = static_cast<double>(image.width) / dw;
    const double fy = static_cast<double>(image.height) / dh;

    for (uint32_t y = 0; y < dh; ++y) {
        const auto y0 = static_cast<uint32_t>(y * fy);
        const auto y1 = std::clamp(static_cast<uint32_t>((y + 1) * fy), y0 + 1, image.height);
        for (uint32_t x = 0; x < dw; ++x) {
            const auto x0 = static_cast<uint32_t>(x * fx);
            const auto x1 = std::clamp(static_cast<uint32_t>((x + 1) * fx), x0 + 1, image.width);
            uint64_t sum[3] = {0, 0, 0};
            for (uint32_t sy = y0; sy < y1; ++sy) {
                const unsigned char* row = image.at(x0, sy);
                for (uint32_t sx = x0; sx < x1; ++sx, row += 3) {
                    sum[0] += row[0];
                    sum[1] += row[1];
                    sum[2] += row[2];
                }
            }
            const uint64_t n = static_cast<uint64_t>(x1 - x0) * (y1 - y0);
            unsigned char* dst = out.at(x, y);
            for (int c = 0; c < 3; ++c) {
                dst[c] = static_cast<unsigned char>((sum[c] + n / 2) / n);
            }
        }
    }
    return out;
}

} // namespace qreport::imaging
