/**
 * @file raster_image.hpp
 * @brief In-memory 8-bit RGB image and the pixel operations of the photo
 * pipeline (orientation, down-scaling).
 */

#ifndef QREPORT_RASTER_IMAGE_HPP
#define QREPORT_RASTER_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qreport {

/**
 * @brief Interleaved RGB8 pixels, rows top to bottom.
 */
struct RasterImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<unsigned char> pixels;

    RasterImage() = default;
    RasterImage(const uint32_t w, const uint32_t h)
        : width(w), height(h), pixels(static_cast<size_t>(w) * h * 3, 0) {}

    [[nodiscard]] bool empty() const noexcept { return width == 0 || height == 0; }
    [[nodiscard]] size_t stride() const noexcept { return static_cast<size_t>(width) * 3; }

    unsigned char* at(const uint32_t x, const uint32_t y) noexcept {
        return pixels.data() + static_cast<size_t>(y) * stride() + static_cast<size_t>(x) * 3;
    }
    [[nodiscard]] const unsigned char* at(const uint32_t x, const uint32_t y) const noexcept {
        return pixels.data() + static_cast<size_t>(y) * stride() + static_cast<size_t>(x) * 3;
    }
};

namespace imaging {

    /**
     * @brief @return true for EXIF orientations that swap width and height (5..8).
     */
    constexpr bool swaps_axes(const int orientation) noexcept {
        return orientation >= 5 && orientation <= 8;
    }

    /**
     * @brief Physically applies an EXIF orientation (1..8) so that the
     * result needs no further correction. Unknown values leave the image
     * untouched.
     */
    RasterImage apply_orientation(RasterImage image, int orientation);

    /**
     * @brief Height that keeps the aspect ratio at @p target_width:
     * round(target_width * height / width), at least 1.
     */
    uint32_t scaled_height(uint32_t width, uint32_t height, uint32_t target_width) noexcept;

    /**
     * @brief Box-filter down-scaling to @p max_width.
     *
     * Images not wider than @p max_width are returned unchanged; images are
     * never enlarged.
     */
    RasterImage fit_to_width(RasterImage image, uint32_t max_width);

} // namespace imaging

} // namespace qreport

#endif // QREPORT_RASTER_IMAGE_HPP
