#ifndef QREPORT_WATERMARK_HPP
#define QREPORT_WATERMARK_HPP

#include "raster_image.hpp"
#include <cstdint>
#include <string_view>

namespace qreport::imaging {

    /// Distance of the watermark band from the right and bottom edges.
    inline constexpr uint32_t kWatermarkMargin = 20;

    /**
     * @brief Glyph scale for a photo width: text height of 24, 36, 48 or
     * 64 px for widths below 600, 1200, 2000 and above.
     */
    uint32_t watermark_scale(uint32_t image_width) noexcept;

    /**
     * @brief Draws @p text in the bottom-right corner over a
     * semi-transparent dark band, using a built-in 5x7 bitmap font.
     *
     * Lowercase letters are drawn as capitals; characters without a glyph
     * are drawn as '?'. The scale shrinks until the text fits the image;
     * text that still doesn't fit is cut.
     */
    void draw_watermark(RasterImage& image, std::string_view text);

} // namespace qreport::imaging

#endif // QREPORT_WATERMARK_HPP
