/**
 * @file jpeg_codec.hpp
 * @brief libjpeg based JPEG decoder and encoder.
 */

#ifndef QREPORT_JPEG_CODEC_HPP
#define QREPORT_JPEG_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <span>
#include <string_view>
#include <vector>

namespace qreport {

    /**
     * @brief Implements IImageCodec for JPEG files using libjpeg.
     *
     * @details Decodes from memory, reading the EXIF orientation from the
     * APP1 marker. When the oriented photo is at least twice as wide as the
     * target width the decoder uses libjpeg DCT scaling (1/2, 1/4, 1/8), so
     * the full-size bitmap of a large camera photo is never allocated.
     */
    class JpegCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegCodec";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] bool matches_signature(std::span<const unsigned char> head) const noexcept override;

        /**
         * @throws std::runtime_error if libjpeg encounters a fatal error.
         */
        [[nodiscard]] DecodedImage decode(std::span<const unsigned char> data,
                                          uint32_t target_width) const override;

        /**
         * @brief Largest DCT scale denominator (1, 2, 4 or 8) that keeps
         * @p oriented_width / denominator at or above @p target_width.
         */
        [[nodiscard]] static unsigned scale_denominator(uint32_t oriented_width, uint32_t target_width) noexcept;
    };

    /**
     * @brief Encodes RGB8 pixels as a baseline JPEG in memory.
     * @param image Pixels to encode.
     * @param quality JPEG quality, clamped to 1..100.
     * @return The complete JPEG file.
     * @throws std::runtime_error if libjpeg encounters a fatal error.
     */
    std::vector<unsigned char> encode_jpeg(const RasterImage& image, int quality);

} // namespace qreport

#endif // QREPORT_JPEG_CODEC_HPP
