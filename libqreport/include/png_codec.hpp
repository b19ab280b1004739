/**
 * @file png_codec.hpp
 * @brief libpng based PNG decoder.
 */

#ifndef QREPORT_PNG_CODEC_HPP
#define QREPORT_PNG_CODEC_HPP

#include "image_codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace qreport {

    /**
     * @brief Implements IImageCodec for PNG files using libpng.
     *
     * @details Every PNG color type and bit depth is expanded to RGB8;
     * transparent pixels are composited over white, the page color of the
     * document the photo ends up in.
     */
    class PngCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngCodec";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] bool matches_signature(std::span<const unsigned char> head) const noexcept override;

        /**
         * @throws std::runtime_error if libpng reports an error.
         */
        [[nodiscard]] DecodedImage decode(std::span<const unsigned char> data,
                                          uint32_t target_width) const override;
    };

} // namespace qreport

#endif // QREPORT_PNG_CODEC_HPP
