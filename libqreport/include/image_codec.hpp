/**
 * @file image_codec.hpp
 * @brief Interface of the source photo decoders.
 */

#ifndef QREPORT_IMAGE_CODEC_HPP
#define QREPORT_IMAGE_CODEC_HPP

#include "raster_image.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace qreport {

/**
 * @brief A decoded source photo, not yet oriented.
 */
struct DecodedImage {
    RasterImage image;
    int orientation = 1;          ///< EXIF orientation 1..8
    uint32_t source_width = 0;    ///< stored width before any decode scaling
    uint32_t source_height = 0;   ///< stored height before any decode scaling
};

/**
 * @brief Decoder for one source image format.
 *
 * Implementations are stateless and safe to share between worker threads.
 * Each codec describes itself (name, extensions, file signature); the
 * ImageCodecRegistry owns the instances and picks one per photo.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "JPEG").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of supported file extensions (e.g. ".jpg").
    [[nodiscard]] virtual std::span<const std::string_view> get_supported_extensions() const noexcept = 0;

    /**
     * @brief Checks the leading bytes of a file.
     * @param head At least the first 8 bytes of the file, when available.
     */
    [[nodiscard]] virtual bool matches_signature(std::span<const unsigned char> head) const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decodes @p data to RGB8.
     * @param data Complete file contents.
     * @param target_width Width the photo will be scaled to once oriented;
     * codecs may decode at a reduced size that is still at least this wide.
     * 0 disables reduced decoding.
     * @throws std::runtime_error if the data can't be decoded.
     */
    [[nodiscard]] virtual DecodedImage decode(std::span<const unsigned char> data,
                                              uint32_t target_width) const = 0;
};

} // namespace qreport

#endif // QREPORT_IMAGE_CODEC_HPP
