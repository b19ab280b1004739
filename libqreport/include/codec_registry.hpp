/**
 * @file codec_registry.hpp
 * @brief Registry of the available source image decoders.
 */

#ifndef QREPORT_CODEC_REGISTRY_HPP
#define QREPORT_CODEC_REGISTRY_HPP

#include "image_codec.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Owns every IImageCodec and selects one per photo.
 *
 * @details Lookup is by file signature first, because photo files renamed
 * by camera apps and messengers frequently carry the wrong extension.
 */
class ImageCodecRegistry {
public:
    /**
     * @brief Construct and register all built-in codecs (JPEG, PNG).
     */
    ImageCodecRegistry();

    /**
     * @brief Finds the codec whose signature matches the leading bytes.
     * @return Non-owning pointer, or nullptr for unknown formats.
     */
    [[nodiscard]] const IImageCodec* find_by_signature(std::span<const unsigned char> head) const;

    /**
     * @brief Finds a codec by file extension (case-insensitive, with the dot).
     * @return Non-owning pointer, or nullptr for unknown extensions.
     */
    [[nodiscard]] const IImageCodec* find_by_extension(const std::string& ext) const;

    [[nodiscard]] const std::vector<std::unique_ptr<IImageCodec>>& all() const { return codecs_; }

private:
    std::vector<std::unique_ptr<IImageCodec>> codecs_;
};

} // namespace qreport

#endif // QREPORT_CODEC_REGISTRY_HPP
