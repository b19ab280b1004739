/**
 * @file photo_processor.hpp
 * @brief Decode, orient, resize, watermark and re-encode one photo.
 */

#ifndef QREPORT_PHOTO_PROCESSOR_HPP
#define QREPORT_PHOTO_PROCESSOR_HPP

#include "checkup.hpp"
#include "codec_registry.hpp"
#include "errors.hpp"
#include "export_options.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace qreport {

/**
 * @brief A photo ready to be embedded in the document.
 *
 * Owned by the document assembler and released right after embedding.
 */
struct ProcessedPhoto {
    std::vector<unsigned char> bytes; ///< JPEG file
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t source_width = 0;
    uint32_t source_height = 0;

    [[nodiscard]] uint64_t size() const noexcept { return bytes.size(); }
};

/**
 * @brief Turns an original photo into a compressed, upright JPEG.
 *
 * @details Steps, in order: read the file (PHOTO_NOT_FOUND when it can't be
 * read), decode it (IMAGE_DECODE_FAILED for unknown or corrupt data), rotate
 * or flip the pixels according to the EXIF orientation, scale down to the
 * policy max width keeping the aspect ratio, optionally draw the
 * watermark, encode at the policy quality.
 *
 * Nothing is written to disk. The processor is stateless apart from a decode
 * counter and can be shared by the worker threads of a PhotoPipeline.
 */
class PhotoProcessor {
public:
    PhotoProcessor() = default;

    /**
     * @param source Path of the original photo.
     * @param policy Compression policy.
     * @param taken_at Capture time shown in the watermark, if known.
     */
    [[nodiscard]] Result<ProcessedPhoto> process(const std::filesystem::path& source,
                                                 const PhotoPolicy& policy,
                                                 std::optional<TimePoint> taken_at = std::nullopt) const;

    /// @return number of decode attempts since construction
    [[nodiscard]] size_t decode_count() const noexcept { return decodes_.load(); }

    [[nodiscard]] const ImageCodecRegistry& codecs() const noexcept { return registry_; }

private:
    ImageCodecRegistry registry_;
    mutable std::atomic<size_t> decodes_{0};
};

} // namespace qreport

#endif // QREPORT_PHOTO_PROCESSOR_HPP
