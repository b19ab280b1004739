#include "../../include/photo_processor.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_formatter.hpp"
#include "../../include/watermark.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "photo_processor";
}

ExportError photo_error(const ExportErrorCode code, const std::filesystem::path& source, std::string message) {
    return ExportError{code, ExportStage::Processing, source.string(), std::move(message)};
}

} // namespace

Result<ProcessedPhoto> PhotoProcessor::process(const std::filesystem::path& source,
                                               const PhotoPolicy& policy,
                                               const std::optional<TimePoint> taken_at) const {
    const auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        Logger::log(LogLevel::Warning, "Photo not found: " + source.string(), processor_tag());
        return photo_error(ExportErrorCode::PhotoNotFound, source, "photo not found");
    }
    auto bytes = read_file_bytes(source);
    if (!bytes) {
        Logger::log(LogLevel::Warning, "Cannot read photo: " + source.string(), processor_tag());
        return photo_error(ExportErrorCode::PhotoNotFound, source, "photo not readable");
    }

    const IImageCodec* codec = registry_.find_by_signature(*bytes);
    if (!codec) {
        Logger::log(LogLevel::Warning, "Unrecognized image format: " + source.string(), processor_tag());
        return photo_error(ExportErrorCode::ImageDecodeFailed, source, "unrecognized image format");
    }

    ++decodes_;
    try {
        DecodedImage decoded = codec->decode(*bytes, policy.max_width);
        bytes.reset();

        RasterImage image = imaging::apply_orientation(std::move(decoded.image), decoded.orientation);
        image = imaging::fit_to_width(std::move(image), policy.max_width);

        if (policy.add_watermark) {
            std::string label = policy.watermark_text;
            if (taken_at) {
                label += "  " + text::format_date_time(*taken_at);
            }
            imaging::draw_watermark(image, label);
        }

        ProcessedPhoto out;
        out.bytes = encode_jpeg(image, std::clamp(policy.quality, 1, 100));
        out.width = image.width;
        out.height = image.height;
        out.source_width = decoded.source_width;
        out.source_height = decoded.source_height;

        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        Logger::log(LogLevel::Debug,
                    std::string(codec->get_name()) + " " + source.filename().string() + " -> " +
                    std::to_string(out.width) + "x" + std::to_string(out.height) + ", " +
                    std::to_string(out.size()) + " bytes in " + std::to_string(ms.count()) + " ms",
                    processor_tag());
        return out;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Photo processing failed for " + source.string() + ": " + e.what(),
                    processor_tag());
        return photo_error(ExportErrorCode::ImageDecodeFailed, source, e.what());
    }
}

} // namespace qreport
