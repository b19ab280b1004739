#include "../../include/storage_budgeter.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "storage_budgeter";
}

fs::path nearest_existing(fs::path dir) {
    std::error_code ec;
    dir = fs::absolute(dir, ec);
    while (!dir.empty() && !fs::exists(dir, ec)) {
        const fs::path parent = dir.parent_path();
        if (parent == dir) break;
        dir = parent;
    }
    return dir;
}

} // namespace

StorageBudgeter::StorageBudgeter(SpaceProbe probe)
    : probe_(probe ? std::move(probe) : SpaceProbe(&StorageBudgeter::filesystem_free_space)) {}

uint64_t StorageBudgeter::average_processed_photo_bytes(const PhotoPolicy& policy) noexcept {
    const uint64_t w = policy.max_width;
    const uint64_t pixels = w * (w * 3 / 4);
    const int q = policy.quality < 1 ? 1 : (policy.quality > 100 ? 100 : policy.quality);
    // bytes per pixel of a typical photo grows from ~0.05 to ~0.30 with quality
    const double bytes_per_pixel = 0.05 + 0.25 * static_cast<double>(q) / 100.0;
    return static_cast<uint64_t>(static_cast<double>(pixels) * bytes_per_pixel);
}

uint64_t StorageBudgeter::estimate(const CheckUpAggregate& aggregate, const ExportOptions& options) const {
    uint64_t photos = 0;
    uint64_t rows = aggregate.spare_parts.size();
    uint64_t originals = 0;
    for (const auto& section : aggregate.sections) {
        rows += section.items.size();
        for (const auto& item : section.items) {
            photos += item.photos.size();
            for (const auto& photo : item.photos) {
                std::error_code ec;
                const auto size = fs::file_size(photo.path, ec);
                originals += ec ? (photo.file_size > 0 ? photo.file_size : kUnknownPhotoBytes) : size;
            }
        }
    }

    uint64_t total = 0;
    if (options.has(ExportFormat::Document)) {
        total += kDocumentBaseBytes + rows * kTableRowBytes;
        if (options.include_photos) {
            total += photos * average_processed_photo_bytes(options.photo_policy);
        }
    }
    if (options.has(ExportFormat::Text)) {
        total += std::max(kTextReportMinBytes, (rows * 8 + photos) * kTextLineBytes);
    }
    if (options.has(ExportFormat::PhotoFolder)) {
        total += originals;
    }

    Logger::log(LogLevel::Debug,
                "Estimated " + std::to_string(total) + " bytes for " + std::to_string(photos) + " photos and " +
                std::to_string(rows) + " table rows",
                processor_tag());
    return total;
}

Status StorageBudgeter::check_available(const fs::path& target_dir, const uint64_t estimate) const {
    const fs::path volume = nearest_existing(target_dir);
    const auto free_bytes = probe_(volume);
    if (!free_bytes) {
        Logger::log(LogLevel::Warning, "Free space unknown for " + volume.string() + ", skipping check",
                    processor_tag());
        return {};
    }

    const uint64_t required = estimate * kSafetyFactor;
    if (*free_bytes < required) {
        Logger::log(LogLevel::Error,
                    "Insufficient storage on " + volume.string() + ": " + std::to_string(*free_bytes) +
                    " bytes free, " + std::to_string(required) + " required",
                    processor_tag());
        return ExportError{ExportErrorCode::InsufficientStorage, ExportStage::Budgeting, target_dir.string(),
                           std::to_string(required) + " bytes required, " + std::to_string(*free_bytes) +
                           " available"};
    }
    return {};
}

std::optional<uint64_t> StorageBudgeter::filesystem_free_space(const fs::path& dir) {
    std::error_code ec;
    const auto info = fs::space(dir, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(info.available);
}

} // namespace qreport
