/**
 * @file export_options.hpp
 * @brief Export configuration: selected formats, photo policy, naming
 * strategy and output layout.
 */

#ifndef QREPORT_EXPORT_OPTIONS_HPP
#define QREPORT_EXPORT_OPTIONS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace qreport {

enum class ExportFormat { Document, Text, PhotoFolder };

enum class NamingStrategy { Structured, Sequential, Timestamp };

[[nodiscard]] constexpr std::string_view to_string(const ExportFormat format) noexcept {
    switch (format) {
        case ExportFormat::Document:    return "DOCUMENT";
        case ExportFormat::Text:        return "TEXT";
        case ExportFormat::PhotoFolder: return "PHOTO_FOLDER";
    }
    return "";
}

[[nodiscard]] constexpr std::string_view to_string(const NamingStrategy strategy) noexcept {
    switch (strategy) {
        case NamingStrategy::Structured: return "STRUCTURED";
        case NamingStrategy::Sequential: return "SEQUENTIAL";
        case NamingStrategy::Timestamp:  return "TIMESTAMP";
    }
    return "";
}

/**
 * @brief Compression policy applied to photos embedded in the document.
 */
struct PhotoPolicy {
    int quality = 85;           ///< JPEG quality, 1..100
    uint32_t max_width = 800;   ///< wider photos are scaled down, never up
    bool add_watermark = false;
    std::string watermark_text = "QReport";
};

/**
 * @brief Options for one export run. Every field has a usable default.
 */
struct ExportOptions {
    std::set<ExportFormat> formats{ExportFormat::Document, ExportFormat::Text, ExportFormat::PhotoFolder};
    bool include_photos = true;
    bool include_notes = true;
    PhotoPolicy photo_policy{};
    NamingStrategy naming_strategy = NamingStrategy::Structured;
    std::optional<std::filesystem::path> custom_template; ///< replacement word/styles.xml
    unsigned photos_per_row = 2;
    bool create_timestamped_directory = false;
    bool generate_photo_index = false;
    bool preserve_file_times = true;
    unsigned worker_threads = 2;

    [[nodiscard]] bool has(const ExportFormat format) const { return formats.contains(format); }

    /// @return worker_threads clamped to 1..4
    [[nodiscard]] unsigned effective_workers() const noexcept;

    /**
     * @brief Checks option ranges.
     * @return Human readable problems; empty when the options are usable.
     */
    [[nodiscard]] std::vector<std::string> validate() const;

    // --- presets ---
    static ExportOptions complete();
    static ExportOptions document_only();
    static ExportOptions text_only();
    static ExportOptions photo_archive();
};

/**
 * @brief Parses "document", "text" or "photos" (case-insensitive).
 */
std::optional<ExportFormat> parse_export_format(std::string_view name);

/**
 * @brief Parses "structured", "sequential" or "timestamp" (case-insensitive).
 */
std::optional<NamingStrategy> parse_naming_strategy(std::string_view name);

} // namespace qreport

#endif // QREPORT_EXPORT_OPTIONS_HPP
