#include "../../include/export_options.hpp"
#include <algorithm>
#include <cctype>

namespace {

std::string lowercase(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

namespace qreport {

unsigned ExportOptions::effective_workers() const noexcept {
    return std::clamp(worker_threads, 1u, 4u);
}

std::vector<std::string> ExportOptions::validate() const {
    std::vector<std::string> problems;
    if (photo_policy.quality < 1 || photo_policy.quality > 100) {
        problems.push_back("photo quality must be between 1 and 100, got " +
                           std::to_string(photo_policy.quality));
    }
    if (photo_policy.max_width < 64 || photo_policy.max_width > 8192) {
        problems.push_back("photo max width must be between 64 and 8192, got " +
                           std::to_string(photo_policy.max_width));
    }
    if (photos_per_row < 1 || photos_per_row > 4) {
        problems.push_back("photos per row must be between 1 and 4, got " +
                           std::to_string(photos_per_row));
    }
    if (photo_policy.add_watermark && photo_policy.watermark_text.empty()) {
        problems.push_back("watermark enabled with empty text");
    }
    if (custom_template && custom_template->empty()) {
        problems.push_back("custom template path is empty");
    }
    return problems;
}

ExportOptions ExportOptions::complete() {
    return ExportOptions{};
}

ExportOptions ExportOptions::document_only() {
    ExportOptions o;
    o.formats = {ExportFormat::Document};
    return o;
}

ExportOptions ExportOptions::text_only() {
    ExportOptions o;
    o.formats = {ExportFormat::Text};
    o.include_photos = false;
    return o;
}

ExportOptions ExportOptions::photo_archive() {
    ExportOptions o;
    o.formats = {ExportFormat::PhotoFolder};
    o.generate_photo_index = true;
    return o;
}

std::optional<ExportFormat> parse_export_format(const std::string_view name) {
    const auto n = lowercase(name);
    if (n == "document" || n == "docx" || n == "word") return ExportFormat::Document;
    if (n == "text" || n == "txt") return ExportFormat::Text;
    if (n == "photos" || n == "photo_folder" || n == "foto") return ExportFormat::PhotoFolder;
    return std::nullopt;
}

std::optional<NamingStrategy> parse_naming_strategy(const std::string_view name) {
    const auto n = lowercase(name);
    if (n == "structured") return NamingStrategy::Structured;
    if (n == "sequential") return NamingStrategy::Sequential;
    if (n == "timestamp") return NamingStrategy::Timestamp;
    return std::nullopt;
}

} // namespace qreport
