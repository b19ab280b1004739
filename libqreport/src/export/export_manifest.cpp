#include "../../include/export_manifest.hpp"
#include <algorithm>
#include <iterator>
#include <numeric>

namespace qreport {

uint64_t ExportManifest::total_size() const noexcept {
    return std::accumulate(files_.begin(), files_.end(), uint64_t{0},
                           [](const uint64_t acc, const ExportedFile& f) { return acc + f.size; });
}

std::vector<ExportedFile> ExportManifest::files_of(const ExportFormat format) const {
    std::vector<ExportedFile> out;
    std::ranges::copy_if(files_, std::back_inserter(out),
                         [format](const ExportedFile& f) { return f.format == format; });
    return out;
}

ManifestBuilder& ManifestBuilder::output_directory(std::filesystem::path dir) {
    manifest_.output_directory_ = std::move(dir);
    return *this;
}

ManifestBuilder& ManifestBuilder::add_file(ExportedFile file) {
    manifest_.files_.push_back(std::move(file));
    return *this;
}

ManifestBuilder& ManifestBuilder::add_photo(ExportedPhoto photo) {
    manifest_.photos_.push_back(std::move(photo));
    return *this;
}

ManifestBuilder& ManifestBuilder::add_warning(ExportWarning warning) {
    const bool duplicate = std::ranges::any_of(manifest_.warnings_, [&](const ExportWarning& w) {
        return w.code == warning.code && w.resource == warning.resource;
    });
    if (!duplicate) {
        manifest_.warnings_.push_back(std::move(warning));
    }
    return *this;
}

ManifestBuilder& ManifestBuilder::merge(const ExportManifest& other) {
    for (const auto& f : other.files()) add_file(f);
    for (const auto& p : other.photos()) add_photo(p);
    for (const auto& w : other.warnings()) add_warning(w);
    return *this;
}

} // namespace qreport
