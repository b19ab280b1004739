/**
 * @file export_manifest.hpp
 * @brief Immutable per-run summary of produced files and warnings.
 */

#ifndef QREPORT_EXPORT_MANIFEST_HPP
#define QREPORT_EXPORT_MANIFEST_HPP

#include "errors.hpp"
#include "export_options.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief One file produced by an export run.
 */
struct ExportedFile {
    std::filesystem::path path;
    uint64_t size = 0;
    ExportFormat format = ExportFormat::Document;
};

/**
 * @brief One original photo copied into the photo folder.
 */
struct ExportedPhoto {
    std::string file_name;
    std::filesystem::path path;
    uint64_t size = 0;
};

/**
 * @brief A recovered per-photo failure.
 */
struct ExportWarning {
    ExportErrorCode code = ExportErrorCode::PhotoNotFound;
    std::filesystem::path resource; ///< source photo path
    std::string section;
    std::string item;
    std::string message;
};

class ManifestBuilder;

/**
 * @brief Output summary of one export run.
 *
 * @details Instances are produced by ManifestBuilder and never change
 * afterwards.
 */
class ExportManifest {
public:
    ExportManifest() = default;

    [[nodiscard]] const std::vector<ExportedFile>& files() const noexcept { return files_; }
    [[nodiscard]] const std::vector<ExportedPhoto>& photos() const noexcept { return photos_; }
    [[nodiscard]] const std::vector<ExportWarning>& warnings() const noexcept { return warnings_; }
    [[nodiscard]] const std::filesystem::path& output_directory() const noexcept { return output_directory_; }

    /// @return sum of the sizes of every produced file
    [[nodiscard]] uint64_t total_size() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return files_.empty() && warnings_.empty(); }

    /// @return the files of one format, in production order
    [[nodiscard]] std::vector<ExportedFile> files_of(ExportFormat format) const;

private:
    friend class ManifestBuilder;

    std::vector<ExportedFile> files_;
    std::vector<ExportedPhoto> photos_;
    std::vector<ExportWarning> warnings_;
    std::filesystem::path output_directory_;
};

/**
 * @brief Accumulates manifest entries during a run.
 *
 * Warnings for the same (code, resource) pair are recorded once, so a
 * missing photo reported by both the document and the photo folder shows
 * up as a single warning.
 */
class ManifestBuilder {
public:
    ManifestBuilder& output_directory(std::filesystem::path dir);
    ManifestBuilder& add_file(ExportedFile file);
    ManifestBuilder& add_photo(ExportedPhoto photo);
    ManifestBuilder& add_warning(ExportWarning warning);

    /// @brief Appends every entry of @p other.
    ManifestBuilder& merge(const ExportManifest& other);

    [[nodiscard]] size_t warning_count() const noexcept { return manifest_.warnings_.size(); }

    [[nodiscard]] ExportManifest build() const { return manifest_; }

private:
    ExportManifest manifest_;
};

} // namespace qreport

#endif // QREPORT_EXPORT_MANIFEST_HPP
