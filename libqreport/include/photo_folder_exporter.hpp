/**
 * @file photo_folder_exporter.hpp
 * @brief Archival copy of the original photos under their resolved names.
 */

#ifndef QREPORT_PHOTO_FOLDER_EXPORTER_HPP
#define QREPORT_PHOTO_FOLDER_EXPORTER_HPP

#include "checkup.hpp"
#include "errors.hpp"
#include "export_manifest.hpp"
#include "export_options.hpp"
#include "file_utils.hpp"
#include "naming_resolver.hpp"
#include <filesystem>
#include <stop_token>
#include <string_view>

namespace qreport {

/**
 * @brief Copies every original photo of an aggregate into one folder.
 *
 * @details Sections, items and photos are visited in source order. Each
 * original file is copied byte for byte (never the processed version)
 * through a temporary sibling that is renamed into place. A source that is
 * missing or unreadable becomes a PHOTO_NOT_FOUND warning and is skipped.
 *
 * A failure to create the folder or write a copy is fatal
 * (PERMISSION_DENIED). Copies go through an OutputJournal, so a file left
 * by an earlier export under the same name is only replaced for good once
 * the journal commits; cancellation and failures put it back.
 */
class PhotoFolderExporter {
public:
    static constexpr std::string_view kFolderName = "FOTO";
    static constexpr std::string_view kIndexFileName = "INDICE_FOTO.txt";

    /**
     * @brief Copies the photos into @p folder, creating it when missing.
     * @param folder Destination, usually "{output}/FOTO".
     * @param naming Resolver shared with the other outputs.
     * @param options Uses preserve_file_times and generate_photo_index.
     * @param stop Checked before every photo.
     * @return One file and one photo entry per copied photo, the index file
     * when requested, and the warnings. PERMISSION_DENIED or CANCELLED.
     */
    [[nodiscard]] Result<ExportManifest> export_folder(const CheckUpAggregate& aggregate,
                                                       const std::filesystem::path& folder,
                                                       NamingResolver& naming,
                                                       const ExportOptions& options,
                                                       std::stop_token stop = {}) const;

    /**
     * @brief Same as above, recording every file in @p journal; the caller
     * commits or rolls back.
     */
    [[nodiscard]] Result<ExportManifest> export_folder(const CheckUpAggregate& aggregate,
                                                       const std::filesystem::path& folder,
                                                       NamingResolver& naming,
                                                       const ExportOptions& options,
                                                       OutputJournal& journal,
                                                       std::stop_token stop = {}) const;
};

} // namespace qreport

#endif // QREPORT_PHOTO_FOLDER_EXPORTER_HPP
