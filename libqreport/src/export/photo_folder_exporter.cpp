#include "../../include/photo_folder_exporter.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_formatter.hpp"
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "photo_folder_exporter";
}

bool is_readable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    const unique_FILE in(open_file(path, "rb"));
    return in != nullptr;
}

struct IndexEntry {
    std::string name;
    size_t section_index;
    std::string section;
    std::string item;
    std::string caption;
    fs::path source;
};

std::string render_index(const CheckUpAggregate& aggregate, const std::vector<IndexEntry>& entries,
                         const TimePoint generated_at) {
    std::ostringstream os;
    os << std::string(80, '=') << '\n'
       << text::center("INDICE FOTO", 80) << '\n'
       << std::string(80, '=') << '\n';
    for (const auto& l : text::wrap(aggregate.header.client.company_name, 80, "Cliente: ", "         ")) {
        os << l << '\n';
    }
    os << "Isola: " << aggregate.header.island.island_type;
    if (!aggregate.header.island.serial_number.empty()) {
        os << " (" << aggregate.header.island.serial_number << ")";
    }
    os << '\n'
       << "Generato il: " << text::format_date_time(generated_at) << '\n'
       << "Foto: " << entries.size() << '\n';

    for (const auto& e : entries) {
        os << '\n' << e.name << '\n';
        for (const auto& l : text::wrap(e.section, 80, "    Modulo " + std::to_string(e.section_index + 1) + ": ",
                                        "      ")) {
            os << l << '\n';
        }
        for (const auto& l : text::wrap(e.item, 80, "    Controllo: ", "      ")) {
            os << l << '\n';
        }
        if (!text::is_blank(e.caption)) {
            for (const auto& l : text::wrap(e.caption, 80, "    Didascalia: ", "      ")) {
                os << l << '\n';
            }
        }
        os << "    Originale: " << e.source.filename().string() << '\n';
    }
    return os.str();
}

} // namespace

Result<ExportManifest> PhotoFolderExporter::export_folder(const CheckUpAggregate& aggregate,
                                                          const fs::path& folder,
                                                          NamingResolver& naming,
                                                          const ExportOptions& options,
                                                          const std::stop_token stop) const {
    OutputJournal journal;
    auto result = export_folder(aggregate, folder, naming, options, journal, stop);
    if (result.ok()) {
        journal.commit();
    }
    return result;
}

Result<ExportManifest> PhotoFolderExporter::export_folder(const CheckUpAggregate& aggregate,
                                                          const fs::path& folder,
                                                          NamingResolver& naming,
                                                          const ExportOptions& options,
                                                          OutputJournal& journal,
                                                          const std::stop_token stop) const {
    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec || !fs::is_directory(folder)) {
        Logger::log(LogLevel::Error, "Can't create photo folder " + folder.string() + " (" + ec.message() + ")",
                    processor_tag());
        return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Writing, folder.string(),
                           "cannot create photo folder"};
    }

    ManifestBuilder manifest;
    manifest.output_directory(folder);
    size_t copied = 0;
    std::vector<IndexEntry> index;

    for (size_t s = 0; s < aggregate.sections.size(); ++s) {
        const Section& section = aggregate.sections[s];
        for (const auto& item : section.items) {
            for (size_t p = 0; p < item.photos.size(); ++p) {
                if (stop.stop_requested()) {
                    Logger::log(LogLevel::Warning, "Photo folder export cancelled", processor_tag());
                    return ExportError{ExportErrorCode::Cancelled, ExportStage::Writing, folder.string(),
                                       "export cancelled"};
                }
                const PhotoRef& photo = item.photos[p];
                const std::string name = naming.resolve(s, section.title, item, p, photo.caption);

                if (!is_readable_file(photo.path)) {
                    Logger::log(LogLevel::Warning, "Photo not found, skipped: " + photo.path.string(),
                                processor_tag());
                    manifest.add_warning({ExportErrorCode::PhotoNotFound, photo.path, section.title, item.title,
                                          "photo not found, not copied to the photo folder"});
                    continue;
                }

                const fs::path target = folder / name;
                const std::error_code copy_ec = journal.copy(photo.path, target, options.preserve_file_times);
                if (copy_ec) {
                    Logger::log(LogLevel::Error,
                                "Can't copy " + photo.path.string() + " to " + target.string() + " (" +
                                copy_ec.message() + ")",
                                processor_tag());
                    return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Writing, target.string(),
                                       copy_ec.message()};
                }
                ++copied;

                std::error_code size_ec;
                const uint64_t size = fs::file_size(target, size_ec);
                manifest.add_file({target, size_ec ? 0 : size, ExportFormat::PhotoFolder});
                manifest.add_photo({name, target, size_ec ? 0 : size});
                index.push_back({name, s, section.title, item.title, photo.caption, photo.path});
                Logger::log(LogLevel::Debug, "Copied " + photo.path.string() + " -> " + name, processor_tag());
            }
        }
    }

    if (options.generate_photo_index) {
        const fs::path index_path = folder / kIndexFileName;
        const std::string content = render_index(aggregate, index, naming.generated_at());
        if (const auto write_ec = journal.write(index_path, std::string_view(content))) {
            Logger::log(LogLevel::Error, "Can't write " + index_path.string() + " (" + write_ec.message() + ")",
                        processor_tag());
            return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Writing, index_path.string(),
                               write_ec.message()};
        }
        manifest.add_file({index_path, content.size(), ExportFormat::PhotoFolder});
    }

    Logger::log(LogLevel::Info,
                "Photo folder: " + std::to_string(copied) + " photos copied, " +
                std::to_string(manifest.warning_count()) + " warnings",
                processor_tag());
    return manifest.build();
}

} // namespace qreport
