#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <map>

namespace {
// accepts the names understood by parse_export_format
struct ExportFormatValidator : CLI::Validator {
    ExportFormatValidator() {
        name_ = "FORMAT";
        func_ = [](const std::string& str) {
            if (!qreport::parse_export_format(str).has_value()) {
                return std::string("Invalid format: '") + str +
                       "'. Must be one of: document, text, photos.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

qreport::ExportOptions Settings::to_options() const {
    qreport::ExportOptions options;
    if (!formats.empty()) {
        options.formats.clear();
        for (const auto& f : formats) {
            if (const auto format = qreport::parse_export_format(f)) {
                options.formats.insert(*format);
            }
        }
    }
    options.include_photos = !no_photos;
    options.include_notes = !no_notes;
    options.photo_policy.quality = quality;
    options.photo_policy.max_width = max_width;
    if (!watermark.empty()) {
        options.photo_policy.add_watermark = true;
        options.photo_policy.watermark_text = watermark;
    }
    options.naming_strategy = naming;
    options.custom_template = template_path;
    options.photos_per_row = photos_per_row;
    options.create_timestamped_directory = timestamped_dir;
    options.generate_photo_index = photo_index;
    options.preserve_file_times = !no_preserve_times;
    options.worker_threads = num_threads;
    return options;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");

    // --- Flags (booleans) ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress, summary).");

    app.add_flag("--no-photos", settings.no_photos,
                 "Leave photos out of the document and the text report, skip the photo folder.");

    app.add_flag("--no-notes", settings.no_notes,
                 "Leave item notes out of the reports.");

    app.add_flag("--photo-index", settings.photo_index,
                 "Write INDICE_FOTO.txt into the photo folder.");

    app.add_flag("--timestamped-dir", settings.timestamped_dir,
                 "Write outputs into Export_Checkup_{yyyyMMdd_HHmm}/ under the output directory.");

    app.add_flag("--no-preserve-times", settings.no_preserve_times,
                 "Don't copy the modification time of the original photos.");

    // --watermark alone uses the default text, --watermark=TEXT sets it
    app.add_flag("--watermark{QReport}", settings.watermark,
                 "Draw a watermark with TEXT and the capture time on embedded photos.");

    // --- Options ---
    app.add_option("-o,--output", settings.output_path,
                   "Directory receiving the exported files.")
                   ->required();

    app.add_option("--formats", settings.formats,
                   "Outputs to produce: document, text, photos (default: all).")
                   ->delimiter(',')
                   ->check(ExportFormatValidator());

    app.add_option("--quality", settings.quality,
                   "JPEG quality of embedded photos.")
                   ->default_val(85)
                   ->check(CLI::Range(1, 100));

    app.add_option("--max-width", settings.max_width,
                   "Maximum width in pixels of embedded photos.")
                   ->default_val(800)
                   ->check(CLI::Range(64, 8192));

    app.add_option("--naming", settings.naming, "Photo naming: structured (default), sequential or timestamp.")
        ->default_val(qreport::NamingStrategy::Structured)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, qreport::NamingStrategy>{
                {"structured", qreport::NamingStrategy::Structured},
                {"sequential", qreport::NamingStrategy::Sequential},
                {"timestamp", qreport::NamingStrategy::Timestamp}
            }, CLI::ignore_case));

    app.add_option("--template", settings.template_path,
                   "WordprocessingML styles.xml replacing the built-in styles.");

    app.add_option("--photos-per-row", settings.photos_per_row,
                   "Photos per row in the document grid.")
                   ->default_val(2)
                   ->check(CLI::Range(1, 4));

    app.add_option("--threads", settings.num_threads,
                   "Threads used to process photos (1-4).")
                   ->default_val(2)
                   ->check(CLI::Range(1, 4));

    app.add_option("--log-level", settings.log_level,
                   "Console log level: ERROR, WARNING, INFO, DEBUG.")
                   ->default_val("WARNING")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    // --- Positional Arguments ---
    app.add_option("input", settings.input, "Check-up JSON file.")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.formats.empty() && settings.no_photos && settings.formats.size() == 1 &&
            qreport::parse_export_format(settings.formats.front()) == qreport::ExportFormat::PhotoFolder) {
            throw CLI::ValidationError("--no-photos with --formats photos leaves nothing to export.");
        }
        if (std::filesystem::exists(settings.output_path) && !std::filesystem::is_directory(settings.output_path)) {
            throw CLI::ValidationError("Output path ('-o') must be a directory.");
        }
    });
}
