#ifndef QREPORT_CLI_PARSER_HPP
#define QREPORT_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../../../libqreport/include/export_options.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool quiet = false;
    bool no_photos = false;
    bool no_notes = false;
    bool photo_index = false;
    bool timestamped_dir = false;
    bool no_preserve_times = false;

    unsigned num_threads = 2;
    int quality = 85;
    uint32_t max_width = 800;
    unsigned photos_per_row = 2;
    std::string log_level = "WARNING";
    std::string watermark; ///< empty when no watermark
    qreport::NamingStrategy naming = qreport::NamingStrategy::Structured;
    std::vector<std::string> formats;
    std::optional<std::filesystem::path> template_path;

    std::filesystem::path input;
    std::filesystem::path output_path;

    /**
     * @brief Maps the command line onto the engine options.
     */
    [[nodiscard]] qreport::ExportOptions to_options() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // QREPORT_CLI_PARSER_HPP
