#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "io/checkup_json.hpp"
#include "report/console_summary.hpp"
#include "../utils/color.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../libqreport/include/logger.hpp"
#include "../../libqreport/include/qreport.hpp"

namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static qreport::ReportExporter* g_exporter = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (g_exporter) {
            g_exporter->stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

// prints progress lines while the export runs
class ConsoleObserver final : public qreport::ReportObserver {
public:
    explicit ConsoleObserver(const size_t total_photos) : total_photos_(total_photos) {}

    void on_stage(const qreport::ExportStage stage) override {
        if (stage == qreport::ExportStage::Done || stage == qreport::ExportStage::Failed) return;
        std::cerr << CYAN << "[" << qreport::to_string(stage) << "]" << RESET << std::endl;
    }

    void on_photo(const fs::path& source, const std::string& name, const bool success, uint64_t) override {
        const size_t current = ++done_;
        std::cerr << (success ? GREEN : YELLOW) << "  photo " << current << "/" << total_photos_ << " "
                  << (success ? name : source.filename().string() + " (placeholder)") << RESET << std::endl;
    }

    void on_file(const fs::path& path, const uint64_t size, const qreport::ExportFormat format) override {
        if (format == qreport::ExportFormat::PhotoFolder) return;
        std::cerr << GREEN << "  written " << path.filename().string() << " (" << size << " bytes)" << RESET
                  << std::endl;
    }

private:
    size_t total_photos_;
    std::atomic<size_t> done_{0};
};

int main(int argc, char* argv[]) {

    CLI::App app{"qreport_cli: export an industrial check-up as document, text report and photo folder."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // set file logger
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<FileLogSink>("qreport.log", false));

    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }
    init_utf8_locale();

    qreport::CheckUpAggregate aggregate;
    try {
        aggregate = load_checkup(settings.input);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }

    const qreport::ExportOptions options = settings.to_options();
    if (const auto problems = options.validate(); !problems.empty()) {
        for (const auto& p : problems) {
            std::cerr << RED << "Invalid option: " << p << RESET << std::endl;
        }
        return 2;
    }

    size_t total_photos = 0;
    for (const auto& section : aggregate.sections) {
        for (const auto& item : section.items) total_photos += item.photos.size();
    }

    qreport::ReportExporter exporter;
    exporter.threads(settings.num_threads);
    ConsoleObserver observer(options.include_photos && options.has(qreport::ExportFormat::Document)
                                 ? total_photos
                                 : 0);
    if (!settings.quiet) {
        exporter.set_observer(&observer);
    }

    const auto start_total = std::chrono::steady_clock::now();
    g_exporter = &exporter;
    auto result = exporter.export_checkup(aggregate, settings.output_path, options);
    g_exporter = nullptr;
    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    if (!result.ok()) {
        print_export_error(result.error());
        if (interrupted.load() || result.error().code == qreport::ExportErrorCode::Cancelled) {
            return 130; // standard exit code for SIGINT
        }
        return 1;
    }

    if (!settings.quiet) {
        print_manifest_summary(result.value(), total_seconds);
    }
    return 0;
}
