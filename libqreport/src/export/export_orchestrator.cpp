#include "../../include/export_orchestrator.hpp"
#include "../../include/document_assembler.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/naming_resolver.hpp"
#include "../../include/photo_folder_exporter.hpp"
#include "../../include/photo_pipeline.hpp"
#include "../../include/photo_processor.hpp"
#include "../../include/text_report_renderer.hpp"
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "export_orchestrator";
}

std::optional<fs::path> nearest_existing(fs::path dir) {
    std::error_code ec;
    dir = fs::absolute(dir, ec);
    if (ec) {
        return std::nullopt;
    }
    while (!dir.empty()) {
        if (fs::exists(dir, ec)) {
            return dir;
        }
        if (dir == dir.parent_path()) {
            break;
        }
        dir = dir.parent_path();
    }
    return std::nullopt;
}

} // namespace

/**
 * @brief What a run has put on disk so far, for rollback.
 */
struct ExportOrchestrator::RunState {
    OutputJournal journal;
    std::vector<fs::path> created_dirs; ///< top-most directory of each create call
    ManifestBuilder manifest;

    /// @return false when the directory can't be created
    bool ensure_directory(const fs::path& dir, std::error_code& ec) {
        std::optional<fs::path> first_missing;
        for (fs::path p = fs::absolute(dir, ec); !ec && !p.empty(); p = p.parent_path()) {
            if (fs::exists(p, ec)) {
                break;
            }
            first_missing = p;
            if (p == p.parent_path()) {
                break;
            }
        }
        if (ec) {
            return false;
        }
        if (!first_missing) {
            return fs::is_directory(dir, ec);
        }
        fs::create_directories(dir, ec);
        if (ec) {
            return false;
        }
        created_dirs.push_back(*first_missing);
        return true;
    }

    /// Removes this run's files, puts back the ones they replaced, then
    /// drops the directories the run created.
    void rollback() {
        journal.rollback();
        for (auto it = created_dirs.rbegin(); it != created_dirs.rend(); ++it) {
            cleanup_temp_dir(*it, processor_tag());
        }
        created_dirs.clear();
    }

    void commit() {
        journal.commit();
        created_dirs.clear();
    }
};

ExportOrchestrator::ExportOrchestrator(EventBus& bus, StorageBudgeter budgeter, ClockFn clock)
    : bus_(bus), budgeter_(std::move(budgeter)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

void ExportOrchestrator::enter(const ExportStage stage) {
    stage_.store(stage);
    Logger::log(LogLevel::Debug, "Stage " + std::string(to_string(stage)), processor_tag());
    bus_.publish(ExportStageEvent{stage});
}

ExportError ExportOrchestrator::cancelled() const {
    return ExportError{ExportErrorCode::Cancelled, stage_.load(), {}, "export cancelled"};
}

ExportError ExportOrchestrator::fail(ExportError error, RunState& state) {
    Logger::log(error.code == ExportErrorCode::Cancelled ? LogLevel::Warning : LogLevel::Error,
                "Export failed: " + error.describe(), processor_tag());
    state.rollback();
    enter(ExportStage::Failed);
    bus_.publish(ExportFailedEvent{error});
    return error;
}

Status ExportOrchestrator::validate(const fs::path& target_dir, const ExportOptions& options) const {
    if (const auto problems = options.validate(); !problems.empty()) {
        std::string message;
        for (const auto& p : problems) {
            if (!message.empty()) message += "; ";
            message += p;
        }
        return ExportError{ExportErrorCode::InvalidOptions, ExportStage::Validating, {}, message};
    }

    if (options.has(ExportFormat::Document) && options.custom_template) {
        std::error_code ec;
        if (!fs::is_regular_file(*options.custom_template, ec)) {
            return ExportError{ExportErrorCode::TemplateNotFound, ExportStage::Validating,
                               options.custom_template->string(), "template file not found"};
        }
    }

    if (target_dir.empty()) {
        return ExportError{ExportErrorCode::InvalidOptions, ExportStage::Validating, {},
                           "target directory not set"};
    }
    std::error_code ec;
    if (fs::exists(target_dir, ec) && !fs::is_directory(target_dir, ec)) {
        return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Validating, target_dir.string(),
                           "target is not a directory"};
    }
    const auto existing = nearest_existing(target_dir);
    if (!existing || !fs::is_directory(*existing, ec) || !is_directory_writable(*existing)) {
        return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Validating, target_dir.string(),
                           "target directory is not writable"};
    }
    return {};
}

Result<ExportManifest> ExportOrchestrator::run(const CheckUpAggregate& aggregate,
                                               const fs::path& target_dir,
                                               const ExportOptions& options) {
    RunState state;
    try {
        auto result = execute(aggregate, target_dir, options, state);
        if (!result.ok()) {
            return fail(result.error(), state);
        }
        state.commit();
        enter(ExportStage::Done);
        return result;
    } catch (const std::exception& e) {
        return fail(ExportError{ExportErrorCode::DocumentGenerationError, stage_.load(), target_dir.string(),
                                e.what()},
                    state);
    }
}

Result<ExportManifest> ExportOrchestrator::execute(const CheckUpAggregate& aggregate,
                                                   const fs::path& target_dir,
                                                   const ExportOptions& options,
                                                   RunState& state) {
    const std::stop_token stop = stop_source_.get_token();

    // --- VALIDATING ---
    enter(ExportStage::Validating);
    if (options.formats.empty()) {
        Logger::log(LogLevel::Info, "No output format selected, nothing to export", processor_tag());
        return state.manifest.output_directory(target_dir).build();
    }
    if (const Status valid = validate(target_dir, options); !valid.ok()) {
        return valid.error();
    }
    if (stop.stop_requested()) return cancelled();

    // --- BUDGETING ---
    enter(ExportStage::Budgeting);
    const uint64_t estimate = budgeter_.estimate(aggregate, options);
    Logger::log(LogLevel::Info, "Estimated export size: " + std::to_string(estimate) + " bytes", processor_tag());
    if (const Status space = budgeter_.check_available(target_dir, estimate); !space.ok()) {
        return space.error();
    }
    if (stop.stop_requested()) return cancelled();

    // --- PROCESSING ---
    enter(ExportStage::Processing);
    const TimePoint generated_at = clock_();
    NamingResolver naming(options.naming_strategy, generated_at);
    naming.resolve_all(aggregate);

    const fs::path output_dir = options.create_timestamped_directory
                                    ? target_dir / NamingResolver::export_directory_name(generated_at)
                                    : target_dir;
    state.manifest.output_directory(output_dir);

    auto record_warning = [&](const ExportWarning& w) {
        const size_t before = state.manifest.warning_count();
        state.manifest.add_warning(w);
        if (state.manifest.warning_count() > before) {
            bus_.publish(ExportWarningEvent{w});
        }
    };

    std::optional<std::vector<unsigned char>> document;
    if (options.has(ExportFormat::Document)) {
        const PhotoProcessor processor;
        std::vector<PhotoJob> jobs;
        if (options.include_photos) {
            jobs = collect_photo_jobs(aggregate, naming);
        }
        PhotoPipeline pipeline(processor, options.photo_policy, std::move(jobs), options.effective_workers(), &bus_);
        const DocumentAssembler assembler(&bus_);
        auto assembled = assembler.assemble(aggregate, options, naming, pipeline, stop, generated_at);
        if (!assembled.ok()) {
            return ExportError{assembled.error().code, ExportStage::Processing, assembled.error().resource,
                               assembled.error().message};
        }
        AssembledDocument doc = std::move(assembled).value();
        for (const auto& w : doc.warnings) {
            record_warning(w);
        }
        document = std::move(doc.bytes);
    }

    std::optional<std::string> text_report;
    if (options.has(ExportFormat::Text)) {
        text_report = TextReportRenderer{}.render(aggregate, options, naming);
    }
    if (stop.stop_requested()) return cancelled();

    // --- WRITING ---
    enter(ExportStage::Writing);
    std::error_code ec;
    if (!state.ensure_directory(output_dir, ec)) {
        return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Writing, output_dir.string(),
                           ec ? ec.message() : "cannot create output directory"};
    }

    auto write_output = [&](const fs::path& path, const auto& data, const ExportFormat format) -> Status {
        if (const auto write_ec = state.journal.write(path, data)) {
            return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Writing, path.string(),
                               write_ec.message()};
        }
        const uint64_t size = data.size();
        state.manifest.add_file({path, size, format});
        bus_.publish(FileWrittenEvent{path, size, format});
        Logger::log(LogLevel::Info, "Written " + path.string() + " (" + std::to_string(size) + " bytes)",
                    processor_tag());
        return {};
    };

    if (document) {
        const fs::path path = output_dir / NamingResolver::document_file_name(aggregate, generated_at);
        if (const Status s = write_output(path, std::span<const unsigned char>(*document), ExportFormat::Document);
            !s.ok()) {
            return s.error();
        }
        document.reset();
    }
    if (text_report) {
        const fs::path path = output_dir / NamingResolver::text_file_name(generated_at);
        if (const Status s = write_output(path, std::string_view(*text_report), ExportFormat::Text); !s.ok()) {
            return s.error();
        }
    }
    if (stop.stop_requested()) return cancelled();

    if (options.has(ExportFormat::PhotoFolder)) {
        if (!options.include_photos) {
            Logger::log(LogLevel::Info, "Photos excluded, photo folder skipped", processor_tag());
        } else {
            const fs::path folder = output_dir / PhotoFolderExporter::kFolderName;
            if (!state.ensure_directory(folder, ec)) {
                return ExportError{ExportErrorCode::PermissionDenied, ExportStage::Writing, folder.string(),
                                   ec ? ec.message() : "cannot create photo folder"};
            }
            auto exported =
                PhotoFolderExporter{}.export_folder(aggregate, folder, naming, options, state.journal, stop);
            if (!exported.ok()) {
                return exported.error();
            }
            const ExportManifest& folder_manifest = exported.value();
            for (const auto& f : folder_manifest.files()) {
                state.manifest.add_file(f);
                bus_.publish(FileWrittenEvent{f.path, f.size, f.format});
            }
            for (const auto& p : folder_manifest.photos()) {
                state.manifest.add_photo(p);
            }
            for (const auto& w : folder_manifest.warnings()) {
                record_warning(w);
            }
        }
    }
    if (stop.stop_requested()) return cancelled();

    ExportManifest manifest = state.manifest.build();
    Logger::log(LogLevel::Info,
                "Export completed: " + std::to_string(manifest.files().size()) + " files, " +
                std::to_string(manifest.total_size()) + " bytes, " + std::to_string(manifest.warnings().size()) +
                " warnings",
                processor_tag());
    return manifest;
}

} // namespace qreport
