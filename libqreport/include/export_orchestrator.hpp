/**
 * @file export_orchestrator.hpp
 * @brief Runs one export: validation, budget check, processing and
 * writing of every selected output format.
 */

#ifndef QREPORT_EXPORT_ORCHESTRATOR_HPP
#define QREPORT_EXPORT_ORCHESTRATOR_HPP

#include "checkup.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "export_manifest.hpp"
#include "export_options.hpp"
#include "storage_budgeter.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <vector>

namespace qreport {

/**
 * @brief Coordinates the export components for one run.
 *
 * @details Stages, in order: VALIDATING, BUDGETING, PROCESSING, WRITING,
 * DONE. A fatal error moves the run to FAILED from any stage. Per-photo
 * failures never do: they are collected as warnings in the manifest.
 *
 * - VALIDATING: options, custom template and target directory checks.
 * - BUDGETING: size estimate against the free space of the target volume.
 *   Nothing is written before this stage passes.
 * - PROCESSING: names are resolved once for all outputs; the document is
 *   assembled while a bounded pool processes its photos; the text report
 *   is rendered.
 * - WRITING: the outputs are written through temporary files renamed into
 *   place, then the photo folder is filled.
 *
 * On a fatal error or cancellation every file written by the run and every
 * directory it created is removed again, and no manifest is returned.
 * Every stage change and written file is published on the EventBus.
 *
 * One instance runs one export; request_stop() may be called from any
 * thread.
 */
class ExportOrchestrator {
public:
    using ClockFn = std::function<TimePoint()>;

    /**
     * @param bus Receives the progress events.
     * @param budgeter Storage pre-flight check.
     * @param clock Source of the run timestamp; system clock when empty.
     */
    explicit ExportOrchestrator(EventBus& bus, StorageBudgeter budgeter = StorageBudgeter{}, ClockFn clock = {});

    /**
     * @brief Runs the export. Blocks until done, failed or cancelled.
     * @param aggregate The check-up, never modified.
     * @param target_dir Output directory, created when missing.
     * @param options Export options.
     * @return The manifest, or the fatal error.
     */
    [[nodiscard]] Result<ExportManifest> run(const CheckUpAggregate& aggregate,
                                             const std::filesystem::path& target_dir,
                                             const ExportOptions& options);

    /**
     * @brief Requests cancellation. Observed between stages, sections and
     * photos.
     */
    void request_stop() noexcept { stop_source_.request_stop(); }

    [[nodiscard]] bool is_stopped() const noexcept { return stop_source_.stop_requested(); }

    /// @return the current stage of the run
    [[nodiscard]] ExportStage stage() const noexcept { return stage_.load(); }

private:
    struct RunState;

    void enter(ExportStage stage);
    Status validate(const std::filesystem::path& target_dir, const ExportOptions& options) const;
    Result<ExportManifest> execute(const CheckUpAggregate& aggregate,
                                   const std::filesystem::path& target_dir,
                                   const ExportOptions& options,
                                   RunState& state);
    ExportError fail(ExportError error, RunState& state);
    [[nodiscard]] ExportError cancelled() const;

    EventBus& bus_;
    StorageBudgeter budgeter_;
    ClockFn clock_;
    std::stop_source stop_source_;
    std::atomic<ExportStage> stage_{ExportStage::Validating};
};

} // namespace qreport

#endif // QREPORT_EXPORT_ORCHESTRATOR_HPP
