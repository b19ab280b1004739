/**
 * @file qreport.hpp
 * @brief Public API of the qreport export engine.
 */

#ifndef QREPORT_HPP
#define QREPORT_HPP

#include "checkup.hpp"
#include "errors.hpp"
#include "export_manifest.hpp"
#include "export_options.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace qreport {

/**
 * @brief Interface for receiving progress and status events during an
 * export. Every callback has an empty default.
 *
 * on_photo may be called from pool worker threads.
 */
struct ReportObserver {
    virtual ~ReportObserver() = default;

    virtual void on_stage(ExportStage stage) {}

    virtual void on_photo(const std::filesystem::path& source,
                          const std::string& name,
                          bool success,
                          uint64_t size) {}

    virtual void on_warning(const ExportWarning& warning) {}

    virtual void on_file(const std::filesystem::path& path, uint64_t size, ExportFormat format) {}

    virtual void on_failed(const ExportError& error) {}

    virtual void on_log(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface of the library.
 *
 * @details Wraps the export pipeline into a blocking call. Uses the PIMPL
 * idiom to hide the codecs, the archive writer and the worker pool.
 */
class ReportExporter {
public:
    ReportExporter();
    ~ReportExporter();

    ReportExporter(const ReportExporter&) = delete;
    ReportExporter& operator=(const ReportExporter&) = delete;
    ReportExporter(ReportExporter&&) noexcept;
    ReportExporter& operator=(ReportExporter&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Overrides ExportOptions::worker_threads for every run.
     * 0 keeps the value in the options.
     */
    ReportExporter& threads(unsigned val);

    /**
     * @brief Source of the run timestamp used in file names and reports.
     * Default: the system clock.
     */
    ReportExporter& clock(std::function<TimePoint()> clock);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void set_observer(ReportObserver* observer);

    // --- Execution ---

    /**
     * @brief Exports @p aggregate into @p target_dir. Blocks until completion.
     * @return The manifest of the produced files, or the fatal error.
     */
    [[nodiscard]] Result<ExportManifest> export_checkup(const CheckUpAggregate& aggregate,
                                                        const std::filesystem::path& target_dir,
                                                        const ExportOptions& options = {});

    // --- Control ---

    /**
     * @brief Requests cancellation of the running export. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace qreport

#endif // QREPORT_HPP
