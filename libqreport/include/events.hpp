#ifndef QREPORT_EVENTS_HPP
#define QREPORT_EVENTS_HPP

#include "errors.hpp"
#include "export_manifest.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace qreport {

/**
 * @brief Events published during an export run.
 *
 * Plain data carriers used with EventBus to notify subscribers (facade
 * observer, CLI progress output) about stage changes, photos, written
 * files and failures.
 */

/**
 * @brief Emitted on every orchestrator stage transition.
 */
struct ExportStageEvent {
    ExportStage stage = ExportStage::Validating;
};

/**
 * @brief Emitted after a photo went through the photo processor.
 */
struct PhotoProcessedEvent {
    std::filesystem::path source;      ///< original photo path
    std::string name;                  ///< resolved file name
    bool success = false;
    uint32_t width = 0;                ///< output width, 0 on failure
    uint32_t height = 0;               ///< output height, 0 on failure
    uint64_t size = 0;                 ///< encoded size in bytes
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a per-photo failure is recovered.
 */
struct ExportWarningEvent {
    ExportWarning warning;
};

/**
 * @brief Emitted when an output file is in its final place.
 */
struct FileWrittenEvent {
    std::filesystem::path path;
    uint64_t size = 0;
    ExportFormat format = ExportFormat::Document;
};

/**
 * @brief Emitted once when a run ends in the FAILED stage.
 */
struct ExportFailedEvent {
    ExportError error;
};

} // namespace qreport

#endif // QREPORT_EVENTS_HPP
