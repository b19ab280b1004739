/**
 * @file storage_budgeter.hpp
 * @brief Pre-flight estimate of the export size and free space check.
 */

#ifndef QREPORT_STORAGE_BUDGETER_HPP
#define QREPORT_STORAGE_BUDGETER_HPP

#include "checkup.hpp"
#include "errors.hpp"
#include "export_options.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>

namespace qreport {

/**
 * @brief Estimates output size and refuses to start when the target volume
 * is too small.
 *
 * @details The estimate is deliberately coarse: a fixed document overhead,
 * the average processed photo size under the compression policy for every
 * embedded photo, a fixed overhead per table row, the original sizes of the
 * photos copied to the photo folder and a minimum for the text report.
 * check_available() requires twice the estimate to be free.
 */
class StorageBudgeter {
public:
    static constexpr uint64_t kDocumentBaseBytes = 500 * 1000;
    static constexpr uint64_t kTableRowBytes = 2 * 1000;
    static constexpr uint64_t kTextReportMinBytes = 10 * 1000;
    static constexpr uint64_t kTextLineBytes = 120;
    static constexpr uint64_t kUnknownPhotoBytes = 2 * 1000 * 1000;
    static constexpr uint64_t kSafetyFactor = 2;

    /// Returns the free bytes of the volume holding a directory, nullopt when unknown.
    using SpaceProbe = std::function<std::optional<uint64_t>(const std::filesystem::path&)>;

    /**
     * @param probe Free space query; the default uses std::filesystem::space.
     */
    explicit StorageBudgeter(SpaceProbe probe = {});

    /**
     * @brief Expected size in bytes of all outputs selected in @p options.
     */
    [[nodiscard]] uint64_t estimate(const CheckUpAggregate& aggregate, const ExportOptions& options) const;

    /**
     * @brief Average size of one processed photo under @p policy,
     * assuming a 4:3 picture at the policy max width.
     */
    [[nodiscard]] static uint64_t average_processed_photo_bytes(const PhotoPolicy& policy) noexcept;

    /**
     * @brief Checks that at least twice @p estimate is free on the volume of
     * @p target_dir (or of its nearest existing parent).
     * @return INSUFFICIENT_STORAGE (BUDGETING stage) when the space is short.
     */
    [[nodiscard]] Status check_available(const std::filesystem::path& target_dir, uint64_t estimate) const;

    /**
     * @brief The default probe, based on std::filesystem::space.
     */
    static std::optional<uint64_t> filesystem_free_space(const std::filesystem::path& dir);

private:
    SpaceProbe probe_;
};

} // namespace qreport

#endif // QREPORT_STORAGE_BUDGETER_HPP
