/**
 * @file text_report_renderer.hpp
 * @brief Fixed-width plain-text rendition of the check-up report.
 */

#ifndef QREPORT_TEXT_REPORT_RENDERER_HPP
#define QREPORT_TEXT_REPORT_RENDERER_HPP

#include "checkup.hpp"
#include "export_options.hpp"
#include "naming_resolver.hpp"
#include <string>

namespace qreport {

/**
 * @brief Renders the report as 80-column text.
 *
 * @details Same logical content as the document: general information,
 * executive summary, per-section detail, spare parts grouped by urgency,
 * conclusions, footer. Photos are not decoded; every item lists its photo
 * count and each resolved file name exactly as the photo folder names it.
 *
 * A file name is always printed whole on one line so that it can be
 * searched for; every other line is wrapped to 80 columns.
 */
class TextReportRenderer {
public:
    static constexpr size_t kWidth = 80;

    /**
     * @brief Renders the report.
     * @param naming Resolver shared with the other outputs; its run
     * timestamp is printed as the generation time.
     * @return The report text, '\n' line endings.
     */
    [[nodiscard]] std::string render(const CheckUpAggregate& aggregate,
                                     const ExportOptions& options,
                                     NamingResolver& naming) const;
};

} // namespace qreport

#endif // QREPORT_TEXT_REPORT_RENDERER_HPP
