/**
 * @file report_statistics.hpp
 * @brief Aggregate figures and recommendations shared by the document and
 * the text report.
 */

#ifndef QREPORT_REPORT_STATISTICS_HPP
#define QREPORT_REPORT_STATISTICS_HPP

#include "checkup.hpp"
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Per-section counters.
 */
struct SectionStatistics {
    size_t total_items = 0;
    size_t ok_items = 0;
    size_t nok_items = 0;
    size_t critical_items = 0; ///< items with CRITICAL status or criticality
    size_t pending_items = 0;
    size_t na_items = 0;
    size_t photos = 0;

    [[nodiscard]] bool has_issues() const noexcept { return nok_items > 0 || critical_items > 0; }
};

/**
 * @brief Whole check-up counters, computed in one pass over all items.
 */
struct CheckupStatistics {
    size_t total_sections = 0;
    size_t total_items = 0;
    size_t ok_items = 0;
    size_t nok_items = 0;
    size_t critical_status_items = 0;
    size_t pending_items = 0;
    size_t na_items = 0;
    size_t critical_issues = 0;  ///< items needing immediate action
    size_t important_issues = 0; ///< items with IMPORTANT criticality
    size_t total_photos = 0;
    size_t sections_with_issues = 0;
    size_t spare_parts = 0;
    std::vector<SectionStatistics> sections;

    [[nodiscard]] double percentage(size_t count) const noexcept {
        return total_items > 0 ? static_cast<double>(count) * 100.0 / static_cast<double>(total_items) : 0.0;
    }
    [[nodiscard]] double ok_percentage() const noexcept { return percentage(ok_items); }
    [[nodiscard]] double nok_percentage() const noexcept { return percentage(nok_items + critical_status_items); }
    [[nodiscard]] double na_percentage() const noexcept { return percentage(na_items); }

    /// @return share of items that are no longer PENDING
    [[nodiscard]] double completion_percentage() const noexcept { return percentage(total_items - pending_items); }
};

enum class OverallRating { Critico, Attenzione, Ottimo, Buono, Sufficiente };

struct Recommendations {
    std::vector<std::string> immediate_actions;
    std::vector<std::string> general;
};

struct NextCheckup {
    TimePoint date;
    std::string reason;
};

/**
 * @brief Single pass over sections and items.
 */
CheckupStatistics compute_statistics(const CheckUpAggregate& aggregate);

SectionStatistics compute_section_statistics(const Section& section);

OverallRating overall_rating(const CheckupStatistics& stats);

/// @return e.g. "CRITICO - Intervento immediato richiesto"
std::string overall_rating_text(OverallRating rating);

/**
 * @brief Action suggested for a single item; empty when none is needed.
 */
std::string item_recommendation(const CheckItem& item);

Recommendations general_recommendations(const CheckupStatistics& stats);

/**
 * @brief Suggested date of the next check-up, counted from @p from:
 * 2 weeks with critical issues, 1 month when more than 15% of the items
 * failed, 6 months when at least 95% are OK, 3 months otherwise.
 */
NextCheckup next_checkup(const CheckupStatistics& stats, TimePoint from);

} // namespace qreport

#endif // QREPORT_REPORT_STATISTICS_HPP
