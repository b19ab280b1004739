#include "../../include/report_statistics.hpp"
#include <chrono>

namespace qreport {

namespace {

void count_item(const CheckItem& item, SectionStatistics& s) {
    ++s.total_items;
    s.photos += item.photos.size();
    switch (item.status) {
        case CheckItemStatus::Ok:       ++s.ok_items; break;
        case CheckItemStatus::Nok:      ++s.nok_items; break;
        case CheckItemStatus::Critical: break;
        case CheckItemStatus::Pending:  ++s.pending_items; break;
        case CheckItemStatus::Na:       ++s.na_items; break;
    }
    if (item.status == CheckItemStatus::Critical || item.criticality == Criticality::Critical) {
        ++s.critical_items;
    }
}

TimePoint add_months(const TimePoint from, const int n) {
    using namespace std::chrono;
    const auto day_point = floor<days>(from);
    const auto time_of_day = from - day_point;
    year_month_day ymd{day_point};
    ymd += months(n);
    if (!ymd.ok()) {
        ymd = ymd.year() / ymd.month() / last;
    }
    return time_point_cast<Clock::duration>(sys_days{ymd} + time_of_day);
}

} // namespace

SectionStatistics compute_section_statistics(const Section& section) {
    SectionStatistics s;
    for (const auto& item : section.items) {
        count_item(item, s);
    }
    return s;
}

CheckupStatistics compute_statistics(const CheckUpAggregate& aggregate) {
    CheckupStatistics stats;
    stats.total_sections = aggregate.sections.size();
    stats.spare_parts = aggregate.spare_parts.size();
    stats.sections.reserve(aggregate.sections.size());

    for (const auto& section : aggregate.sections) {
        SectionStatistics s;
        for (const auto& item : section.items) {
            count_item(item, s);
            if (item.status == CheckItemStatus::Critical) ++stats.critical_status_items;
            if (item.criticality == Criticality::Important) ++stats.important_issues;
        }
        stats.total_items += s.total_items;
        stats.ok_items += s.ok_items;
        stats.nok_items += s.nok_items;
        stats.pending_items += s.pending_items;
        stats.na_items += s.na_items;
        stats.critical_issues += s.critical_items;
        stats.total_photos += s.photos;
        if (s.has_issues()) ++stats.sections_with_issues;
        stats.sections.push_back(s);
    }
    return stats;
}

OverallRating overall_rating(const CheckupStatistics& stats) {
    if (stats.critical_issues > 0) return OverallRating::Critico;
    if (stats.nok_percentage() > 10.0) return OverallRating::Attenzione;
    if (stats.ok_percentage() >= 95.0) return OverallRating::Ottimo;
    if (stats.ok_percentage() >= 85.0) return OverallRating::Buono;
    return OverallRating::Sufficiente;
}

std::string overall_rating_text(const OverallRating rating) {
    switch (rating) {
        case OverallRating::Critico:     return "CRITICO - Intervento immediato richiesto";
        case OverallRating::Attenzione:  return "ATTENZIONE - Problemi rilevati";
        case OverallRating::Ottimo:      return "OTTIMO - Sistema in perfette condizioni";
        case OverallRating::Buono:       return "BUONO - Sistema funzionale";
        case OverallRating::Sufficiente: return "SUFFICIENTE - Monitoraggio richiesto";
    }
    return {};
}

std::string item_recommendation(const CheckItem& item) {
    if (item.status == CheckItemStatus::Critical) return "Sostituire entro 24h";
    if (item.criticality == Criticality::Critical) return "Intervento immediato necessario";
    if (item.status == CheckItemStatus::Nok && item.criticality == Criticality::Important)
        return "Programmare sostituzione";
    if (item.status == CheckItemStatus::Nok) return "Monitorare nelle prossime verifiche";
    return {};
}

Recommendations general_recommendations(const CheckupStatistics& stats) {
    Recommendations r;
    if (stats.critical_issues > 0) {
        r.immediate_actions.push_back("Sostituire immediatamente " + std::to_string(stats.critical_issues) +
                                      " componenti critici");
    }
    if (stats.nok_percentage() > 10.0) {
        r.general.push_back("Programmare manutenzione straordinaria - " +
                            std::to_string(stats.nok_items + stats.critical_status_items) + " controlli falliti");
    }
    if (stats.pending_items > 0) {
        r.general.push_back("Completare " + std::to_string(stats.pending_items) + " controlli in sospeso");
    }
    if (stats.total_photos > 50) {
        r.general.push_back("Archiviare foto del checkup per storico manutenzioni");
    }
    return r;
}

NextCheckup next_checkup(const CheckupStatistics& stats, const TimePoint from) {
    if (stats.critical_issues > 0) return {from + std::chrono::weeks(2), "Verifica risoluzione criticita'"};
    if (stats.nok_percentage() > 15.0) return {add_months(from, 1), "Monitoraggio problemi rilevati"};
    if (stats.ok_percentage() >= 95.0) return {add_months(from, 6), "Manutenzione preventiva standard"};
    return {add_months(from, 3), "Controllo periodico raccomandato"};
}

} // namespace qreport
