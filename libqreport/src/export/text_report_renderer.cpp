#include "../../include/text_report_renderer.hpp"
#include "../../include/logger.hpp"
#include "../../include/report_statistics.hpp"
#include "../../include/text_formatter.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "text_renderer";
}

constexpr size_t kLabelWidth = 22;

std::string_view status_label(const CheckItemStatus status) {
    switch (status) {
        case CheckItemStatus::Ok:       return "OK";
        case CheckItemStatus::Nok:      return "NOK";
        case CheckItemStatus::Critical: return "CRITICO";
        case CheckItemStatus::Pending:  return "IN ATTESA";
        case CheckItemStatus::Na:       return "N/A";
    }
    return "";
}

std::string_view criticality_label(const Criticality criticality) {
    switch (criticality) {
        case Criticality::Critical:  return "CRITICA";
        case Criticality::Important: return "IMPORTANTE";
        case Criticality::Routine:   return "ROUTINE";
        case Criticality::Na:        return "N/A";
    }
    return "";
}

std::string upper(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string percent(const double value) {
    return text::format_decimal(value, 1) + "%";
}

/**
 * @brief Line-oriented writer that never exceeds the report width.
 */
class ReportText {
public:
    void line(const std::string_view s = {}) {
        if (s.size() <= TextReportRenderer::kWidth) {
            out_ << s << '\n';
            return;
        }
        for (const auto& l : text::wrap(s, TextReportRenderer::kWidth, "", "")) {
            out_ << l << '\n';
        }
    }

    void rule(const char c) { out_ << std::string(TextReportRenderer::kWidth, c) << '\n'; }

    void banner(const std::string_view title) {
        rule('=');
        line(text::center(title, TextReportRenderer::kWidth));
        rule('=');
    }

    void heading(const std::string_view title) {
        line();
        line(title);
        rule('-');
    }

    /// "Label:                value", value wrapped under itself
    void field(const std::string_view label, const std::string_view value) {
        std::string prefix(label);
        prefix += ':';
        if (prefix.size() < kLabelWidth) prefix.resize(kLabelWidth, ' ');
        else prefix += ' ';
        const std::string value_text = text::is_blank(value) ? "-" : std::string(value);
        for (const auto& l : text::wrap(value_text, TextReportRenderer::kWidth, prefix,
                                        std::string(prefix.size(), ' '))) {
            line(l);
        }
    }

    void wrapped(const std::string_view value, const std::string_view first, const std::string_view next) {
        for (const auto& l : text::wrap(value, TextReportRenderer::kWidth, first, next)) {
            line(l);
        }
    }

    /// A file name on its own line, never split.
    void file_name(const std::string_view indent, const std::string_view name) {
        if (indent.size() + name.size() <= TextReportRenderer::kWidth) {
            out_ << indent << name << '\n';
        } else {
            out_ << name << '\n';
        }
    }

    [[nodiscard]] std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
};

void general_information(ReportText& r, const CheckUpAggregate& aggregate, const ExportOptions& options) {
    const auto& h = aggregate.header;
    r.heading("INFORMAZIONI GENERALI");
    r.field("Cliente", h.client.company_name);
    if (!h.client.site.empty()) r.field("Sito", h.client.site);
    if (!h.client.contact_person.empty()) r.field("Contatto", h.client.contact_person);
    if (!h.client.address.empty()) r.field("Indirizzo", h.client.address);
    r.field("Tecnico", h.technician.name);
    if (!h.technician.company.empty()) r.field("Azienda tecnico", h.technician.company);
    r.field("Tipo isola", h.island.island_type);
    r.field("Serial number", h.island.serial_number);
    if (!h.island.model.empty()) r.field("Modello", h.island.model);
    if (h.island.operating_hours) r.field("Ore funzionamento", std::to_string(*h.island.operating_hours) + " h");
    if (h.island.cycle_count) r.field("Cicli", std::to_string(*h.island.cycle_count));
    if (h.scheduled_at) r.field("Data programmata", text::format_date_time(*h.scheduled_at));
    if (h.started_at) r.field("Data inizio", text::format_date_time(*h.started_at));
    r.field("Data completamento", h.completed_at ? text::format_date_time(*h.completed_at) : "In corso");
    if (!h.status.empty()) r.field("Stato", h.status);
    if (options.include_notes && !text::is_blank(h.notes)) {
        r.field("Note generali", h.notes);
    }
}

void executive_summary(ReportText& r, const CheckupStatistics& stats, const ExportOptions& options) {
    r.heading("RIEPILOGO ESECUTIVO");
    r.field("Valutazione", overall_rating_text(overall_rating(stats)));
    r.field("Moduli", std::to_string(stats.total_sections));
    r.field("Controlli totali", std::to_string(stats.total_items));
    r.field("OK", std::to_string(stats.ok_items) + " (" + percent(stats.ok_percentage()) + ")");
    r.field("NOK", std::to_string(stats.nok_items + stats.critical_status_items) + " (" +
                   percent(stats.nok_percentage()) + ")");
    r.field("N/A", std::to_string(stats.na_items) + " (" + percent(stats.na_percentage()) + ")");
    r.field("In attesa", std::to_string(stats.pending_items));
    r.field("Criticita' rilevate", std::to_string(stats.critical_issues));
    r.field("Completamento", percent(stats.completion_percentage()));
    if (options.include_photos) {
        r.field("Foto acquisite", std::to_string(stats.total_photos));
    }
    if (stats.sections_with_issues > 0) {
        r.field("Moduli con problemi",
                std::to_string(stats.sections_with_issues) + "/" + std::to_string(stats.total_sections));
    }
}

void section_detail(ReportText& r, const CheckUpAggregate& aggregate, const CheckupStatistics& stats,
                    const ExportOptions& options, NamingResolver& naming) {
    r.line();
    r.banner("DETTAGLIO CONTROLLI");
    for (size_t s = 0; s < aggregate.sections.size(); ++s) {
        const Section& section = aggregate.sections[s];
        const SectionStatistics& ss = stats.sections[s];
        r.line();
        r.wrapped(upper(section.title), "MODULO " + std::to_string(s + 1) + ": ", "  ");
        r.line("Controlli: " + std::to_string(ss.total_items) + " | OK: " + std::to_string(ss.ok_items) +
               " | NOK: " + std::to_string(ss.nok_items) + " | Critici: " + std::to_string(ss.critical_items));
        r.rule('-');

        if (section.items.empty()) {
            r.line("Nessun controllo registrato");
            continue;
        }
        for (size_t i = 0; i < section.items.size(); ++i) {
            const CheckItem& item = section.items[i];
            if (i > 0) r.line();
            r.wrapped(item.title, std::to_string(i + 1) + ". ", "   ");
            if (!item.code.empty()) r.wrapped(item.code, "   Codice: ", "           ");
            r.line("   Stato: " + std::string(status_label(item.status)));
            r.line("   Criticita': " + std::string(criticality_label(item.criticality)));
            if (options.include_notes && !text::is_blank(item.note)) {
                r.wrapped(item.note, "   Note: ", "         ");
            }
            if (options.include_photos) {
                if (item.photos.empty()) {
                    r.line("   Foto: Nessuna foto");
                } else {
                    r.line("   Foto: " + std::to_string(item.photos.size()) + " foto acquisite");
                    for (size_t p = 0; p < item.photos.size(); ++p) {
                        r.file_name("      - ", naming.resolve(s, section.title, item, p, item.photos[p].caption));
                    }
                }
            }
            const std::string action = item_recommendation(item);
            if (!action.empty()) {
                r.wrapped(action, "   Azione: ", "           ");
            }
        }
    }
}

void spare_parts(ReportText& r, const CheckUpAggregate& aggregate, const ExportOptions& options) {
    if (aggregate.spare_parts.empty()) {
        return;
    }
    r.line();
    r.banner("PARTI DI RICAMBIO");

    constexpr std::array<std::pair<Criticality, std::string_view>, 4> groups{{
        {Criticality::Critical, "URGENZA CRITICA"},
        {Criticality::Important, "URGENZA IMPORTANTE"},
        {Criticality::Routine, "URGENZA ROUTINE"},
        {Criticality::Na, "URGENZA NON DEFINITA"},
    }};

    double total_cost = 0.0;
    bool any_cost = false;
    for (const auto& [urgency, title] : groups) {
        std::vector<const SparePart*> parts;
        for (const auto& part : aggregate.spare_parts) {
            if (part.urgency == urgency) parts.push_back(&part);
        }
        if (parts.empty()) continue;

        r.line();
        r.line(std::string(title) + " (" + std::to_string(parts.size()) + ")");
        for (const SparePart* part : parts) {
            std::string head = "[" + part->part_number + "] " + part->description;
            head += " x" + std::to_string(part->quantity);
            r.wrapped(head, "- ", "  ");
            if (part->estimated_cost) {
                const double cost = *part->estimated_cost * part->quantity;
                total_cost += cost;
                any_cost = true;
                r.line("  Costo stimato: EUR " + text::format_decimal(cost, 2));
            }
            if (options.include_notes && !text::is_blank(part->notes)) {
                r.wrapped(part->notes, "  Note: ", "        ");
            }
        }
    }
    if (any_cost) {
        r.line();
        r.line("Totale stimato: EUR " + text::format_decimal(total_cost, 2));
    }
}

void conclusions(ReportText& r, const CheckUpAggregate& aggregate, const CheckupStatistics& stats,
                 const TimePoint generated_at) {
    r.line();
    r.banner("CONCLUSIONI");
    const Recommendations rec = general_recommendations(stats);
    if (!rec.immediate_actions.empty()) {
        r.heading("AZIONI IMMEDIATE");
        for (const auto& a : rec.immediate_actions) r.wrapped(a, "- ", "  ");
    }
    if (!rec.general.empty()) {
        r.heading("RACCOMANDAZIONI");
        for (const auto& g : rec.general) r.wrapped(g, "- ", "  ");
    }
    const NextCheckup next = next_checkup(stats, generated_at);
    r.heading("PROSSIMO CHECKUP");
    r.field("Data consigliata", text::format_date(next.date));
    r.field("Motivo", next.reason);

    const auto& h = aggregate.header;
    r.heading("VALIDAZIONE TECNICA");
    r.field("Tecnico", h.technician.name);
    if (!h.technician.certification.empty()) r.field("Certificazione", h.technician.certification);
    if (!h.technician.phone.empty()) r.field("Telefono", h.technician.phone);
    if (!h.technician.email.empty()) r.field("Email", h.technician.email);
    r.field("Report generato il", text::format_date_time(generated_at));
}

} // namespace

std::string TextReportRenderer::render(const CheckUpAggregate& aggregate,
                                       const ExportOptions& options,
                                       NamingResolver& naming) const {
    const CheckupStatistics stats = compute_statistics(aggregate);
    ReportText r;

    r.banner("REPORT CHECKUP INDUSTRIALE");
    general_information(r, aggregate, options);
    executive_summary(r, stats, options);
    section_detail(r, aggregate, stats, options, naming);
    spare_parts(r, aggregate, options);
    conclusions(r, aggregate, stats, naming.generated_at());

    r.line();
    r.rule('=');
    r.line(text::center("Report generato automaticamente da QReport v1.0", kWidth));
    r.rule('=');

    std::string out = r.str();
    Logger::log(LogLevel::Debug,
                "Text report rendered: " + std::to_string(out.size()) + " bytes, " +
                std::to_string(stats.total_items) + " items",
                processor_tag());
    return out;
}

} // namespace qreport
