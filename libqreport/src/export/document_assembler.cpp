#include "../../include/document_assembler.hpp"
#include "../../include/docx_package.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/photo_processor.hpp"
#include "../../include/report_statistics.hpp"
#include "../../include/text_formatter.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "document_assembler";
}

// A4 with 0.5" margins, in twentieths of a point
constexpr int kPageWidthTwips = 11906;
constexpr int kPageHeightTwips = 16838;
constexpr int kMarginTwips = 720;
constexpr int kTextWidthTwips = kPageWidthTwips - 2 * kMarginTwips;
constexpr int kCellMarginTwips = 80;

constexpr std::string_view kColorTitle = "1F4E79";
constexpr std::string_view kColorHeader = "D9E2F3";
constexpr std::string_view kColorOk = "00B050";
constexpr std::string_view kColorNok = "FF0000";
constexpr std::string_view kColorPending = "FFC000";
constexpr std::string_view kColorNeutral = "808080";

constexpr std::string_view kContentTypes =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(<Default Extension="jpg" ContentType="image/jpeg"/>)"
    R"(<Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>)"
    R"(<Override PartName="/word/styles.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml"/>)"
    R"(<Override PartName="/docProps/core.xml" ContentType="application/vnd.openxmlformats-package.core-properties+xml"/>)"
    R"(<Override PartName="/docProps/app.xml" ContentType="application/vnd.openxmlformats-officedocument.extended-properties+xml"/>)"
    R"(</Types>)";

constexpr std::string_view kPackageRels =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
    R"(<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties" Target="docProps/core.xml"/>)"
    R"(<Relationship Id="rId3" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties" Target="docProps/app.xml"/>)"
    R"(</Relationships>)";

constexpr std::string_view kStyles =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:styles xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:docDefaults><w:rPrDefault><w:rPr><w:rFonts w:ascii="Calibri" w:hAnsi="Calibri" w:cs="Calibri"/>)"
    R"(<w:sz w:val="22"/><w:szCs w:val="22"/><w:lang w:val="it-IT"/></w:rPr></w:rPrDefault>)"
    R"(<w:pPrDefault><w:pPr><w:spacing w:after="120" w:line="264" w:lineRule="auto"/></w:pPr></w:pPrDefault></w:docDefaults>)"
    R"(<w:style w:type="paragraph" w:default="1" w:styleId="Normal"><w:name w:val="Normal"/></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Title"><w:name w:val="Title"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:jc w:val="center"/><w:spacing w:after="240"/></w:pPr>)"
    R"(<w:rPr><w:b/><w:color w:val="1F4E79"/><w:sz w:val="40"/></w:rPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Subtitle"><w:name w:val="Subtitle"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:jc w:val="center"/></w:pPr><w:rPr><w:color w:val="404040"/><w:sz w:val="28"/></w:rPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Heading1"><w:name w:val="heading 1"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:keepNext/><w:spacing w:before="360" w:after="120"/><w:outlineLvl w:val="0"/></w:pPr>)"
    R"(<w:rPr><w:b/><w:color w:val="1F4E79"/><w:sz w:val="32"/></w:rPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Heading2"><w:name w:val="heading 2"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:keepNext/><w:spacing w:before="240" w:after="80"/><w:outlineLvl w:val="1"/></w:pPr>)"
    R"(<w:rPr><w:b/><w:color w:val="2E75B6"/><w:sz w:val="26"/></w:rPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="Caption"><w:name w:val="caption"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:jc w:val="center"/><w:spacing w:after="160"/></w:pPr>)"
    R"(<w:rPr><w:i/><w:color w:val="404040"/><w:sz w:val="16"/></w:rPr></w:style>)"
    R"(<w:style w:type="paragraph" w:styleId="TableText"><w:name w:val="Table Text"/><w:basedOn w:val="Normal"/>)"
    R"(<w:pPr><w:spacing w:after="0"/></w:pPr><w:rPr><w:sz w:val="18"/></w:rPr></w:style>)"
    R"(</w:styles>)";

std::string xml_escape(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                // XML 1.0 forbids most control characters
                if (c < 0x20 && ch != '\t' && ch != '\n' && ch != '\r') {
                    out += ' ';
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

/**
 * @brief Formatting of a single run of text.
 */
struct RunStyle {
    bool bold = false;
    bool italic = false;
    std::string_view color{};
    int half_points = 0; ///< 0 keeps the paragraph style size
};

struct StatusLook {
    std::string text;
    std::string_view color;
};

StatusLook status_look(const CheckItemStatus status) {
    switch (status) {
        case CheckItemStatus::Ok:       return {"✔ OK", kColorOk};
        case CheckItemStatus::Nok:      return {"✘ NOK", kColorNok};
        case CheckItemStatus::Critical: return {"✘ CRITICO", kColorNok};
        case CheckItemStatus::Pending:  return {"◷ IN ATTESA", kColorPending};
        case CheckItemStatus::Na:       return {"– N/A", kColorNeutral};
    }
    return {"", kColorNeutral};
}

StatusLook criticality_look(const Criticality criticality) {
    switch (criticality) {
        case Criticality::Critical:  return {"● CRITICA", kColorNok};
        case Criticality::Important: return {"● IMPORTANTE", kColorPending};
        case Criticality::Routine:   return {"● ROUTINE", kColorOk};
        case Criticality::Na:        return {"– N/A", kColorNeutral};
    }
    return {"", kColorNeutral};
}

std::string optional_date(const std::optional<TimePoint>& tp, const std::string& fallback = "-") {
    return tp ? text::format_date_time(*tp) : fallback;
}

/**
 * @brief Accumulates word/document.xml and streams media parts into the
 * package while the body is being written.
 */
class DocumentWriter {
public:
    explicit DocumentWriter(DocxPackage& package) : package_(package) {}

    // --- paragraphs ---

    void paragraph(const std::string_view text, const std::string_view style = {},
                   const RunStyle& run_style = {}, const std::string_view align = {}) {
        open_paragraph(style, align);
        run(text, run_style);
        body_ << "</w:p>";
    }

    void labelled(const std::string_view label, const std::string_view value) {
        open_paragraph({}, {});
        run(label, RunStyle{.bold = true});
        run(value, {});
        body_ << "</w:p>";
    }

    void page_break() {
        body_ << R"(<w:p><w:r><w:br w:type="page"/></w:r></w:p>)";
    }

    // --- tables ---

    void begin_table(const std::vector<int>& column_twips, const bool borders = true) {
        column_twips_ = column_twips;
        body_ << "<w:tbl><w:tblPr>"
              << R"(<w:tblW w:w=")" << sum(column_twips) << R"(" w:type="dxa"/>)";
        if (borders) {
            body_ << "<w:tblBorders>";
            for (const char* edge : {"top", "left", "bottom", "right", "insideH", "insideV"}) {
                body_ << "<w:" << edge << R"( w:val="single" w:sz="4" w:space="0" w:color="A6A6A6"/>)";
            }
            body_ << "</w:tblBorders>";
        }
        body_ << R"(<w:tblLayout w:type="fixed"/>)"
              << R"(<w:tblCellMar><w:left w:w=")" << kCellMarginTwips << R"(" w:type="dxa"/><w:right w:w=")"
              << kCellMarginTwips << R"(" w:type="dxa"/></w:tblCellMar>)"
              << "</w:tblPr><w:tblGrid>";
        for (const int w : column_twips) {
            body_ << R"(<w:gridCol w:w=")" << w << R"("/>)";
        }
        body_ << "</w:tblGrid>";
    }

    void begin_row(const bool header = false) {
        body_ << "<w:tr>";
        if (header) {
            body_ << "<w:trPr><w:tblHeader/></w:trPr>";
        }
        column_ = 0;
    }

    void begin_cell(const std::string_view fill = {}) {
        const int width = column_ < column_twips_.size() ? column_twips_[column_] : 0;
        body_ << R"(<w:tc><w:tcPr><w:tcW w:w=")" << width << R"(" w:type="dxa"/>)";
        if (!fill.empty()) {
            body_ << R"(<w:shd w:val="clear" w:color="auto" w:fill=")" << fill << R"("/>)";
        }
        body_ << "<w:vAlign w:val=\"center\"/></w:tcPr>";
        ++column_;
    }

    void end_cell() { body_ << "</w:tc>"; }
    void end_row() { body_ << "</w:tr>"; }

    void end_table() {
        body_ << "</w:tbl>";
        // Word merges adjacent tables without a paragraph in between
        body_ << "<w:p/>";
    }

    void text_cell(const std::string_view text, const RunStyle& style = {}, const std::string_view fill = {}) {
        begin_cell(fill);
        paragraph(text, "TableText", style);
        end_cell();
    }

    void header_row(const std::vector<std::string_view>& titles) {
        begin_row(true);
        for (const auto title : titles) {
            text_cell(title, RunStyle{.bold = true, .color = kColorTitle}, kColorHeader);
        }
        end_row();
    }

    // --- images ---

    /**
     * @brief Stores @p jpeg as a media part and writes an inline picture
     * paragraph of the given size.
     */
    void image(const std::vector<unsigned char>& jpeg, const std::string& name,
               const int64_t cx_emu, const int64_t cy_emu) {
        const size_t index = ++image_count_;
        const std::string part = "media/image" + std::to_string(index) + ".jpg";
        package_.add_part("word/" + part, jpeg);

        const std::string rid = "rId" + std::to_string(index + 1);
        relationships_ << R"(<Relationship Id=")" << rid
                       << R"(" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/image" Target=")"
                       << part << R"("/>)";

        const size_t id = index;
        body_ << R"(<w:p><w:pPr><w:pStyle w:val="TableText"/><w:jc w:val="center"/></w:pPr><w:r><w:drawing>)"
              << R"(<wp:inline distT="0" distB="0" distL="0" distR="0">)"
              << R"(<wp:extent cx=")" << cx_emu << R"(" cy=")" << cy_emu << R"("/>)"
              << R"(<wp:docPr id=")" << id << R"(" name="Foto )" << id << R"(" descr=")" << xml_escape(name) << R"("/>)"
              << R"(<wp:cNvGraphicFramePr><a:graphicFrameLocks noChangeAspect="1"/></wp:cNvGraphicFramePr>)"
              << R"(<a:graphic><a:graphicData uri="http://schemas.openxmlformats.org/drawingml/2006/picture">)"
              << R"(<pic:pic><pic:nvPicPr><pic:cNvPr id=")" << id << R"(" name=")" << xml_escape(name) << R"("/>)"
              << R"(<pic:cNvPicPr/></pic:nvPicPr>)"
              << R"(<pic:blipFill><a:blip r:embed=")" << rid << R"("/><a:stretch><a:fillRect/></a:stretch></pic:blipFill>)"
              << R"(<pic:spPr><a:xfrm><a:off x="0" y="0"/><a:ext cx=")" << cx_emu << R"(" cy=")" << cy_emu << R"("/></a:xfrm>)"
              << R"(<a:prstGeom prst="rect"><a:avLst/></a:prstGeom></pic:spPr></pic:pic>)"
              << R"(</a:graphicData></a:graphic></wp:inline></w:drawing></w:r></w:p>)";
    }

    // --- output ---

    [[nodiscard]] std::string document_xml() const {
        std::ostringstream doc;
        doc << R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
            << R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main")"
            << R"( xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships")"
            << R"( xmlns:wp="http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing")"
            << R"( xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main")"
            << R"( xmlns:pic="http://schemas.openxmlformats.org/drawingml/2006/picture">)"
            << "<w:body>" << body_.str()
            << R"(<w:sectPr><w:pgSz w:w=")" << kPageWidthTwips << R"(" w:h=")" << kPageHeightTwips << R"("/>)"
            << R"(<w:pgMar w:top=")" << kMarginTwips << R"(" w:right=")" << kMarginTwips
            << R"(" w:bottom=")" << kMarginTwips << R"(" w:left=")" << kMarginTwips
            << R"(" w:header="360" w:footer="360" w:gutter="0"/></w:sectPr>)"
            << "</w:body></w:document>";
        return doc.str();
    }

    [[nodiscard]] std::string relationships_xml() const {
        std::ostringstream rels;
        rels << R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
             << R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
             << R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles" Target="styles.xml"/>)"
             << relationships_.str() << "</Relationships>";
        return rels.str();
    }

private:
    static int sum(const std::vector<int>& v) {
        int total = 0;
        for (const int x : v) total += x;
        return total;
    }

    void open_paragraph(const std::string_view style, const std::string_view align) {
        body_ << "<w:p>";
        if (!style.empty() || !align.empty()) {
            body_ << "<w:pPr>";
            if (!style.empty()) body_ << R"(<w:pStyle w:val=")" << style << R"("/>)";
            if (!align.empty()) body_ << R"(<w:jc w:val=")" << align << R"("/>)";
            body_ << "</w:pPr>";
        }
    }

    void run(const std::string_view text, const RunStyle& style) {
        if (text.empty()) return;
        body_ << "<w:r>";
        if (style.bold || style.italic || !style.color.empty() || style.half_points > 0) {
            body_ << "<w:rPr>";
            if (style.bold) body_ << "<w:b/>";
            if (style.italic) body_ << "<w:i/>";
            if (!style.color.empty()) body_ << R"(<w:color w:val=")" << style.color << R"("/>)";
            if (style.half_points > 0) body_ << R"(<w:sz w:val=")" << style.half_points << R"("/>)";
            body_ << "</w:rPr>";
        }
        body_ << R"(<w:t xml:space="preserve">)" << xml_escape(text) << "</w:t></w:r>";
    }

    DocxPackage& package_;
    std::ostringstream body_;
    std::ostringstream relationships_;
    std::vector<int> column_twips_;
    size_t column_ = 0;
    size_t image_count_ = 0;
};

std::string core_properties(const CheckUpAggregate& aggregate, const TimePoint generated_at) {
    std::ostringstream os;
    const std::string stamp = text::format_iso8601_utc(generated_at);
    os << R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
       << R"(<cp:coreProperties xmlns:cp="http://schemas.openxmlformats.org/package/2006/metadata/core-properties")"
       << R"( xmlns:dc="http://purl.org/dc/elements/1.1/" xmlns:dcterms="http://purl.org/dc/terms/")"
       << R"( xmlns:dcmitype="http://purl.org/dc/dcmitype/" xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance">)"
       << "<dc:title>" << xml_escape("Report Checkup " + aggregate.header.island.island_type) << "</dc:title>"
       << "<dc:subject>" << xml_escape(aggregate.header.client.company_name) << "</dc:subject>"
       << "<dc:creator>" << xml_escape(aggregate.header.technician.name) << "</dc:creator>"
       << R"(<dcterms:created xsi:type="dcterms:W3CDTF">)" << stamp << "</dcterms:created>"
       << R"(<dcterms:modified xsi:type="dcterms:W3CDTF">)" << stamp << "</dcterms:modified>"
       << "</cp:coreProperties>";
    return os.str();
}

std::string app_properties(const size_t photos) {
    std::ostringstream os;
    os << R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
       << R"(<Properties xmlns="http://schemas.openxmlformats.org/officeDocument/2006/extended-properties">)"
       << "<Application>QReport</Application><Company>QReport</Company>"
       << "<Pictures>" << photos << "</Pictures></Properties>";
    return os.str();
}

/**
 * @brief Sequential document build; one instance per assemble() call.
 */
class Assembly {
public:
    Assembly(const CheckUpAggregate& aggregate, const ExportOptions& options, NamingResolver& naming,
             PhotoProvider& photos, std::stop_token stop, const TimePoint generated_at, DocxPackage& package)
        : aggregate_(aggregate), options_(options), naming_(naming), photos_(photos),
          stop_(std::move(stop)), generated_at_(generated_at), writer_(package),
          stats_(compute_statistics(aggregate)) {}

    /// @return false when cancelled
    bool build() {
        title_block();
        info_table();
        executive_summary();
        writer_.page_break();
        writer_.paragraph("DETTAGLIO CONTROLLI", "Heading1");
        for (size_t s = 0; s < aggregate_.sections.size(); ++s) {
            if (stop_.stop_requested()) {
                return false;
            }
            if (!section_block(s)) {
                return false;
            }
        }
        spare_parts();
        conclusions();
        signature_block();
        return true;
    }

    [[nodiscard]] const DocumentWriter& writer() const noexcept { return writer_; }
    [[nodiscard]] AssembledDocument& result() noexcept { return result_; }

private:
    void title_block() {
        std::string island = aggregate_.header.island.island_type;
        std::ranges::transform(island, island.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        writer_.paragraph("REPORT CHECKUP " + island, "Title");
        writer_.paragraph("Cliente: " + aggregate_.header.client.company_name, "Subtitle");
        if (!aggregate_.header.client.site.empty()) {
            writer_.paragraph("Sito: " + aggregate_.header.client.site, "Subtitle");
        }
    }

    void info_table() {
        const auto& h = aggregate_.header;
        std::vector<std::pair<std::string, std::string>> rows = {
            {"Data Check-up", optional_date(h.completed_at ? h.completed_at : h.started_at)},
            {"Tecnico", h.technician.name},
            {"Azienda Tecnico", h.technician.company},
            {"Isola Serial Number", h.island.serial_number},
            {"Modello Isola", h.island.model},
            {"Ore Funzionamento", h.island.operating_hours ? std::to_string(*h.island.operating_hours) + " h" : "-"},
        };
        if (h.island.cycle_count) rows.emplace_back("Cicli", std::to_string(*h.island.cycle_count));
        if (!h.client.contact_person.empty()) rows.emplace_back("Contatto", h.client.contact_person);
        if (!h.client.address.empty()) rows.emplace_back("Indirizzo", h.client.address);
        if (!h.status.empty()) rows.emplace_back("Stato", h.status);

        writer_.begin_table({kTextWidthTwips * 35 / 100, kTextWidthTwips * 65 / 100});
        for (const auto& [label, value] : rows) {
            writer_.begin_row();
            writer_.text_cell(label, RunStyle{.bold = true}, kColorHeader);
            writer_.text_cell(value.empty() ? "-" : value);
            writer_.end_row();
        }
        writer_.end_table();

        if (options_.include_notes && !text::is_blank(h.notes)) {
            writer_.labelled("Note generali: ", h.notes);
        }
    }

    void executive_summary() {
        writer_.paragraph("RIEPILOGO ESECUTIVO", "Heading1");
        const OverallRating rating = overall_rating(stats_);
        const std::string_view color = rating == OverallRating::Critico      ? kColorNok
                                       : rating == OverallRating::Attenzione ? kColorPending
                                                                             : kColorOk;
        writer_.paragraph(overall_rating_text(rating), {}, RunStyle{.bold = true, .color = color, .half_points = 26});

        auto pct = [](const double v) { return text::format_decimal(v, 1) + "%"; };
        writer_.labelled("Controlli totali: ", std::to_string(stats_.total_items));
        writer_.labelled("Controlli OK: ", std::to_string(stats_.ok_items) + " (" + pct(stats_.ok_percentage()) + ")");
        writer_.labelled("Controlli NOK: ", std::to_string(stats_.nok_items + stats_.critical_status_items) +
                                            " (" + pct(stats_.nok_percentage()) + ")");
        writer_.labelled("Criticita' rilevate: ", std::to_string(stats_.critical_issues));
        writer_.labelled("Completamento: ", pct(stats_.completion_percentage()));
        writer_.labelled("Foto acquisite: ", std::to_string(stats_.total_photos));
        if (stats_.sections_with_issues > 0) {
            writer_.labelled("Sezioni con problemi: ", std::to_string(stats_.sections_with_issues) + "/" +
                                                       std::to_string(stats_.total_sections));
        }
    }

    bool section_block(const size_t s) {
        const Section& section = aggregate_.sections[s];
        const SectionStatistics& ss = stats_.sections[s];
        writer_.paragraph(std::to_string(s + 1) + ". " + section.title, "Heading2");
        writer_.paragraph("Controlli: " + std::to_string(ss.total_items) + "  |  OK: " + std::to_string(ss.ok_items) +
                          "  |  NOK: " + std::to_string(ss.nok_items) + "  |  Critici: " +
                          std::to_string(ss.critical_items),
                          {}, RunStyle{.italic = true, .color = kColorNeutral, .half_points = 18});

        if (!section.items.empty()) {
            items_table(section);
        }
        if (options_.include_photos) {
            return photo_grid(s);
        }
        return true;
    }

    void items_table(const Section& section) {
        std::vector<int> cols;
        std::vector<std::string_view> titles;
        if (options_.include_notes) {
            cols = {kTextWidthTwips * 34 / 100, kTextWidthTwips * 16 / 100, kTextWidthTwips * 16 / 100,
                    kTextWidthTwips * 34 / 100};
            titles = {"Controllo", "Stato", "Criticità", "Note"};
        } else {
            cols = {kTextWidthTwips * 60 / 100, kTextWidthTwips * 20 / 100, kTextWidthTwips * 20 / 100};
            titles = {"Controllo", "Stato", "Criticità"};
        }
        writer_.begin_table(cols);
        writer_.header_row(titles);
        for (const auto& item : section.items) {
            writer_.begin_row();
            writer_.text_cell(item.code.empty() ? item.title : item.code + " - " + item.title);
            const StatusLook st = status_look(item.status);
            writer_.text_cell(st.text, RunStyle{.bold = true, .color = st.color});
            const StatusLook cr = criticality_look(item.criticality);
            writer_.text_cell(cr.text, RunStyle{.color = cr.color});
            if (options_.include_notes) {
                writer_.text_cell(text::ellipsize(text::single_line(item.note), DocumentAssembler::kNoteMaxChars));
            }
            writer_.end_row();
        }
        writer_.end_table();
    }

    /// @return false when cancelled
    bool photo_grid(const size_t s) {
        const Section& section = aggregate_.sections[s];
        std::vector<PhotoJob> jobs;
        for (size_t i = 0; i < section.items.size(); ++i) {
            const auto& item = section.items[i];
            for (size_t p = 0; p < item.photos.size(); ++p) {
                jobs.push_back({s, i, p, item.photos[p],
                                naming_.resolve(s, section.title, item, p, item.photos[p].caption)});
            }
        }
        if (jobs.empty()) {
            return true;
        }

        const unsigned per_row = std::max(1u, options_.photos_per_row);
        const uint32_t cell_points = DocumentAssembler::grid_image_width(per_row);
        writer_.paragraph("Documentazione fotografica", {}, RunStyle{.bold = true, .color = kColorTitle});
        writer_.begin_table(std::vector<int>(per_row, kTextWidthTwips / static_cast<int>(per_row)), false);

        for (size_t j = 0; j < jobs.size(); ++j) {
            if (stop_.stop_requested()) {
                return false;
            }
            if (j % per_row == 0) {
                if (j > 0) writer_.end_row();
                writer_.begin_row();
            }
            const PhotoJob& job = jobs[j];
            writer_.begin_cell();
            {
                auto processed = photos_.take(job, stop_);
                if (processed.ok()) {
                    const ProcessedPhoto& photo = processed.value();
                    const double aspect = photo.width > 0
                                              ? static_cast<double>(photo.height) / static_cast<double>(photo.width)
                                              : 0.75;
                    writer_.image(photo.bytes, job.name, DocumentAssembler::points_to_emu(cell_points),
                                  DocumentAssembler::points_to_emu(cell_points * aspect));
                    ++result_.embedded_photos;
                } else if (processed.error().code == ExportErrorCode::Cancelled) {
                    return false;
                } else {
                    placeholder(job, section, processed.error());
                }
                // processed photo released here, before the next one is requested
            }
            writer_.paragraph(job.name, "Caption");
            writer_.end_cell();
        }
        const size_t remainder = jobs.size() % per_row;
        if (remainder != 0) {
            for (size_t k = remainder; k < per_row; ++k) {
                writer_.begin_cell();
                writer_.paragraph({}, "TableText");
                writer_.end_cell();
            }
        }
        writer_.end_row();
        writer_.end_table();
        return true;
    }

    void placeholder(const PhotoJob& job, const Section& section, const ExportError& error) {
        writer_.paragraph(DocumentAssembler::kPhotoPlaceholder, "TableText",
                          RunStyle{.italic = true, .color = kColorNeutral}, "center");
        ++result_.placeholders;
        ExportWarning w;
        w.code = error.code;
        w.resource = job.photo.path;
        w.section = section.title;
        w.item = section.items[job.item_index].title;
        w.message = error.code == ExportErrorCode::PhotoNotFound
                        ? "photo not found, placeholder inserted"
                        : "photo could not be decoded, placeholder inserted";
        Logger::log(LogLevel::Warning, job.photo.path.string() + ": " + w.message, processor_tag());
        result_.warnings.push_back(std::move(w));
    }

    void spare_parts() {
        if (aggregate_.spare_parts.empty()) {
            return;
        }
        writer_.paragraph("PARTI DI RICAMBIO", "Heading1");
        const int w = kTextWidthTwips;
        writer_.begin_table({w * 15 / 100, w * 35 / 100, w * 10 / 100, w * 15 / 100, w * 25 / 100});
        writer_.header_row({"Codice", "Descrizione", "Quantità", "Urgenza", "Note"});
        for (const auto& part : aggregate_.spare_parts) {
            writer_.begin_row();
            writer_.text_cell(part.part_number);
            writer_.text_cell(part.description);
            writer_.text_cell(std::to_string(part.quantity));
            const StatusLook urgency = criticality_look(part.urgency);
            writer_.text_cell(urgency.text, RunStyle{.color = urgency.color});
            std::string notes = part.notes;
            if (part.estimated_cost) {
                notes += (notes.empty() ? "" : " - ") + std::string("€ ") +
                         text::format_decimal(*part.estimated_cost, 2);
            }
            writer_.text_cell(notes);
            writer_.end_row();
        }
        writer_.end_table();
    }

    void conclusions() {
        writer_.paragraph("CONCLUSIONI", "Heading1");
        const Recommendations rec = general_recommendations(stats_);
        if (!rec.immediate_actions.empty()) {
            writer_.paragraph("Azioni immediate richieste", {}, RunStyle{.bold = true, .color = kColorNok});
            for (const auto& a : rec.immediate_actions) writer_.paragraph("- " + a);
        }
        if (!rec.general.empty()) {
            writer_.paragraph("Raccomandazioni generali", {}, RunStyle{.bold = true});
            for (const auto& r : rec.general) writer_.paragraph("- " + r);
        }
        const NextCheckup next = next_checkup(stats_, generated_at_);
        writer_.labelled("Prossimo checkup consigliato: ", text::format_date(next.date) + " (" + next.reason + ")");
    }

    void signature_block() {
        const auto& h = aggregate_.header;
        writer_.paragraph("VALIDAZIONE TECNICA", "Heading1");
        writer_.labelled("Tecnico: ", h.technician.name);
        if (!h.technician.company.empty()) writer_.labelled("Azienda: ", h.technician.company);
        if (!h.technician.certification.empty()) writer_.labelled("Certificazione: ", h.technician.certification);
        writer_.labelled("Data completamento: ", optional_date(h.completed_at, "In corso"));
        writer_.labelled("Documento generato il: ", text::format_date_time(generated_at_));
        writer_.paragraph("Firma: ______________________________");
    }

    const CheckUpAggregate& aggregate_;
    const ExportOptions& options_;
    NamingResolver& naming_;
    PhotoProvider& photos_;
    std::stop_token stop_;
    TimePoint generated_at_;
    DocumentWriter writer_;
    CheckupStatistics stats_;
    AssembledDocument result_;
};

} // namespace

DocumentAssembler::DocumentAssembler(EventBus* bus) : bus_(bus) {}

uint32_t DocumentAssembler::grid_cell_width(const unsigned photos_per_row) noexcept {
    switch (photos_per_row) {
        case 1:  return 400;
        case 2:  return 250;
        default: return 200;
    }
}

uint32_t DocumentAssembler::grid_image_width(const unsigned photos_per_row) noexcept {
    const int per_row = static_cast<int>(std::max(1u, photos_per_row));
    const int column_points = (kTextWidthTwips / per_row - 2 * kCellMarginTwips) / 20;
    return std::min(grid_cell_width(photos_per_row), static_cast<uint32_t>(std::max(column_points, 1)));
}

std::string_view DocumentAssembler::default_styles() {
    return kStyles;
}

Result<AssembledDocument> DocumentAssembler::assemble(const CheckUpAggregate& aggregate,
                                                      const ExportOptions& options,
                                                      NamingResolver& naming) const {
    const PhotoProcessor processor;
    InlinePhotoProvider provider(processor, options.photo_policy, bus_);
    return assemble(aggregate, options, naming, provider, std::stop_token{}, Clock::now());
}

Result<AssembledDocument> DocumentAssembler::assemble(const CheckUpAggregate& aggregate,
                                                      const ExportOptions& options,
                                                      NamingResolver& naming,
                                                      PhotoProvider& photos,
                                                      const std::stop_token stop,
                                                      const TimePoint generated_at) const {
    Logger::log(LogLevel::Info, "Assembling document for " + aggregate.header.client.company_name, processor_tag());

    std::string styles(kStyles);
    if (options.custom_template) {
        auto custom = read_file_bytes(*options.custom_template);
        if (!custom) {
            Logger::log(LogLevel::Error, "Template not found: " + options.custom_template->string(), processor_tag());
            return ExportError{ExportErrorCode::TemplateNotFound, ExportStage::Processing,
                               options.custom_template->string(), "template not readable"};
        }
        styles.assign(custom->begin(), custom->end());
    }

    try {
        AssembledDocument out;
        {
            DocxPackage package;
            package.add_part("[Content_Types].xml", kContentTypes);
            package.add_part("_rels/.rels", kPackageRels);
            package.add_part("docProps/core.xml", core_properties(aggregate, generated_at));

            Assembly assembly(aggregate, options, naming, photos, stop, generated_at, package);
            if (!assembly.build()) {
                Logger::log(LogLevel::Warning, "Document assembly cancelled", processor_tag());
                return ExportError{ExportErrorCode::Cancelled, ExportStage::Processing, {}, "export cancelled"};
            }

            out = std::move(assembly.result());
            package.add_part("docProps/app.xml", app_properties(out.embedded_photos));
            package.add_part("word/document.xml", assembly.writer().document_xml());
            package.add_part("word/styles.xml", styles);
            package.add_part("word/_rels/document.xml.rels", assembly.writer().relationships_xml());
            out.bytes = package.finish();
        }
        // package and body released here

        Logger::log(LogLevel::Info,
                    "Document assembled: " + std::to_string(out.bytes.size()) + " bytes, " +
                    std::to_string(out.embedded_photos) + " photos, " + std::to_string(out.placeholders) +
                    " placeholders",
                    processor_tag());
        return out;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Document generation failed: ") + e.what(), processor_tag());
        return ExportError{ExportErrorCode::DocumentGenerationError, ExportStage::Processing, {}, e.what()};
    }
}

} // namespace qreport
