/**
 * @file test_document_assembler.cpp
 * @brief Unit tests for the .docx document, read back with libarchive
 */

#include <doctest/doctest.h>
#include "../../libqreport/include/document_assembler.hpp"
#include "../../libqreport/include/naming_resolver.hpp"
#include "../support/test_support.hpp"

using namespace qreport;

namespace {

struct Assembled {
    AssembledDocument document;
    std::map<std::string, std::string> parts;
};

Assembled assemble_ok(const CheckUpAggregate& checkup, const ExportOptions& options) {
    NamingResolver naming(options.naming_strategy, test::fixed_time());
    auto result = DocumentAssembler{}.assemble(checkup, options, naming);
    REQUIRE(result.ok());
    Assembled out;
    out.document = std::move(result).value();
    out.parts = test::read_zip(std::span<const unsigned char>(out.document.bytes));
    return out;
}

} // namespace

TEST_CASE("package structure") {
    const test::TempDir dir("docx_structure");
    const auto checkup = test::sample_checkup(dir.path());
    const auto a = assemble_ok(checkup, ExportOptions{});

    for (const char* part : {"[Content_Types].xml", "_rels/.rels", "docProps/core.xml", "docProps/app.xml",
                             "word/document.xml", "word/styles.xml", "word/_rels/document.xml.rels",
                             "word/media/image1.jpg", "word/media/image2.jpg"}) {
        INFO("Part: " << part);
        CHECK(a.parts.count(part) == 1);
    }
    CHECK(a.parts.count("word/media/image3.jpg") == 0);

    const std::string& image = a.parts.at("word/media/image1.jpg");
    REQUIRE(image.size() > 2);
    CHECK(static_cast<unsigned char>(image[0]) == 0xFF);
    CHECK(static_cast<unsigned char>(image[1]) == 0xD8);

    CHECK(a.parts.at("word/styles.xml") == DocumentAssembler::default_styles());
    CHECK(a.parts.at("word/_rels/document.xml.rels").find("media/image2.jpg") != std::string::npos);
}

TEST_CASE("document content") {
    const test::TempDir dir("docx_content");
    auto checkup = test::sample_checkup(dir.path());
    checkup.sections[0].items[0].title = "Ripari & protezioni <lato A>";
    const auto a = assemble_ok(checkup, ExportOptions{});
    const std::string& doc = a.parts.at("word/document.xml");

    CHECK(a.document.embedded_photos == 2);
    CHECK(a.document.placeholders == 0);
    CHECK(a.document.warnings.empty());
    CHECK(test::count_occurrences(doc, "<w:drawing>") == 2);

    CHECK(doc.find("Acme S.p.A.") != std::string::npos);
    CHECK(doc.find("Ripari &amp; protezioni &lt;lato A&gt;") != std::string::npos);
    CHECK(doc.find("02_meccanica_cinghia-di-trasmissione_vista-frontale.jpg") != std::string::npos);
    CHECK(doc.find("DETTAGLIO CONTROLLI") != std::string::npos);
    CHECK(doc.find(R"(<w:br w:type="page"/>)") != std::string::npos);

    // 800x600 photo in a 250 pt cell of a two-column grid
    CHECK(doc.find(R"(cx="3175000" cy="2381250")") != std::string::npos);
}

TEST_CASE("missing photo becomes a placeholder and a warning") {
    const test::TempDir dir("docx_placeholder");
    auto checkup = test::sample_checkup(dir.path());
    checkup.sections[1].items[0].photos[0].path = dir / "gone.jpg";
    const auto a = assemble_ok(checkup, ExportOptions{});
    const std::string& doc = a.parts.at("word/document.xml");

    CHECK(a.document.embedded_photos == 1);
    CHECK(a.document.placeholders == 1);
    CHECK(test::count_occurrences(doc, DocumentAssembler::kPhotoPlaceholder) == 1);
    CHECK(test::count_occurrences(doc, "<w:drawing>") == 1);
    CHECK(a.parts.count("word/media/image1.jpg") == 1);
    CHECK(a.parts.count("word/media/image2.jpg") == 0);

    REQUIRE(a.document.warnings.size() == 1);
    const ExportWarning& w = a.document.warnings[0];
    CHECK(w.code == ExportErrorCode::PhotoNotFound);
    CHECK(w.resource == dir / "gone.jpg");
    CHECK(w.section == "Meccanica");
    CHECK(w.item == "Cinghia di trasmissione");
}

TEST_CASE("undecodable photo becomes a placeholder") {
    const test::TempDir dir("docx_undecodable");
    auto checkup = test::sample_checkup(dir.path());
    checkup.sections[1].items[0].photos[1].path = test::write_bytes(dir.path(), "broken.jpg", "garbage");
    const auto a = assemble_ok(checkup, ExportOptions{});

    CHECK(a.document.placeholders == 1);
    REQUIRE(a.document.warnings.size() == 1);
    CHECK(a.document.warnings[0].code == ExportErrorCode::ImageDecodeFailed);
}

TEST_CASE("photos excluded") {
    const test::TempDir dir("docx_no_photos");
    const auto checkup = test::sample_checkup(dir.path());
    ExportOptions options;
    options.include_photos = false;
    const auto a = assemble_ok(checkup, options);

    CHECK(a.document.embedded_photos == 0);
    CHECK(a.document.placeholders == 0);
    CHECK(a.parts.count("word/media/image1.jpg") == 0);
    CHECK(a.parts.at("word/document.xml").find("<w:drawing>") == std::string::npos);
    CHECK(a.parts.at("word/document.xml").find("Barriere fotoelettriche") != std::string::npos);
}

TEST_CASE("photos per row changes the cell width") {
    const test::TempDir dir("docx_grid");
    const auto checkup = test::sample_checkup(dir.path());
    ExportOptions options;
    options.photos_per_row = 1;
    const auto a = assemble_ok(checkup, options);

    // 400 pt wide, 300 pt high
    CHECK(a.parts.at("word/document.xml").find(R"(cx="5080000" cy="3810000")") != std::string::npos);
    CHECK(DocumentAssembler::grid_cell_width(3) == 200);
    CHECK(DocumentAssembler::points_to_emu(1.0) == 12700);
}

TEST_CASE("grid images fit inside their column") {
    CHECK(DocumentAssembler::grid_image_width(1) == 400);
    CHECK(DocumentAssembler::grid_image_width(2) == 250);
    CHECK(DocumentAssembler::grid_image_width(3) == 166);
    CHECK(DocumentAssembler::grid_image_width(4) == 122);

    const test::TempDir dir("docx_grid_narrow");
    const auto checkup = test::sample_checkup(dir.path());

    SUBCASE("three per row") {
        ExportOptions options;
        options.photos_per_row = 3;
        const auto a = assemble_ok(checkup, options);
        // 166 pt wide, 124.5 pt high
        const std::string& doc = a.parts.at("word/document.xml");
        CHECK(test::count_occurrences(doc, R"(<wp:extent cx="2108200" cy="1581150"/>)") == 2);
    }

    SUBCASE("four per row") {
        ExportOptions options;
        options.photos_per_row = 4;
        const auto a = assemble_ok(checkup, options);
        // 122 pt wide, 91.5 pt high
        const std::string& doc = a.parts.at("word/document.xml");
        CHECK(test::count_occurrences(doc, R"(<wp:extent cx="1549400" cy="1162050"/>)") == 2);
    }
}

TEST_CASE("custom template") {
    const test::TempDir dir("docx_template");
    const auto checkup = test::sample_checkup(dir.path());

    SUBCASE("replaces the style part") {
        const std::string styles = R"(<?xml version="1.0"?><w:styles xmlns:w="x"/>)";
        ExportOptions options;
        options.custom_template = test::write_bytes(dir.path(), "styles.xml", styles);
        const auto a = assemble_ok(checkup, options);
        CHECK(a.parts.at("word/styles.xml") == styles);
    }

    SUBCASE("missing template is an error") {
        ExportOptions options;
        options.custom_template = dir / "nope.xml";
        NamingResolver naming(NamingStrategy::Structured, test::fixed_time());
        const auto result = DocumentAssembler{}.assemble(checkup, options, naming);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::TemplateNotFound);
    }
}

TEST_CASE("cancellation stops the assembly") {
    const test::TempDir dir("docx_cancel");
    const auto checkup = test::sample_checkup(dir.path());
    NamingResolver naming(NamingStrategy::Structured, test::fixed_time());
    const PhotoProcessor processor;
    InlinePhotoProvider provider(processor, PhotoPolicy{});

    std::stop_source stop;
    stop.request_stop();
    const auto result = DocumentAssembler{}.assemble(checkup, ExportOptions{}, naming, provider,
                                                     stop.get_token(), test::fixed_time());
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().code == ExportErrorCode::Cancelled);
    CHECK(processor.decode_count() == 0);
}
