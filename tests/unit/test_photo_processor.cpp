/**
 * @file test_photo_processor.cpp
 * @brief Unit tests for the decode, orient, resize and encode pipeline
 */

#include <doctest/doctest.h>
#include "../../libqreport/include/jpeg_codec.hpp"
#include "../../libqreport/include/photo_processor.hpp"
#include "../support/test_support.hpp"

using namespace qreport;

namespace {

DecodedImage decode(const ProcessedPhoto& photo) {
    return JpegCodec{}.decode(photo.bytes, 0);
}

} // namespace

TEST_CASE("wide photos are scaled down to the maximum width") {
    const test::TempDir dir("processor_wide");
    const auto source = test::write_jpeg(dir.path(), "wide.jpg", 1600, 1200);

    const PhotoProcessor processor;
    PhotoPolicy policy;
    policy.max_width = 800;
    const auto result = processor.process(source, policy);

    REQUIRE(result.ok());
    CHECK(result.value().width == 800);
    CHECK(result.value().height == 600);
    CHECK(result.value().source_width == 1600);
    CHECK(result.value().source_height == 1200);

    const auto decoded = decode(result.value());
    CHECK(decoded.image.width == 800);
    CHECK(decoded.image.height == 600);
}

TEST_CASE("odd source widths still honour the maximum") {
    const test::TempDir dir("processor_odd");
    const auto source = test::write_jpeg(dir.path(), "odd.jpg", 1001, 333);

    PhotoPolicy policy;
    policy.max_width = 800;
    const auto result = PhotoProcessor{}.process(source, policy);

    REQUIRE(result.ok());
    CHECK(result.value().width == 800);
    CHECK(result.value().height == 266);
}

TEST_CASE("narrow photos are never upscaled") {
    const test::TempDir dir("processor_narrow");
    const auto source = test::write_jpeg(dir.path(), "narrow.jpg", 400, 300);

    PhotoPolicy policy;
    policy.max_width = 800;
    const auto result = PhotoProcessor{}.process(source, policy);

    REQUIRE(result.ok());
    CHECK(result.value().width == 400);
    CHECK(result.value().height == 300);
}

TEST_CASE("EXIF orientation is applied to the pixels") {
    const test::TempDir dir("processor_orientation");
    const auto source = test::write_jpeg(dir.path(), "rotated.jpg", 400, 200, 6);

    const auto result = PhotoProcessor{}.process(source, PhotoPolicy{});

    REQUIRE(result.ok());
    CHECK(result.value().width == 200);
    CHECK(result.value().height == 400);

    // the re-encoded file carries no orientation any more
    const auto decoded = decode(result.value());
    CHECK(decoded.orientation == 1);
    CHECK(decoded.image.width == 200);
}

TEST_CASE("PNG sources are re-encoded as JPEG") {
    const test::TempDir dir("processor_png");
    const auto source = test::write_png(dir.path(), "diagram.png", 300, 200);

    const auto result = PhotoProcessor{}.process(source, PhotoPolicy{});

    REQUIRE(result.ok());
    REQUIRE(result.value().bytes.size() > 3);
    CHECK(result.value().bytes[0] == 0xFF);
    CHECK(result.value().bytes[1] == 0xD8);
    CHECK(result.value().width == 300);
    CHECK(result.value().height == 200);
}

TEST_CASE("quality changes the encoded size") {
    const test::TempDir dir("processor_quality");
    const auto source = test::write_jpeg(dir.path(), "q.jpg", 640, 480);

    PhotoPolicy low;
    low.quality = 10;
    PhotoPolicy high;
    high.quality = 95;

    const PhotoProcessor processor;
    const auto small = processor.process(source, low);
    const auto large = processor.process(source, high);
    REQUIRE(small.ok());
    REQUIRE(large.ok());
    CHECK(small.value().size() < large.value().size());
}

TEST_CASE("watermark alters the output without changing its size") {
    const test::TempDir dir("processor_watermark");
    const auto source = test::write_jpeg(dir.path(), "wm.jpg", 640, 480);

    PhotoPolicy plain;
    PhotoPolicy marked;
    marked.add_watermark = true;
    marked.watermark_text = "QReport";

    const PhotoProcessor processor;
    const auto a = processor.process(source, plain);
    const auto b = processor.process(source, marked, test::fixed_time());
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    CHECK(a.value().width == b.value().width);
    CHECK(a.value().height == b.value().height);
    CHECK(a.value().bytes != b.value().bytes);
}

TEST_CASE("failures are reported as typed errors") {
    const test::TempDir dir("processor_errors");
    const PhotoProcessor processor;

    SUBCASE("missing file") {
        const auto result = processor.process(dir / "missing.jpg", PhotoPolicy{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::PhotoNotFound);
        CHECK(result.error().resource == (dir / "missing.jpg").string());
        CHECK(processor.decode_count() == 0);
    }

    SUBCASE("directory instead of a file") {
        const auto result = processor.process(dir.path(), PhotoPolicy{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::PhotoNotFound);
    }

    SUBCASE("unrecognised content") {
        const auto source = test::write_bytes(dir.path(), "notes.jpg", "this is not an image");
        const auto result = processor.process(source, PhotoPolicy{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::ImageDecodeFailed);
        CHECK(is_recoverable(result.error().code));
    }

    SUBCASE("corrupt JPEG stream") {
        std::string corrupt = "\xFF\xD8\xFF\xE0";
        corrupt.append(512, '\0');
        const auto source = test::write_bytes(dir.path(), "corrupt.jpg", corrupt);
        const auto result = processor.process(source, PhotoPolicy{});
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ExportErrorCode::ImageDecodeFailed);
        CHECK(processor.decode_count() == 1);
    }
}
