/**
 * @file test_imaging.cpp
 * @brief Unit tests for raster transforms, EXIF parsing, codecs and the watermark
 */

#include <doctest/doctest.h>
#include "../../libqreport/include/codec_registry.hpp"
#include "../../libqreport/include/exif_orientation.hpp"
#include "../../libqreport/include/jpeg_codec.hpp"
#include "../../libqreport/include/png_codec.hpp"
#include "../../libqreport/include/raster_image.hpp"
#include "../../libqreport/include/watermark.hpp"
#include "../../libqreport/include/file_utils.hpp"
#include "../support/test_support.hpp"
#include <cstring>

using namespace qreport;

namespace {

// red channel encodes the source position: x * 10 + y
RasterImage labelled_image(const uint32_t w, const uint32_t h) {
    RasterImage img(w, h);
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            img.at(x, y)[0] = static_cast<unsigned char>(x * 10 + y);
        }
    }
    return img;
}

int red(const RasterImage& img, const uint32_t x, const uint32_t y) {
    return img.at(x, y)[0];
}

RasterImage filled(const uint32_t w, const uint32_t h, const unsigned char value) {
    RasterImage img(w, h);
    std::memset(img.pixels.data(), value, img.pixels.size());
    return img;
}

} // namespace

TEST_CASE("apply_orientation") {
    const RasterImage src = labelled_image(3, 2);

    SUBCASE("1 and out-of-range values are identity") {
        CHECK(imaging::apply_orientation(src, 1).pixels == src.pixels);
        CHECK(imaging::apply_orientation(src, 0).pixels == src.pixels);
        CHECK(imaging::apply_orientation(src, 9).pixels == src.pixels);
    }

    SUBCASE("mirror and rotate 180 keep dimensions") {
        const auto mirrored = imaging::apply_orientation(src, 2);
        CHECK(mirrored.width == 3);
        CHECK(red(mirrored, 0, 0) == 20);
        const auto rotated = imaging::apply_orientation(src, 3);
        CHECK(rotated.height == 2);
        CHECK(red(rotated, 0, 0) == 21);
        CHECK(red(rotated, 2, 1) == 0);
    }

    SUBCASE("rotate 90 clockwise swaps axes") {
        const auto out = imaging::apply_orientation(src, 6);
        CHECK(out.width == 2);
        CHECK(out.height == 3);
        CHECK(red(out, 0, 0) == 1);
        CHECK(red(out, 1, 0) == 0);
        CHECK(red(out, 0, 2) == 21);
    }

    SUBCASE("rotate 90 counter-clockwise swaps axes") {
        const auto out = imaging::apply_orientation(src, 8);
        CHECK(out.width == 2);
        CHECK(out.height == 3);
        CHECK(red(out, 0, 0) == 20);
        CHECK(red(out, 1, 0) == 21);
    }

    CHECK(imaging::swaps_axes(5));
    CHECK(imaging::swaps_axes(8));
    CHECK_FALSE(imaging::swaps_axes(4));
}

TEST_CASE("fit_to_width") {
    SUBCASE("scales down preserving aspect ratio") {
        const auto out = imaging::fit_to_width(filled(1000, 750, 77), 800);
        CHECK(out.width == 800);
        CHECK(out.height == 600);
        CHECK(out.at(0, 0)[0] == 77);
        CHECK(out.at(799, 599)[2] == 77);
    }

    SUBCASE("never upscales") {
        const auto out = imaging::fit_to_width(filled(400, 300, 10), 800);
        CHECK(out.width == 400);
        CHECK(out.height == 300);
    }

    SUBCASE("scaled_height rounds and never returns zero") {
        CHECK(imaging::scaled_height(1001, 333, 800) == 266);
        CHECK(imaging::scaled_height(10, 1, 2) == 1);
        CHECK(imaging::scaled_height(0, 10, 5) == 0);
    }
}

TEST_CASE("parse_exif_orientation") {
    CHECK(imaging::parse_exif_orientation(test::exif_payload(6, false)) == 6);
    CHECK(imaging::parse_exif_orientation(test::exif_payload(8, true)) == 8);
    CHECK(imaging::parse_exif_orientation(test::exif_payload(3, true)) == 3);

    SUBCASE("invalid values fall back to 1") {
        CHECK(imaging::parse_exif_orientation(test::exif_payload(9, false)) == 1);
        CHECK(imaging::parse_exif_orientation(test::exif_payload(0, false)) == 1);
    }

    SUBCASE("missing or damaged header") {
        auto payload = test::exif_payload(6, false);
        payload[0] = 'X';
        CHECK(imaging::parse_exif_orientation(payload) == 1);
        CHECK(imaging::parse_exif_orientation({}) == 1);

        auto truncated = test::exif_payload(6, false);
        truncated.resize(20);
        CHECK(imaging::parse_exif_orientation(truncated) == 1);
    }
}

TEST_CASE("codec registry selects codecs by signature") {
    const ImageCodecRegistry registry;
    const test::TempDir dir("codec_registry");

    const auto jpeg = test::make_jpeg(32, 16);
    const IImageCodec* jpeg_codec = registry.find_by_signature(jpeg);
    REQUIRE(jpeg_codec != nullptr);
    CHECK(std::string(jpeg_codec->get_name()) == "JpegCodec");

    const auto png = read_file_bytes(test::write_png(dir.path(), "sample.png", 32, 16));
    REQUIRE(png.has_value());
    const IImageCodec* png_codec = registry.find_by_signature(*png);
    REQUIRE(png_codec != nullptr);
    CHECK(std::string(png_codec->get_name()) == "PngCodec");

    const std::string text = "plain text, not an image";
    CHECK(registry.find_by_signature(std::span(reinterpret_cast<const unsigned char*>(text.data()), text.size())) ==
          nullptr);

    REQUIRE(registry.find_by_extension(".jpeg") != nullptr);
    CHECK(std::string(registry.find_by_extension(".jpeg")->get_name()) == "JpegCodec");
    CHECK(registry.find_by_extension(".gif") == nullptr);
}

TEST_CASE("jpeg codec") {
    SUBCASE("DCT scale denominator") {
        CHECK(JpegCodec::scale_denominator(1600, 800) == 2);
        CHECK(JpegCodec::scale_denominator(1599, 800) == 1);
        CHECK(JpegCodec::scale_denominator(8000, 800) == 8);
        CHECK(JpegCodec::scale_denominator(4000, 800) == 4);
        CHECK(JpegCodec::scale_denominator(4000, 0) == 1);
    }

    SUBCASE("decode reads EXIF orientation and source size") {
        const auto bytes = test::with_exif_orientation(test::make_jpeg(120, 80), 6);
        const DecodedImage decoded = JpegCodec{}.decode(bytes, 800);
        CHECK(decoded.orientation == 6);
        CHECK(decoded.source_width == 120);
        CHECK(decoded.source_height == 80);
        CHECK(decoded.image.width == 120);
    }

    SUBCASE("decode scales wide sources") {
        const DecodedImage decoded = JpegCodec{}.decode(test::make_jpeg(1600, 1200), 400);
        CHECK(decoded.source_width == 1600);
        CHECK(decoded.image.width == 400);
        CHECK(decoded.image.height == 300);
    }

    SUBCASE("garbage after the SOI marker throws") {
        std::vector<unsigned char> bytes = {0xFF, 0xD8, 0xFF, 0xE0};
        bytes.resize(256, 0);
        CHECK_THROWS(static_cast<void>(JpegCodec{}.decode(bytes, 800)));
    }
}

TEST_CASE("png codec decodes to RGB") {
    const test::TempDir dir("png_codec");
    const auto png = read_file_bytes(test::write_png(dir.path(), "gradient.png", 64, 48));
    REQUIRE(png.has_value());
    const DecodedImage decoded = PngCodec{}.decode(*png, 800);
    CHECK(decoded.image.width == 64);
    CHECK(decoded.image.height == 48);
    CHECK(decoded.orientation == 1);
    CHECK(decoded.image.pixels.size() == 64u * 48u * 3u);
}

TEST_CASE("watermark") {
    SUBCASE("scale grows with the image width") {
        CHECK(imaging::watermark_scale(400) == 3);
        CHECK(imaging::watermark_scale(800) == 4);
        CHECK(imaging::watermark_scale(1600) == 6);
        CHECK(imaging::watermark_scale(2400) == 8);
    }

    SUBCASE("band is drawn in the bottom-right corner inside the margin") {
        RasterImage img = filled(400, 300, 255);
        imaging::draw_watermark(img, "QReport");

        // untouched corners
        CHECK(img.at(0, 0)[0] == 255);
        CHECK(img.at(399, 299)[0] == 255);
        CHECK(img.at(400 - imaging::kWatermarkMargin, 299)[0] == 255);

        // band padding is darkened
        const uint32_t band_w = 7 * 6 * 3 + 12;
        const uint32_t band_h = 7 * 3 + 12;
        const uint32_t x0 = 400 - imaging::kWatermarkMargin - band_w;
        const uint32_t y0 = 300 - imaging::kWatermarkMargin - band_h;
        CHECK(img.at(x0, y0)[0] < 255);
        CHECK(img.at(x0 - 1, y0)[0] == 255);
    }

    SUBCASE("empty text leaves the image unchanged") {
        RasterImage img = filled(200, 100, 200);
        const auto before = img.pixels;
        imaging::draw_watermark(img, "");
        CHECK(img.pixels == before);
    }
}
