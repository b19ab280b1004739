#include "../../include/png_codec.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    /**
     * @brief libpng warning handler.
     * @param msg The warning message from libpng.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief Read cursor over an in-memory PNG file.
     */
    struct MemoryReader {
        std::span<const unsigned char> data;
        size_t offset = 0;
    };

    void png_read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
        auto *reader = static_cast<MemoryReader *>(png_get_io_ptr(png));
        if (length > reader->data.size() - reader->offset) {
            png_error(png, "Read past end of PNG data");
        }
        std::memcpy(out, reader->data.data() + reader->offset, length);
        reader->offset += length;
    }

} // namespace

namespace qreport {

bool PngCodec::matches_signature(const std::span<const unsigned char> head) const noexcept {
    static constexpr unsigned char kSig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    return head.size() >= 8 && std::memcmp(head.data(), kSig, 8) == 0;
}

DecodedImage PngCodec::decode(const std::span<const unsigned char> data, uint32_t) const {
    if (!matches_signature(data)) {
        throw std::runtime_error("Not a PNG file");
    }

    PngRead r;
    r.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!r.png) throw std::runtime_error("png_create_read_struct failed");
    r.info = png_create_info_struct(r.png);
    if (!r.info) throw std::runtime_error("png_create_info_struct failed");

    MemoryReader reader{data, 0};
    png_set_read_fn(r.png, &reader, png_read_from_memory);
    png_read_info(r.png, r.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(r.png, r.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    if (bit_depth == 16) png_set_strip_16(r.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(r.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(r.png);
    if (png_get_valid(r.png, r.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(r.png);
    if (!(color_type & PNG_COLOR_MASK_ALPHA) && !png_get_valid(r.png, r.info, PNG_INFO_tRNS))
        png_set_filler(r.png, 0xFF, PNG_FILLER_AFTER);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(r.png);
    png_set_interlace_handling(r.png);
    png_read_update_info(r.png, r.info);

    const size_t rowbytes = png_get_rowbytes(r.png, r.info);
    if (rowbytes != static_cast<size_t>(width) * 4) {
        throw std::runtime_error("Unexpected PNG row layout");
    }

    std::vector<unsigned char> rgba(rowbytes * height);
    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = rgba.data() + static_cast<size_t>(y) * rowbytes;
    }
    png_read_image(r.png, rows.data());
    png_read_end(r.png, nullptr);

    DecodedImage result;
    result.source_width = width;
    result.source_height = height;
    result.image = RasterImage(width, height);
    const unsigned char *src = rgba.data();
    unsigned char *dst = result.image.pixels.data();
    for (size_t i = 0, n = static_cast<size_t>(width) * height; i < n; ++i, src += 4, dst += 3) {
        const unsigned a = src[3];
        for (int c = 0; c < 3; ++c) {
            // composite over white
            dst[c] = static_cast<unsigned char>((src[c] * a + 255 * (255 - a) + 127) / 255);
        }
    }

    Logger::log(LogLevel::Debug, "PNG " + std::to_string(width) + "x" + std::to_string(height) + " decoded",
                "png_codec");
    return result;
}

} // namespace qreport
