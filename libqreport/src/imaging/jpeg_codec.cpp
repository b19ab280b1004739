#include "../../include/jpeg_codec.hpp"
#include "../../include/exif_orientation.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Routes libjpeg warnings to the logger instead of stderr.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

/**
 * @brief Owns a decompress struct; destroys it on every exit path.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief Owns a compress struct and the buffer jpeg_mem_dest allocates.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    unsigned char *buffer = nullptr;
    unsigned long size = 0;

    JpegCompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_compress(&cinfo);
    }
    ~JpegCompress() {
        jpeg_destroy_compress(&cinfo);
        std::free(buffer);
    }

    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

/**
 * @brief Scans the saved APP1 markers for an EXIF orientation.
 */
int find_orientation(const j_decompress_ptr cinfo) {
    for (jpeg_saved_marker_ptr m = cinfo->marker_list; m; m = m->next) {
        if (m->marker == JPEG_APP0 + 1 && m->data && m->data_length > 0) {
            const int o = qreport::imaging::parse_exif_orientation({m->data, m->data_length});
            if (o != 1) {
                return o;
            }
        }
    }
    return 1;
}

/**
 * @brief Converts one decoded scanline to RGB8.
 */
void to_rgb(const unsigned char *src, unsigned char *dst, const JDIMENSION width,
            const int components, const bool inverted_cmyk) {
    for (JDIMENSION x = 0; x < width; ++x) {
        if (components == 1) {
            dst[0] = dst[1] = dst[2] = src[x];
        } else if (components == 4) {
            const unsigned char *p = src + static_cast<size_t>(x) * 4;
            int c = p[0], m = p[1], y = p[2], k = p[3];
            if (!inverted_cmyk) {
                c = 255 - c; m = 255 - m; y = 255 - y; k = 255 - k;
            }
            dst[0] = static_cast<unsigned char>(c * k / 255);
            dst[1] = static_cast<unsigned char>(m * k / 255);
            dst[2] = static_cast<unsigned char>(y * k / 255);
        } else {
            const unsigned char *p = src + static_cast<size_t>(x) * 3;
            dst[0] = p[0];
            dst[1] = p[1];
            dst[2] = p[2];
        }
        dst += 3;
    }
}

} // namespace

namespace qreport {

bool JpegCodec::matches_signature(const std::span<const unsigned char> head) const noexcept {
    return head.size() >= 3 && head[0] == 0xFF && head[1] == 0xD8 && head[2] == 0xFF;
}

unsigned JpegCodec::scale_denominator(const uint32_t oriented_width, const uint32_t target_width) noexcept {
    if (target_width == 0) return 1;
    unsigned denom = 1;
    while (denom < 8 && oriented_width / (denom * 2) >= target_width) {
        denom *= 2;
    }
    return denom;
}

DecodedImage JpegCodec::decode(const std::span<const unsigned char> data, const uint32_t target_width) const {
    JpegDecompress dec;
    jpeg_mem_src(&dec.cinfo, const_cast<unsigned char *>(data.data()), static_cast<unsigned long>(data.size()));
    jpeg_save_markers(&dec.cinfo, JPEG_APP0 + 1, 0xFFFF);

    if (jpeg_read_header(&dec.cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }

    DecodedImage result;
    result.orientation = find_orientation(&dec.cinfo);
    result.source_width = dec.cinfo.image_width;
    result.source_height = dec.cinfo.image_height;

    const uint32_t oriented_width = imaging::swaps_axes(result.orientation)
                                        ? dec.cinfo.image_height
                                        : dec.cinfo.image_width;
    const unsigned denom = scale_denominator(oriented_width, target_width);
    dec.cinfo.scale_num = 1;
    dec.cinfo.scale_denom = denom;

    bool inverted_cmyk = false;
    if (dec.cinfo.jpeg_color_space == JCS_CMYK || dec.cinfo.jpeg_color_space == JCS_YCCK) {
        dec.cinfo.out_color_space = JCS_CMYK;
        inverted_cmyk = dec.cinfo.saw_Adobe_marker;
    } else if (dec.cinfo.jpeg_color_space == JCS_GRAYSCALE) {
        dec.cinfo.out_color_space = JCS_GRAYSCALE;
    } else {
        dec.cinfo.out_color_space = JCS_RGB;
    }

    jpeg_start_decompress(&dec.cinfo);

    Logger::log(LogLevel::Debug,
                "JPEG " + std::to_string(dec.cinfo.image_width) + "x" + std::to_string(dec.cinfo.image_height) +
                " decoded at 1/" + std::to_string(denom) + " (" + std::to_string(dec.cinfo.output_width) + "x" +
                std::to_string(dec.cinfo.output_height) + "), orientation " + std::to_string(result.orientation),
                "jpeg_codec");

    const int components = dec.cinfo.output_components;
    if (components != 1 && components != 3 && components != 4) {
        throw std::runtime_error("Unsupported JPEG component count: " + std::to_string(components));
    }

    result.image = RasterImage(dec.cinfo.output_width, dec.cinfo.output_height);
    std::vector<unsigned char> scanline(static_cast<size_t>(dec.cinfo.output_width) * components);
    while (dec.cinfo.output_scanline < dec.cinfo.output_height) {
        const JDIMENSION y = dec.cinfo.output_scanline;
        JSAMPROW row = scanline.data();
        if (jpeg_read_scanlines(&dec.cinfo, &row, 1) != 1) {
            throw std::runtime_error("Truncated JPEG data");
        }
        to_rgb(scanline.data(), result.image.at(0, y), dec.cinfo.output_width, components, inverted_cmyk);
    }

    jpeg_finish_decompress(&dec.cinfo);
    return result;
}

std::vector<unsigned char> encode_jpeg(const RasterImage& image, const int quality) {
    if (image.empty()) {
        throw std::runtime_error("Cannot encode an empty image");
    }

    JpegCompress enc;
    jpeg_mem_dest(&enc.cinfo, &enc.buffer, &enc.size);

    enc.cinfo.image_width = image.width;
    enc.cinfo.image_height = image.height;
    enc.cinfo.input_components = 3;
    enc.cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&enc.cinfo);
    jpeg_set_quality(&enc.cinfo, std::clamp(quality, 1, 100), TRUE);
    enc.cinfo.optimize_coding = TRUE;

    jpeg_start_compress(&enc.cinfo, TRUE);
    while (enc.cinfo.next_scanline < enc.cinfo.image_height) {
        JSAMPROW row = const_cast<unsigned char *>(image.at(0, enc.cinfo.next_scanline));
        jpeg_write_scanlines(&enc.cinfo, &row, 1);
    }
    jpeg_finish_compress(&enc.cinfo);

    return {enc.buffer, enc.buffer + enc.size};
}

} // namespace qreport
