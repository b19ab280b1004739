#include "test_support.hpp"
#include "../../libqreport/include/file_utils.hpp"
#include "../../libqreport/include/jpeg_codec.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <png.h>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace qreport::test {

TempDir::TempDir(const std::string& name) : path_(make_temp_dir_for(name, "qreport_test")) {
    if (std::error_code ec; !fs::is_directory(path_, ec)) {
        throw std::runtime_error("cannot create temporary directory for " + name);
    }
}

TempDir::~TempDir() {
    cleanup_temp_dir(path_, "test_support");
}

RasterImage gradient_image(const uint32_t width, const uint32_t height) {
    RasterImage img(width, height);
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            unsigned char* px = img.at(x, y);
            px[0] = static_cast<unsigned char>(x * 255 / (width > 1 ? width - 1 : 1));
            px[1] = static_cast<unsigned char>(y * 255 / (height > 1 ? height - 1 : 1));
            px[2] = 128;
        }
    }
    return img;
}

std::vector<unsigned char> make_jpeg(const uint32_t width, const uint32_t height, const int quality) {
    return encode_jpeg(gradient_image(width, height), quality);
}

std::vector<unsigned char> exif_payload(const int orientation, const bool big_endian) {
    auto put16 = [big_endian](std::vector<unsigned char>& out, const unsigned v) {
        if (big_endian) {
            out.push_back(static_cast<unsigned char>(v >> 8));
            out.push_back(static_cast<unsigned char>(v & 0xFF));
        } else {
            out.push_back(static_cast<unsigned char>(v & 0xFF));
            out.push_back(static_cast<unsigned char>(v >> 8));
        }
    };
    auto put32 = [&](std::vector<unsigned char>& out, const uint32_t v) {
        if (big_endian) {
            put16(out, v >> 16);
            put16(out, v & 0xFFFF);
        } else {
            put16(out, v & 0xFFFF);
            put16(out, v >> 16);
        }
    };

    std::vector<unsigned char> out = {'E', 'x', 'i', 'f', 0, 0};
    if (big_endian) {
        out.push_back('M');
        out.push_back('M');
    } else {
        out.push_back('I');
        out.push_back('I');
    }
    put16(out, 42);
    put32(out, 8);       // IFD0 offset
    put16(out, 1);       // one entry
    put16(out, 0x0112);  // orientation
    put16(out, 3);       // SHORT
    put32(out, 1);
    put16(out, static_cast<unsigned>(orientation));
    put16(out, 0);
    put32(out, 0);       // no next IFD
    return out;
}

std::vector<unsigned char> with_exif_orientation(const std::vector<unsigned char>& jpeg, const int orientation,
                                                 const bool big_endian) {
    if (jpeg.size() < 2 || jpeg[0] != 0xFF || jpeg[1] != 0xD8) {
        throw std::invalid_argument("not a JPEG stream");
    }
    const auto payload = exif_payload(orientation, big_endian);
    const size_t length = payload.size() + 2;

    std::vector<unsigned char> out(jpeg.begin(), jpeg.begin() + 2);
    out.push_back(0xFF);
    out.push_back(0xE1);
    out.push_back(static_cast<unsigned char>(length >> 8));
    out.push_back(static_cast<unsigned char>(length & 0xFF));
    out.insert(out.end(), payload.begin(), payload.end());
    out.insert(out.end(), jpeg.begin() + 2, jpeg.end());
    return out;
}

fs::path write_jpeg(const fs::path& dir, const std::string& name, const uint32_t width, const uint32_t height,
                    const int orientation) {
    auto bytes = make_jpeg(width, height);
    if (orientation != 1) {
        bytes = with_exif_orientation(bytes, orientation);
    }
    const fs::path path = dir / name;
    if (const auto ec = write_file_atomic(path, std::span<const unsigned char>(bytes))) {
        throw std::runtime_error("cannot write " + path.string() + ": " + ec.message());
    }
    return path;
}

fs::path write_png(const fs::path& dir, const std::string& name, const uint32_t width, const uint32_t height) {
    const RasterImage img = gradient_image(width, height);
    const fs::path path = dir / name;

    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = width;
    image.height = height;
    image.format = PNG_FORMAT_RGB;
    if (!png_image_write_to_file(&image, path.string().c_str(), 0, img.pixels.data(), 0, nullptr)) {
        const std::string message = image.message;
        png_image_free(&image);
        throw std::runtime_error("cannot write " + path.string() + ": " + message);
    }
    return path;
}

fs::path write_bytes(const fs::path& dir, const std::string& name, const std::string_view content) {
    const fs::path path = dir / name;
    if (const auto ec = write_file_atomic(path, content)) {
        throw std::runtime_error("cannot write " + path.string() + ": " + ec.message());
    }
    return path;
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::map<std::string, std::string> read_zip(const std::span<const unsigned char> data) {
    std::map<std::string, std::string> entries;
    archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    if (archive_read_open_memory(a, data.data(), data.size()) != ARCHIVE_OK) {
        const std::string message = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        throw std::runtime_error("cannot open archive: " + message);
    }

    archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        std::string content;
        char buf[8192];
        la_ssize_t n = 0;
        while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
            content.append(buf, static_cast<size_t>(n));
        }
        entries.emplace(archive_entry_pathname(entry), std::move(content));
    }
    archive_read_free(a);
    return entries;
}

std::map<std::string, std::string> read_zip(const fs::path& path) {
    const auto bytes = read_file_bytes(path);
    if (!bytes) {
        throw std::runtime_error("cannot read " + path.string());
    }
    return read_zip(std::span<const unsigned char>(*bytes));
}

size_t count_occurrences(const std::string_view haystack, const std::string_view needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::vector<std::string> split_lines(const std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        const size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

TimePoint fixed_time() {
    std::tm tm{};
    tm.tm_year = 2025 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 14;
    tm.tm_hour = 10;
    tm.tm_min = 30;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

CheckUpAggregate sample_checkup(const fs::path& photo_dir) {
    CheckUpAggregate c;
    c.id = "CU-2025-001";
    c.header.client = {"Acme S.p.A.", "Mario Rossi", "Stabilimento Nord", "Via Roma 1, Milano"};
    c.header.technician = {"Luca Bianchi", "Service Srl", "CERT-42", "+39 02 000000", "luca@example.com"};
    c.header.island = {"Saldatura", "SN-1234", "RW-500", 12000u, uint64_t{450000}};
    c.header.started_at = fixed_time();
    c.header.status = "COMPLETATO";

    Section sicurezza;
    sicurezza.title = "Sicurezza";
    CheckItem barriere;
    barriere.id = "S1";
    barriere.code = "SIC-01";
    barriere.title = "Barriere fotoelettriche";
    barriere.status = CheckItemStatus::Nok;
    barriere.criticality = Criticality::Important;
    barriere.note = "Allineamento non corretto sul lato operatore";
    sicurezza.items.push_back(barriere);

    Section meccanica;
    meccanica.title = "Meccanica";
    CheckItem cinghia;
    cinghia.id = "M1";
    cinghia.code = "MEC-01";
    cinghia.title = "Cinghia di trasmissione";
    cinghia.status = CheckItemStatus::Ok;
    cinghia.criticality = Criticality::Routine;
    cinghia.photos.push_back({write_jpeg(photo_dir, "IMG_0001.jpg", 1600, 1200), "Vista frontale"});
    cinghia.photos.push_back({write_jpeg(photo_dir, "IMG_0002.JPEG", 640, 480), ""});
    meccanica.items.push_back(cinghia);

    c.sections = {sicurezza, meccanica};

    SparePart belt;
    belt.part_number = "BLT-900";
    belt.description = "Cinghia dentata";
    belt.quantity = 2;
    belt.urgency = Criticality::Important;
    belt.estimated_cost = 45.5;
    c.spare_parts.push_back(belt);
    return c;
}

} // namespace qreport::test
