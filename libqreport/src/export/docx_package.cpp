#include "../../include/docx_package.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <stdexcept>
#include <string>

namespace qreport {

namespace {

constexpr std::string_view processor_tag() {
    return "libarchive";
}

std::string archive_message(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

int open_memory(archive*, void*) {
    return ARCHIVE_OK;
}

la_ssize_t write_memory(archive*, void* client, const void* buffer, const size_t length) {
    auto* bytes = static_cast<std::vector<unsigned char>*>(client);
    const auto* p = static_cast<const unsigned char*>(buffer);
    bytes->insert(bytes->end(), p, p + length);
    return static_cast<la_ssize_t>(length);
}

int close_memory(archive*, void*) {
    return ARCHIVE_OK;
}

} // namespace

DocxPackage::DocxPackage() {
    out_ = archive_write_new();
    if (!out_) {
        Logger::log(LogLevel::Error, "archive_write_new failed", processor_tag());
        throw std::runtime_error("DocxPackage: archive_write_new failed");
    }

    // set ZIP format and force deflate compression
    const int set_fmt = archive_write_set_format_zip(out_);
    if (set_fmt == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(out_), processor_tag());
    }
    if (set_fmt != ARCHIVE_OK && set_fmt != ARCHIVE_WARN) {
        Logger::log(LogLevel::Error, "Failed to set ZIP format: " + archive_message(out_), processor_tag());
        archive_write_free(out_);
        out_ = nullptr;
        throw std::runtime_error("DocxPackage: set_format_zip failed");
    }
    archive_write_set_options(out_, "compression=deflate");
    archive_write_set_bytes_in_last_block(out_, 1);

    const int open_w = archive_write_open(out_, &bytes_, open_memory, write_memory, close_memory);
    if (open_w != ARCHIVE_OK) {
        Logger::log(LogLevel::Error, "Failed to open in-memory archive: " + archive_message(out_), processor_tag());
        archive_write_free(out_);
        out_ = nullptr;
        throw std::runtime_error("DocxPackage: write_open failed");
    }
}

DocxPackage::~DocxPackage() {
    if (out_) {
        if (!finished_) {
            archive_write_close(out_);
        }
        archive_write_free(out_);
    }
}

void DocxPackage::add_part(const std::string_view name, const std::span<const unsigned char> data) {
    if (finished_) {
        throw std::runtime_error("DocxPackage: add_part after finish");
    }

    archive_entry* entry = archive_entry_new();
    if (!entry) {
        Logger::log(LogLevel::Error, "archive_entry_new failed", processor_tag());
        throw std::runtime_error("DocxPackage: archive_entry_new failed");
    }

    const std::string path(name);
    archive_entry_set_pathname(entry, path.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_mtime(entry, 0, 0); // determinism

    const int wh = archive_write_header(out_, entry);
    if (wh == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(out_), processor_tag());
    }
    if (wh != ARCHIVE_OK && wh != ARCHIVE_WARN) {
        Logger::log(LogLevel::Error,
                    "Failed to write header for: " + path + " (" + archive_message(out_) + ")", processor_tag());
        archive_entry_free(entry);
        throw std::runtime_error("DocxPackage: write_header failed for " + path);
    }

    if (!data.empty()) {
        const la_ssize_t wrote = archive_write_data(out_, data.data(), data.size());
        if (wrote < 0) {
            Logger::log(LogLevel::Error,
                        "Failed to write data for: " + path + " (" + archive_message(out_) + ")", processor_tag());
            archive_entry_free(entry);
            throw std::runtime_error("DocxPackage: write_data failed for " + path);
        }
    }

    archive_entry_free(entry);
    ++parts_;
    Logger::log(LogLevel::Debug, "Added part " + path + " (" + std::to_string(data.size()) + " bytes)",
                processor_tag());
}

void DocxPackage::add_part(const std::string_view name, const std::string_view text) {
    add_part(name, std::span(reinterpret_cast<const unsigned char*>(text.data()), text.size()));
}

std::vector<unsigned char> DocxPackage::finish() {
    if (finished_) {
        throw std::runtime_error("DocxPackage: finish called twice");
    }
    finished_ = true;
    const int close_w = archive_write_close(out_);
    if (close_w != ARCHIVE_OK) {
        Logger::log(LogLevel::Error, "Failed to close archive: " + archive_message(out_), processor_tag());
        throw std::runtime_error("DocxPackage: write_close failed");
    }
    return std::move(bytes_);
}

} // namespace qreport
