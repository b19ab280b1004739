#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

fs::path temp_sibling(const fs::path &target) {
    return target.parent_path() /
           ("." + target.filename().string() + ".tmp" + RandomUtils::random_suffix());
}

void discard_temp(const fs::path &tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't remove temp file: " + tmp.string() + " (" + ec.message() + ")",
                    "file_utils");
    }
}

fs::path backup_sibling(const fs::path &target) {
    return target.parent_path() /
           ("." + target.filename().string() + ".bak" + RandomUtils::random_suffix());
}

std::error_code write_temp(const fs::path &tmp, const unsigned char *data, const size_t size) {
    qreport::unique_FILE out(qreport::open_file(tmp, "wb"));
    if (!out) {
        return std::make_error_code(std::errc::permission_denied);
    }
    if ((size > 0 && std::fwrite(data, 1, size, out.get()) != size) || std::fflush(out.get()) != 0) {
        out.reset();
        discard_temp(tmp);
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code copy_temp(const fs::path &source, const fs::path &tmp, const bool preserve_time) {
    std::error_code ec;
    fs::copy_file(source, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        discard_temp(tmp);
        return ec;
    }
    if (preserve_time) {
        const auto mtime = fs::last_write_time(source, ec);
        if (!ec) {
            fs::last_write_time(tmp, mtime, ec);
        }
        if (ec) {
            Logger::log(LogLevel::Warning,
                        "Can't preserve modification time of " + source.string() + " (" + ec.message() + ")",
                        "file_utils");
        }
    }
    return {};
}

std::error_code rename_into_place(const fs::path &tmp, const fs::path &target) {
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        discard_temp(tmp);
    }
    return ec;
}

} // namespace

namespace qreport {

    FILE* open_file(const fs::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = fs::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prefix bypasses MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::optional<std::vector<unsigned char>> read_file_bytes(const fs::path& path) {
        unique_FILE in(open_file(path, "rb"));
        if (!in) {
            return std::nullopt;
        }
        std::vector<unsigned char> bytes;
        unsigned char buf[64 * 1024];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), in.get())) > 0) {
            bytes.insert(bytes.end(), buf, buf + n);
        }
        if (std::ferror(in.get())) {
            return std::nullopt;
        }
        return bytes;
    }

    std::error_code write_file_atomic(const fs::path& target, const std::span<const unsigned char> data) {
        const fs::path tmp = temp_sibling(target);
        if (const auto ec = write_temp(tmp, data.data(), data.size())) {
            return ec;
        }
        return rename_into_place(tmp, target);
    }

    std::error_code write_file_atomic(const fs::path& target, const std::string_view text) {
        return write_file_atomic(target, std::span(reinterpret_cast<const unsigned char*>(text.data()), text.size()));
    }

    std::error_code copy_file_atomic(const fs::path& source, const fs::path& target, const bool preserve_time) {
        const fs::path tmp = temp_sibling(target);
        if (const auto ec = copy_temp(source, tmp, preserve_time)) {
            return ec;
        }
        return rename_into_place(tmp, target);
    }

    OutputJournal::~OutputJournal() {
        rollback();
    }

    std::error_code OutputJournal::write(const fs::path& target, const std::span<const unsigned char> data) {
        const fs::path tmp = temp_sibling(target);
        if (const auto ec = write_temp(tmp, data.data(), data.size())) {
            return ec;
        }
        return place(tmp, target);
    }

    std::error_code OutputJournal::write(const fs::path& target, const std::string_view text) {
        return write(target, std::span(reinterpret_cast<const unsigned char*>(text.data()), text.size()));
    }

    std::error_code OutputJournal::copy(const fs::path& source, const fs::path& target, const bool preserve_time) {
        const fs::path tmp = temp_sibling(target);
        if (const auto ec = copy_temp(source, tmp, preserve_time)) {
            return ec;
        }
        return place(tmp, target);
    }

    std::error_code OutputJournal::place(const fs::path& tmp, const fs::path& target) {
        const bool recorded = std::ranges::any_of(entries_, [&](const Entry& e) { return e.target == target; });
        Entry entry{target, std::nullopt};

        std::error_code ec;
        const bool existing = !recorded && fs::exists(target, ec);
        if (ec) {
            discard_temp(tmp);
            return ec;
        }
        if (existing) {
            const fs::path backup = backup_sibling(target);
            fs::rename(target, backup, ec);
            if (ec) {
                discard_temp(tmp);
                return ec;
            }
            entry.backup = backup;
        }

        fs::rename(tmp, target, ec);
        if (ec) {
            discard_temp(tmp);
            if (entry.backup) {
                restore(*entry.backup, target);
            }
            return ec;
        }
        if (!recorded) {
            entries_.push_back(std::move(entry));
        }
        return {};
    }

    void OutputJournal::restore(const fs::path& backup, const fs::path& target) {
        std::error_code ec;
        fs::rename(backup, target, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                        "Can't restore " + target.string() + " from " + backup.string() + " (" + ec.message() + ")",
                        "file_utils");
        }
    }

    void OutputJournal::rollback() {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            std::error_code ec;
            fs::remove(it->target, ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "Can't remove " + it->target.string() + " (" + ec.message() + ")",
                            "file_utils");
            }
            if (it->backup) {
                restore(*it->backup, it->target);
            }
        }
        entries_.clear();
    }

    void OutputJournal::commit() {
        for (const auto& entry : entries_) {
            if (!entry.backup) {
                continue;
            }
            std::error_code ec;
            fs::remove(*entry.backup, ec);
            if (ec) {
                Logger::log(LogLevel::Warning,
                            "Can't remove backup " + entry.backup->string() + " (" + ec.message() + ")",
                            "file_utils");
            }
        }
        entries_.clear();
    }

    bool is_directory_writable(const fs::path& dir) {
        const fs::path probe = dir / (".qreport-probe-" + RandomUtils::random_suffix());
        {
            unique_FILE f(open_file(probe, "wb"));
            if (!f) {
                return false;
            }
        }
        std::error_code ec;
        fs::remove(probe, ec);
        return true;
    }

    fs::path make_temp_dir_for(const std::string& name, const std::string& prefix) {
        const auto base_tmp = fs::temp_directory_path() / ("qreport-" + prefix);

        std::error_code ec;
        fs::create_directories(base_tmp, ec);

        const std::string dir_name = prefix + "_" + name + "_" + RandomUtils::random_suffix();
        auto dir = base_tmp / dir_name;

        fs::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
        }
        return dir;
    }

    void cleanup_temp_dir(const fs::path& dir, const std::string_view tag) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

} // namespace qreport
