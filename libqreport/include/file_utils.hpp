#ifndef QREPORT_FILE_UTILS_HPP
#define QREPORT_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace qreport {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Reads a whole file into memory.
     * @return The file bytes, or std::nullopt if the file can't be opened or read.
     */
    std::optional<std::vector<unsigned char>> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Writes @p data to @p target through a temporary sibling file
     * that is renamed into place once flushed.
     *
     * The target is either absent or complete; a failed write removes the
     * temporary file.
     *
     * @return An empty error code on success.
     */
    std::error_code write_file_atomic(const std::filesystem::path &target,
                                      std::span<const unsigned char> data);

    /// @overload
    std::error_code write_file_atomic(const std::filesystem::path &target, std::string_view text);

    /**
     * @brief Copies @p source to @p target through a temporary sibling file.
     * @param preserve_time Copy the source modification time onto the target.
     * @return An empty error code on success.
     */
    std::error_code copy_file_atomic(const std::filesystem::path &source,
                                     const std::filesystem::path &target,
                                     bool preserve_time);

    /**
     * @brief Records the files an export puts in place so they can be taken
     * back as a unit.
     *
     * @details Every output goes through a temporary sibling that is renamed
     * onto the target. When the target already exists (a previous export
     * under the same name), it is first moved aside to a hidden
     * ".{name}.bak*" sibling. rollback() removes the new files and moves the
     * previous ones back; commit() drops the set-aside copies. A journal
     * destroyed without commit() rolls back.
     */
    class OutputJournal {
    public:
        OutputJournal() = default;
        ~OutputJournal();

        OutputJournal(const OutputJournal&) = delete;
        OutputJournal& operator=(const OutputJournal&) = delete;

        /// @return An empty error code on success; on failure the target is unchanged.
        std::error_code write(const std::filesystem::path &target, std::span<const unsigned char> data);

        /// @overload
        std::error_code write(const std::filesystem::path &target, std::string_view text);

        /// @brief Copies @p source onto @p target, see copy_file_atomic().
        std::error_code copy(const std::filesystem::path &source,
                             const std::filesystem::path &target,
                             bool preserve_time);

        void rollback();
        void commit();

        [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

    private:
        struct Entry {
            std::filesystem::path target;
            std::optional<std::filesystem::path> backup;
        };

        std::error_code place(const std::filesystem::path &tmp, const std::filesystem::path &target);
        static void restore(const std::filesystem::path &backup, const std::filesystem::path &target);

        std::vector<Entry> entries_;
    };

    /**
     * @brief Checks that a file can be created inside @p dir.
     *
     * Creates and removes a small probe file.
     */
    bool is_directory_writable(const std::filesystem::path &dir);

    /**
     * @brief Creates a unique temporary directory.
     *
     * Creates a directory inside the system temp path using a
     * "qreport-{prefix}/{prefix}_{name}_{random_suffix}" pattern.
     *
     * @param name A readable part of the directory name.
     * @param prefix A short prefix (e.g., "test", "export").
     * @return Filesystem path to the newly created temporary directory.
     */
    std::filesystem::path make_temp_dir_for(const std::string &name,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag (e.g., "export_orchestrator").
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

} // namespace qreport

#endif // QREPORT_FILE_UTILS_HPP
