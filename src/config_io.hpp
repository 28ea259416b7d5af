#ifndef CONFIG_IO_HPP
#define CONFIG_IO_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mpwrd {

// Exclusive advisory lock on <path>.lock, held for the lifetime of the object.
class FileLock {
public:
    explicit FileLock(const std::filesystem::path& target);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
    int m_fd = -1;
};

class ConfigIO {
public:
    using RenameHook = std::function<void(const std::filesystem::path& temporary)>;

    // std::nullopt when the file does not exist. Other failures throw ReadError.
    static std::optional<std::string> read_text(const std::filesystem::path& path);

    // Writes to a temporary file beside `path`, fsyncs it and renames it over
    // `path`. `before_rename` runs between the two steps. Throws FatalError.
    static void write_atomic(const std::filesystem::path& path, const std::string& content,
                             const RenameHook& before_rename = {});

    static std::vector<std::string> split_lines(const std::string& text);
    static std::string join_lines(const std::vector<std::string>& lines);

    static std::string trim(const std::string& text);
    static std::string indent_of(const std::string& line);
};

}  // namespace mpwrd

#endif // CONFIG_IO_HPP
