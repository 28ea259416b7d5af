#include "config_io.hpp"

#include "core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mpwrd {

namespace {
std::string with_errno(const std::string& message, int error) {
    return message + ": " + std::strerror(error);
}

void ensure_directory(const std::filesystem::path& directory) {
    if (directory.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw FatalError("cannot create directory " + directory.string() + ": " + ec.message());
    }
}

void sync_directory(const std::filesystem::path& directory) {
    int fd = ::open(directory.empty() ? "." : directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw FatalError(with_errno("cannot open directory " + directory.string(), errno));
    }
    if (::fsync(fd) != 0) {
        int error = errno;
        ::close(fd);
        throw FatalError(with_errno("cannot sync directory " + directory.string(), error));
    }
    ::close(fd);
}
}  // namespace

FileLock::FileLock(const std::filesystem::path& target) : m_path(target.string() + ".lock") {
    ensure_directory(m_path.parent_path());
    m_fd = ::open(m_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd < 0) {
        throw FatalError(with_errno("cannot open lock file " + m_path.string(), errno));
    }
    while (::flock(m_fd, LOCK_EX) != 0) {
        if (errno == EINTR) {
            continue;
        }
        int error = errno;
        ::close(m_fd);
        m_fd = -1;
        throw FatalError(with_errno("cannot lock " + m_path.string(), error));
    }
}

FileLock::~FileLock() {
    if (m_fd >= 0) {
        ::flock(m_fd, LOCK_UN);
        ::close(m_fd);
    }
}

std::optional<std::string> ConfigIO::read_text(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw ReadError("cannot stat " + path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream inFile(path, std::ios::binary);
    if (!inFile.is_open()) {
        throw ReadError(with_errno("cannot open " + path.string() + " for reading", errno));
    }
    std::ostringstream content;
    content << inFile.rdbuf();
    if (inFile.bad()) {
        throw ReadError("error while reading " + path.string());
    }
    return content.str();
}

void ConfigIO::write_atomic(const std::filesystem::path& path, const std::string& content,
                            const RenameHook& before_rename) {
    const std::filesystem::path directory = path.parent_path();
    ensure_directory(directory);

    std::string pattern = (directory / ("." + path.filename().string() + ".XXXXXX")).string();
    int fd = ::mkstemp(pattern.data());
    if (fd < 0) {
        throw FatalError(with_errno("cannot create temporary file for " + path.string(), errno));
    }
    const std::filesystem::path temporary(pattern);

    auto fail = [&](const std::string& what) {
        int error = errno;
        if (fd >= 0) {
            ::close(fd);
        }
        ::unlink(temporary.c_str());
        throw FatalError(with_errno(what, error));
    };

    mode_t mode = 0644;
    struct stat existing {};
    if (::stat(path.c_str(), &existing) == 0) {
        mode = existing.st_mode & 07777;
    }
    if (::fchmod(fd, mode) != 0) {
        fail("cannot set permissions on " + temporary.string());
    }

    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail("cannot write " + temporary.string());
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    if (::fsync(fd) != 0) {
        fail("cannot sync " + temporary.string());
    }
    if (::close(fd) != 0) {
        fd = -1;
        fail("cannot close " + temporary.string());
    }
    fd = -1;

    if (before_rename) {
        try {
            before_rename(temporary);
        } catch (...) {
            ::unlink(temporary.c_str());
            throw;
        }
    }

    if (::rename(temporary.c_str(), path.c_str()) != 0) {
        fail("cannot rename " + temporary.string() + " to " + path.string());
    }
    sync_directory(directory);
}

std::vector<std::string> ConfigIO::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string ConfigIO::join_lines(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& l : lines) {
        text += l;
        text += '\n';
    }
    return text;
}

std::string ConfigIO::trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string ConfigIO::indent_of(const std::string& line) {
    size_t first = line.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return line;
    }
    return line.substr(0, first);
}

}  // namespace mpwrd
