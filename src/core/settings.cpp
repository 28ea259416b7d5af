#include "core/settings.hpp"

#include <cstdlib>
#include <glib.h>
#include <stdexcept>
#include <utility>

namespace mpwrd {

Settings Settings::from_environment() {
    Settings settings;
    if (const char* path = std::getenv("MPWRD_CONFIG_PATH"); path && *path) {
        settings.config_path = path;
    }
    if (const char* sysroot = std::getenv("MPWRD_SYSROOT"); sysroot && *sysroot) {
        settings.sysroot = sysroot;
    }
    if (const char* timeout = std::getenv("MPWRD_COMMAND_TIMEOUT"); timeout && *timeout) {
        try {
            int seconds = std::stoi(timeout);
            if (seconds <= 0) {
                throw std::out_of_range("non-positive timeout");
            }
            settings.command_timeout = std::chrono::seconds(seconds);
        } catch (const std::exception&) {
            g_warning("Ignoring MPWRD_COMMAND_TIMEOUT=%s, using %lld seconds", timeout,
                      static_cast<long long>(settings.command_timeout.count()));
        }
    }
    return settings;
}

SystemPaths::SystemPaths(std::filesystem::path sysroot) : m_sysroot(std::move(sysroot)) {}

std::filesystem::path SystemPaths::resolve(const std::string& absolute) const {
    if (m_sysroot.empty()) {
        return absolute;
    }
    return m_sysroot / std::filesystem::path(absolute).relative_path();
}

}  // namespace mpwrd
