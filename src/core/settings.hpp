#ifndef CORE_SETTINGS_HPP
#define CORE_SETTINGS_HPP

#include <chrono>
#include <filesystem>
#include <string>

namespace mpwrd {

inline constexpr const char* kDefaultConfigPath = "/etc/mpwrd-config.toml";
inline constexpr std::chrono::seconds kDefaultCommandTimeout{10};

struct Settings {
    std::filesystem::path config_path = kDefaultConfigPath;
    std::filesystem::path sysroot;  // empty means the live system
    std::chrono::seconds command_timeout = kDefaultCommandTimeout;

    // Defaults overridden by MPWRD_CONFIG_PATH, MPWRD_SYSROOT and
    // MPWRD_COMMAND_TIMEOUT.
    static Settings from_environment();
};

// Every system file the adapters touch, resolved below the system root.
class SystemPaths {
public:
    explicit SystemPaths(std::filesystem::path sysroot = {});

    std::filesystem::path resolve(const std::string& absolute) const;

    std::filesystem::path hostname() const { return resolve("/etc/hostname"); }
    std::filesystem::path hosts() const { return resolve("/etc/hosts"); }
    std::filesystem::path wpa_supplicant() const { return resolve("/etc/wpa_supplicant/wpa_supplicant.conf"); }
    std::filesystem::path wifi_state() const { return resolve("/etc/wifi_state.txt"); }
    std::filesystem::path luckfox_cfg() const { return resolve("/etc/luckfox.cfg"); }
    std::filesystem::path net_class() const { return resolve("/sys/class/net"); }
    std::filesystem::path leds_class() const { return resolve("/sys/class/leds"); }
    std::filesystem::path last_time() const { return resolve("/tmp/last_time"); }

    const std::filesystem::path& sysroot() const { return m_sysroot; }

private:
    std::filesystem::path m_sysroot;
};

}  // namespace mpwrd

#endif
