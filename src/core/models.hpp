#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mpwrd {

inline constexpr const char* kDefaultHostname = "mpwrd";
inline constexpr const char* kDefaultCountryCode = "US";

struct WifiNetwork {
    std::string ssid;
    std::string psk;

    bool operator==(const WifiNetwork& other) const { return ssid == other.ssid && psk == other.psk; }
    bool operator!=(const WifiNetwork& other) const { return !(*this == other); }
};

struct NetworkingConfig {
    std::string hostname = kDefaultHostname;
    bool wifi_enabled = false;
    std::string country_code = kDefaultCountryCode;
    std::vector<WifiNetwork> wifi;
    // Selectors only. Never read back from the system.
    std::optional<std::string> wifi_interface;
    std::optional<std::string> ethernet_interface;

    bool operator==(const NetworkingConfig& other) const;
    bool operator!=(const NetworkingConfig& other) const { return !(*this == other); }
};

struct ServiceState {
    bool enabled = false;
    // Unset means "same as enabled".
    std::optional<bool> running;

    bool is_running() const { return running.value_or(enabled); }

    bool operator==(const ServiceState& other) const {
        return enabled == other.enabled && is_running() == other.is_running();
    }
    bool operator!=(const ServiceState& other) const { return !(*this == other); }
};

using ServicesConfig = std::map<std::string, ServiceState>;

enum class LedMode {
    Enable,
    Disable,
    Heartbeat
};

struct LedConfig {
    LedMode mode = LedMode::Enable;

    bool operator==(const LedConfig& other) const { return mode == other.mode; }
    bool operator!=(const LedConfig& other) const { return !(*this == other); }
};

struct BusConfig {
    bool enabled = false;
    std::optional<long long> speed;

    bool operator==(const BusConfig& other) const {
        return enabled == other.enabled && speed == other.speed;
    }
    bool operator!=(const BusConfig& other) const { return !(*this == other); }
};

using PeripheralConfig = std::variant<LedConfig, BusConfig>;
using HardwareConfig = std::map<std::string, PeripheralConfig>;

struct ConfigModel {
    NetworkingConfig networking;
    ServicesConfig services;
    HardwareConfig hardware;

    bool operator==(const ConfigModel& other) const {
        return networking == other.networking && services == other.services && hardware == other.hardware;
    }
    bool operator!=(const ConfigModel& other) const { return !(*this == other); }
};

// The closed set of buses on the board and the luckfox.cfg keys behind them.
struct BusDescriptor {
    const char* name;
    const char* status_key;
    const char* speed_key;  // nullptr when the bus has no speed setting
};

const std::vector<BusDescriptor>& known_buses();
const BusDescriptor* find_bus(const std::string& name);
bool is_bus_peripheral(const std::string& name);

std::string to_string(LedMode mode);
std::optional<LedMode> parse_led_mode(const std::string& value);

std::string describe(const ServiceState& state);
std::string describe(const PeripheralConfig& peripheral);

bool is_valid_hostname(const std::string& hostname);
bool is_valid_country_code(const std::string& code);
bool is_valid_service_name(const std::string& name);

// Throws ValidationError listing every violation. No side effects.
void validate(const ConfigModel& model);
std::vector<std::string> collect_violations(const ConfigModel& model);

}  // namespace mpwrd

#endif
