#include "core/models.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace mpwrd {

namespace {
bool is_bad_interface_name(const std::string& name) {
    if (name.empty()) {
        return true;
    }
    for (char c : name) {
        if (c == '/' || std::isspace(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

bool is_printable_ascii(unsigned char c) {
    return c >= 0x20 && c < 0x7F;
}

// wpa_supplicant takes a passphrase of 8 to 63 printable characters or a raw
// 256-bit key as 64 hex digits. Empty means an open network.
bool is_valid_psk(const std::string& psk) {
    if (psk.empty()) {
        return true;
    }
    if (psk.size() == 64) {
        return std::all_of(psk.begin(), psk.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
    }
    return psk.size() >= 8 && psk.size() <= 63 && std::all_of(psk.begin(), psk.end(), is_printable_ascii);
}

bool has_control_character(const std::string& text) {
    return std::any_of(text.begin(), text.end(), [](unsigned char c) { return c < 0x20 || c == 0x7F; });
}

// Names a directory under /sys/class/leds.
bool is_valid_led_name(const std::string& name) {
    if (name.empty() || name.find('/') != std::string::npos) {
        return false;
    }
    return name.find_first_not_of('.') != std::string::npos;
}
}  // namespace

bool NetworkingConfig::operator==(const NetworkingConfig& other) const {
    return hostname == other.hostname && wifi_enabled == other.wifi_enabled &&
           country_code == other.country_code && wifi == other.wifi &&
           wifi_interface == other.wifi_interface && ethernet_interface == other.ethernet_interface;
}

const std::vector<BusDescriptor>& known_buses() {
    static const std::vector<BusDescriptor> buses = {
        {"spi0", "SPI0_M0_STATUS", "SPI0_M0_SPEED"},
        {"i2c3", "I2C3_M1_STATUS", "I2C3_M1_SPEED"},
        {"uart3", "UART3_M1_STATUS", nullptr},
        {"uart4", "UART4_M1_STATUS", nullptr},
    };
    return buses;
}

const BusDescriptor* find_bus(const std::string& name) {
    for (const auto& bus : known_buses()) {
        if (name == bus.name) {
            return &bus;
        }
    }
    return nullptr;
}

bool is_bus_peripheral(const std::string& name) {
    return find_bus(name) != nullptr;
}

std::string to_string(LedMode mode) {
    switch (mode) {
        case LedMode::Enable:
            return "enable";
        case LedMode::Disable:
            return "disable";
        case LedMode::Heartbeat:
            return "heartbeat";
    }
    return "enable";
}

std::optional<LedMode> parse_led_mode(const std::string& value) {
    if (value == "enable") {
        return LedMode::Enable;
    }
    if (value == "disable") {
        return LedMode::Disable;
    }
    if (value == "heartbeat") {
        return LedMode::Heartbeat;
    }
    return std::nullopt;
}

std::string describe(const ServiceState& state) {
    return std::string(state.enabled ? "enabled" : "disabled") + ", " +
           (state.is_running() ? "running" : "stopped");
}

std::string describe(const PeripheralConfig& peripheral) {
    if (const auto* led = std::get_if<LedConfig>(&peripheral)) {
        return "mode " + to_string(led->mode);
    }
    const auto& bus = std::get<BusConfig>(peripheral);
    std::string text = bus.enabled ? "enabled" : "disabled";
    if (bus.speed) {
        text += ", speed " + std::to_string(*bus.speed);
    }
    return text;
}

bool is_valid_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname.size() > 63) {
        return false;
    }
    if (hostname.front() == '-' || hostname.back() == '-') {
        return false;
    }
    for (char c : hostname) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
    }
    return true;
}

bool is_valid_country_code(const std::string& code) {
    return code.size() == 2 && std::isupper(static_cast<unsigned char>(code[0])) &&
           std::isupper(static_cast<unsigned char>(code[1]));
}

bool is_valid_service_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != ':' && c != '_' && c != '.' &&
            c != '@' && c != '-') {
            return false;
        }
    }
    return true;
}

std::vector<std::string> collect_violations(const ConfigModel& model) {
    std::vector<std::string> violations;
    const auto& net = model.networking;

    if (!is_valid_hostname(net.hostname)) {
        violations.push_back("networking.hostname: '" + net.hostname + "' is not a valid DNS label");
    }
    if (!is_valid_country_code(net.country_code)) {
        violations.push_back("networking.country_code: '" + net.country_code +
                             "' is not an ISO 3166-1 alpha-2 code");
    }

    std::set<std::string> seen;
    std::set<std::string> reported;
    for (size_t i = 0; i < net.wifi.size(); ++i) {
        const std::string prefix = "networking.wifi[" + std::to_string(i) + "]";
        const auto& ssid = net.wifi[i].ssid;
        if (!is_valid_psk(net.wifi[i].psk)) {
            violations.push_back(prefix + ".psk: must be 8 to 63 printable ASCII characters or 64 hex digits");
        }
        if (ssid.empty()) {
            violations.push_back(prefix + ": ssid must not be empty");
            continue;
        }
        if (ssid.size() > 32) {
            violations.push_back(prefix + ".ssid: longer than 32 bytes");
        } else if (has_control_character(ssid)) {
            violations.push_back(prefix + ".ssid: contains control characters");
        }
        if (!seen.insert(ssid).second && reported.insert(ssid).second) {
            violations.push_back("networking.wifi: duplicate ssid '" + ssid + "'");
        }
    }

    if (net.wifi_interface && is_bad_interface_name(*net.wifi_interface)) {
        violations.push_back("networking.wifi_interface: '" + *net.wifi_interface +
                             "' is not an interface name");
    }
    if (net.ethernet_interface && is_bad_interface_name(*net.ethernet_interface)) {
        violations.push_back("networking.ethernet_interface: '" + *net.ethernet_interface +
                             "' is not an interface name");
    }

    for (const auto& [name, state] : model.services) {
        (void)state;
        if (!is_valid_service_name(name)) {
            violations.push_back("services: '" + name + "' is not a valid unit name");
        }
    }

    for (const auto& [name, peripheral] : model.hardware) {
        if (const auto* bus = std::get_if<BusConfig>(&peripheral)) {
            const BusDescriptor* descriptor = find_bus(name);
            if (!descriptor) {
                violations.push_back("hardware." + name + ": unknown bus");
                continue;
            }
            if (bus->speed && !descriptor->speed_key) {
                violations.push_back("hardware." + name + ".speed: bus has no speed setting");
            } else if (bus->speed && *bus->speed <= 0) {
                violations.push_back("hardware." + name + ".speed: must be a positive integer");
            }
        } else {
            if (!is_valid_led_name(name)) {
                violations.push_back("hardware: '" + name + "' is not a valid LED name");
            } else if (is_bus_peripheral(name)) {
                violations.push_back("hardware." + name + ": bus configured with an LED mode");
            }
        }
    }

    return violations;
}

void validate(const ConfigModel& model) {
    auto violations = collect_violations(model);
    if (!violations.empty()) {
        throw ValidationError(std::move(violations));
    }
}

}  // namespace mpwrd
