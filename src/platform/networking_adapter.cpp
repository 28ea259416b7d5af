#include "platform/networking_adapter.hpp"

#include "config_io.hpp"
#include "platform/iproute_json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <glib.h>
#include <regex>
#include <utility>

namespace mpwrd {

namespace {
constexpr const char* kHostnameField = "networking.hostname";
constexpr const char* kWifiEnabledField = "networking.wifi_enabled";
constexpr const char* kCountryField = "networking.country_code";
constexpr const char* kWifiField = "networking.wifi";

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool is_hex(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool needs_hex_ssid(const std::string& ssid) {
    return std::any_of(ssid.begin(), ssid.end(), [](unsigned char c) { return c == '"' || c < 0x20 || c >= 0x7F; });
}

std::string to_hex(const std::string& text) {
    std::string hex;
    char buffer[3];
    for (unsigned char c : text) {
        std::snprintf(buffer, sizeof(buffer), "%02x", c);
        hex += buffer;
    }
    return hex;
}

std::string from_hex(const std::string& hex) {
    std::string text;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        text += static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16));
    }
    return text;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string decode_ssid(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"') {
        return unquote(value);
    }
    if (!value.empty() && value.size() % 2 == 0 && is_hex(value)) {
        return from_hex(value);
    }
    return value;
}

std::string regex_escape(const std::string& text) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
    return std::regex_replace(text, special, R"(\$&)");
}

std::string describe_networks(const std::vector<WifiNetwork>& networks) {
    if (networks.empty()) {
        return "no networks";
    }
    std::string text;
    for (const auto& network : networks) {
        if (!text.empty()) {
            text += ", ";
        }
        text += network.ssid;
    }
    return text;
}

void write_system_file(const std::filesystem::path& path, const std::string& content) {
    ConfigIO::write_atomic(path, content);
    g_message("Wrote %s", path.c_str());
}
}  // namespace

namespace wpa {
SupplicantConfig default_config() {
    SupplicantConfig config;
    config.globals = {"ctrl_interface=DIR=/var/run/wpa_supplicant GROUP=netdev", "update_config=1"};
    return config;
}

SupplicantConfig parse(const std::string& text) {
    SupplicantConfig config;
    bool in_block = false;
    WifiNetwork network;

    for (const auto& line : ConfigIO::split_lines(text)) {
        const std::string trimmed = ConfigIO::trim(line);
        if (in_block) {
            if (starts_with(trimmed, "}")) {
                config.networks.push_back(network);
                in_block = false;
                continue;
            }
            size_t eq = trimmed.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            const std::string key = ConfigIO::trim(trimmed.substr(0, eq));
            const std::string value = ConfigIO::trim(trimmed.substr(eq + 1));
            if (key == "ssid") {
                network.ssid = decode_ssid(value);
            } else if (key == "psk") {
                network.psk = unquote(value);
            }
            continue;
        }

        if (starts_with(trimmed, "network=") || starts_with(trimmed, "network =")) {
            in_block = true;
            network = WifiNetwork{};
            continue;
        }
        if (starts_with(trimmed, "country=")) {
            config.country = unquote(ConfigIO::trim(trimmed.substr(8)));
            config.country_line = config.globals.size();
            continue;
        }
        config.globals.push_back(line);
    }

    while (!config.globals.empty() && ConfigIO::trim(config.globals.back()).empty()) {
        config.globals.pop_back();
    }
    config.country_line = std::min(config.country_line, config.globals.size());
    return config;
}

std::string render(const SupplicantConfig& config) {
    std::vector<std::string> lines;
    for (std::size_t i = 0; i <= config.globals.size(); ++i) {
        if (config.country && i == config.country_line) {
            lines.push_back("country=" + *config.country);
        }
        if (i < config.globals.size()) {
            lines.push_back(config.globals[i]);
        }
    }

    for (const auto& network : config.networks) {
        lines.emplace_back();
        lines.push_back("network={");
        if (needs_hex_ssid(network.ssid)) {
            lines.push_back("    ssid=" + to_hex(network.ssid));
        } else {
            lines.push_back("    ssid=\"" + network.ssid + "\"");
        }
        if (network.psk.empty()) {
            lines.push_back("    key_mgmt=NONE");
        } else if (network.psk.size() == 64 && is_hex(network.psk)) {
            lines.push_back("    psk=" + network.psk);
        } else {
            lines.push_back("    psk=\"" + network.psk + "\"");
        }
        lines.push_back("}");
    }
    return ConfigIO::join_lines(lines);
}
}  // namespace wpa

NetworkingAdapter::NetworkingAdapter(SystemPaths paths, CommandRunner& runner)
    : m_paths(std::move(paths)), m_runner(runner) {}

std::vector<std::string> NetworkingAdapter::wifi_interfaces() const {
    std::vector<std::string> interfaces;
    std::error_code ec;
    const auto root = m_paths.net_class();
    if (!std::filesystem::is_directory(root, ec)) {
        return interfaces;
    }
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        const std::string name = entry.path().filename().string();
        if (name == "lo") {
            continue;
        }
        const bool wireless = std::filesystem::exists(entry.path() / "wireless", ec) || starts_with(name, "wl");
        const bool physical = std::filesystem::exists(entry.path() / "device", ec);
        if (wireless && physical) {
            interfaces.push_back(name);
        }
    }
    std::sort(interfaces.begin(), interfaces.end());
    return interfaces;
}

InterfaceChoice NetworkingAdapter::resolve_wifi_interface(const std::optional<std::string>& preferred) const {
    const auto interfaces = wifi_interfaces();
    std::string available;
    for (const auto& name : interfaces) {
        available += available.empty() ? name : ", " + name;
    }

    InterfaceChoice choice;
    if (preferred) {
        if (std::find(interfaces.begin(), interfaces.end(), *preferred) != interfaces.end()) {
            choice.name = *preferred;
        } else {
            choice.error = "Wi-Fi interface '" + *preferred + "' not found, available: " +
                           (available.empty() ? "none" : available);
        }
    } else if (interfaces.size() == 1) {
        choice.name = interfaces.front();
    } else if (interfaces.empty()) {
        choice.error = "no Wi-Fi interface detected";
    } else {
        choice.error = "multiple Wi-Fi interfaces detected (" + available + "), set networking.wifi_interface";
    }
    return choice;
}

std::string NetworkingAdapter::read_hostname() const {
    const auto text = ConfigIO::read_text(m_paths.hostname());
    if (!text) {
        return kDefaultHostname;
    }
    const auto lines = ConfigIO::split_lines(*text);
    const std::string hostname = lines.empty() ? "" : ConfigIO::trim(lines.front());
    return hostname.empty() ? kDefaultHostname : hostname;
}

bool NetworkingAdapter::read_wifi_enabled(const std::optional<std::string>& preferred) const {
    if (const auto state = ConfigIO::read_text(m_paths.wifi_state())) {
        const std::string value = ConfigIO::trim(*state);
        if (value == "up") {
            return true;
        }
        if (value == "down") {
            return false;
        }
        g_warning("Ignoring unexpected Wi-Fi state '%s' in %s", value.c_str(), m_paths.wifi_state().c_str());
    }

    const InterfaceChoice choice = resolve_wifi_interface(preferred);
    if (!choice.name) {
        g_debug("Wi-Fi state unknown: %s", choice.error.c_str());
        return false;
    }

    const std::vector<std::string> argv{"ip", "-j", "link", "show", "dev", *choice.name};
    const CommandResult result = m_runner.run(argv);
    if (result.timed_out) {
        throw ReadError(describe_failure(argv, result));
    }
    if (!result.ok()) {
        g_warning("%s", describe_failure(argv, result).c_str());
        return false;
    }
    const auto links = parse_links(result.output);
    return !links.empty() && links.front().administratively_up();
}

ConfigModel NetworkingAdapter::read(const ConfigModel& scope) const {
    ConfigModel partial;
    NetworkingConfig& net = partial.networking;
    net.hostname = read_hostname();
    net.wifi_enabled = read_wifi_enabled(scope.networking.wifi_interface);

    if (const auto text = ConfigIO::read_text(m_paths.wpa_supplicant())) {
        const auto config = wpa::parse(*text);
        net.country_code = config.country.value_or(kDefaultCountryCode);
        net.wifi = config.networks;
    }
    return partial;
}

void NetworkingAdapter::merge(const ConfigModel& partial, ConfigModel& into) const {
    into.networking = partial.networking;
}

std::vector<FieldDiff> NetworkingAdapter::diff(const ConfigModel& desired, const ConfigModel& current) const {
    std::vector<FieldDiff> diffs;
    const NetworkingConfig& want = desired.networking;
    const NetworkingConfig& have = current.networking;

    if (want.hostname != have.hostname) {
        diffs.push_back({kHostnameField, have.hostname, want.hostname});
    }
    if (want.wifi_enabled != have.wifi_enabled) {
        diffs.push_back({kWifiEnabledField, have.wifi_enabled ? "up" : "down", want.wifi_enabled ? "up" : "down"});
    }
    if (want.country_code != have.country_code) {
        diffs.push_back({kCountryField, have.country_code, want.country_code});
    }
    if (want.wifi != have.wifi) {
        std::string wanted = describe_networks(want.wifi);
        const std::string had = describe_networks(have.wifi);
        if (wanted == had) {
            wanted += " (credentials changed)";
        }
        diffs.push_back({kWifiField, had, wanted});
    }
    return diffs;
}

void NetworkingAdapter::apply_hostname(const std::string& desired, const std::string& current,
                                       ApplyResult& result) const {
    const std::vector<std::string> argv{"hostnamectl", "set-hostname", desired};
    const CommandResult command = m_runner.run(argv);
    if (!command.ok()) {
        result.failed(kHostnameField, describe_failure(argv, command));
        return;
    }

    try {
        // hostnamectl only writes the live /etc/hostname.
        const auto existing = ConfigIO::read_text(m_paths.hostname());
        if (!existing || ConfigIO::trim(*existing) != desired) {
            write_system_file(m_paths.hostname(), desired + "\n");
        }

        const std::string hosts = ConfigIO::read_text(m_paths.hosts()).value_or("");
        std::string updated = hosts;
        if (!current.empty() && current != desired) {
            updated = std::regex_replace(hosts, std::regex("\\b" + regex_escape(current) + "\\b"), desired);
        }
        if (!std::regex_search(updated, std::regex("\\b" + regex_escape(desired) + "\\b"))) {
            if (!updated.empty() && updated.back() != '\n') {
                updated += '\n';
            }
            updated += "127.0.1.1 " + desired + "\n";
        }
        if (updated != hosts) {
            write_system_file(m_paths.hosts(), updated);
        }
    } catch (const Error& e) {
        result.failed(kHostnameField, e.what());
        return;
    }

    const std::vector<std::string> restart{"systemctl", "restart", "avahi-daemon"};
    if (m_runner.available("systemctl")) {
        const CommandResult avahi = m_runner.run(restart);
        if (!avahi.ok()) {
            g_warning("%s", describe_failure(restart, avahi).c_str());
        }
    }
    result.changed(kHostnameField, "hostname set to " + desired);
}

void NetworkingAdapter::apply_wifi_enabled(const NetworkingConfig& desired, ApplyResult& result) const {
    const InterfaceChoice choice = resolve_wifi_interface(desired.wifi_interface);
    if (!choice.name) {
        result.failed(kWifiEnabledField, choice.error);
        return;
    }

    const std::string state = desired.wifi_enabled ? "up" : "down";
    const std::vector<std::string> argv{"ip", "link", "set", *choice.name, state};
    const CommandResult command = m_runner.run(argv);
    if (!command.ok()) {
        result.failed(kWifiEnabledField, describe_failure(argv, command));
        return;
    }

    try {
        write_system_file(m_paths.wifi_state(), state + "\n");
    } catch (const Error& e) {
        result.failed(kWifiEnabledField, e.what());
        return;
    }
    result.changed(kWifiEnabledField, "Wi-Fi interface " + *choice.name + " set " + state);
}

bool NetworkingAdapter::apply_supplicant(const std::string& field, const NetworkingConfig& desired,
                                         ApplyResult& result) const {
    try {
        const auto text = ConfigIO::read_text(m_paths.wpa_supplicant());
        wpa::SupplicantConfig config = text ? wpa::parse(*text) : wpa::default_config();
        std::string description;
        if (field == kCountryField) {
            config.country = desired.country_code;
            description = "regulatory country set to " + desired.country_code;
        } else {
            config.networks = desired.wifi;
            description = "Wi-Fi networks set to " + describe_networks(desired.wifi);
        }
        write_system_file(m_paths.wpa_supplicant(), wpa::render(config));
        result.changed(field, description);
        return true;
    } catch (const Error& e) {
        result.failed(field, e.what());
        return false;
    }
}

void NetworkingAdapter::reconfigure_supplicant(const NetworkingConfig& desired) const {
    if (!desired.wifi_enabled || !m_runner.available("wpa_cli")) {
        return;
    }
    const InterfaceChoice choice = resolve_wifi_interface(desired.wifi_interface);
    if (!choice.name) {
        g_warning("Skipping wpa_cli reconfigure: %s", choice.error.c_str());
        return;
    }
    const std::vector<std::string> argv{"wpa_cli", "-i", *choice.name, "reconfigure"};
    const CommandResult command = m_runner.run(argv);
    if (!command.ok()) {
        g_warning("%s", describe_failure(argv, command).c_str());
    }
}

ApplyResult NetworkingAdapter::apply(const ConfigModel& desired, const ConfigModel& current) const {
    ApplyResult result;
    const NetworkingConfig& want = desired.networking;
    const NetworkingConfig& have = current.networking;

    if (want.hostname != have.hostname) {
        apply_hostname(want.hostname, have.hostname, result);
    }
    if (want.wifi_enabled != have.wifi_enabled) {
        apply_wifi_enabled(want, result);
    }

    bool supplicant_changed = false;
    if (want.country_code != have.country_code) {
        supplicant_changed |= apply_supplicant(kCountryField, want, result);
    }
    if (want.wifi != have.wifi) {
        supplicant_changed |= apply_supplicant(kWifiField, want, result);
    }
    if (supplicant_changed) {
        reconfigure_supplicant(want);
    }
    return result;
}

}  // namespace mpwrd
