#include "platform/hardware_adapters.hpp"

#include "config_io.hpp"

#include <fstream>
#include <glib.h>
#include <set>
#include <utility>

namespace mpwrd {

namespace {
template <typename T>
const T* peripheral_as(const HardwareConfig& hardware, const std::string& name) {
    auto it = hardware.find(name);
    return it == hardware.end() ? nullptr : std::get_if<T>(&it->second);
}

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool bus_differs(const BusConfig& wanted, const BusConfig& have) {
    // An absent speed leaves whatever the board has configured.
    return wanted.enabled != have.enabled || (wanted.speed && wanted.speed != have.speed);
}
}  // namespace

LedAdapter::LedAdapter(SystemPaths paths) : m_paths(std::move(paths)) {}

std::string LedAdapter::active_trigger(const std::string& trigger_file) {
    size_t open = trigger_file.find('[');
    if (open != std::string::npos) {
        size_t close = trigger_file.find(']', open);
        if (close != std::string::npos) {
            return trigger_file.substr(open + 1, close - open - 1);
        }
    }
    const std::string trimmed = ConfigIO::trim(trigger_file);
    return trimmed.find_first_of(" \t\n") == std::string::npos ? trimmed : "";
}

std::optional<LedMode> LedAdapter::mode_for_trigger(const std::string& trigger) {
    if (trigger == "activity") {
        return LedMode::Enable;
    }
    if (trigger == "none") {
        return LedMode::Disable;
    }
    if (trigger == "heartbeat") {
        return LedMode::Heartbeat;
    }
    return std::nullopt;
}

std::string LedAdapter::trigger_for_mode(LedMode mode) {
    switch (mode) {
        case LedMode::Enable:
            return "activity";
        case LedMode::Disable:
            return "none";
        case LedMode::Heartbeat:
            return "heartbeat";
    }
    return "activity";
}

ConfigModel LedAdapter::read(const ConfigModel& scope) const {
    ConfigModel partial;
    for (const auto& [name, peripheral] : scope.hardware) {
        if (!std::holds_alternative<LedConfig>(peripheral)) {
            continue;
        }
        const auto path = m_paths.leds_class() / name / "trigger";
        const auto text = ConfigIO::read_text(path);
        if (!text) {
            partial.hardware[name] = LedConfig{};
            continue;
        }
        const std::string trigger = active_trigger(*text);
        if (auto mode = mode_for_trigger(trigger)) {
            partial.hardware[name] = LedConfig{*mode};
        } else {
            g_debug("LED %s uses unmanaged trigger '%s'", name.c_str(), trigger.c_str());
        }
    }
    return partial;
}

void LedAdapter::merge(const ConfigModel& partial, ConfigModel& into) const {
    for (const auto& [name, peripheral] : partial.hardware) {
        if (std::holds_alternative<LedConfig>(peripheral)) {
            into.hardware[name] = peripheral;
        }
    }
}

std::vector<FieldDiff> LedAdapter::diff(const ConfigModel& desired, const ConfigModel& current) const {
    std::vector<FieldDiff> diffs;
    for (const auto& [name, peripheral] : desired.hardware) {
        const auto* wanted = std::get_if<LedConfig>(&peripheral);
        if (!wanted) {
            continue;
        }
        const auto* have = peripheral_as<LedConfig>(current.hardware, name);
        if (!have || *have != *wanted) {
            diffs.push_back({"hardware." + name, have ? describe(PeripheralConfig{*have}) : "unmanaged trigger",
                             describe(peripheral)});
        }
    }
    return diffs;
}

ApplyResult LedAdapter::apply(const ConfigModel& desired, const ConfigModel& current) const {
    ApplyResult result;
    for (const auto& [name, peripheral] : desired.hardware) {
        const auto* wanted = std::get_if<LedConfig>(&peripheral);
        if (!wanted) {
            continue;
        }
        const auto* have = peripheral_as<LedConfig>(current.hardware, name);
        if (have && *have == *wanted) {
            continue;
        }

        const std::string field = "hardware." + name;
        const auto path = m_paths.leds_class() / name / "trigger";
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            result.failed(field, "LED '" + name + "' not found at " + path.string());
            continue;
        }

        const std::string trigger = trigger_for_mode(wanted->mode);
        std::ofstream outFile(path, std::ios::trunc);
        if (!outFile.is_open()) {
            result.failed(field, "cannot open " + path.string() + " for writing");
            continue;
        }
        outFile << trigger;
        outFile.close();
        if (!outFile) {
            result.failed(field, "cannot write trigger '" + trigger + "' to " + path.string());
            continue;
        }
        g_message("LED %s trigger set to %s", name.c_str(), trigger.c_str());
        result.changed(field, "LED " + name + " " + describe(peripheral));
    }
    return result;
}

BusAdapter::BusAdapter(SystemPaths paths) : m_paths(std::move(paths)) {}

std::map<std::string, std::string> BusAdapter::parse_kv(const std::string& text) {
    std::map<std::string, std::string> values;
    for (const auto& line : ConfigIO::split_lines(text)) {
        const std::string trimmed = ConfigIO::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        values[ConfigIO::trim(trimmed.substr(0, eq))] = strip_quotes(ConfigIO::trim(trimmed.substr(eq + 1)));
    }
    return values;
}

std::string BusAdapter::update_kv(const std::string& text, const std::map<std::string, std::string>& values) {
    std::vector<std::string> lines = ConfigIO::split_lines(text);
    std::set<std::string> written;
    for (auto& line : lines) {
        const std::string trimmed = ConfigIO::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = ConfigIO::trim(trimmed.substr(0, eq));
        auto it = values.find(key);
        if (it != values.end() && written.insert(key).second) {
            line = ConfigIO::indent_of(line) + key + "=" + it->second;
        }
    }
    for (const auto& [key, value] : values) {
        if (written.count(key) == 0) {
            lines.push_back(key + "=" + value);
        }
    }
    return ConfigIO::join_lines(lines);
}

ConfigModel BusAdapter::read(const ConfigModel& scope) const {
    ConfigModel partial;
    const auto text = ConfigIO::read_text(m_paths.luckfox_cfg());
    const auto values = parse_kv(text.value_or(""));

    for (const auto& [name, peripheral] : scope.hardware) {
        const BusDescriptor* bus = find_bus(name);
        if (!bus || !std::holds_alternative<BusConfig>(peripheral)) {
            continue;
        }
        BusConfig state;
        auto status = values.find(bus->status_key);
        state.enabled = status != values.end() && status->second == "1";
        if (bus->speed_key) {
            auto speed = values.find(bus->speed_key);
            if (speed != values.end()) {
                try {
                    state.speed = std::stoll(speed->second);
                } catch (const std::exception&) {
                    g_warning("Ignoring %s=%s in %s", bus->speed_key, speed->second.c_str(),
                              m_paths.luckfox_cfg().c_str());
                }
            }
        }
        partial.hardware[name] = state;
    }
    return partial;
}

void BusAdapter::merge(const ConfigModel& partial, ConfigModel& into) const {
    for (const auto& [name, peripheral] : partial.hardware) {
        if (std::holds_alternative<BusConfig>(peripheral)) {
            into.hardware[name] = peripheral;
        }
    }
}

std::vector<FieldDiff> BusAdapter::diff(const ConfigModel& desired, const ConfigModel& current) const {
    std::vector<FieldDiff> diffs;
    for (const auto& [name, peripheral] : desired.hardware) {
        const auto* wanted = std::get_if<BusConfig>(&peripheral);
        if (!wanted) {
            continue;
        }
        const auto* found = peripheral_as<BusConfig>(current.hardware, name);
        const BusConfig have = found ? *found : BusConfig{};
        if (bus_differs(*wanted, have)) {
            diffs.push_back({"hardware." + name, describe(PeripheralConfig{have}), describe(peripheral)});
        }
    }
    return diffs;
}

ApplyResult BusAdapter::apply(const ConfigModel& desired, const ConfigModel& current) const {
    ApplyResult result;
    for (const auto& [name, peripheral] : desired.hardware) {
        const auto* wanted = std::get_if<BusConfig>(&peripheral);
        if (!wanted) {
            continue;
        }
        const auto* found = peripheral_as<BusConfig>(current.hardware, name);
        if (!bus_differs(*wanted, found ? *found : BusConfig{})) {
            continue;
        }

        const std::string field = "hardware." + name;
        const BusDescriptor* bus = find_bus(name);
        if (!bus) {
            result.failed(field, "unknown bus '" + name + "'");
            continue;
        }

        std::map<std::string, std::string> values{{bus->status_key, wanted->enabled ? "1" : "0"}};
        if (wanted->speed && bus->speed_key) {
            values[bus->speed_key] = std::to_string(*wanted->speed);
        }

        try {
            const auto text = ConfigIO::read_text(m_paths.luckfox_cfg());
            ConfigIO::write_atomic(m_paths.luckfox_cfg(), update_kv(text.value_or(""), values));
        } catch (const Error& e) {
            result.failed(field, e.what());
            continue;
        }
        g_message("Updated %s for %s", m_paths.luckfox_cfg().c_str(), name.c_str());
        result.changed(field, name + " " + describe(peripheral) + " (effective after reboot)");
    }
    return result;
}

}  // namespace mpwrd
