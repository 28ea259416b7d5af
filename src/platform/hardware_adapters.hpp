#ifndef HARDWARE_ADAPTERS_HPP
#define HARDWARE_ADAPTERS_HPP

#include "core/models.hpp"
#include "core/settings.hpp"
#include "platform/adapter_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mpwrd {

// sysfs LED class devices: /sys/class/leds/<name>/trigger.
class LedAdapter {
public:
    explicit LedAdapter(SystemPaths paths);

    const char* name() const { return "led"; }

    ConfigModel read(const ConfigModel& scope) const;
    std::vector<FieldDiff> diff(const ConfigModel& desired, const ConfigModel& current) const;
    ApplyResult apply(const ConfigModel& desired, const ConfigModel& current) const;
    void merge(const ConfigModel& partial, ConfigModel& into) const;

    static std::string active_trigger(const std::string& trigger_file);
    static std::optional<LedMode> mode_for_trigger(const std::string& trigger);
    static std::string trigger_for_mode(LedMode mode);

private:
    SystemPaths m_paths;
};

// Buses switched through the board's luckfox.cfg KEY=VALUE file.
class BusAdapter {
public:
    explicit BusAdapter(SystemPaths paths);

    const char* name() const { return "bus"; }

    ConfigModel read(const ConfigModel& scope) const;
    std::vector<FieldDiff> diff(const ConfigModel& desired, const ConfigModel& current) const;
    ApplyResult apply(const ConfigModel& desired, const ConfigModel& current) const;
    void merge(const ConfigModel& partial, ConfigModel& into) const;

    static std::map<std::string, std::string> parse_kv(const std::string& text);
    // Replaces the value of every key in `values`, appending keys not present.
    static std::string update_kv(const std::string& text, const std::map<std::string, std::string>& values);

private:
    SystemPaths m_paths;
};

}  // namespace mpwrd

#endif
