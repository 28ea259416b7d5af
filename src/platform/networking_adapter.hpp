#ifndef NETWORKING_ADAPTER_HPP
#define NETWORKING_ADAPTER_HPP

#include "core/models.hpp"
#include "core/settings.hpp"
#include "platform/adapter_types.hpp"
#include "platform/command_runner.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mpwrd {

namespace wpa {
struct SupplicantConfig {
    std::vector<std::string> globals;  // every line outside network blocks except country=
    std::optional<std::string> country;
    std::size_t country_line = 0;  // index into globals the country line is written before
    std::vector<WifiNetwork> networks;
};

SupplicantConfig default_config();
SupplicantConfig parse(const std::string& text);
std::string render(const SupplicantConfig& config);
}  // namespace wpa

struct InterfaceChoice {
    std::optional<std::string> name;
    std::string error;
};

class NetworkingAdapter {
public:
    NetworkingAdapter(SystemPaths paths, CommandRunner& runner);

    const char* name() const { return "networking"; }

    ConfigModel read(const ConfigModel& scope) const;
    std::vector<FieldDiff> diff(const ConfigModel& desired, const ConfigModel& current) const;
    ApplyResult apply(const ConfigModel& desired, const ConfigModel& current) const;
    void merge(const ConfigModel& partial, ConfigModel& into) const;

    std::vector<std::string> wifi_interfaces() const;
    InterfaceChoice resolve_wifi_interface(const std::optional<std::string>& preferred) const;

private:
    std::string read_hostname() const;
    bool read_wifi_enabled(const std::optional<std::string>& preferred) const;

    void apply_hostname(const std::string& desired, const std::string& current, ApplyResult& result) const;
    void apply_wifi_enabled(const NetworkingConfig& desired, ApplyResult& result) const;
    bool apply_supplicant(const std::string& field, const NetworkingConfig& desired, ApplyResult& result) const;
    void reconfigure_supplicant(const NetworkingConfig& desired) const;

    SystemPaths m_paths;
    CommandRunner& m_runner;
};

}  // namespace mpwrd

#endif
