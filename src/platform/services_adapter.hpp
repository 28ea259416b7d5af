#ifndef SERVICES_ADAPTER_HPP
#define SERVICES_ADAPTER_HPP

#include "core/models.hpp"
#include "platform/adapter_types.hpp"
#include "platform/command_runner.hpp"

#include <string>
#include <vector>

namespace mpwrd {

// systemd units, through systemctl.
class ServicesAdapter {
public:
    explicit ServicesAdapter(CommandRunner& runner);

    const char* name() const { return "services"; }

    ConfigModel read(const ConfigModel& scope) const;
    std::vector<FieldDiff> diff(const ConfigModel& desired, const ConfigModel& current) const;
    ApplyResult apply(const ConfigModel& desired, const ConfigModel& current) const;
    void merge(const ConfigModel& partial, ConfigModel& into) const;

private:
    CommandResult query(const std::string& verb, const std::string& unit) const;

    CommandRunner& m_runner;
};

}  // namespace mpwrd

#endif
