#include "platform/services_adapter.hpp"

#include "config_io.hpp"

#include <glib.h>
#include <set>

namespace mpwrd {

namespace {
// is-enabled answers for units whose enablement systemctl cannot toggle.
// These exit 0 without being enabled through an [Install] section.
const std::set<std::string> kFixedEnablement = {"static", "indirect", "generated", "alias", "transient"};

std::string first_line(const std::string& output) {
    const auto lines = ConfigIO::split_lines(output);
    return lines.empty() ? std::string() : ConfigIO::trim(lines.front());
}

ServiceState state_or_default(const ServicesConfig& services, const std::string& unit) {
    auto it = services.find(unit);
    return it == services.end() ? ServiceState{} : it->second;
}
}  // namespace

ServicesAdapter::ServicesAdapter(CommandRunner& runner) : m_runner(runner) {}

CommandResult ServicesAdapter::query(const std::string& verb, const std::string& unit) const {
    const std::vector<std::string> argv{"systemctl", verb, unit};
    CommandResult result = m_runner.run(argv);
    if (result.timed_out) {
        throw ReadError(describe_failure(argv, result));
    }
    return result;
}

ConfigModel ServicesAdapter::read(const ConfigModel& scope) const {
    ConfigModel partial;
    for (const auto& [unit, wanted] : scope.services) {
        ServiceState state;
        const CommandResult enablement = query("is-enabled", unit);
        const std::string answer = first_line(enablement.output);
        if (kFixedEnablement.count(answer) > 0) {
            // Nothing to enable or disable, so whatever was asked for already holds.
            g_debug("%s is %s, enablement left as requested", unit.c_str(), answer.c_str());
            state.enabled = wanted.enabled;
        } else if (!answer.empty()) {
            state.enabled = answer == "enabled" || answer == "enabled-runtime";
        } else {
            state.enabled = enablement.exit_status == 0;
        }
        // Non-zero means inactive, including units that do not exist.
        state.running = query("is-active", unit).exit_status == 0;
        partial.services[unit] = state;
    }
    return partial;
}

void ServicesAdapter::merge(const ConfigModel& partial, ConfigModel& into) const {
    into.services = partial.services;
}

std::vector<FieldDiff> ServicesAdapter::diff(const ConfigModel& desired, const ConfigModel& current) const {
    std::vector<FieldDiff> diffs;
    for (const auto& [unit, wanted] : desired.services) {
        const ServiceState have = state_or_default(current.services, unit);
        if (wanted != have) {
            diffs.push_back({"services." + unit, describe(have), describe(wanted)});
        }
    }
    return diffs;
}

ApplyResult ServicesAdapter::apply(const ConfigModel& desired, const ConfigModel& current) const {
    ApplyResult result;
    for (const auto& [unit, wanted] : desired.services) {
        const ServiceState have = state_or_default(current.services, unit);
        if (wanted == have) {
            continue;
        }

        const std::string field = "services." + unit;
        std::vector<std::vector<std::string>> steps;
        if (wanted.enabled != have.enabled) {
            steps.push_back({"systemctl", wanted.enabled ? "enable" : "disable", unit});
        }
        if (wanted.is_running() != have.is_running()) {
            steps.push_back({"systemctl", wanted.is_running() ? "start" : "stop", unit});
        }

        bool failed = false;
        for (const auto& argv : steps) {
            const CommandResult command = m_runner.run(argv);
            if (!command.ok()) {
                result.failed(field, describe_failure(argv, command));
                failed = true;
                break;
            }
            g_message("%s", describe_command(argv).c_str());
        }
        if (!failed) {
            result.changed(field, unit + " " + describe(wanted));
        }
    }
    return result;
}

}  // namespace mpwrd
