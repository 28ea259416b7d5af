#ifndef RECONCILER_HPP
#define RECONCILER_HPP

#include "core/models.hpp"
#include "core/settings.hpp"
#include "platform/adapter_types.hpp"
#include "platform/command_runner.hpp"
#include "platform/hardware_adapters.hpp"
#include "platform/networking_adapter.hpp"
#include "platform/services_adapter.hpp"

#include <string>
#include <variant>
#include <vector>

namespace mpwrd {

// The closed set of system surfaces, applied in the order they are listed.
using SystemAdapter = std::variant<NetworkingAdapter, ServicesAdapter, LedAdapter, BusAdapter>;

std::vector<SystemAdapter> make_adapters(const SystemPaths& paths, CommandRunner& runner);

enum class RunState {
    Loaded,
    Diffed,
    Applying,
    Converged,
    PartiallyFailed
};

std::string to_string(RunState state);

struct ReconcileReport {
    RunState state = RunState::Loaded;
    ConfigModel current;
    std::vector<FieldDiff> diff;
    std::vector<AppliedChange> applied;
    std::vector<ApplyError> failures;
    std::vector<std::string> read_errors;  // domains that fell back to defaults

    bool converged() const { return state == RunState::Converged; }
};

struct ReconcileOptions {
    bool dry_run = false;  // stop once the diff is known
};

class Reconciler {
public:
    explicit Reconciler(std::vector<SystemAdapter> adapters);

    // Throws ValidationError before touching the system. FatalError from an
    // adapter aborts the run and propagates.
    ReconcileReport run(const ConfigModel& desired, const ReconcileOptions& options = {}) const;

    // Live state of everything `scope` names.
    ConfigModel current_state(const ConfigModel& scope, std::vector<std::string>* read_errors = nullptr) const;

private:
    std::vector<SystemAdapter> m_adapters;
};

}  // namespace mpwrd

#endif
