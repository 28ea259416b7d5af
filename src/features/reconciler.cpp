#include "features/reconciler.hpp"

#include <glib.h>
#include <utility>

namespace mpwrd {

std::vector<SystemAdapter> make_adapters(const SystemPaths& paths, CommandRunner& runner) {
    std::vector<SystemAdapter> adapters;
    adapters.emplace_back(NetworkingAdapter(paths, runner));
    adapters.emplace_back(ServicesAdapter(runner));
    adapters.emplace_back(LedAdapter(paths));
    adapters.emplace_back(BusAdapter(paths));
    return adapters;
}

std::string to_string(RunState state) {
    switch (state) {
        case RunState::Loaded:
            return "loaded";
        case RunState::Diffed:
            return "diffed";
        case RunState::Applying:
            return "applying";
        case RunState::Converged:
            return "converged";
        case RunState::PartiallyFailed:
            return "partially failed";
    }
    return "unknown";
}

Reconciler::Reconciler(std::vector<SystemAdapter> adapters) : m_adapters(std::move(adapters)) {}

ConfigModel Reconciler::current_state(const ConfigModel& scope, std::vector<std::string>* read_errors) const {
    ConfigModel current;
    for (const auto& adapter : m_adapters) {
        std::visit(
            [&](const auto& a) {
                try {
                    a.merge(a.read(scope), current);
                } catch (const ReadError& e) {
                    g_warning("Reading %s state failed, assuming defaults: %s", a.name(), e.what());
                    if (read_errors) {
                        read_errors->push_back(std::string(a.name()) + ": " + e.what());
                    }
                }
            },
            adapter);
    }
    return current;
}

ReconcileReport Reconciler::run(const ConfigModel& desired, const ReconcileOptions& options) const {
    ReconcileReport report;
    validate(desired);

    report.current = current_state(desired, &report.read_errors);

    std::vector<bool> pending;
    for (const auto& adapter : m_adapters) {
        auto diffs = std::visit([&](const auto& a) { return a.diff(desired, report.current); }, adapter);
        pending.push_back(!diffs.empty());
        report.diff.insert(report.diff.end(), diffs.begin(), diffs.end());
    }
    report.state = RunState::Diffed;
    g_debug("%zu field(s) differ from the desired configuration", report.diff.size());
    if (options.dry_run) {
        return report;
    }

    report.state = RunState::Applying;
    for (std::size_t i = 0; i < m_adapters.size(); ++i) {
        if (!pending[i]) {
            continue;
        }
        ApplyResult result =
            std::visit([&](const auto& a) { return a.apply(desired, report.current); }, m_adapters[i]);
        for (const auto& failure : result.failures) {
            g_warning("%s: %s", failure.field.c_str(), failure.cause.c_str());
        }
        report.applied.insert(report.applied.end(), result.changes.begin(), result.changes.end());
        report.failures.insert(report.failures.end(), result.failures.begin(), result.failures.end());
    }

    report.state = report.failures.empty() ? RunState::Converged : RunState::PartiallyFailed;
    g_message("Reconcile %s: %zu change(s), %zu failure(s)", to_string(report.state).c_str(),
              report.applied.size(), report.failures.size());
    return report;
}

}  // namespace mpwrd
