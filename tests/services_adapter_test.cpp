#include "platform/services_adapter.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>

using namespace mpwrd;

int main() {
    {
        test::FakeCommandRunner runner;
        test::FakeSystemd systemd;
        systemd.install(runner);
        systemd.units["meshtasticd"] = ServiceState{false, false};
        systemd.units["avahi-daemon"] = ServiceState{true, true};
        ServicesAdapter adapter(runner);

        ConfigModel desired;
        desired.services["meshtasticd"] = ServiceState{true, true};
        desired.services["avahi-daemon"] = ServiceState{true, true};
        desired.services["getty@ttyS0.service"] = ServiceState{false, false};

        const ConfigModel current = adapter.read(desired);
        assert(current.services.size() == 3);
        assert(current.services.at("avahi-daemon") == (ServiceState{true, true}));
        // Unknown units read as disabled and inactive.
        assert(current.services.at("getty@ttyS0.service") == ServiceState{});

        const auto diffs = adapter.diff(desired, current);
        assert(diffs.size() == 1);
        assert(diffs[0].field == "services.meshtasticd");
        assert(diffs[0].current == "disabled, stopped");
        assert(diffs[0].desired == "enabled, running");

        const ApplyResult result = adapter.apply(desired, current);
        assert(result.failures.empty());
        assert(result.changes.size() == 1);
        assert(result.changes[0].description == "meshtasticd enabled, running");
        assert(runner.called({"systemctl", "enable", "meshtasticd"}));
        assert(runner.called({"systemctl", "start", "meshtasticd"}));
        assert(!runner.called({"systemctl", "enable", "avahi-daemon"}));

        assert(adapter.diff(desired, adapter.read(desired)).empty());
    }

    {
        // Only the steps that differ run.
        test::FakeCommandRunner runner;
        test::FakeSystemd systemd;
        systemd.install(runner);
        systemd.units["foo"] = ServiceState{true, false};
        ServicesAdapter adapter(runner);

        ConfigModel desired;
        desired.services["foo"] = ServiceState{true, true};
        const ApplyResult result = adapter.apply(desired, adapter.read(desired));
        assert(result.changes.size() == 1);
        assert(runner.called({"systemctl", "start", "foo"}));
        assert(!runner.called({"systemctl", "enable", "foo"}));
    }

    {
        test::FakeCommandRunner runner;
        test::FakeSystemd systemd;
        systemd.install(runner);
        systemd.failing.insert("enable broken");
        ServicesAdapter adapter(runner);

        ConfigModel desired;
        desired.services["broken"] = ServiceState{true, true};
        desired.services["fine"] = ServiceState{true, false};
        const ApplyResult result = adapter.apply(desired, ConfigModel{});
        assert(result.failures.size() == 1);
        assert(result.failures[0].field == "services.broken");
        assert(result.failures[0].cause == "'systemctl enable broken' exited with status 1: Failed to enable broken");
        // The start step is skipped once enable fails.
        assert(!runner.called({"systemctl", "start", "broken"}));
        assert(result.changes.size() == 1 && result.changes[0].field == "services.fine");
        assert(systemd.units["fine"].enabled);
    }

    {
        test::FakeCommandRunner runner;
        test::FakeSystemd systemd;
        systemd.install(runner);
        systemd.hanging.insert("is-active slow");
        ServicesAdapter adapter(runner);

        ConfigModel scope;
        scope.services["slow"] = ServiceState{};
        try {
            adapter.read(scope);
            assert(false);
        } catch (const ReadError& e) {
            assert(std::string(e.what()) == "'systemctl is-active slow' timed out");
        }
    }

    {
        // A static unit exits 0 from is-enabled but has no enablement to change.
        test::FakeCommandRunner runner;
        test::FakeSystemd systemd;
        systemd.install(runner);
        systemd.static_units.insert("systemd-journald");
        systemd.units["systemd-journald"].running = true;
        ServicesAdapter adapter(runner);

        ConfigModel desired;
        desired.services["systemd-journald"] = ServiceState{false, true};
        const ConfigModel current = adapter.read(desired);
        assert(current.services.at("systemd-journald") == (ServiceState{false, true}));
        assert(adapter.diff(desired, current).empty());
        const ApplyResult result = adapter.apply(desired, current);
        assert(result.changes.empty() && result.failures.empty());
        assert(runner.count("systemctl") == 2);

        desired.services["systemd-journald"] = ServiceState{true, true};
        assert(adapter.diff(desired, adapter.read(desired)).empty());
        assert(!runner.called({"systemctl", "enable", "systemd-journald"}));
    }

    {
        // "enabled" on stdout decides, not the exit status alone.
        test::FakeCommandRunner runner;
        runner.handlers["systemctl"] = [](const std::vector<std::string>& argv) {
            if (argv[1] == "is-enabled") {
                return test::exit_with(0, argv[2] == "rt" ? "enabled-runtime\n" : "indirect\n");
            }
            return test::exit_with(3, "inactive\n");
        };
        ServicesAdapter adapter(runner);

        ConfigModel scope;
        scope.services["rt"] = ServiceState{false, false};
        scope.services["socket-activated"] = ServiceState{false, false};
        const ConfigModel current = adapter.read(scope);
        assert(current.services.at("rt").enabled);
        assert(!current.services.at("socket-activated").enabled);
    }

    {
        test::FakeCommandRunner runner;
        ServicesAdapter adapter(runner);
        ConfigModel partial;
        partial.services["x"] = ServiceState{true, true};
        ConfigModel into;
        into.networking.hostname = "kept";
        adapter.merge(partial, into);
        assert(into.services == partial.services);
        assert(into.networking.hostname == "kept");
    }

    return 0;
}
