#include "features/reconciler.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>

using namespace mpwrd;

namespace {
struct Board {
    Board() {
        root.write("etc/hostname", "mpwrd\n");
        root.write("etc/wifi_state.txt", "down\n");
        systemd.install(runner);
        systemd.units["meshtasticd"] = ServiceState{false, false};
    }

    Reconciler reconciler() { return Reconciler(make_adapters(SystemPaths(root.path()), runner)); }

    test::TempDir root;
    test::FakeCommandRunner runner;
    test::FakeSystemd systemd;
};

ConfigModel radio_enabled() {
    ConfigModel desired;
    desired.services["meshtasticd"] = ServiceState{true, true};
    return desired;
}
}  // namespace

int main() {
    {
        Board board;
        const Reconciler reconciler = board.reconciler();

        const ReconcileReport first = reconciler.run(radio_enabled());
        assert(first.converged());
        assert(first.diff.size() == 1);
        assert(first.applied.size() == 1);
        assert(first.applied[0].field == "services.meshtasticd");
        assert(first.failures.empty() && first.read_errors.empty());
        assert(board.systemd.units["meshtasticd"] == (ServiceState{true, true}));

        const std::size_t calls = board.runner.calls.size();
        const ReconcileReport second = reconciler.run(radio_enabled());
        assert(second.converged());
        assert(second.diff.empty() && second.applied.empty());
        for (std::size_t i = calls; i < board.runner.calls.size(); ++i) {
            const auto& verb = board.runner.calls[i].at(1);
            assert(verb == "is-enabled" || verb == "is-active");
        }
    }

    {
        // An unset running follows enabled.
        Board board;
        ConfigModel desired;
        ServiceState wanted;
        wanted.enabled = true;
        desired.services["meshtasticd"] = wanted;

        const ReconcileReport report = board.reconciler().run(desired);
        assert(report.converged());
        assert(report.applied.size() == 1);
        assert(board.runner.called({"systemctl", "start", "meshtasticd"}));
        assert(board.systemd.units["meshtasticd"] == (ServiceState{true, true}));
        assert(board.reconciler().run(desired).applied.empty());
    }

    {
        Board board;
        board.runner.handlers["hostnamectl"] = [](const std::vector<std::string>&) {
            return test::exit_with(1, "Access denied");
        };
        ConfigModel desired = radio_enabled();
        desired.networking.hostname = "node1";

        const ReconcileReport report = board.reconciler().run(desired);
        assert(report.state == RunState::PartiallyFailed);
        assert(to_string(report.state) == "partially failed");
        assert(report.failures.size() == 1);
        assert(report.failures[0].field == "networking.hostname");
        // The failed field does not stop the services domain.
        assert(report.applied.size() == 1);
        assert(report.applied[0].field == "services.meshtasticd");
    }

    {
        Board board;
        ConfigModel desired = radio_enabled();
        desired.networking.hostname = "node1";
        ReconcileOptions options;
        options.dry_run = true;

        const ReconcileReport report = board.reconciler().run(desired, options);
        assert(report.state == RunState::Diffed);
        assert(report.diff.size() == 2);
        assert(report.diff[0].field == "networking.hostname");
        assert(report.diff[1].field == "services.meshtasticd");
        assert(report.applied.empty());
        assert(board.runner.count("hostnamectl") == 0);
        assert(board.systemd.units["meshtasticd"] == ServiceState{});
        assert(board.root.read("etc/hostname") == "mpwrd\n");
    }

    {
        Board board;
        board.systemd.units["meshtasticd"] = ServiceState{true, true};
        board.systemd.hanging.insert("is-enabled meshtasticd");

        const ReconcileReport report = board.reconciler().run(radio_enabled());
        assert(report.read_errors.size() == 1);
        assert(report.read_errors[0].rfind("services: ", 0) == 0);
        // Unreadable state counts as the default, so the unit is driven again.
        assert(report.diff.size() == 1);
        assert(report.converged());
        assert(board.runner.called({"systemctl", "enable", "meshtasticd"}));
    }

    {
        Board board;
        board.runner.handlers["hostnamectl"] = [](const std::vector<std::string>&) -> CommandResult {
            throw FatalError("disk full");
        };
        ConfigModel desired = radio_enabled();
        desired.networking.hostname = "node1";
        try {
            board.reconciler().run(desired);
            assert(false);
        } catch (const FatalError& e) {
            assert(std::string(e.what()) == "disk full");
        }
        assert(!board.runner.called({"systemctl", "enable", "meshtasticd"}));
        assert(board.systemd.units["meshtasticd"] == ServiceState{});
    }

    {
        Board board;
        ConfigModel desired = radio_enabled();
        desired.networking.hostname = "bad host";
        desired.networking.country_code = "x";
        try {
            board.reconciler().run(desired);
            assert(false);
        } catch (const ValidationError& e) {
            assert(e.violations().size() == 2);
        }
        assert(board.runner.calls.empty());
    }

    {
        Board board;
        board.root.write("sys/class/leds/work/trigger", "[none] activity\n");
        board.root.write("etc/luckfox.cfg", "I2C3_M1_STATUS=0\n");
        ConfigModel scope;
        scope.services["meshtasticd"] = ServiceState{};
        scope.hardware["work"] = LedConfig{};
        scope.hardware["i2c3"] = BusConfig{};

        std::vector<std::string> read_errors;
        const ConfigModel current = board.reconciler().current_state(scope, &read_errors);
        assert(read_errors.empty());
        assert(current.networking.hostname == "mpwrd");
        assert(current.services.at("meshtasticd") == ServiceState{});
        assert(std::get<LedConfig>(current.hardware.at("work")).mode == LedMode::Disable);
        assert(std::get<BusConfig>(current.hardware.at("i2c3")) == BusConfig{});
    }

    return 0;
}
