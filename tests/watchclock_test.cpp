#include "features/watchclock.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>

using namespace mpwrd;

int main() {
    const long long week = 7 * 24 * 60 * 60;

    {
        test::TempDir root;
        test::FakeCommandRunner runner;
        test::FakeSystemd systemd;
        systemd.install(runner);
        systemd.units["meshtasticd"] = ServiceState{true, true};
        Watchclock watchclock(SystemPaths(root.path()), runner);

        assert(!watchclock.tick(1000));
        assert(root.read("tmp/last_time") == "1000\n");
        assert(!watchclock.tick(1030));
        assert(systemd.restarts.empty());

        // First NTP sync on a board that booted in 1970.
        assert(watchclock.tick(1030 + week));
        assert(systemd.restarts.size() == 1 && systemd.restarts[0] == "meshtasticd");
        assert(root.read("tmp/last_time") == std::to_string(1030 + week) + "\n");

        // Backwards jumps count too.
        assert(watchclock.tick(1060));
        assert(systemd.restarts.size() == 2);
    }

    {
        test::TempDir root;
        root.write("tmp/last_time", "500\n");
        test::FakeCommandRunner runner;
        test::FakeSystemd systemd;
        systemd.install(runner);
        systemd.units["radio"] = ServiceState{true, false};

        WatchclockOptions options;
        options.threshold_seconds = 60;
        options.unit = "radio";
        Watchclock watchclock(SystemPaths(root.path()), runner, options);

        // An inactive unit is left alone and the last time is not touched.
        assert(!watchclock.tick(5000));
        assert(root.read("tmp/last_time") == "500\n");
        assert(runner.called({"systemctl", "is-active", "--quiet", "radio"}));

        systemd.units["radio"].running = true;
        systemd.failing.insert("restart radio");
        assert(!watchclock.tick(5000));
        assert(systemd.restarts.empty());
        assert(root.read("tmp/last_time") == "5000\n");

        assert(!watchclock.tick(5059));
        systemd.failing.clear();
        assert(watchclock.tick(5119));
    }

    {
        test::TempDir root;
        root.write("tmp/last_time", "not a number\n");
        test::FakeCommandRunner runner;
        Watchclock watchclock(SystemPaths(root.path()), runner);

        assert(!watchclock.tick(2000000000));
        assert(runner.count("systemctl") == 1);
        assert(root.read("tmp/last_time") == "2000000000\n");
    }

    {
        // Timestamps at the ends of the range still measure as a jump.
        for (const char* stored : {"-9223372036854775808\n", "9223372036854775807\n"}) {
            test::TempDir root;
            root.write("tmp/last_time", stored);
            test::FakeCommandRunner runner;
            test::FakeSystemd systemd;
            systemd.install(runner);
            systemd.units["meshtasticd"] = ServiceState{true, true};
            Watchclock watchclock(SystemPaths(root.path()), runner);

            assert(watchclock.tick(1000));
            assert(systemd.restarts.size() == 1);
            assert(root.read("tmp/last_time") == "1000\n");
        }
    }

    return 0;
}
