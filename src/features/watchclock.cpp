#include "features/watchclock.hpp"

#include "config_io.hpp"
#include "core/errors.hpp"

#include <ctime>
#include <glib.h>
#include <glibmm/main.h>
#include <utility>

namespace mpwrd {

Watchclock::Watchclock(SystemPaths paths, CommandRunner& runner, WatchclockOptions options)
    : m_paths(std::move(paths)), m_runner(runner), m_options(std::move(options)) {}

bool Watchclock::tick(long long now) const {
    if (!m_runner.run({"systemctl", "is-active", "--quiet", m_options.unit}).ok()) {
        g_debug("%s is not active", m_options.unit.c_str());
        return false;
    }

    const auto path = m_paths.last_time();
    long long previous = now;
    if (const auto text = ConfigIO::read_text(path)) {
        try {
            previous = std::stoll(ConfigIO::trim(*text));
        } catch (const std::exception&) {
            g_warning("Ignoring unreadable timestamp in %s", path.c_str());
        }
    }

    // Any two long longs are at most 2^64 - 1 apart, which fits unsigned.
    const bool forward = now >= previous;
    const unsigned long long distance = forward
        ? static_cast<unsigned long long>(now) - static_cast<unsigned long long>(previous)
        : static_cast<unsigned long long>(previous) - static_cast<unsigned long long>(now);

    bool restarted = false;
    if (distance >= static_cast<unsigned long long>(m_options.threshold_seconds)) {
        g_message("Large time change detected (%s%llu seconds), restarting %s", forward ? "+" : "-", distance,
                  m_options.unit.c_str());
        const std::vector<std::string> argv{"systemctl", "restart", m_options.unit};
        const CommandResult result = m_runner.run(argv);
        if (result.ok()) {
            restarted = true;
        } else {
            g_warning("%s", describe_failure(argv, result).c_str());
        }
    }

    ConfigIO::write_atomic(path, std::to_string(now) + "\n");
    return restarted;
}

int Watchclock::run() const {
    auto loop = Glib::MainLoop::create();
    int status = 0;

    auto on_tick = [&]() {
        try {
            tick(static_cast<long long>(std::time(nullptr)));
            return true;
        } catch (const Error& e) {
            g_critical("watchclock stopped: %s", e.what());
            status = 1;
            loop->quit();
            return false;
        }
    };

    if (!on_tick()) {
        return status;
    }
    Glib::signal_timeout().connect_seconds(on_tick, static_cast<unsigned int>(m_options.interval_seconds));
    loop->run();
    return status;
}

}  // namespace mpwrd
