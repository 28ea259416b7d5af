#ifndef WATCHCLOCK_HPP
#define WATCHCLOCK_HPP

#include "core/settings.hpp"
#include "platform/command_runner.hpp"

#include <string>

namespace mpwrd {

struct WatchclockOptions {
    long long threshold_seconds = 7 * 24 * 60 * 60;
    long long interval_seconds = 30;
    std::string unit = "meshtasticd";
};

// Restarts the radio daemon when the wall clock jumps, e.g. after the first
// NTP sync on a board without an RTC.
class Watchclock {
public:
    Watchclock(SystemPaths paths, CommandRunner& runner, WatchclockOptions options = {});

    // One pass at time `now` (seconds since the epoch). Returns true when the
    // unit was restarted. Throws FatalError if the last time cannot be recorded.
    bool tick(long long now) const;

    // Ticks every interval until a tick fails. Returns the process exit status.
    int run() const;

private:
    SystemPaths m_paths;
    CommandRunner& m_runner;
    WatchclockOptions m_options;
};

}  // namespace mpwrd

#endif
