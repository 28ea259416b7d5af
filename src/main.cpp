#include "core/errors.hpp"
#include "core/settings.hpp"
#include "core/store.hpp"
#include "features/config_service.hpp"
#include "features/watchclock.hpp"
#include "platform/command_runner.hpp"

#include <glib.h>
#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>
#include <iostream>
#include <string>

namespace {
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr const char* kCommands =
    "Commands:\n"
    "  init        Write a default configuration file (--force to overwrite)\n"
    "  show        Print the configuration as the store would write it\n"
    "  validate    Check the configuration without touching the system\n"
    "  status      Print the live system state (--diff for pending changes)\n"
    "  apply       Bring the system in line with the configuration (--dry-run)\n"
    "  watchclock  Restart meshtasticd after large wall clock jumps";

struct Options {
    std::string config;
    std::string sysroot;
    int timeout = 0;
    bool verbose = false;
    bool force = false;
    bool diff = false;
    bool dry_run = false;
    int threshold_seconds = 0;
    int interval_seconds = 0;
};

Glib::OptionEntry make_entry(const char* long_name, const char* description, const char* arg_description = nullptr) {
    Glib::OptionEntry entry;
    entry.set_long_name(long_name);
    entry.set_description(description);
    if (arg_description) {
        entry.set_arg_description(arg_description);
    }
    return entry;
}

void print_diff(const mpwrd::ReconcileReport& report) {
    if (report.diff.empty()) {
        std::cout << "System matches the configuration." << '\n';
        return;
    }
    for (const auto& diff : report.diff) {
        std::cout << diff.field << ": " << diff.current << " -> " << diff.desired << '\n';
    }
}

void print_read_errors(const std::vector<std::string>& read_errors) {
    for (const auto& error : read_errors) {
        std::cerr << "warning: could not read " << error << '\n';
    }
}

int cmd_init(mpwrd::ConfigService& service, const Options& options) {
    service.init(options.force);
    std::cout << "Wrote " << service.store().path().string() << '\n';
    return kExitOk;
}

int cmd_show(mpwrd::ConfigService& service) {
    std::cout << mpwrd::Store::serialize(service.load_model());
    return kExitOk;
}

int cmd_validate(mpwrd::ConfigService& service) {
    service.validate_model(service.load_model());
    std::cout << service.store().path().string() << ": valid" << '\n';
    return kExitOk;
}

int cmd_status(mpwrd::ConfigService& service, const Options& options) {
    if (options.diff) {
        mpwrd::ReconcileOptions reconcile_options;
        reconcile_options.dry_run = true;
        const auto report = service.reconcile(service.load_model(), reconcile_options);
        print_read_errors(report.read_errors);
        print_diff(report);
        return kExitOk;
    }

    std::vector<std::string> read_errors;
    const auto current = service.current_state(&read_errors);
    print_read_errors(read_errors);
    std::cout << mpwrd::Store::serialize(current);
    return kExitOk;
}

int cmd_apply(mpwrd::ConfigService& service, const Options& options) {
    mpwrd::ReconcileOptions reconcile_options;
    reconcile_options.dry_run = options.dry_run;
    const auto report = service.reconcile(service.load_model(), reconcile_options);
    print_read_errors(report.read_errors);

    if (options.dry_run) {
        print_diff(report);
        return kExitOk;
    }

    for (const auto& change : report.applied) {
        std::cout << change.field << ": " << change.description << '\n';
    }
    for (const auto& failure : report.failures) {
        std::cerr << "failed " << failure.field << ": " << failure.cause << '\n';
    }
    if (report.applied.empty() && report.failures.empty()) {
        std::cout << "Nothing to do." << '\n';
    }
    return report.failures.empty() ? kExitOk : kExitFailure;
}

int cmd_watchclock(const mpwrd::Settings& settings, mpwrd::CommandRunner& runner, const Options& options) {
    mpwrd::WatchclockOptions watch;
    if (options.threshold_seconds > 0) {
        watch.threshold_seconds = options.threshold_seconds;
    }
    if (options.interval_seconds > 0) {
        watch.interval_seconds = options.interval_seconds;
    }
    mpwrd::Watchclock watchclock(mpwrd::SystemPaths(settings.sysroot), runner, watch);
    return watchclock.run();
}
}  // namespace

int main(int argc, char* argv[]) {
    Glib::init();

    Options options;
    Glib::OptionContext context("COMMAND");
    Glib::OptionGroup group("mpwrd-config", "mpwrd-config options");

    auto config_entry = make_entry("config", "Canonical configuration file", "PATH");
    config_entry.set_short_name('c');
    group.add_entry_filename(config_entry, options.config);
    auto sysroot_entry = make_entry("sysroot", "Resolve system files below DIR", "DIR");
    group.add_entry_filename(sysroot_entry, options.sysroot);
    auto timeout_entry = make_entry("timeout", "Seconds before a system command is killed", "SECONDS");
    group.add_entry(timeout_entry, options.timeout);
    auto verbose_entry = make_entry("verbose", "Print debug messages");
    verbose_entry.set_short_name('v');
    group.add_entry(verbose_entry, options.verbose);
    auto force_entry = make_entry("force", "init: overwrite an existing file");
    group.add_entry(force_entry, options.force);
    auto diff_entry = make_entry("diff", "status: print pending changes");
    group.add_entry(diff_entry, options.diff);
    auto dry_run_entry = make_entry("dry-run", "apply: stop after computing the changes");
    group.add_entry(dry_run_entry, options.dry_run);
    auto threshold_entry = make_entry("threshold-seconds", "watchclock: clock jump that triggers a restart", "N");
    group.add_entry(threshold_entry, options.threshold_seconds);
    auto interval_entry = make_entry("interval-seconds", "watchclock: seconds between checks", "N");
    group.add_entry(interval_entry, options.interval_seconds);

    context.set_main_group(group);
    context.set_description(kCommands);

    try {
        context.parse(argc, argv);
    } catch (const Glib::Error& e) {
        std::cerr << e.what() << '\n';
        return kExitUsage;
    }

    if (argc != 2) {
        std::cerr << context.get_help();
        return kExitUsage;
    }
    const std::string command = argv[1];

    mpwrd::Settings settings = mpwrd::Settings::from_environment();
    if (!options.config.empty()) {
        settings.config_path = options.config;
    }
    if (!options.sysroot.empty()) {
        settings.sysroot = options.sysroot;
    }
    if (options.timeout > 0) {
        settings.command_timeout = std::chrono::seconds(options.timeout);
    }
    if (options.verbose) {
        g_setenv("G_MESSAGES_DEBUG", "all", TRUE);
    }

    mpwrd::SystemCommandRunner runner(settings.command_timeout);
    mpwrd::ConfigService service(settings, runner);

    try {
        if (command == "init") {
            return cmd_init(service, options);
        }
        if (command == "show") {
            return cmd_show(service);
        }
        if (command == "validate") {
            return cmd_validate(service);
        }
        if (command == "status") {
            return cmd_status(service, options);
        }
        if (command == "apply") {
            return cmd_apply(service, options);
        }
        if (command == "watchclock") {
            return cmd_watchclock(settings, runner, options);
        }
    } catch (const mpwrd::ValidationError& e) {
        std::cerr << e.what() << '\n';
        return kExitFailure;
    } catch (const mpwrd::ParseError& e) {
        std::cerr << settings.config_path.string() << ": " << e.what() << '\n';
        return kExitFailure;
    } catch (const mpwrd::FatalError& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return kExitUsage;
    } catch (const mpwrd::Error& e) {
        std::cerr << e.what() << '\n';
        return kExitFailure;
    }

    std::cerr << "unknown command '" << command << "'\n\n" << context.get_help();
    return kExitUsage;
}
