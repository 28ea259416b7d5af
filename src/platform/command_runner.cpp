#include "platform/command_runner.hpp"

#include "config_io.hpp"

#include <csignal>
#include <glib.h>
#include <glibmm/miscutils.h>
#include <glibmm/spawn.h>
#include <sys/wait.h>

namespace mpwrd {

namespace {
constexpr int kTimeoutExitStatus = 124;
constexpr int kKillAfterSeconds = 2;
}  // namespace

SystemCommandRunner::SystemCommandRunner(std::chrono::seconds timeout) : m_timeout(timeout) {}

bool SystemCommandRunner::available(const std::string& program) const {
    return !Glib::find_program_in_path(program).empty();
}

CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        result.exit_status = 127;
        result.error_output = "empty command";
        return result;
    }
    if (!available(argv.front())) {
        result.exit_status = 127;
        result.error_output = "command not found: " + argv.front();
        return result;
    }

    std::vector<std::string> command;
    if (available("timeout")) {
        command = {"timeout", "--kill-after=" + std::to_string(kKillAfterSeconds),
                   std::to_string(m_timeout.count())};
    } else if (!m_warned_no_timeout) {
        g_warning("timeout(1) not found, commands run without a time limit");
        m_warned_no_timeout = true;
    }
    command.insert(command.end(), argv.begin(), argv.end());

    g_debug("Running %s", describe_command(argv).c_str());

    int wait_status = 0;
    try {
        Glib::spawn_sync("", command, Glib::SpawnFlags::SEARCH_PATH, {}, &result.output, &result.error_output,
                         &wait_status);
    } catch (const Glib::Error& error) {
        result.exit_status = 126;
        result.error_output = error.what();
        return result;
    }

    if (WIFEXITED(wait_status)) {
        result.exit_status = WEXITSTATUS(wait_status);
        result.timed_out = result.exit_status == kTimeoutExitStatus && command.front() == "timeout";
    } else if (WIFSIGNALED(wait_status)) {
        result.exit_status = 128 + WTERMSIG(wait_status);
        result.timed_out = WTERMSIG(wait_status) == SIGKILL;
    }
    return result;
}

std::string describe_command(const std::vector<std::string>& argv) {
    std::string text;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        text += arg;
    }
    return text;
}

std::string describe_failure(const std::vector<std::string>& argv, const CommandResult& result) {
    if (result.timed_out) {
        return "'" + describe_command(argv) + "' timed out";
    }
    std::string detail = ConfigIO::trim(result.error_output);
    if (detail.empty()) {
        detail = ConfigIO::trim(result.output);
    }
    std::string message = "'" + describe_command(argv) + "' exited with status " + std::to_string(result.exit_status);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}  // namespace mpwrd
