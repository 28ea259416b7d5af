#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <chrono>
#include <string>
#include <vector>

namespace mpwrd {

struct CommandResult {
    int exit_status = 0;
    std::string output;
    std::string error_output;
    bool timed_out = false;

    bool ok() const { return !timed_out && exit_status == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] with the remaining arguments. Never goes through a shell.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
    virtual bool available(const std::string& program) const = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    explicit SystemCommandRunner(std::chrono::seconds timeout);

    CommandResult run(const std::vector<std::string>& argv) override;
    bool available(const std::string& program) const override;

private:
    std::chrono::seconds m_timeout;
    bool m_warned_no_timeout = false;
};

std::string describe_command(const std::vector<std::string>& argv);
std::string describe_failure(const std::vector<std::string>& argv, const CommandResult& result);

}  // namespace mpwrd

#endif
