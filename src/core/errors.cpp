#include "core/errors.hpp"

#include <utility>

namespace mpwrd {

namespace {
std::string join_violations(const std::vector<std::string>& violations) {
    std::string message = "invalid configuration";
    for (const auto& violation : violations) {
        message += "\n  - " + violation;
    }
    return message;
}
}  // namespace

ValidationError::ValidationError(std::vector<std::string> violations)
    : Error(join_violations(violations)), m_violations(std::move(violations)) {}

ParseError::ParseError(const std::string& message, std::size_t line, std::size_t column)
    : Error("line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message),
      m_detail(message),
      m_line(line),
      m_column(column) {}

}  // namespace mpwrd
