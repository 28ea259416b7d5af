#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpwrd {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by validate() with every violated invariant, never just the first.
class ValidationError : public Error {
public:
    explicit ValidationError(std::vector<std::string> violations);

    const std::vector<std::string>& violations() const { return m_violations; }

private:
    std::vector<std::string> m_violations;
};

class ParseError : public Error {
public:
    ParseError(const std::string& message, std::size_t line, std::size_t column);

    std::size_t line() const { return m_line; }
    std::size_t column() const { return m_column; }
    const std::string& detail() const { return m_detail; }

private:
    std::string m_detail;
    std::size_t m_line;
    std::size_t m_column;
};

class NotFoundError : public Error {
public:
    using Error::Error;
};

// An adapter could not inspect system state.
class ReadError : public Error {
public:
    using Error::Error;
};

// Aborts a whole run: lock acquisition, disk full, failed rename.
class FatalError : public Error {
public:
    using Error::Error;
};

// Field-scoped apply failure. Returned as data, never thrown.
struct ApplyError {
    std::string field;
    std::string cause;
};

}  // namespace mpwrd

#endif
