#ifndef ADAPTER_TYPES_HPP
#define ADAPTER_TYPES_HPP

#include "core/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mpwrd {

struct AppliedChange {
    std::string field;
    std::string description;
};

// One field whose live value differs from the desired one.
struct FieldDiff {
    std::string field;
    std::string current;
    std::string desired;
};

struct ApplyResult {
    std::vector<AppliedChange> changes;
    std::vector<ApplyError> failures;

    void changed(std::string field, std::string description) {
        changes.push_back(AppliedChange{std::move(field), std::move(description)});
    }
    void failed(std::string field, std::string cause) {
        failures.push_back(ApplyError{std::move(field), std::move(cause)});
    }
};

}  // namespace mpwrd

#endif
