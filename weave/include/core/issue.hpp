//! # Issues
//!
//! Recoverable problems found while building the graph: requests that do not
//! resolve, malformed requests, unknown transition names. Issues degrade the
//! result of one operation and never stop the build; they are collected by
//! the session and logged under their category.
//!
//! ## Issue Codes
//!
//! | Code | Category   | Meaning                         |
//! |------|------------|---------------------------------|
//! | R001 | resolve    | Request could not be resolved   |
//! | R002 | resolve    | Request is malformed            |
//! | R003 | resolve    | package.json unreadable/invalid |
//! | X001 | transition | Unknown transition name         |
//! | E001 | emit       | Read or write failed            |

#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace weave::core {

namespace IssueCodes {
constexpr const char* UNRESOLVED_REQUEST = "R001";
constexpr const char* MALFORMED_REQUEST = "R002";
constexpr const char* INVALID_PACKAGE_JSON = "R003";
constexpr const char* UNKNOWN_TRANSITION = "X001";
constexpr const char* WRITE_FAILED = "E001";
} // namespace IssueCodes

enum class IssueSeverity { Warning, Error };

struct Issue {
    IssueSeverity severity = IssueSeverity::Warning;
    std::string code;
    std::string category; ///< Also the log module tag
    std::string context;  ///< Path the issue was found in
    std::string message;

    /// `"warning[R001] src/app: unable to resolve './missing'"`
    [[nodiscard]] std::string to_string() const;
};

/// Thread-safe issue collector owned by the session.
class IssueReporter {
public:
    void report(Issue issue);

    [[nodiscard]] std::vector<Issue> issues() const;

    /// Issues with the given code.
    [[nodiscard]] std::vector<Issue> with_code(const std::string& code) const;

    [[nodiscard]] size_t count() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Issue> issues_;
};

} // namespace weave::core
