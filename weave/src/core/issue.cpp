#include "core/issue.hpp"

#include "log/log.hpp"

namespace weave::core {

std::string Issue::to_string() const {
    std::string s = severity == IssueSeverity::Error ? "error[" : "warning[";
    s += code;
    s += "] ";
    if (!context.empty()) {
        s += context;
        s += ": ";
    }
    s += message;
    return s;
}

void IssueReporter::report(Issue issue) {
    if (issue.severity == IssueSeverity::Error) {
        WEAVE_LOG_ERROR(issue.category, issue.to_string());
    } else {
        WEAVE_LOG_WARN(issue.category, issue.to_string());
    }

    std::lock_guard lock(mutex_);
    issues_.push_back(std::move(issue));
}

std::vector<Issue> IssueReporter::issues() const {
    std::lock_guard lock(mutex_);
    return issues_;
}

std::vector<Issue> IssueReporter::with_code(const std::string& code) const {
    std::lock_guard lock(mutex_);
    std::vector<Issue> matching;
    for (const auto& issue : issues_) {
        if (issue.code == code) {
            matching.push_back(issue);
        }
    }
    return matching;
}

size_t IssueReporter::count() const {
    std::lock_guard lock(mutex_);
    return issues_.size();
}

void IssueReporter::clear() {
    std::lock_guard lock(mutex_);
    issues_.clear();
}

} // namespace weave::core
