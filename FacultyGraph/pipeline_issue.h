#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

enum class ErrorKind {
    DiscoveryFailure,
    DepartmentNotFound,
    ExtractionFailure,
    ValidationRejected,
    EntityConflict,
    RateLimitExceeded
};

inline string errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DiscoveryFailure: return "discovery_failure";
    case ErrorKind::DepartmentNotFound: return "department_not_found";
    case ErrorKind::ExtractionFailure: return "extraction_failure";
    case ErrorKind::ValidationRejected: return "validation_rejected";
    case ErrorKind::EntityConflict: return "entity_conflict";
    case ErrorKind::RateLimitExceeded: return "rate_limit_exceeded";
    }
    return "unknown";
}

// One recorded, non-fatal problem. `context` names what it happened to (a URL, a person, a department).
struct PipelineIssue {
    ErrorKind kind = ErrorKind::ExtractionFailure;
    string context;
    string message;
};

inline json toJson(const PipelineIssue& issue) {
    json j;
    j["type"] = errorKindName(issue.kind);
    j["context"] = issue.context;
    j["message"] = issue.message;
    return j;
}

// Thrown only for genuine I/O failures such as an export file that cannot be written.
class FacultyGraphError : public runtime_error {
public:
    explicit FacultyGraphError(const string& what) : runtime_error(what) {}
};
