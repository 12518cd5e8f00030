#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

using namespace std;

// Collaborator seams. The pipeline runs without any of them.

struct LabPrediction {
    bool isLabName = false;
    double confidence = 0.0;
};

// Pure: same text, same answer, no side effects.
class LabClassifier {
public:
    virtual ~LabClassifier() = default;
    virtual LabPrediction predict(const string& text) const = 0;
};

struct LabSearchResult {
    string url;
    string title;
    string snippet;
    double confidence = 0.0;
};

// Returns an empty list when throttled; never blocks waiting for quota.
class LabSearch {
public:
    virtual ~LabSearch() = default;
    virtual vector<LabSearchResult> searchLabUrls(const string& facultyName, const string& labName,
                                                  const string& university, size_t maxResults) = 0;
};

struct DiscoveryAssistantResult {
    vector<string> facultyPaths;
    map<string, vector<string>> departmentPaths;
    double confidence = 0.0;
    string reasoning;
};

class DiscoveryAssistant {
public:
    virtual ~DiscoveryAssistant() = default;
    virtual optional<DiscoveryAssistantResult> discoverFacultyDirectories(const string& universityName,
                                                                         const string& baseUrl,
                                                                         const string& department) = 0;
};
