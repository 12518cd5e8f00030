#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <nlohmann/json.hpp>

#include "time_utils.h"

using namespace std;
using json = nlohmann::json;

struct UniversityPattern {
    string universityName;
    string baseUrl;
    vector<string> facultyDirectoryPaths;       // relative fragments or absolute URLs
    vector<string> departmentPaths;             // department keyword patterns
    vector<string> paginationPatterns;
    vector<string> facultyProfilePatterns;
    vector<string> subdomainPatterns;
    map<string, string> departmentSubdomains;   // department name -> subdomain base URL
    map<string, vector<string>> departments;    // department name -> department-specific paths
    double confidence = 0.0;
    string discoveryMethod;
    TimePoint lastUpdated;
    double successRate = 0.0;
};

enum class StructureType { List, Grid, Table, Cards, Unknown };

inline string structureTypeName(StructureType t) {
    switch (t) {
    case StructureType::List: return "list";
    case StructureType::Grid: return "grid";
    case StructureType::Table: return "table";
    case StructureType::Cards: return "cards";
    default: return "unknown";
    }
}

inline StructureType structureTypeFromName(const string& s) {
    if (s == "list") return StructureType::List;
    if (s == "grid") return StructureType::Grid;
    if (s == "table") return StructureType::Table;
    if (s == "cards") return StructureType::Cards;
    return StructureType::Unknown;
}

struct DepartmentInfo {
    string name;
    string url;
    size_t estimatedFacultyCount = 0;
    StructureType structureType = StructureType::Unknown;
    double confidence = 0.0;
    bool isSubdomain = false;
    string subdomainBaseUrl;
};

inline json toJson(const UniversityPattern& p) {
    json j;
    j["university_name"] = p.universityName;
    j["base_url"] = p.baseUrl;
    j["faculty_directory_paths"] = p.facultyDirectoryPaths;
    j["department_paths"] = p.departmentPaths;
    j["pagination_patterns"] = p.paginationPatterns;
    j["faculty_profile_patterns"] = p.facultyProfilePatterns;
    j["subdomain_patterns"] = p.subdomainPatterns;
    j["department_subdomains"] = p.departmentSubdomains;
    j["departments"] = p.departments;
    j["confidence"] = p.confidence;
    j["discovery_method"] = p.discoveryMethod;
    j["last_updated"] = formatTimestamp(p.lastUpdated);
    j["success_rate"] = p.successRate;
    return j;
}

// Throws json::exception on a structurally wrong document.
inline UniversityPattern patternFromJson(const json& j) {
    UniversityPattern p;
    p.universityName = j.at("university_name").get<string>();
    p.baseUrl = j.at("base_url").get<string>();
    p.facultyDirectoryPaths = j.value("faculty_directory_paths", vector<string>());
    p.departmentPaths = j.value("department_paths", vector<string>());
    p.paginationPatterns = j.value("pagination_patterns", vector<string>());
    p.facultyProfilePatterns = j.value("faculty_profile_patterns", vector<string>());
    p.subdomainPatterns = j.value("subdomain_patterns", vector<string>());
    p.departmentSubdomains = j.value("department_subdomains", map<string, string>());
    p.departments = j.value("departments", map<string, vector<string>>());
    p.confidence = j.value("confidence", 0.0);
    p.discoveryMethod = j.value("discovery_method", string());
    if (!parseTimestamp(j.value("last_updated", string()), p.lastUpdated)) {
        p.lastUpdated = TimePoint();
    }
    p.successRate = j.value("success_rate", 0.0);
    return p;
}

inline json toJson(const DepartmentInfo& d) {
    json j;
    j["name"] = d.name;
    j["url"] = d.url;
    j["faculty_count"] = d.estimatedFacultyCount;
    j["structure_type"] = structureTypeName(d.structureType);
    j["confidence"] = d.confidence;
    j["is_subdomain"] = d.isSubdomain;
    j["subdomain_url"] = d.subdomainBaseUrl;
    return j;
}
