#pragma once

#include <string>
#include <vector>
#include <atomic>
#include <mutex>
#include <optional>
#include <algorithm>
#include <exception>
#include <nlohmann/json.hpp>

#include "adaptive_extractor.h"
#include "config.h"
#include "department_resolver.h"
#include "faculty_record.h"
#include "log_utils.h"
#include "pattern_discovery.h"
#include "pipeline_issue.h"
#include "time_utils.h"
#include "university_pattern.h"
#include "worker_pool.h"

using namespace std;
using json = nlohmann::json;

// Shared flag a caller flips to stop a scrape between departments and pages.
class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_.load(); }

private:
    atomic<bool> cancelled_{ false };
};

struct DepartmentResult {
    string name;
    string url;
    bool success = false;
    size_t facultyCount = 0;
    size_t pagesVisited = 0;
    StructureType structureType = StructureType::Unknown;
    string selector;
    double confidence = 0.0;
    bool isSubdomain = false;
    string error;
};

inline json toJson(const DepartmentResult& d) {
    json j;
    j["department"] = d.name;
    j["url"] = d.url;
    j["success"] = d.success;
    j["faculty_count"] = d.facultyCount;
    j["pages_visited"] = d.pagesVisited;
    j["structure_type"] = structureTypeName(d.structureType);
    j["selector"] = d.selector;
    j["confidence"] = d.confidence;
    j["is_subdomain"] = d.isSubdomain;
    if (!d.error.empty()) j["error"] = d.error;
    return j;
}

struct ScrapeResult {
    string universityName;
    string baseUrl;
    vector<RawFacultyRecord> faculty;
    size_t departmentsProcessed = 0;
    vector<DepartmentResult> departmentResults;
    double discoveryConfidence = 0.0;
    string discoveryMethod;
    string scrapingStrategy = "adaptive";
    bool labDiscoveryEnabled = false;
    bool cancelled = false;
    TimePoint timestamp;
    vector<PipelineIssue> issues;
    bool success = false;
    string error;
};

inline json toJson(const ScrapeResult& r) {
    json j;
    j["university_name"] = r.universityName;
    j["base_url"] = r.baseUrl;
    j["faculty"] = json::array();
    for (const auto& f : r.faculty) j["faculty"].push_back(toJson(f));
    json meta;
    meta["total_faculty"] = r.faculty.size();
    meta["departments_processed"] = r.departmentsProcessed;
    meta["department_results"] = json::array();
    for (const auto& d : r.departmentResults) meta["department_results"].push_back(toJson(d));
    meta["discovery_confidence"] = r.discoveryConfidence;
    meta["discovery_method"] = r.discoveryMethod;
    meta["scraping_strategy"] = r.scrapingStrategy;
    meta["lab_discovery_enabled"] = r.labDiscoveryEnabled;
    meta["cancelled"] = r.cancelled;
    meta["timestamp"] = formatTimestamp(r.timestamp);
    meta["issues"] = json::array();
    for (const auto& i : r.issues) meta["issues"].push_back(toJson(i));
    j["metadata"] = meta;
    j["success"] = r.success;
    j["error"] = r.error.empty() ? json(nullptr) : json(r.error);
    return j;
}

// Discovery, department resolution and extraction for one university.
class FacultyScraper {
public:
    FacultyScraper(PatternDiscoveryEngine& discovery, DepartmentResolver& resolver, AdaptiveExtractor& extractor,
                   size_t workers = DEFAULT_WORKER_COUNT, bool labDiscoveryEnabled = true, ClockFn clock = systemClock())
        : discovery_(discovery), resolver_(resolver), extractor_(extractor),
          workers_(max<size_t>(1, workers)), labDiscoveryEnabled_(labDiscoveryEnabled), clock_(std::move(clock)) {}

    // Only a missing base URL makes the result unsuccessful. Department failures are reported
    // in metadata and reduce the counts.
    ScrapeResult scrapeUniversityFaculty(const string& universityName,
                                         const optional<string>& departmentFilter = nullopt,
                                         const optional<size_t>& maxFaculty = nullopt,
                                         const optional<string>& baseUrl = nullopt,
                                         const CancellationToken* token = nullptr) {
        ScrapeResult result;
        result.universityName = universityName;
        result.labDiscoveryEnabled = labDiscoveryEnabled_;
        result.timestamp = clock_();
        logInfo("Starting adaptive scrape for " + universityName +
                (departmentFilter ? " (department: " + *departmentFilter + ")" : string()));

        UniversityPattern pattern = discovery_.discover(universityName, baseUrl.value_or(string()));
        result.baseUrl = pattern.baseUrl;
        result.discoveryConfidence = pattern.confidence;
        result.discoveryMethod = pattern.discoveryMethod;
        bumpStat(universitiesProcessed_);
        if (pattern.baseUrl.empty()) {
            result.error = "Could not determine base URL for " + universityName;
            result.issues.push_back(PipelineIssue{ ErrorKind::DiscoveryFailure, universityName, result.error });
            logError(result.error);
            return result;
        }
        if (pattern.discoveryMethod == "fallback") {
            result.issues.push_back(PipelineIssue{ ErrorKind::DiscoveryFailure, pattern.baseUrl,
                "no strategy found a directory pattern, using generic paths" });
        }

        vector<DepartmentInfo> departments = resolver_.resolve(pattern, departmentFilter.value_or(string()));
        if (departmentFilter) {
            vector<DepartmentInfo> matching;
            for (const auto& d : departments) {
                if (departmentNameMatches(d.name, *departmentFilter)) matching.push_back(d);
            }
            departments = matching;
        }
        if (departments.empty()) {
            string context = departmentFilter.value_or(universityName);
            result.issues.push_back(PipelineIssue{ ErrorKind::DepartmentNotFound, context,
                "no department pages found, scraping the base URL as one department" });
            logWarn("Scraper", "no departments resolved for " + context + ", falling back to " + pattern.baseUrl);
            departments.push_back(pseudoDepartment(pattern, departmentFilter));
        }
        bumpStat(departmentsDiscovered_, departments.size());
        logInfo("Processing " + to_string(departments.size()) + " department(s) for " + universityName);

        // Departments run in bounded batches so the faculty cap and cancellation are honoured between them.
        for (size_t start = 0; start < departments.size(); start += workers_) {
            if (token && token->isCancelled()) {
                result.cancelled = true;
                break;
            }
            if (maxFaculty && result.faculty.size() >= *maxFaculty) break;
            size_t end = min(departments.size(), start + workers_);
            vector<DepartmentInfo> batch(departments.begin() + (ptrdiff_t)start, departments.begin() + (ptrdiff_t)end);
            optional<size_t> remaining;
            if (maxFaculty) remaining = *maxFaculty - result.faculty.size();

            vector<DepartmentRun> runs = parallelMap<DepartmentInfo, DepartmentRun>(batch, workers_,
                [&](const DepartmentInfo& d) { return runDepartment(d, universityName, remaining, token); });

            for (size_t i = 0; i < runs.size(); ++i) {
                DepartmentRun& run = runs[i];
                DepartmentResult dr = run.result;
                dr.name = batch[i].name;
                dr.url = batch[i].url;
                dr.confidence = batch[i].confidence;
                dr.isSubdomain = batch[i].isSubdomain;
                ++result.departmentsProcessed;
                for (auto& issue : run.extraction.issues) result.issues.push_back(issue);
                if (run.extraction.cancelled) result.cancelled = true;
                for (auto& record : run.extraction.records) {
                    if (maxFaculty && result.faculty.size() >= *maxFaculty) break;
                    if (!record.university) record.university = universityName;
                    if (!record.department) record.department = batch[i].name;
                    result.faculty.push_back(record);
                }
                result.departmentResults.push_back(dr);
            }
        }

        bumpStat(facultyExtracted_, result.faculty.size());
        result.success = true;
        logOk("Scraped " + to_string(result.faculty.size()) + " faculty from " +
              to_string(result.departmentsProcessed) + " department(s) at " + universityName);
        return result;
    }

    json stats() const {
        lock_guard<mutex> lock(statsMu_);
        json j;
        j["universities_processed"] = universitiesProcessed_;
        j["departments_discovered"] = departmentsDiscovered_;
        j["faculty_extracted"] = facultyExtracted_;
        j["adaptation_failures"] = adaptationFailures_;
        return j;
    }

private:
    struct DepartmentRun {
        DepartmentExtraction extraction;
        DepartmentResult result;
    };

    DepartmentRun runDepartment(const DepartmentInfo& department, const string& universityName,
                                const optional<size_t>& cap, const CancellationToken* token) {
        DepartmentRun run;
        if (token && token->isCancelled()) {
            run.extraction.cancelled = true;
            run.result.error = "cancelled";
            return run;
        }
        try {
            function<bool()> cancelled = [token]() { return token && token->isCancelled(); };
            run.extraction = extractor_.scrape(department, universityName, cap, cancelled);
            run.result.facultyCount = run.extraction.records.size();
            run.result.pagesVisited = run.extraction.pagesVisited;
            run.result.structureType = run.extraction.structureType;
            run.result.selector = run.extraction.selector;
            run.result.success = !run.extraction.records.empty() ||
                (run.extraction.pagesVisited > 0 && run.extraction.issues.empty());
            if (!run.result.success && !run.extraction.issues.empty()) run.result.error = run.extraction.issues.front().message;
        }
        catch (const std::exception& e) {
            logWarn("Scraper", "department " + department.name + " failed: " + e.what());
            run.extraction.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, department.url, e.what() });
            run.result.error = e.what();
        }
        if (!run.result.success) bumpStat(adaptationFailures_);
        return run;
    }

    static DepartmentInfo pseudoDepartment(const UniversityPattern& pattern, const optional<string>& filter) {
        DepartmentInfo d;
        d.name = filter.value_or("All Faculty");
        d.url = pattern.baseUrl;
        d.confidence = pattern.confidence;
        return d;
    }

    void bumpStat(size_t& counter, size_t by = 1) {
        lock_guard<mutex> lock(statsMu_);
        counter += by;
    }

    PatternDiscoveryEngine& discovery_;
    DepartmentResolver& resolver_;
    AdaptiveExtractor& extractor_;
    size_t workers_;
    bool labDiscoveryEnabled_;
    ClockFn clock_;
    mutable mutex statsMu_;
    size_t universitiesProcessed_ = 0;
    size_t departmentsDiscovered_ = 0;
    size_t facultyExtracted_ = 0;
    size_t adaptationFailures_ = 0;
};
