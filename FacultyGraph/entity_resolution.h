#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <random>
#include <optional>
#include <algorithm>
#include <fstream>
#include <filesystem>
#include <exception>
#include <nlohmann/json.hpp>

#include "config.h"
#include "entities.h"
#include "entity_store.h"
#include "faculty_record.h"
#include "log_utils.h"
#include "name_utils.h"
#include "pipeline_issue.h"
#include "string_utils.h"
#include "time_utils.h"
#include "url_utils.h"

using namespace std;
using json = nlohmann::json;

static const double DEFAULT_FACULTY_CONFIDENCE = 0.8;
static const double DEPARTMENT_ASSOCIATION_CONFIDENCE = 0.9;
static const double LAB_ENTITY_CONFIDENCE = 0.7;
static const double LAB_ASSOCIATION_CONFIDENCE = 0.7;
static const double LAB_DEPARTMENT_CONFIDENCE = 0.8;
static const double ENRICHMENT_ASSOCIATION_CONFIDENCE = 0.8;
static const double ENRICHMENT_QUALITY = 0.7;
static const double ENRICHMENT_COMPLETENESS = 0.6;
static const string PRINCIPAL_INVESTIGATOR_ROLE = "Principal Investigator";

struct IngestReport {
    size_t processed = 0;
    size_t created = 0;
    size_t merged = 0;
    size_t labsCreated = 0;
    size_t universitiesCreated = 0;
    size_t departmentsCreated = 0;
    size_t associationsCreated = 0;
    size_t enrichmentsCreated = 0;
    size_t conflicts = 0;
    size_t rejected = 0;
    vector<PipelineIssue> issues;
};

inline json toJson(const IngestReport& r) {
    json j;
    j["faculty_processed"] = r.processed;
    j["faculty_created"] = r.created;
    j["faculty_merged"] = r.merged;
    j["labs_created"] = r.labsCreated;
    j["universities_created"] = r.universitiesCreated;
    j["departments_created"] = r.departmentsCreated;
    j["associations_created"] = r.associationsCreated;
    j["enrichments_created"] = r.enrichmentsCreated;
    j["conflicts_detected"] = r.conflicts;
    j["records_rejected"] = r.rejected;
    j["issues"] = json::array();
    for (const auto& i : r.issues) j["issues"].push_back(toJson(i));
    return j;
}

struct FacultyAggregatedView {
    FacultyEntity faculty;
    optional<UniversityEntity> university;
    optional<DepartmentEntity> primaryDepartment;
    vector<pair<FacultyDepartmentAssociation, optional<DepartmentEntity>>> departmentAssociations;
    vector<pair<FacultyLabAssociation, optional<LabEntity>>> labAssociations;
    map<string, vector<json>> enrichments;
    size_t totalEnrichments = 0;
    vector<string> dataSources;
    double dataFreshnessScore = 0.0;
    double completenessScore = 0.0;
    double confidenceScore = 0.0;
};

struct LabAggregatedView {
    LabEntity lab;
    optional<UniversityEntity> university;
    optional<DepartmentEntity> primaryDepartment;
    vector<pair<LabDepartmentAssociation, optional<DepartmentEntity>>> departmentAssociations;
    vector<pair<FacultyLabAssociation, FacultyEntity>> facultyAssociations;
    size_t memberCount = 0;
    size_t piCount = 0;
    vector<string> dataSources;
    double completenessScore = 0.0;
    double confidenceScore = 0.0;
};

struct DataRelationshipMap {
    size_t totalFaculty = 0;
    size_t totalLabs = 0;
    size_t totalUniversities = 0;
    size_t totalDepartments = 0;
    size_t facultyLabAssociations = 0;
    size_t facultyDepartmentAssociations = 0;
    size_t labDepartmentAssociations = 0;
    map<string, size_t> totalEnrichments;
    double averageConfidenceScore = 0.0;
    double dataCompleteness = 0.0;
    vector<string> orphanedFaculty;
    vector<string> orphanedLabs;
    vector<string> orphanedEnrichments;
    map<string, vector<string>> potentialDuplicates;
    vector<string> dataIssues;
};

template <typename T>
json optionalEntityJson(const optional<T>& v) {
    return v ? toJson(*v) : json(nullptr);
}

inline json toJson(const FacultyAggregatedView& v) {
    json j;
    j["faculty"] = toJson(v.faculty);
    j["university"] = optionalEntityJson(v.university);
    j["primary_department"] = optionalEntityJson(v.primaryDepartment);
    j["department_associations"] = json::array();
    for (const auto& p : v.departmentAssociations) {
        j["department_associations"].push_back({ { "association", toJson(p.first) }, { "department", optionalEntityJson(p.second) } });
    }
    j["lab_associations"] = json::array();
    for (const auto& p : v.labAssociations) {
        j["lab_associations"].push_back({ { "association", toJson(p.first) }, { "lab", optionalEntityJson(p.second) } });
    }
    j["enrichments"] = json::object();
    for (const auto& kv : v.enrichments) j["enrichments"][kv.first] = kv.second;
    j["computed_metrics"] = {
        { "total_enrichments", v.totalEnrichments },
        { "lab_count", v.labAssociations.size() },
        { "department_count", v.departmentAssociations.size() }
    };
    j["data_sources"] = v.dataSources;
    j["data_freshness_score"] = v.dataFreshnessScore;
    j["completeness_score"] = v.completenessScore;
    j["confidence_score"] = v.confidenceScore;
    return j;
}

inline json toJson(const LabAggregatedView& v) {
    json j;
    j["lab"] = toJson(v.lab);
    j["university"] = optionalEntityJson(v.university);
    j["primary_department"] = optionalEntityJson(v.primaryDepartment);
    j["department_associations"] = json::array();
    for (const auto& p : v.departmentAssociations) {
        j["department_associations"].push_back({ { "association", toJson(p.first) }, { "department", optionalEntityJson(p.second) } });
    }
    j["faculty_associations"] = json::array();
    for (const auto& p : v.facultyAssociations) {
        j["faculty_associations"].push_back({ { "association", toJson(p.first) }, { "faculty", toJson(p.second) } });
    }
    j["computed_metrics"] = {
        { "member_count", v.memberCount },
        { "pi_count", v.piCount },
        { "is_multi_pi", v.piCount > 1 }
    };
    j["data_sources"] = v.dataSources;
    j["completeness_score"] = v.completenessScore;
    j["confidence_score"] = v.confidenceScore;
    return j;
}

inline json toJson(const DataRelationshipMap& m) {
    json j;
    j["total_faculty"] = m.totalFaculty;
    j["total_labs"] = m.totalLabs;
    j["total_universities"] = m.totalUniversities;
    j["total_departments"] = m.totalDepartments;
    j["faculty_lab_associations"] = m.facultyLabAssociations;
    j["faculty_department_associations"] = m.facultyDepartmentAssociations;
    j["lab_department_associations"] = m.labDepartmentAssociations;
    j["total_enrichments"] = m.totalEnrichments;
    j["average_confidence_score"] = m.averageConfidenceScore;
    j["data_completeness"] = m.dataCompleteness;
    j["orphaned_faculty"] = m.orphanedFaculty;
    j["orphaned_labs"] = m.orphanedLabs;
    j["orphaned_enrichments"] = m.orphanedEnrichments;
    j["potential_duplicates"] = m.potentialDuplicates;
    j["data_issues"] = m.dataIssues;
    return j;
}

// "Carnegie Mellon University" -> "carnegie_mellon"
inline string institutionKey(const string& name) {
    return replaceAllStr(normalizeInstitutionName(name), " ", "_");
}

// Association state machine. Disputes are reached from anywhere but only left through resolveDispute.
inline bool isAllowedAssociationTransition(AssociationStatus from, AssociationStatus to) {
    if (from == to) return false;
    switch (to) {
    case AssociationStatus::Disputed:
        return true;
    case AssociationStatus::Verified:
        return from == AssociationStatus::PendingVerification;
    case AssociationStatus::Inactive:
        return from == AssociationStatus::PendingVerification || from == AssociationStatus::Active ||
            from == AssociationStatus::Verified;
    default:
        return false;
    }
}

// Deduplicates raw faculty records into an ID-linked entity graph and serves aggregated views.
// All public calls are serialised on one mutex, so concurrent ingests cannot race on a dedup key.
class EntityResolutionStore {
public:
    explicit EntityResolutionStore(EntityRepository& repo, ClockFn clock = systemClock())
        : repo_(repo), clock_(std::move(clock)), rng_(random_device{}()) {}

    IngestReport ingest(const vector<RawFacultyRecord>& records, const string& scrapeSessionId) {
        lock_guard<mutex> lock(mu_);
        IngestReport report;
        ScrapeSession session;
        session.id = scrapeSessionId;
        session.sourceType = "adaptive_scrape";
        for (const auto& record : records) {
            try {
                optional<string> facultyId = processRecord(record, scrapeSessionId, report, session);
                if (!facultyId) continue;
                if (find(session.facultyIds.begin(), session.facultyIds.end(), *facultyId) == session.facultyIds.end()) {
                    session.facultyIds.push_back(*facultyId);
                }
                ++report.processed;
            }
            catch (const std::exception& e) {
                logWarn("EntityStore", "failed to ingest " + record.name + ": " + e.what());
                report.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, record.name, e.what() });
            }
        }
        session.processedAt = clock_();
        session.report = toJson(report);
        repo_.putScrapeSession(session);
        logOk("Ingested " + to_string(report.processed) + " records (" + to_string(report.created) + " new, " +
              to_string(report.merged) + " merged, " + to_string(report.conflicts) + " conflicts)");
        return report;
    }

    // ---- lookups ----

    optional<FacultyEntity> getFaculty(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return repo_.getFaculty(id);
    }

    optional<LabEntity> getLab(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return repo_.getLab(id);
    }

    optional<UniversityEntity> getUniversity(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return repo_.getUniversity(id);
    }

    optional<DepartmentEntity> getDepartment(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return repo_.getDepartment(id);
    }

    // Live (not merged away) faculty whose normalized name matches.
    vector<FacultyEntity> findFacultyByName(const string& name) const {
        lock_guard<mutex> lock(mu_);
        vector<FacultyEntity> out;
        for (const auto& id : repo_.facultyIdsByNormalizedName(normalizeName(name))) {
            optional<FacultyEntity> f = repo_.getFaculty(id);
            if (f && f->status != EntityStatus::Merged) out.push_back(*f);
        }
        return out;
    }

    size_t facultyCount() const {
        lock_guard<mutex> lock(mu_);
        return repo_.allFacultyIds().size();
    }

    size_t labCount() const {
        lock_guard<mutex> lock(mu_);
        return repo_.allLabIds().size();
    }

    vector<string> facultyIds() const {
        lock_guard<mutex> lock(mu_);
        return repo_.allFacultyIds();
    }

    vector<string> labIds() const {
        lock_guard<mutex> lock(mu_);
        return repo_.allLabIds();
    }

    vector<FacultyDepartmentAssociation> departmentAssociationsOf(const string& facultyId) const {
        lock_guard<mutex> lock(mu_);
        return departmentAssociationsFor(facultyId);
    }

    vector<FacultyLabAssociation> labAssociationsOf(const string& facultyId) const {
        lock_guard<mutex> lock(mu_);
        return labAssociationsFor(facultyId);
    }

    optional<FacultyLabAssociation> getFacultyLabAssociation(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return repo_.getFacultyLabAssociation(id);
    }

    optional<FacultyDepartmentAssociation> getFacultyDepartmentAssociation(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return repo_.getFacultyDepartmentAssociation(id);
    }

    optional<ScrapeSession> getScrapeSession(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return repo_.getScrapeSession(id);
    }

    optional<EnrichmentMeta> getEnrichmentMeta(const string& id) const {
        lock_guard<mutex> lock(mu_);
        return enrichmentMeta(id);
    }

    // ---- entity merge ----

    // Folds duplicate into canonical. The duplicate stays retrievable with status merged.
    bool mergeFacultyEntities(const string& canonicalId, const string& duplicateId) {
        lock_guard<mutex> lock(mu_);
        if (canonicalId == duplicateId) return false;
        optional<FacultyEntity> canonical = repo_.getFaculty(canonicalId);
        optional<FacultyEntity> duplicate = repo_.getFaculty(duplicateId);
        if (!canonical || !duplicate) return false;
        if (canonical->status == EntityStatus::Merged || duplicate->status == EntityStatus::Merged) return false;

        fillBlank(canonical->email, duplicate->email);
        fillBlank(canonical->phone, duplicate->phone);
        fillBlank(canonical->officeLocation, duplicate->officeLocation);
        fillBlank(canonical->profileUrl, duplicate->profileUrl);
        fillBlank(canonical->personalWebsite, duplicate->personalWebsite);
        keepLongerTitle(canonical->title, duplicate->title);
        canonical->confidenceScore = (canonical->confidenceScore + duplicate->confidenceScore) / 2.0;
        canonical->mergedFrom.push_back(duplicate->id);
        for (const auto& id : duplicate->mergedFrom) canonical->mergedFrom.push_back(id);
        canonical->updatedAt = clock_();

        duplicate->status = EntityStatus::Merged;
        duplicate->duplicateOf = canonical->id;
        duplicate->updatedAt = clock_();

        TimePoint now = clock_();
        set<string> canonicalDepartments;
        for (const auto& a : departmentAssociationsFor(canonicalId)) canonicalDepartments.insert(a.departmentId);
        for (auto a : departmentAssociationsFor(duplicateId)) {
            a.facultyId = canonicalId;
            if (canonicalDepartments.count(a.departmentId)) {
                a.status = AssociationStatus::Inactive;
                a.isCurrent = false;
                a.endDate = now;
            }
            a.updatedAt = now;
            repo_.putFacultyDepartmentAssociation(a);
        }
        set<string> canonicalLabs;
        for (const auto& a : labAssociationsFor(canonicalId)) canonicalLabs.insert(a.labId);
        for (auto a : labAssociationsFor(duplicateId)) {
            a.facultyId = canonicalId;
            if (canonicalLabs.count(a.labId)) {
                a.status = AssociationStatus::Inactive;
                a.isCurrent = false;
                a.endDate = now;
            }
            a.updatedAt = now;
            repo_.putFacultyLabAssociation(a);
        }
        for (auto a : repo_.facultyEnrichmentAssociations()) {
            if (a.facultyId != duplicateId) continue;
            a.facultyId = canonicalId;
            repo_.putFacultyEnrichmentAssociation(a);
        }
        repo_.putFaculty(*canonical);
        repo_.putFaculty(*duplicate);
        logInfo("Merged faculty " + duplicateId + " into " + canonicalId);
        return true;
    }

    // ---- association lifecycle ----

    // Ends the relationship but keeps the row: inactive, not current, end date set.
    bool breakFacultyLabAssociation(const string& associationId) {
        lock_guard<mutex> lock(mu_);
        optional<FacultyLabAssociation> a = repo_.getFacultyLabAssociation(associationId);
        if (!a || a->status == AssociationStatus::Inactive) return false;
        TimePoint now = clock_();
        a->status = AssociationStatus::Inactive;
        a->isCurrent = false;
        a->endDate = now;
        a->updatedAt = now;
        repo_.putFacultyLabAssociation(*a);
        dequeueDispute(associationId);
        return true;
    }

    // Deletes the association row. Neither endpoint entity is touched.
    bool removeFacultyLabAssociation(const string& associationId) {
        lock_guard<mutex> lock(mu_);
        if (!repo_.eraseFacultyLabAssociation(associationId)) return false;
        dequeueDispute(associationId);
        return true;
    }

    bool verifyAssociation(const string& associationId, const string& verifiedBy) {
        lock_guard<mutex> lock(mu_);
        TimePoint now = clock_();
        return updateAssociation(associationId, [&](auto& a) {
            if (!isAllowedAssociationTransition(a.status, AssociationStatus::Verified)) return false;
            a.status = AssociationStatus::Verified;
            a.verifiedBy = verifiedBy;
            a.updatedAt = now;
            return true;
        });
    }

    bool deactivateAssociation(const string& associationId) {
        lock_guard<mutex> lock(mu_);
        TimePoint now = clock_();
        return updateAssociation(associationId, [&](auto& a) {
            if (!isAllowedAssociationTransition(a.status, AssociationStatus::Inactive)) return false;
            a.status = AssociationStatus::Inactive;
            a.isCurrent = false;
            a.endDate = now;
            a.updatedAt = now;
            return true;
        });
    }

    // Marks an association disputed and queues it for review. `conflictingId` is recorded when known.
    bool disputeAssociation(const string& associationId, const string& conflictingId = string()) {
        lock_guard<mutex> lock(mu_);
        return markDisputed(associationId, conflictingId);
    }

    // Explicit review decision for a disputed association: verified, active or inactive.
    bool resolveDispute(const string& associationId, AssociationStatus outcome, const string& resolvedBy) {
        lock_guard<mutex> lock(mu_);
        if (outcome != AssociationStatus::Verified && outcome != AssociationStatus::Active && outcome != AssociationStatus::Inactive) {
            return false;
        }
        TimePoint now = clock_();
        bool ok = updateAssociation(associationId, [&](auto& a) {
            if (a.status != AssociationStatus::Disputed) return false;
            a.status = outcome;
            a.verifiedBy = resolvedBy;
            a.updatedAt = now;
            if (outcome == AssociationStatus::Inactive) {
                a.isCurrent = false;
                a.endDate = now;
            }
            return true;
        });
        if (ok) dequeueDispute(associationId);
        return ok;
    }

    // Disputed associations in the order they were flagged.
    vector<string> disputeQueue() const {
        lock_guard<mutex> lock(mu_);
        return repo_.disputeIds();
    }

    // ---- enrichment lifecycle ----

    bool markEnrichmentStale(const string& enrichmentId) {
        lock_guard<mutex> lock(mu_);
        return updateEnrichmentMeta(enrichmentId, [](EnrichmentMeta& m) {
            if (m.status != EnrichmentStatus::Fresh) return false;
            m.status = EnrichmentStatus::Stale;
            return true;
        });
    }

    // Ages every fresh enrichment older than maxAge to stale. Returns how many changed.
    size_t markStaleEnrichments(chrono::hours maxAge) {
        lock_guard<mutex> lock(mu_);
        TimePoint now = clock_();
        size_t changed = 0;
        for (const auto& type : ENRICHMENT_TYPES) {
            for (const auto& id : repo_.enrichmentIds(type)) {
                bool updated = updateEnrichmentMeta(id, [&](EnrichmentMeta& m) {
                    if (m.status != EnrichmentStatus::Fresh || now - m.extractedAt <= maxAge) return false;
                    m.status = EnrichmentStatus::Stale;
                    return true;
                });
                if (updated) ++changed;
            }
        }
        if (changed) logInfo("Marked " + to_string(changed) + " enrichments stale");
        return changed;
    }

    bool beginReextraction(const string& enrichmentId) {
        lock_guard<mutex> lock(mu_);
        return updateEnrichmentMeta(enrichmentId, [](EnrichmentMeta& m) {
            if (m.status != EnrichmentStatus::Stale && m.status != EnrichmentStatus::Failed) return false;
            m.status = EnrichmentStatus::Processing;
            return true;
        });
    }

    bool recordReextraction(const string& enrichmentId) {
        lock_guard<mutex> lock(mu_);
        TimePoint now = clock_();
        return updateEnrichmentMeta(enrichmentId, [&](EnrichmentMeta& m) {
            return applyReextraction(m, now);
        });
    }

    bool markEnrichmentFailed(const string& enrichmentId, const string& error) {
        lock_guard<mutex> lock(mu_);
        return updateEnrichmentMeta(enrichmentId, [&](EnrichmentMeta& m) {
            m.status = EnrichmentStatus::Failed;
            if (!error.empty()) m.extractionErrors.push_back(error);
            return true;
        });
    }

    bool markEnrichmentValidated(const string& enrichmentId) {
        lock_guard<mutex> lock(mu_);
        return updateEnrichmentMeta(enrichmentId, [](EnrichmentMeta& m) {
            if (m.status == EnrichmentStatus::Validated) return false;
            m.status = EnrichmentStatus::Validated;
            return true;
        });
    }

    // ---- aggregated views ----

    optional<FacultyAggregatedView> getFacultyAggregatedView(const string& facultyId) const {
        lock_guard<mutex> lock(mu_);
        return buildFacultyView(facultyId);
    }

    optional<LabAggregatedView> getLabAggregatedView(const string& labId) const {
        lock_guard<mutex> lock(mu_);
        return buildLabView(labId);
    }

    DataRelationshipMap generateRelationshipMap() const {
        lock_guard<mutex> lock(mu_);
        DataRelationshipMap m;
        vector<string> facultyIds = repo_.allFacultyIds();
        vector<string> labIds = repo_.allLabIds();
        vector<FacultyLabAssociation> labAssocs = repo_.facultyLabAssociations();
        vector<FacultyDepartmentAssociation> deptAssocs = repo_.facultyDepartmentAssociations();
        vector<FacultyEnrichmentAssociation> enrichmentAssocs = repo_.facultyEnrichmentAssociations();

        m.totalFaculty = facultyIds.size();
        m.totalLabs = labIds.size();
        m.totalUniversities = repo_.universityCount();
        m.totalDepartments = repo_.departmentCount();
        m.facultyLabAssociations = labAssocs.size();
        m.facultyDepartmentAssociations = deptAssocs.size();
        m.labDepartmentAssociations = repo_.labDepartmentAssociations().size();

        size_t enrichmentTotal = 0;
        set<string> linkedEnrichments;
        for (const auto& a : enrichmentAssocs) linkedEnrichments.insert(a.enrichmentId);
        for (const auto& type : ENRICHMENT_TYPES) {
            vector<string> ids = repo_.enrichmentIds(type);
            m.totalEnrichments[type] = ids.size();
            enrichmentTotal += ids.size();
            for (const auto& id : ids) {
                if (!linkedEnrichments.count(id)) m.orphanedEnrichments.push_back(id);
            }
        }

        double confidenceSum = 0.0;
        size_t confidenceCount = 0;
        set<string> associatedFaculty;
        set<string> associatedLabs;
        for (const auto& a : deptAssocs) associatedFaculty.insert(a.facultyId);
        for (const auto& a : labAssocs) {
            associatedFaculty.insert(a.facultyId);
            associatedLabs.insert(a.labId);
        }
        map<string, vector<string>> byName;
        for (const auto& id : facultyIds) {
            optional<FacultyEntity> f = repo_.getFaculty(id);
            if (!f) continue;
            confidenceSum += f->confidenceScore;
            ++confidenceCount;
            if (!associatedFaculty.count(id)) m.orphanedFaculty.push_back(id);
            if (f->status != EntityStatus::Merged) byName[f->normalizedName].push_back(id);
        }
        for (const auto& id : labIds) {
            optional<LabEntity> l = repo_.getLab(id);
            if (!l) continue;
            confidenceSum += l->confidenceScore;
            ++confidenceCount;
            if (!associatedLabs.count(id)) m.orphanedLabs.push_back(id);
        }
        for (auto& kv : byName) {
            if (kv.second.size() > 1) m.potentialDuplicates[kv.first] = kv.second;
        }
        m.averageConfidenceScore = confidenceCount ? confidenceSum / (double)confidenceCount : 0.0;
        m.dataCompleteness = m.totalFaculty ? min(1.0, (double)enrichmentTotal / (3.0 * (double)m.totalFaculty)) : 0.0;

        size_t disputed = repo_.disputeIds().size();
        if (disputed) m.dataIssues.push_back(to_string(disputed) + " disputed associations awaiting review");
        if (!m.potentialDuplicates.empty()) m.dataIssues.push_back(to_string(m.potentialDuplicates.size()) + " names shared by more than one faculty entity");
        if (!m.orphanedFaculty.empty()) m.dataIssues.push_back(to_string(m.orphanedFaculty.size()) + " faculty without any association");
        return m;
    }

    // Writes the three JSON exports into dir and returns their paths by kind.
    // Throws FacultyGraphError when a file cannot be written.
    map<string, string> exportAggregatedViews(const string& dir) const {
        json facultyViews = json::array();
        json labViews = json::array();
        for (const auto& id : facultyIds()) {
            optional<FacultyAggregatedView> v = getFacultyAggregatedView(id);
            if (v) facultyViews.push_back(toJson(*v));
        }
        for (const auto& id : labIds()) {
            optional<LabAggregatedView> v = getLabAggregatedView(id);
            if (v) labViews.push_back(toJson(*v));
        }
        json relationshipMap = toJson(generateRelationshipMap());

        std::error_code ec;
        filesystem::create_directories(dir, ec);
        if (ec) throw FacultyGraphError("cannot create export directory " + dir + ": " + ec.message());

        string stamp = fileTimestamp(clock_());
        map<string, string> paths;
        paths["faculty_views"] = writeJsonFile(dir, "faculty_aggregated_views_" + stamp + ".json", facultyViews);
        paths["lab_views"] = writeJsonFile(dir, "lab_aggregated_views_" + stamp + ".json", labViews);
        paths["relationship_map"] = writeJsonFile(dir, "data_relationship_map_" + stamp + ".json", relationshipMap);
        logOk("Exported aggregated views to " + dir);
        return paths;
    }

private:
    // ---- ingestion ----

    optional<string> processRecord(const RawFacultyRecord& record, const string& sessionId,
                                   IngestReport& report, ScrapeSession& session) {
        string name = cleanPersonName(record.name);
        string key = normalizeName(name);
        if (name.empty() || key.empty()) {
            ++report.rejected;
            report.issues.push_back(PipelineIssue{ ErrorKind::ValidationRejected, record.sourceUrl.value_or(string()), "record without a usable name" });
            return nullopt;
        }

        string universityId = ensureUniversity(record, report);
        string departmentId = ensureDepartment(record, universityId, report);

        string facultyId;
        optional<string> existing = findExistingFaculty(key, record, universityId);
        if (existing) {
            facultyId = *existing;
            mergeRecordInto(facultyId, record, report);
            ++report.merged;
        }
        else {
            facultyId = createFaculty(name, key, record, universityId, departmentId, sessionId);
            ++report.created;
        }

        ensureDepartmentAssociation(facultyId, departmentId, record, sessionId, report);

        if (record.labName || record.labWebsite) {
            optional<string> labId = resolveLab(record, universityId, departmentId, sessionId, report);
            if (labId) {
                if (find(session.labIds.begin(), session.labIds.end(), *labId) == session.labIds.end()) session.labIds.push_back(*labId);
                ensureLabAssociation(facultyId, *labId, record, sessionId, report);
            }
        }

        processEnrichments(facultyId, record, sessionId, report);
        return facultyId;
    }

    // Same normalized name, plus the same e-mail or a loose university-name match.
    optional<string> findExistingFaculty(const string& key, const RawFacultyRecord& record, const string& universityId) const {
        if (record.email) {
            optional<string> byEmail = repo_.facultyIdByUniversityEmail(universityId, *record.email);
            if (byEmail) {
                optional<FacultyEntity> f = repo_.getFaculty(*byEmail);
                if (f && f->status != EntityStatus::Merged && f->normalizedName == key) return f->id;
            }
        }
        for (const auto& id : repo_.facultyIdsByNormalizedName(key)) {
            optional<FacultyEntity> f = repo_.getFaculty(id);
            if (!f || f->status == EntityStatus::Merged) continue;
            if (record.email && f->email && toLowerStr(*record.email) == toLowerStr(*f->email)) return id;
            if (record.university && universityLooselyMatches(*record.university, f->primaryUniversityId)) return id;
        }
        return nullopt;
    }

    bool universityLooselyMatches(const string& recordUniversity, const string& universityId) const {
        string wanted = toLowerStr(trimStr(recordUniversity));
        if (wanted.empty()) return false;
        optional<UniversityEntity> u = repo_.getUniversity(universityId);
        if (u && toLowerStr(u->name).find(wanted) != string::npos) return true;
        string key = institutionKey(recordUniversity);
        return !key.empty() && universityId.find(key) != string::npos;
    }

    string createFaculty(const string& name, const string& key, const RawFacultyRecord& record,
                         const string& universityId, const string& departmentId, const string& sessionId) {
        TimePoint now = clock_();
        FacultyEntity f;
        f.id = newId("fac");
        f.name = name;
        f.normalizedName = key;
        f.title = record.title;
        f.primaryUniversityId = universityId;
        f.primaryDepartmentId = departmentId;
        f.email = record.email;
        f.phone = record.phone;
        f.officeLocation = record.office;
        f.profileUrl = record.profileUrl;
        f.personalWebsite = record.personalWebsite;
        f.confidenceScore = record.confidence.value_or(DEFAULT_FACULTY_CONFIDENCE);
        f.createdAt = now;
        f.updatedAt = now;
        f.sourceScrapeId = sessionId;
        repo_.putFaculty(f);
        return f.id;
    }

    void mergeRecordInto(const string& facultyId, const RawFacultyRecord& record, IngestReport& report) {
        optional<FacultyEntity> f = repo_.getFaculty(facultyId);
        if (!f) return;
        noteConflict(f->name, "email", f->email, record.email, report);
        noteConflict(f->name, "phone", f->phone, record.phone, report);
        fillBlank(f->email, record.email);
        fillBlank(f->phone, record.phone);
        fillBlank(f->officeLocation, record.office);
        fillBlank(f->profileUrl, record.profileUrl);
        fillBlank(f->personalWebsite, record.personalWebsite);
        keepLongerTitle(f->title, record.title);
        f->confidenceScore = (f->confidenceScore + record.confidence.value_or(DEFAULT_FACULTY_CONFIDENCE)) / 2.0;
        f->updatedAt = clock_();
        repo_.putFaculty(*f);
    }

    void noteConflict(const string& who, const string& field, const optional<string>& kept,
                      const optional<string>& seen, IngestReport& report) const {
        if (!kept || !seen) return;
        if (toLowerStr(trimStr(*kept)) == toLowerStr(trimStr(*seen))) return;
        ++report.conflicts;
        report.issues.push_back(PipelineIssue{ ErrorKind::EntityConflict, who, field + " differs: kept " + *kept + ", saw " + *seen });
        logWarn("EntityStore", who + ": conflicting " + field + " (" + *kept + " vs " + *seen + ")");
    }

    string ensureUniversity(const RawFacultyRecord& record, IngestReport& report) {
        string name = record.university.value_or("Unknown University");
        string key = institutionKey(name);
        string id = "univ_" + (key.empty() ? string("unknown") : key);
        if (repo_.getUniversity(id)) return id;
        UniversityEntity u;
        u.id = id;
        u.name = name;
        u.normalizedName = normalizeInstitutionName(name);
        u.domain = "unknown.edu";
        if (record.profileUrl && !urlHost(*record.profileUrl).empty()) u.domain = urlHost(*record.profileUrl);
        else if (record.sourceUrl && !urlHost(*record.sourceUrl).empty()) u.domain = urlHost(*record.sourceUrl);
        u.websiteUrl = "https://" + u.domain;
        u.createdAt = clock_();
        repo_.putUniversity(u);
        ++report.universitiesCreated;
        return id;
    }

    string ensureDepartment(const RawFacultyRecord& record, const string& universityId, IngestReport& report) {
        string name = record.department.value_or("Unknown Department");
        string key = institutionKey(name);
        string id = "dept_" + universityId + "_" + (key.empty() ? string("unknown") : key);
        if (repo_.getDepartment(id)) return id;
        DepartmentEntity d;
        d.id = id;
        d.name = name;
        d.normalizedName = normalizeInstitutionName(name);
        d.universityId = universityId;
        if (record.sourceUrl) d.websiteUrl = record.sourceUrl;
        d.createdAt = clock_();
        repo_.putDepartment(d);
        ++report.departmentsCreated;
        return id;
    }

    static vector<string> evidenceOf(const RawFacultyRecord& record) {
        vector<string> evidence;
        if (record.profileUrl) evidence.push_back(*record.profileUrl);
        else if (record.sourceUrl) evidence.push_back(*record.sourceUrl);
        return evidence;
    }

    static void addEvidence(vector<string>& evidence, const vector<string>& more) {
        for (const auto& e : more) {
            if (!e.empty() && find(evidence.begin(), evidence.end(), e) == evidence.end()) evidence.push_back(e);
        }
    }

    void ensureDepartmentAssociation(const string& facultyId, const string& departmentId, const RawFacultyRecord& record,
                                     const string& sessionId, IngestReport& report) {
        vector<FacultyDepartmentAssociation> current = departmentAssociationsFor(facultyId);
        for (auto& a : current) {
            if (a.departmentId != departmentId) continue;
            addEvidence(a.evidenceSources, evidenceOf(record));
            if (!a.title && record.title) a.title = record.title;
            a.updatedAt = clock_();
            repo_.putFacultyDepartmentAssociation(a);
            return;
        }
        TimePoint now = clock_();
        FacultyDepartmentAssociation a;
        a.id = newId("fda");
        a.facultyId = facultyId;
        a.departmentId = departmentId;
        a.appointmentType = current.empty() ? "primary" : "joint";
        a.title = record.title;
        a.confidenceScore = DEPARTMENT_ASSOCIATION_CONFIDENCE;
        a.confidenceLevel = confidenceLevelFor(a.confidenceScore);
        a.evidenceSources = evidenceOf(record);
        a.status = AssociationStatus::Active;
        a.createdAt = now;
        a.updatedAt = now;
        a.createdByScrapeId = sessionId;
        repo_.putFacultyDepartmentAssociation(a);
        ++report.associationsCreated;
    }

    optional<string> resolveLab(const RawFacultyRecord& record, const string& universityId,
                                const string& departmentId, const string& sessionId, IngestReport& report) {
        string normalized = record.labName ? normalizeInstitutionName(*record.labName) : string();
        optional<string> existing;
        if (!normalized.empty()) existing = repo_.labIdByNormalizedName(normalized);
        if (!existing && record.labWebsite) existing = repo_.labIdByWebsite(*record.labWebsite);
        if (existing) {
            optional<LabEntity> lab = repo_.getLab(*existing);
            if (lab && !lab->websiteUrl && record.labWebsite) {
                lab->websiteUrl = record.labWebsite;
                lab->updatedAt = clock_();
                repo_.putLab(*lab);
            }
            return existing;
        }

        TimePoint now = clock_();
        LabEntity lab;
        string key = institutionKey(record.labName.value_or(string()));
        lab.id = key.empty() ? newId("lab") : "lab_" + universityId + "_" + key;
        if (repo_.getLab(lab.id)) lab.id = newId("lab");
        lab.name = record.labName.value_or("Unknown Lab");
        lab.normalizedName = normalized;
        lab.labType = string("research");
        lab.universityId = universityId;
        lab.primaryDepartmentId = departmentId;
        lab.websiteUrl = record.labWebsite;
        lab.confidenceScore = LAB_ENTITY_CONFIDENCE;
        lab.createdAt = now;
        lab.updatedAt = now;
        lab.sourceScrapeId = sessionId;
        repo_.putLab(lab);

        LabDepartmentAssociation link;
        link.id = newId("lda");
        link.labId = lab.id;
        link.departmentId = departmentId;
        link.confidenceScore = LAB_DEPARTMENT_CONFIDENCE;
        link.evidenceSources = evidenceOf(record);
        link.createdAt = now;
        link.createdByScrapeId = sessionId;
        repo_.putLabDepartmentAssociation(link);

        ++report.labsCreated;
        return lab.id;
    }

    void ensureLabAssociation(const string& facultyId, const string& labId, const RawFacultyRecord& record,
                              const string& sessionId, IngestReport& report) {
        string surname = nameSurname(record.name);
        bool pi = record.labName && !surname.empty() && toLowerStr(*record.labName).find(surname) != string::npos;
        string role = pi ? PRINCIPAL_INVESTIGATOR_ROLE : "member";
        string relationship = pi ? "pi" : "member";
        vector<string> evidence = evidenceOf(record);
        if (record.labWebsite) addEvidence(evidence, { *record.labWebsite });

        optional<FacultyLabAssociation> conflicting;
        for (auto& a : labAssociationsFor(facultyId)) {
            if (a.labId != labId || !a.isCurrent) continue;
            if (a.relationshipType == relationship) {
                addEvidence(a.evidenceSources, evidence);
                a.updatedAt = clock_();
                repo_.putFacultyLabAssociation(a);
                return;
            }
            conflicting = a;
        }

        TimePoint now = clock_();
        FacultyLabAssociation a;
        a.id = newId("fla");
        a.facultyId = facultyId;
        a.labId = labId;
        a.role = role;
        a.relationshipType = relationship;
        a.confidenceScore = LAB_ASSOCIATION_CONFIDENCE;
        a.confidenceLevel = confidenceLevelFor(a.confidenceScore);
        a.evidenceSources = evidence;
        a.status = AssociationStatus::PendingVerification;
        a.createdAt = now;
        a.updatedAt = now;
        a.createdByScrapeId = sessionId;
        repo_.putFacultyLabAssociation(a);
        ++report.associationsCreated;

        if (conflicting) {
            markDisputed(a.id, conflicting->id);
            markDisputed(conflicting->id, a.id);
            ++report.conflicts;
            report.issues.push_back(PipelineIssue{ ErrorKind::EntityConflict, record.name,
                "lab role " + relationship + " contradicts " + conflicting->relationshipType + " on " + conflicting->id });
        }
    }

    void processEnrichments(const string& facultyId, const RawFacultyRecord& record,
                            const string& sessionId, IngestReport& report) {
        string profileSource = record.profileUrl.value_or(record.sourceUrl.value_or(string()));
        TimePoint now = clock_();

        if (record.googleScholarUrl) {
            json data = record.scholarData.value_or(json::object());
            upsertEnrichment(facultyId, ENRICHMENT_GOOGLE_SCHOLAR, *record.googleScholarUrl, sessionId, report,
                [&](const string& id) {
                    GoogleScholarEnrichment e;
                    e.meta = newMeta(id, *record.googleScholarUrl, record.extractionMethod, now);
                    if (data.contains("scholar_id") && data["scholar_id"].is_string()) e.scholarId = data["scholar_id"].get<string>();
                    e.verifiedEmail = data.value("verified_email", false);
                    if (data.contains("citation_count") && data["citation_count"].is_number_integer()) e.totalCitations = data["citation_count"].get<long>();
                    if (data.contains("h_index") && data["h_index"].is_number_integer()) e.hIndex = data["h_index"].get<long>();
                    if (data.contains("i10_index") && data["i10_index"].is_number_integer()) e.i10Index = data["i10_index"].get<long>();
                    if (data.contains("research_interests") && data["research_interests"].is_array()) {
                        for (const auto& s : data["research_interests"]) {
                            if (s.is_string()) e.scholarInterests.push_back(s.get<string>());
                        }
                    }
                    e.profileCompleteness = 0.8;
                    if (auto existing = repo_.getScholarEnrichment(id)) e = mergeEnrichment(*existing, e);
                    repo_.putScholarEnrichment(e);
                });
        }

        if (record.bio || !record.researchInterests.empty()) {
            upsertEnrichment(facultyId, ENRICHMENT_PROFILE, profileSource, sessionId, report,
                [&](const string& id) {
                    ProfileEnrichment e;
                    e.meta = newMeta(id, profileSource, record.extractionMethod, now);
                    e.fullBiography = record.bio;
                    e.researchKeywords = record.researchInterests;
                    e.officeHours = record.officeHours;
                    e.completenessScore = 0.7;
                    if (auto existing = repo_.getProfileEnrichment(id)) e = mergeEnrichment(*existing, e);
                    repo_.putProfileEnrichment(e);
                });
        }

        if (!record.links.empty()) {
            upsertEnrichment(facultyId, ENRICHMENT_LINKS, profileSource, sessionId, report,
                [&](const string& id) {
                    LinkEnrichment e;
                    e.meta = newMeta(id, profileSource, record.extractionMethod, now);
                    e.title = "Links for " + record.name;
                    e.researchInterests = record.researchInterests;
                    e.relatedLinks = record.links;
                    e.contentQualityScore = 0.6;
                    if (auto existing = repo_.getLinkEnrichment(id)) e = mergeEnrichment(*existing, e);
                    repo_.putLinkEnrichment(e);
                });
        }

        if (record.researchData) {
            const json& data = *record.researchData;
            upsertEnrichment(facultyId, ENRICHMENT_RESEARCH, profileSource, sessionId, report,
                [&](const string& id) {
                    ResearchEnrichment e;
                    e.meta = newMeta(id, profileSource, record.extractionMethod, now);
                    if (data.contains("publications") && data["publications"].is_array()) {
                        for (const auto& p : data["publications"]) e.publications.push_back(p);
                        e.publicationCount = (long)e.publications.size();
                    }
                    if (data.contains("publication_count") && data["publication_count"].is_number_integer()) e.publicationCount = data["publication_count"].get<long>();
                    if (data.contains("h_index") && data["h_index"].is_number_integer()) e.hIndex = data["h_index"].get<long>();
                    if (data.contains("citation_count") && data["citation_count"].is_number_integer()) e.citationCount = data["citation_count"].get<long>();
                    if (data.contains("research_themes") && data["research_themes"].is_array()) {
                        for (const auto& s : data["research_themes"]) {
                            if (s.is_string()) e.researchThemes.push_back(s.get<string>());
                        }
                    }
                    if (auto existing = repo_.getResearchEnrichment(id)) e = mergeEnrichment(*existing, e);
                    repo_.putResearchEnrichment(e);
                });
        }
    }

    static EnrichmentMeta newMeta(const string& id, const string& source, const string& method, TimePoint now) {
        EnrichmentMeta m;
        m.id = id;
        m.sourceUrl = source;
        m.extractionMethod = method;
        m.extractedAt = now;
        return m;
    }

    // Existing rows keep their lifecycle state and errors; the new extraction only fills blanks.
    static ProfileEnrichment mergeEnrichment(ProfileEnrichment row, const ProfileEnrichment& fresh) {
        fillBlank(row.fullBiography, fresh.fullBiography);
        fillEmpty(row.researchKeywords, fresh.researchKeywords);
        fillBlank(row.officeHours, fresh.officeHours);
        return row;
    }

    static LinkEnrichment mergeEnrichment(LinkEnrichment row, const LinkEnrichment& fresh) {
        if (row.title.empty()) row.title = fresh.title;
        fillEmpty(row.researchInterests, fresh.researchInterests);
        fillEmpty(row.relatedLinks, fresh.relatedLinks);
        return row;
    }

    static ResearchEnrichment mergeEnrichment(ResearchEnrichment row, const ResearchEnrichment& fresh) {
        fillEmpty(row.publications, fresh.publications);
        fillMissing(row.publicationCount, fresh.publicationCount);
        fillMissing(row.hIndex, fresh.hIndex);
        fillMissing(row.citationCount, fresh.citationCount);
        fillEmpty(row.researchThemes, fresh.researchThemes);
        return row;
    }

    static GoogleScholarEnrichment mergeEnrichment(GoogleScholarEnrichment row, const GoogleScholarEnrichment& fresh) {
        fillBlank(row.scholarId, fresh.scholarId);
        row.verifiedEmail = row.verifiedEmail || fresh.verifiedEmail;
        fillMissing(row.totalCitations, fresh.totalCitations);
        fillMissing(row.hIndex, fresh.hIndex);
        fillMissing(row.i10Index, fresh.i10Index);
        fillEmpty(row.scholarInterests, fresh.scholarInterests);
        return row;
    }

    static bool applyReextraction(EnrichmentMeta& m, TimePoint now) {
        if (m.status != EnrichmentStatus::Stale && m.status != EnrichmentStatus::Failed &&
            m.status != EnrichmentStatus::Processing) return false;
        m.status = EnrichmentStatus::Fresh;
        m.extractedAt = now;
        ++m.extractionCount;
        return true;
    }

    // A repeat of (faculty, type, source) re-extracts the existing row instead of adding another.
    // Stale and failed rows come back fresh, validated rows stay validated.
    template <typename Write>
    void upsertEnrichment(const string& facultyId, const string& type, const string& source,
                          const string& sessionId, IngestReport& report, Write write) {
        for (const auto& a : repo_.facultyEnrichmentAssociations()) {
            if (a.facultyId != facultyId || a.enrichmentType != type || a.dataSource != source) continue;
            TimePoint now = clock_();
            write(a.enrichmentId);
            updateEnrichmentMeta(a.enrichmentId, [&](EnrichmentMeta& m) {
                if (applyReextraction(m, now)) return true;
                if (m.status == EnrichmentStatus::Fresh) m.extractedAt = now;
                ++m.extractionCount;
                return true;
            });
            return;
        }
        string prefix = type == ENRICHMENT_GOOGLE_SCHOLAR ? "scholar" : type;
        string id = newId(prefix);
        write(id);
        TimePoint now = clock_();
        FacultyEnrichmentAssociation a;
        a.id = newId("fea");
        a.facultyId = facultyId;
        a.enrichmentId = id;
        a.enrichmentType = type;
        a.dataSource = source;
        a.extractionMethod = "scrape_ingest";
        a.confidenceScore = ENRICHMENT_ASSOCIATION_CONFIDENCE;
        a.qualityScore = ENRICHMENT_QUALITY;
        a.completenessScore = ENRICHMENT_COMPLETENESS;
        a.extractedAt = now;
        a.createdAt = now;
        a.createdByScrapeId = sessionId;
        repo_.putFacultyEnrichmentAssociation(a);
        ++report.enrichmentsCreated;
    }

    // ---- helpers, caller holds mu_ ----

    static void fillBlank(optional<string>& target, const optional<string>& source) {
        if ((!target || target->empty()) && source && !source->empty()) target = source;
    }

    template <typename T>
    static void fillMissing(optional<T>& target, const optional<T>& source) {
        if (!target && source) target = source;
    }

    template <typename T>
    static void fillEmpty(vector<T>& target, const vector<T>& source) {
        if (target.empty()) target = source;
    }

    static void keepLongerTitle(optional<string>& target, const optional<string>& candidate) {
        if (candidate && candidate->size() > target.value_or(string()).size()) target = candidate;
    }

    string newId(const string& prefix) {
        static const char HEX[] = "0123456789abcdef";
        uniform_int_distribution<int> digit(0, 15);
        while (true) {
            string id = prefix + "_";
            for (int i = 0; i < 8; ++i) id.push_back(HEX[digit(rng_)]);
            if (!idTaken(id)) return id;
        }
    }

    bool idTaken(const string& id) const {
        return repo_.getFaculty(id) || repo_.getLab(id) || repo_.getFacultyLabAssociation(id) ||
            repo_.getFacultyDepartmentAssociation(id) || repo_.getFacultyEnrichmentAssociation(id) ||
            repo_.getLabDepartmentAssociation(id) || enrichmentMeta(id);
    }

    vector<FacultyDepartmentAssociation> departmentAssociationsFor(const string& facultyId) const {
        vector<FacultyDepartmentAssociation> out;
        for (const auto& a : repo_.facultyDepartmentAssociations()) {
            if (a.facultyId == facultyId) out.push_back(a);
        }
        return out;
    }

    vector<FacultyLabAssociation> labAssociationsFor(const string& facultyId) const {
        vector<FacultyLabAssociation> out;
        for (const auto& a : repo_.facultyLabAssociations()) {
            if (a.facultyId == facultyId) out.push_back(a);
        }
        return out;
    }

    template <typename Fn>
    bool updateAssociation(const string& id, Fn fn) {
        optional<FacultyLabAssociation> lab = repo_.getFacultyLabAssociation(id);
        if (lab) {
            if (!fn(*lab)) return false;
            repo_.putFacultyLabAssociation(*lab);
            return true;
        }
        optional<FacultyDepartmentAssociation> dept = repo_.getFacultyDepartmentAssociation(id);
        if (dept) {
            if (!fn(*dept)) return false;
            repo_.putFacultyDepartmentAssociation(*dept);
            return true;
        }
        return false;
    }

    bool markDisputed(const string& associationId, const string& conflictingId) {
        TimePoint now = clock_();
        bool ok = updateAssociation(associationId, [&](auto& a) {
            if (!conflictingId.empty() && find(a.conflictsWith.begin(), a.conflictsWith.end(), conflictingId) == a.conflictsWith.end()) {
                a.conflictsWith.push_back(conflictingId);
            }
            if (a.status == AssociationStatus::Disputed) return true;
            a.status = AssociationStatus::Disputed;
            a.updatedAt = now;
            return true;
        });
        if (ok && repo_.enqueueDispute(associationId)) {
            logWarn("EntityStore", "association " + associationId + " disputed, queued for review");
        }
        return ok;
    }

    void dequeueDispute(const string& associationId) {
        repo_.dequeueDispute(associationId);
    }

    optional<EnrichmentMeta> enrichmentMeta(const string& id) const {
        if (auto e = repo_.getLinkEnrichment(id)) return e->meta;
        if (auto e = repo_.getProfileEnrichment(id)) return e->meta;
        if (auto e = repo_.getResearchEnrichment(id)) return e->meta;
        if (auto e = repo_.getScholarEnrichment(id)) return e->meta;
        return nullopt;
    }

    template <typename Fn>
    bool updateEnrichmentMeta(const string& id, Fn fn) {
        if (auto e = repo_.getLinkEnrichment(id)) {
            if (!fn(e->meta)) return false;
            repo_.putLinkEnrichment(*e);
            return true;
        }
        if (auto e = repo_.getProfileEnrichment(id)) {
            if (!fn(e->meta)) return false;
            repo_.putProfileEnrichment(*e);
            return true;
        }
        if (auto e = repo_.getResearchEnrichment(id)) {
            if (!fn(e->meta)) return false;
            repo_.putResearchEnrichment(*e);
            return true;
        }
        if (auto e = repo_.getScholarEnrichment(id)) {
            if (!fn(e->meta)) return false;
            repo_.putScholarEnrichment(*e);
            return true;
        }
        return false;
    }

    optional<json> enrichmentJson(const string& type, const string& id) const {
        if (type == ENRICHMENT_GOOGLE_SCHOLAR) {
            if (auto e = repo_.getScholarEnrichment(id)) return toJson(*e);
        }
        else if (type == ENRICHMENT_PROFILE) {
            if (auto e = repo_.getProfileEnrichment(id)) return toJson(*e);
        }
        else if (type == ENRICHMENT_LINKS) {
            if (auto e = repo_.getLinkEnrichment(id)) return toJson(*e);
        }
        else if (type == ENRICHMENT_RESEARCH) {
            if (auto e = repo_.getResearchEnrichment(id)) return toJson(*e);
        }
        return nullopt;
    }

    optional<FacultyAggregatedView> buildFacultyView(const string& facultyId) const {
        optional<FacultyEntity> faculty = repo_.getFaculty(facultyId);
        if (!faculty) return nullopt;
        FacultyAggregatedView v;
        v.faculty = *faculty;
        v.university = repo_.getUniversity(faculty->primaryUniversityId);
        v.primaryDepartment = repo_.getDepartment(faculty->primaryDepartmentId);
        for (const auto& a : departmentAssociationsFor(facultyId)) {
            v.departmentAssociations.push_back(make_pair(a, repo_.getDepartment(a.departmentId)));
        }
        for (const auto& a : labAssociationsFor(facultyId)) {
            v.labAssociations.push_back(make_pair(a, repo_.getLab(a.labId)));
        }
        for (const auto& type : ENRICHMENT_TYPES) v.enrichments[type] = vector<json>();

        TimePoint now = clock_();
        set<string> sources;
        if (faculty->profileUrl) sources.insert(*faculty->profileUrl);
        double freshnessSum = 0.0;
        for (const auto& a : repo_.facultyEnrichmentAssociations()) {
            if (a.facultyId != facultyId) continue;
            optional<json> e = enrichmentJson(a.enrichmentType, a.enrichmentId);
            if (!e) continue;
            (*e)["association"] = toJson(a);
            string source = e->value("source_url", string());
            if (!source.empty()) sources.insert(source);
            optional<EnrichmentMeta> meta = enrichmentMeta(a.enrichmentId);
            if (meta) freshnessSum += max(0.0, 1.0 - ageInDays(meta->extractedAt, now) / FRESHNESS_WINDOW_DAYS);
            v.enrichments[a.enrichmentType].push_back(*e);
            ++v.totalEnrichments;
        }
        v.dataSources.assign(sources.begin(), sources.end());
        v.dataFreshnessScore = v.totalEnrichments ? min(1.0, freshnessSum / (double)v.totalEnrichments) : 0.0;
        v.completenessScore = min(1.0, (double)v.totalEnrichments / COMPLETENESS_TARGET);
        v.confidenceScore = faculty->confidenceScore;
        return v;
    }

    optional<LabAggregatedView> buildLabView(const string& labId) const {
        optional<LabEntity> lab = repo_.getLab(labId);
        if (!lab) return nullopt;
        LabAggregatedView v;
        v.lab = *lab;
        v.university = repo_.getUniversity(lab->universityId);
        v.primaryDepartment = repo_.getDepartment(lab->primaryDepartmentId);
        for (const auto& a : repo_.labDepartmentAssociations()) {
            if (a.labId == labId) v.departmentAssociations.push_back(make_pair(a, repo_.getDepartment(a.departmentId)));
        }
        for (const auto& a : repo_.facultyLabAssociations()) {
            if (a.labId != labId) continue;
            optional<FacultyEntity> f = repo_.getFaculty(a.facultyId);
            if (!f) continue;
            v.facultyAssociations.push_back(make_pair(a, *f));
            if (a.role == PRINCIPAL_INVESTIGATOR_ROLE) ++v.piCount;
        }
        v.memberCount = v.facultyAssociations.size();
        if (lab->websiteUrl) v.dataSources.push_back(*lab->websiteUrl);
        v.completenessScore = lab->websiteUrl ? 0.8 : 0.3;
        v.confidenceScore = lab->confidenceScore;
        return v;
    }

    static string writeJsonFile(const string& dir, const string& fileName, const json& content) {
        string path = (filesystem::path(dir) / fileName).string();
        ofstream out(path);
        if (!out) throw FacultyGraphError("cannot open " + path + " for writing");
        out << content.dump(2);
        if (!out) throw FacultyGraphError("failed writing " + path);
        return path;
    }

    EntityRepository& repo_;
    ClockFn clock_;
    mutable mutex mu_;
    mt19937_64 rng_;
};
