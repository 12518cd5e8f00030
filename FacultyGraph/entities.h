#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

#include "faculty_record.h"
#include "time_utils.h"

using namespace std;
using json = nlohmann::json;

enum class EntityStatus { Active, Inactive, Pending, Merged };
enum class AssociationStatus { Active, Inactive, Disputed, PendingVerification, Verified };
enum class AssociationConfidence { High, Medium, Low, Uncertain };
enum class EnrichmentStatus { Fresh, Stale, Failed, Processing, Validated };

inline string entityStatusName(EntityStatus s) {
    switch (s) {
    case EntityStatus::Active: return "active";
    case EntityStatus::Inactive: return "inactive";
    case EntityStatus::Pending: return "pending";
    case EntityStatus::Merged: return "merged";
    }
    return "active";
}

inline string associationStatusName(AssociationStatus s) {
    switch (s) {
    case AssociationStatus::Active: return "active";
    case AssociationStatus::Inactive: return "inactive";
    case AssociationStatus::Disputed: return "disputed";
    case AssociationStatus::PendingVerification: return "pending_verification";
    case AssociationStatus::Verified: return "verified";
    }
    return "active";
}

inline string associationConfidenceName(AssociationConfidence c) {
    switch (c) {
    case AssociationConfidence::High: return "high";
    case AssociationConfidence::Medium: return "medium";
    case AssociationConfidence::Low: return "low";
    case AssociationConfidence::Uncertain: return "uncertain";
    }
    return "uncertain";
}

// high 0.8+, medium 0.5+, low 0.2+, otherwise uncertain
inline AssociationConfidence confidenceLevelFor(double score) {
    if (score >= 0.8) return AssociationConfidence::High;
    if (score >= 0.5) return AssociationConfidence::Medium;
    if (score >= 0.2) return AssociationConfidence::Low;
    return AssociationConfidence::Uncertain;
}

inline string enrichmentStatusName(EnrichmentStatus s) {
    switch (s) {
    case EnrichmentStatus::Fresh: return "fresh";
    case EnrichmentStatus::Stale: return "stale";
    case EnrichmentStatus::Failed: return "failed";
    case EnrichmentStatus::Processing: return "processing";
    case EnrichmentStatus::Validated: return "validated";
    }
    return "fresh";
}

inline json timestampJson(const optional<TimePoint>& tp) {
    return tp ? json(formatTimestamp(*tp)) : json(nullptr);
}

// ---- Entities ----

struct FacultyEntity {
    string id;
    string name;
    string normalizedName;
    optional<string> title;
    string primaryUniversityId;
    string primaryDepartmentId;
    optional<string> email;
    optional<string> phone;
    optional<string> officeLocation;
    optional<string> profileUrl;
    optional<string> personalWebsite;
    EntityStatus status = EntityStatus::Active;
    double confidenceScore = 0.0;
    optional<string> duplicateOf;
    vector<string> mergedFrom;
    TimePoint createdAt;
    TimePoint updatedAt;
    string sourceScrapeId;
};

struct LabEntity {
    string id;
    string name;
    string normalizedName;
    optional<string> labType;
    string universityId;
    string primaryDepartmentId;
    optional<string> websiteUrl;
    optional<string> description;
    optional<string> location;
    EntityStatus status = EntityStatus::Active;
    double confidenceScore = 0.0;
    optional<string> duplicateOf;
    vector<string> mergedFrom;
    TimePoint createdAt;
    TimePoint updatedAt;
    string sourceScrapeId;
};

struct UniversityEntity {
    string id;
    string name;
    string normalizedName;
    string domain;
    string websiteUrl;
    EntityStatus status = EntityStatus::Active;
    TimePoint createdAt;
};

struct DepartmentEntity {
    string id;
    string name;
    string normalizedName;
    string universityId;
    optional<string> websiteUrl;
    EntityStatus status = EntityStatus::Active;
    TimePoint createdAt;
};

// ---- Associations. Removing one never touches its endpoint entities. ----

struct FacultyLabAssociation {
    string id;
    string facultyId;
    string labId;
    string role;
    string relationshipType = "member";
    double confidenceScore = 0.0;
    AssociationConfidence confidenceLevel = AssociationConfidence::Uncertain;
    vector<string> evidenceSources;
    AssociationStatus status = AssociationStatus::PendingVerification;
    optional<TimePoint> startDate;
    optional<TimePoint> endDate;
    bool isCurrent = true;
    vector<string> conflictsWith;
    optional<string> supersedes;
    TimePoint createdAt;
    TimePoint updatedAt;
    string createdByScrapeId;
    optional<string> verifiedBy;
};

struct FacultyDepartmentAssociation {
    string id;
    string facultyId;
    string departmentId;
    string appointmentType = "primary";
    optional<string> title;
    optional<double> percentage;
    double confidenceScore = 0.0;
    AssociationConfidence confidenceLevel = AssociationConfidence::Uncertain;
    vector<string> evidenceSources;
    AssociationStatus status = AssociationStatus::Active;
    optional<TimePoint> startDate;
    optional<TimePoint> endDate;
    bool isCurrent = true;
    vector<string> conflictsWith;
    TimePoint createdAt;
    TimePoint updatedAt;
    string createdByScrapeId;
    optional<string> verifiedBy;
};

struct FacultyEnrichmentAssociation {
    string id;
    string facultyId;
    string enrichmentId;
    string enrichmentType;
    string dataSource;
    string extractionMethod;
    double confidenceScore = 0.0;
    double qualityScore = 0.0;
    double completenessScore = 0.0;
    AssociationStatus status = AssociationStatus::Active;
    TimePoint extractedAt;
    TimePoint createdAt;
    string createdByScrapeId;
};

struct LabDepartmentAssociation {
    string id;
    string labId;
    string departmentId;
    string relationshipType = "primary";
    double confidenceScore = 0.0;
    vector<string> evidenceSources;
    AssociationStatus status = AssociationStatus::Active;
    bool isCurrent = true;
    TimePoint createdAt;
    string createdByScrapeId;
};

// ---- Enrichment pools ----

static const string ENRICHMENT_GOOGLE_SCHOLAR = "google_scholar";
static const string ENRICHMENT_PROFILE = "profile";
static const string ENRICHMENT_LINKS = "links";
static const string ENRICHMENT_RESEARCH = "research";
static const vector<string> ENRICHMENT_TYPES = { ENRICHMENT_GOOGLE_SCHOLAR, ENRICHMENT_PROFILE, ENRICHMENT_LINKS, ENRICHMENT_RESEARCH };

// Lifecycle fields every enrichment row carries.
struct EnrichmentMeta {
    string id;
    string sourceUrl;
    EnrichmentStatus status = EnrichmentStatus::Fresh;
    string extractionMethod;
    vector<string> extractionErrors;
    TimePoint extractedAt;
    int extractionCount = 1;
};

struct LinkEnrichment {
    EnrichmentMeta meta;
    string sourceType = "faculty_profile";
    string title;
    vector<string> researchInterests;
    vector<json> relatedLinks;
    double contentQualityScore = 0.0;
};

struct ProfileEnrichment {
    EnrichmentMeta meta;
    optional<string> fullBiography;
    vector<string> researchKeywords;
    optional<string> officeHours;
    double completenessScore = 0.0;
};

struct ResearchEnrichment {
    EnrichmentMeta meta;
    vector<json> publications;
    optional<long> publicationCount;
    optional<long> hIndex;
    optional<long> citationCount;
    vector<string> researchThemes;
};

struct GoogleScholarEnrichment {
    EnrichmentMeta meta;
    optional<string> scholarId;
    bool verifiedEmail = false;
    optional<long> totalCitations;
    optional<long> hIndex;
    optional<long> i10Index;
    vector<string> scholarInterests;
    double profileCompleteness = 0.0;
};

// ---- JSON ----

inline json toJson(const FacultyEntity& f) {
    json j;
    j["id"] = f.id;
    j["name"] = f.name;
    j["normalized_name"] = f.normalizedName;
    j["title"] = optionalJson(f.title);
    j["primary_university_id"] = f.primaryUniversityId;
    j["primary_department_id"] = f.primaryDepartmentId;
    j["email"] = optionalJson(f.email);
    j["phone"] = optionalJson(f.phone);
    j["office_location"] = optionalJson(f.officeLocation);
    j["profile_url"] = optionalJson(f.profileUrl);
    j["personal_website"] = optionalJson(f.personalWebsite);
    j["status"] = entityStatusName(f.status);
    j["confidence_score"] = f.confidenceScore;
    j["duplicate_of"] = optionalJson(f.duplicateOf);
    j["merged_from"] = f.mergedFrom;
    j["created_at"] = formatTimestamp(f.createdAt);
    j["updated_at"] = formatTimestamp(f.updatedAt);
    j["source_scrape_id"] = f.sourceScrapeId;
    return j;
}

inline json toJson(const LabEntity& l) {
    json j;
    j["id"] = l.id;
    j["name"] = l.name;
    j["normalized_name"] = l.normalizedName;
    j["lab_type"] = optionalJson(l.labType);
    j["university_id"] = l.universityId;
    j["primary_department_id"] = l.primaryDepartmentId;
    j["website_url"] = optionalJson(l.websiteUrl);
    j["description"] = optionalJson(l.description);
    j["location"] = optionalJson(l.location);
    j["status"] = entityStatusName(l.status);
    j["confidence_score"] = l.confidenceScore;
    j["duplicate_of"] = optionalJson(l.duplicateOf);
    j["merged_from"] = l.mergedFrom;
    j["created_at"] = formatTimestamp(l.createdAt);
    j["updated_at"] = formatTimestamp(l.updatedAt);
    j["source_scrape_id"] = l.sourceScrapeId;
    return j;
}

inline json toJson(const UniversityEntity& u) {
    json j;
    j["id"] = u.id;
    j["name"] = u.name;
    j["normalized_name"] = u.normalizedName;
    j["domain"] = u.domain;
    j["website_url"] = u.websiteUrl;
    j["status"] = entityStatusName(u.status);
    j["created_at"] = formatTimestamp(u.createdAt);
    return j;
}

inline json toJson(const DepartmentEntity& d) {
    json j;
    j["id"] = d.id;
    j["name"] = d.name;
    j["normalized_name"] = d.normalizedName;
    j["university_id"] = d.universityId;
    j["website_url"] = optionalJson(d.websiteUrl);
    j["status"] = entityStatusName(d.status);
    j["created_at"] = formatTimestamp(d.createdAt);
    return j;
}

inline json toJson(const FacultyLabAssociation& a) {
    json j;
    j["id"] = a.id;
    j["faculty_id"] = a.facultyId;
    j["lab_id"] = a.labId;
    j["role"] = a.role;
    j["relationship_type"] = a.relationshipType;
    j["confidence_score"] = a.confidenceScore;
    j["confidence_level"] = associationConfidenceName(a.confidenceLevel);
    j["evidence_sources"] = a.evidenceSources;
    j["status"] = associationStatusName(a.status);
    j["start_date"] = timestampJson(a.startDate);
    j["end_date"] = timestampJson(a.endDate);
    j["is_current"] = a.isCurrent;
    j["conflicts_with"] = a.conflictsWith;
    j["supersedes"] = optionalJson(a.supersedes);
    j["created_at"] = formatTimestamp(a.createdAt);
    j["updated_at"] = formatTimestamp(a.updatedAt);
    j["created_by_scrape_id"] = a.createdByScrapeId;
    j["verified_by"] = optionalJson(a.verifiedBy);
    return j;
}

inline json toJson(const FacultyDepartmentAssociation& a) {
    json j;
    j["id"] = a.id;
    j["faculty_id"] = a.facultyId;
    j["department_id"] = a.departmentId;
    j["appointment_type"] = a.appointmentType;
    j["title"] = optionalJson(a.title);
    j["percentage"] = a.percentage ? json(*a.percentage) : json(nullptr);
    j["confidence_score"] = a.confidenceScore;
    j["confidence_level"] = associationConfidenceName(a.confidenceLevel);
    j["evidence_sources"] = a.evidenceSources;
    j["status"] = associationStatusName(a.status);
    j["start_date"] = timestampJson(a.startDate);
    j["end_date"] = timestampJson(a.endDate);
    j["is_current"] = a.isCurrent;
    j["conflicts_with"] = a.conflictsWith;
    j["created_at"] = formatTimestamp(a.createdAt);
    j["updated_at"] = formatTimestamp(a.updatedAt);
    j["created_by_scrape_id"] = a.createdByScrapeId;
    j["verified_by"] = optionalJson(a.verifiedBy);
    return j;
}

inline json toJson(const FacultyEnrichmentAssociation& a) {
    json j;
    j["id"] = a.id;
    j["faculty_id"] = a.facultyId;
    j["enrichment_id"] = a.enrichmentId;
    j["enrichment_type"] = a.enrichmentType;
    j["data_source"] = a.dataSource;
    j["extraction_method"] = a.extractionMethod;
    j["confidence_score"] = a.confidenceScore;
    j["quality_score"] = a.qualityScore;
    j["completeness_score"] = a.completenessScore;
    j["status"] = associationStatusName(a.status);
    j["extracted_at"] = formatTimestamp(a.extractedAt);
    j["created_at"] = formatTimestamp(a.createdAt);
    j["created_by_scrape_id"] = a.createdByScrapeId;
    return j;
}

inline json toJson(const LabDepartmentAssociation& a) {
    json j;
    j["id"] = a.id;
    j["lab_id"] = a.labId;
    j["department_id"] = a.departmentId;
    j["relationship_type"] = a.relationshipType;
    j["confidence_score"] = a.confidenceScore;
    j["evidence_sources"] = a.evidenceSources;
    j["status"] = associationStatusName(a.status);
    j["is_current"] = a.isCurrent;
    j["created_at"] = formatTimestamp(a.createdAt);
    j["created_by_scrape_id"] = a.createdByScrapeId;
    return j;
}

inline void writeMeta(json& j, const EnrichmentMeta& m) {
    j["id"] = m.id;
    j["source_url"] = m.sourceUrl;
    j["status"] = enrichmentStatusName(m.status);
    j["extraction_method"] = m.extractionMethod;
    j["extraction_errors"] = m.extractionErrors;
    j["extracted_at"] = formatTimestamp(m.extractedAt);
    j["extraction_count"] = m.extractionCount;
}

inline json optionalLongJson(const optional<long>& v) {
    return v ? json(*v) : json(nullptr);
}

inline json toJson(const LinkEnrichment& e) {
    json j;
    writeMeta(j, e.meta);
    j["source_type"] = e.sourceType;
    j["title"] = e.title;
    j["research_interests"] = e.researchInterests;
    j["related_links"] = e.relatedLinks;
    j["content_quality_score"] = e.contentQualityScore;
    return j;
}

inline json toJson(const ProfileEnrichment& e) {
    json j;
    writeMeta(j, e.meta);
    j["profile_url"] = e.meta.sourceUrl;
    j["full_biography"] = optionalJson(e.fullBiography);
    j["research_keywords"] = e.researchKeywords;
    j["office_hours"] = optionalJson(e.officeHours);
    j["completeness_score"] = e.completenessScore;
    return j;
}

inline json toJson(const ResearchEnrichment& e) {
    json j;
    writeMeta(j, e.meta);
    j["publications"] = e.publications;
    j["publication_count"] = optionalLongJson(e.publicationCount);
    j["h_index"] = optionalLongJson(e.hIndex);
    j["citation_count"] = optionalLongJson(e.citationCount);
    j["research_themes"] = e.researchThemes;
    return j;
}

inline json toJson(const GoogleScholarEnrichment& e) {
    json j;
    writeMeta(j, e.meta);
    j["scholar_url"] = e.meta.sourceUrl;
    j["scholar_id"] = optionalJson(e.scholarId);
    j["verified_email"] = e.verifiedEmail;
    j["total_citations"] = optionalLongJson(e.totalCitations);
    j["h_index"] = optionalLongJson(e.hIndex);
    j["i10_index"] = optionalLongJson(e.i10Index);
    j["scholar_interests"] = e.scholarInterests;
    j["profile_completeness"] = e.profileCompleteness;
    return j;
}
