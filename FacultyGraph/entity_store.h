#pragma once

#include <string>
#include <vector>
#include <map>
#include <deque>
#include <algorithm>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

#include "entities.h"
#include "string_utils.h"
#include "time_utils.h"

using namespace std;
using json = nlohmann::json;

struct ScrapeSession {
    string id;
    TimePoint processedAt;
    vector<string> facultyIds;
    vector<string> labIds;
    string sourceType;
    json report;
};

inline json toJson(const ScrapeSession& s) {
    json j;
    j["id"] = s.id;
    j["processed_at"] = formatTimestamp(s.processedAt);
    j["faculty_ids"] = s.facultyIds;
    j["lab_ids"] = s.labIds;
    j["source_type"] = s.sourceType;
    j["report"] = s.report;
    return j;
}

// Storage seam for the entity graph. Implementations keep their own indexes current on every put.
// Not synchronised; the resolution store is the single writer.
class EntityRepository {
public:
    virtual ~EntityRepository() = default;

    virtual optional<FacultyEntity> getFaculty(const string& id) const = 0;
    virtual void putFaculty(const FacultyEntity& faculty) = 0;
    virtual vector<string> facultyIdsByNormalizedName(const string& normalizedName) const = 0;
    virtual optional<string> facultyIdByUniversityEmail(const string& universityId, const string& email) const = 0;
    virtual vector<string> allFacultyIds() const = 0;

    virtual optional<LabEntity> getLab(const string& id) const = 0;
    virtual void putLab(const LabEntity& lab) = 0;
    virtual optional<string> labIdByNormalizedName(const string& normalizedName) const = 0;
    virtual optional<string> labIdByWebsite(const string& url) const = 0;
    virtual vector<string> allLabIds() const = 0;

    virtual optional<UniversityEntity> getUniversity(const string& id) const = 0;
    virtual void putUniversity(const UniversityEntity& university) = 0;
    virtual size_t universityCount() const = 0;

    virtual optional<DepartmentEntity> getDepartment(const string& id) const = 0;
    virtual void putDepartment(const DepartmentEntity& department) = 0;
    virtual size_t departmentCount() const = 0;

    virtual optional<FacultyLabAssociation> getFacultyLabAssociation(const string& id) const = 0;
    virtual void putFacultyLabAssociation(const FacultyLabAssociation& association) = 0;
    virtual bool eraseFacultyLabAssociation(const string& id) = 0;
    virtual vector<FacultyLabAssociation> facultyLabAssociations() const = 0;

    virtual optional<FacultyDepartmentAssociation> getFacultyDepartmentAssociation(const string& id) const = 0;
    virtual void putFacultyDepartmentAssociation(const FacultyDepartmentAssociation& association) = 0;
    virtual vector<FacultyDepartmentAssociation> facultyDepartmentAssociations() const = 0;

    virtual optional<FacultyEnrichmentAssociation> getFacultyEnrichmentAssociation(const string& id) const = 0;
    virtual void putFacultyEnrichmentAssociation(const FacultyEnrichmentAssociation& association) = 0;
    virtual vector<FacultyEnrichmentAssociation> facultyEnrichmentAssociations() const = 0;

    virtual optional<LabDepartmentAssociation> getLabDepartmentAssociation(const string& id) const = 0;
    virtual void putLabDepartmentAssociation(const LabDepartmentAssociation& association) = 0;
    virtual vector<LabDepartmentAssociation> labDepartmentAssociations() const = 0;

    // Disputed associations awaiting manual review, oldest first. Enqueue returns false for an id already queued.
    virtual bool enqueueDispute(const string& associationId) = 0;
    virtual bool dequeueDispute(const string& associationId) = 0;
    virtual vector<string> disputeIds() const = 0;

    virtual optional<LinkEnrichment> getLinkEnrichment(const string& id) const = 0;
    virtual void putLinkEnrichment(const LinkEnrichment& e) = 0;
    virtual optional<ProfileEnrichment> getProfileEnrichment(const string& id) const = 0;
    virtual void putProfileEnrichment(const ProfileEnrichment& e) = 0;
    virtual optional<ResearchEnrichment> getResearchEnrichment(const string& id) const = 0;
    virtual void putResearchEnrichment(const ResearchEnrichment& e) = 0;
    virtual optional<GoogleScholarEnrichment> getScholarEnrichment(const string& id) const = 0;
    virtual void putScholarEnrichment(const GoogleScholarEnrichment& e) = 0;
    // Ids of every row in one enrichment pool.
    virtual vector<string> enrichmentIds(const string& enrichmentType) const = 0;

    virtual void putScrapeSession(const ScrapeSession& session) = 0;
    virtual optional<ScrapeSession> getScrapeSession(const string& id) const = 0;
};

template <typename V>
optional<V> findIn(const map<string, V>& m, const string& key) {
    auto it = m.find(key);
    if (it == m.end()) return nullopt;
    return it->second;
}

template <typename V>
vector<V> valuesOf(const map<string, V>& m) {
    vector<V> out;
    out.reserve(m.size());
    for (const auto& kv : m) out.push_back(kv.second);
    return out;
}

template <typename V>
vector<string> keysOf(const map<string, V>& m) {
    vector<string> out;
    out.reserve(m.size());
    for (const auto& kv : m) out.push_back(kv.first);
    return out;
}

// Process-memory repository with name, email and website indexes.
class InMemoryEntityRepository : public EntityRepository {
public:
    optional<FacultyEntity> getFaculty(const string& id) const override { return findIn(faculty_, id); }

    void putFaculty(const FacultyEntity& f) override {
        auto old = faculty_.find(f.id);
        if (old != faculty_.end()) unindexFaculty(old->second);
        faculty_[f.id] = f;
        facultyByName_[f.normalizedName].insert(f.id);
        if (f.email) facultyByUniversityEmail_[emailKey(f.primaryUniversityId, *f.email)] = f.id;
    }

    vector<string> facultyIdsByNormalizedName(const string& normalizedName) const override {
        auto it = facultyByName_.find(normalizedName);
        if (it == facultyByName_.end()) return {};
        return vector<string>(it->second.begin(), it->second.end());
    }

    optional<string> facultyIdByUniversityEmail(const string& universityId, const string& email) const override {
        return findIn(facultyByUniversityEmail_, emailKey(universityId, email));
    }

    vector<string> allFacultyIds() const override { return keysOf(faculty_); }

    optional<LabEntity> getLab(const string& id) const override { return findIn(labs_, id); }

    void putLab(const LabEntity& l) override {
        auto old = labs_.find(l.id);
        if (old != labs_.end()) {
            labsByName_.erase(old->second.normalizedName);
            if (old->second.websiteUrl) labsByWebsite_.erase(*old->second.websiteUrl);
        }
        labs_[l.id] = l;
        if (!l.normalizedName.empty()) labsByName_[l.normalizedName] = l.id;
        if (l.websiteUrl) labsByWebsite_[*l.websiteUrl] = l.id;
    }

    optional<string> labIdByNormalizedName(const string& normalizedName) const override {
        return findIn(labsByName_, normalizedName);
    }

    optional<string> labIdByWebsite(const string& url) const override { return findIn(labsByWebsite_, url); }

    vector<string> allLabIds() const override { return keysOf(labs_); }

    optional<UniversityEntity> getUniversity(const string& id) const override { return findIn(universities_, id); }
    void putUniversity(const UniversityEntity& u) override { universities_[u.id] = u; }
    size_t universityCount() const override { return universities_.size(); }

    optional<DepartmentEntity> getDepartment(const string& id) const override { return findIn(departments_, id); }
    void putDepartment(const DepartmentEntity& d) override { departments_[d.id] = d; }
    size_t departmentCount() const override { return departments_.size(); }

    optional<FacultyLabAssociation> getFacultyLabAssociation(const string& id) const override { return findIn(facultyLab_, id); }
    void putFacultyLabAssociation(const FacultyLabAssociation& a) override { facultyLab_[a.id] = a; }
    bool eraseFacultyLabAssociation(const string& id) override { return facultyLab_.erase(id) > 0; }
    vector<FacultyLabAssociation> facultyLabAssociations() const override { return valuesOf(facultyLab_); }

    optional<FacultyDepartmentAssociation> getFacultyDepartmentAssociation(const string& id) const override { return findIn(facultyDept_, id); }
    void putFacultyDepartmentAssociation(const FacultyDepartmentAssociation& a) override { facultyDept_[a.id] = a; }
    vector<FacultyDepartmentAssociation> facultyDepartmentAssociations() const override { return valuesOf(facultyDept_); }

    optional<FacultyEnrichmentAssociation> getFacultyEnrichmentAssociation(const string& id) const override { return findIn(facultyEnrichment_, id); }
    void putFacultyEnrichmentAssociation(const FacultyEnrichmentAssociation& a) override { facultyEnrichment_[a.id] = a; }
    vector<FacultyEnrichmentAssociation> facultyEnrichmentAssociations() const override { return valuesOf(facultyEnrichment_); }

    optional<LabDepartmentAssociation> getLabDepartmentAssociation(const string& id) const override { return findIn(labDept_, id); }
    void putLabDepartmentAssociation(const LabDepartmentAssociation& a) override { labDept_[a.id] = a; }
    vector<LabDepartmentAssociation> labDepartmentAssociations() const override { return valuesOf(labDept_); }

    bool enqueueDispute(const string& associationId) override {
        if (find(disputes_.begin(), disputes_.end(), associationId) != disputes_.end()) return false;
        disputes_.push_back(associationId);
        return true;
    }

    bool dequeueDispute(const string& associationId) override {
        auto it = find(disputes_.begin(), disputes_.end(), associationId);
        if (it == disputes_.end()) return false;
        disputes_.erase(it);
        return true;
    }

    vector<string> disputeIds() const override { return vector<string>(disputes_.begin(), disputes_.end()); }

    optional<LinkEnrichment> getLinkEnrichment(const string& id) const override { return findIn(links_, id); }
    void putLinkEnrichment(const LinkEnrichment& e) override { links_[e.meta.id] = e; }
    optional<ProfileEnrichment> getProfileEnrichment(const string& id) const override { return findIn(profiles_, id); }
    void putProfileEnrichment(const ProfileEnrichment& e) override { profiles_[e.meta.id] = e; }
    optional<ResearchEnrichment> getResearchEnrichment(const string& id) const override { return findIn(research_, id); }
    void putResearchEnrichment(const ResearchEnrichment& e) override { research_[e.meta.id] = e; }
    optional<GoogleScholarEnrichment> getScholarEnrichment(const string& id) const override { return findIn(scholar_, id); }
    void putScholarEnrichment(const GoogleScholarEnrichment& e) override { scholar_[e.meta.id] = e; }

    vector<string> enrichmentIds(const string& enrichmentType) const override {
        if (enrichmentType == ENRICHMENT_LINKS) return keysOf(links_);
        if (enrichmentType == ENRICHMENT_PROFILE) return keysOf(profiles_);
        if (enrichmentType == ENRICHMENT_RESEARCH) return keysOf(research_);
        if (enrichmentType == ENRICHMENT_GOOGLE_SCHOLAR) return keysOf(scholar_);
        return {};
    }

    void putScrapeSession(const ScrapeSession& s) override { sessions_[s.id] = s; }
    optional<ScrapeSession> getScrapeSession(const string& id) const override { return findIn(sessions_, id); }

private:
    static string emailKey(const string& universityId, const string& email) {
        return universityId + "|" + toLowerStr(trimStr(email));
    }

    void unindexFaculty(const FacultyEntity& f) {
        auto it = facultyByName_.find(f.normalizedName);
        if (it != facultyByName_.end()) {
            it->second.erase(f.id);
            if (it->second.empty()) facultyByName_.erase(it);
        }
        if (f.email) {
            auto e = facultyByUniversityEmail_.find(emailKey(f.primaryUniversityId, *f.email));
            if (e != facultyByUniversityEmail_.end() && e->second == f.id) facultyByUniversityEmail_.erase(e);
        }
    }

    map<string, FacultyEntity> faculty_;
    map<string, set<string>> facultyByName_;
    map<string, string> facultyByUniversityEmail_;

    map<string, LabEntity> labs_;
    map<string, string> labsByName_;
    map<string, string> labsByWebsite_;

    map<string, UniversityEntity> universities_;
    map<string, DepartmentEntity> departments_;

    map<string, FacultyLabAssociation> facultyLab_;
    map<string, FacultyDepartmentAssociation> facultyDept_;
    map<string, FacultyEnrichmentAssociation> facultyEnrichment_;
    map<string, LabDepartmentAssociation> labDept_;

    map<string, LinkEnrichment> links_;
    map<string, ProfileEnrichment> profiles_;
    map<string, ResearchEnrichment> research_;
    map<string, GoogleScholarEnrichment> scholar_;

    map<string, ScrapeSession> sessions_;
    deque<string> disputes_;
};
