#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

#include "string_utils.h"

using namespace std;
using json = nlohmann::json;

// One person as seen on one page. Not identity-bearing; consumed once by the entity store.
struct RawFacultyRecord {
    string name;
    optional<string> title;
    optional<string> email;
    optional<string> phone;
    optional<string> office;
    optional<string> department;
    optional<string> university;
    optional<string> profileUrl;
    optional<string> personalWebsite;
    optional<string> sourceUrl;
    string extractionMethod = "adaptive";
    optional<double> confidence;

    // Lab signals
    optional<string> labName;
    optional<string> labWebsite;
    optional<string> labDiscoveryMethod;
    double labDiscoveryConfidence = 0.0;

    // Enrichment payloads, stored apart from the entity
    optional<string> googleScholarUrl;
    optional<json> scholarData;
    optional<string> bio;
    vector<string> researchInterests;
    optional<string> officeHours;
    vector<json> links;
    optional<json> researchData;
};

inline json optionalJson(const optional<string>& v) {
    return v ? json(*v) : json(nullptr);
}

inline json toJson(const RawFacultyRecord& r) {
    json j;
    j["name"] = r.name;
    j["title"] = optionalJson(r.title);
    j["email"] = optionalJson(r.email);
    j["phone"] = optionalJson(r.phone);
    j["office"] = optionalJson(r.office);
    j["department"] = optionalJson(r.department);
    j["university"] = optionalJson(r.university);
    j["profile_url"] = optionalJson(r.profileUrl);
    j["personal_website"] = optionalJson(r.personalWebsite);
    j["source_url"] = optionalJson(r.sourceUrl);
    j["extraction_method"] = r.extractionMethod;
    j["confidence_score"] = r.confidence ? json(*r.confidence) : json(nullptr);
    j["lab_name"] = optionalJson(r.labName);
    j["lab_website"] = optionalJson(r.labWebsite);
    j["lab_discovery_method"] = optionalJson(r.labDiscoveryMethod);
    j["lab_discovery_confidence"] = r.labDiscoveryConfidence;
    if (r.googleScholarUrl) j["google_scholar_url"] = *r.googleScholarUrl;
    if (r.scholarData) j["scholar_data"] = *r.scholarData;
    if (r.bio) j["bio"] = *r.bio;
    if (!r.researchInterests.empty()) j["research_interests"] = r.researchInterests;
    if (r.officeHours) j["office_hours"] = *r.officeHours;
    if (!r.links.empty()) j["links"] = r.links;
    if (r.researchData) j["research_data"] = *r.researchData;
    return j;
}

// Field aliases in priority order. The first non-empty alias wins.
static const vector<string> NAME_ALIASES = { "name", "full_name", "faculty_name" };
static const vector<string> TITLE_ALIASES = { "title", "position", "rank" };
static const vector<string> EMAIL_ALIASES = { "email", "email_address", "contact_email" };
static const vector<string> PHONE_ALIASES = { "phone", "phone_number", "telephone" };
static const vector<string> OFFICE_ALIASES = { "office_location", "office", "location" };
static const vector<string> DEPARTMENT_ALIASES = { "department", "department_name", "dept" };
static const vector<string> UNIVERSITY_ALIASES = { "university", "university_name", "institution" };
static const vector<string> PROFILE_URL_ALIASES = { "profile_url", "profile", "url" };
static const vector<string> PERSONAL_SITE_ALIASES = { "personal_website", "website", "homepage" };
static const vector<string> SOURCE_URL_ALIASES = { "source_url", "page_url" };
static const vector<string> LAB_NAME_ALIASES = { "lab_name", "lab", "research_group" };
static const vector<string> LAB_WEBSITE_ALIASES = { "lab_website", "lab_url", "lab_urls" };
static const vector<string> SCHOLAR_URL_ALIASES = { "google_scholar_url", "scholar_url" };
static const vector<string> BIO_ALIASES = { "bio", "biography", "full_biography" };
static const vector<string> INTEREST_ALIASES = { "research_interests", "research_areas", "interests" };
static const vector<string> LINK_ALIASES = { "additional_links", "links", "related_links" };
static const vector<string> RESEARCH_ALIASES = { "research_data", "publications" };

// String value of the first alias that holds one. Arrays yield their first string element.
inline optional<string> firstStringAlias(const json& j, const vector<string>& aliases) {
    for (const auto& key : aliases) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (it->is_string()) {
            string v = trimStr(it->get<string>());
            if (!v.empty()) return v;
        }
        else if (it->is_array()) {
            for (const auto& e : *it) {
                if (e.is_string() && !trimStr(e.get<string>()).empty()) return trimStr(e.get<string>());
            }
        }
    }
    return nullopt;
}

inline vector<string> stringListAlias(const json& j, const vector<string>& aliases) {
    vector<string> out;
    for (const auto& key : aliases) {
        auto it = j.find(key);
        if (it == j.end()) continue;
        if (it->is_array()) {
            for (const auto& e : *it) {
                if (e.is_string() && !e.get<string>().empty()) out.push_back(e.get<string>());
            }
        }
        else if (it->is_string()) {
            for (const auto& part : splitOn(it->get<string>(), ',')) {
                string t = trimStr(part);
                if (!t.empty()) out.push_back(t);
            }
        }
        if (!out.empty()) break;
    }
    return out;
}

// Loosely shaped JSON (legacy exports, hand-written fixtures) to an explicit record.
// Returns nullopt when no name can be found.
inline optional<RawFacultyRecord> rawFacultyRecordFromJson(const json& j) {
    if (!j.is_object()) return nullopt;
    optional<string> name = firstStringAlias(j, NAME_ALIASES);
    if (!name) return nullopt;
    RawFacultyRecord r;
    r.name = *name;
    r.title = firstStringAlias(j, TITLE_ALIASES);
    r.email = firstStringAlias(j, EMAIL_ALIASES);
    r.phone = firstStringAlias(j, PHONE_ALIASES);
    r.office = firstStringAlias(j, OFFICE_ALIASES);
    r.department = firstStringAlias(j, DEPARTMENT_ALIASES);
    r.university = firstStringAlias(j, UNIVERSITY_ALIASES);
    r.profileUrl = firstStringAlias(j, PROFILE_URL_ALIASES);
    r.personalWebsite = firstStringAlias(j, PERSONAL_SITE_ALIASES);
    r.sourceUrl = firstStringAlias(j, SOURCE_URL_ALIASES);
    optional<string> method = firstStringAlias(j, { "extraction_method" });
    if (method) r.extractionMethod = *method;
    auto conf = j.find("confidence_score");
    if (conf != j.end() && conf->is_number()) r.confidence = conf->get<double>();
    r.labName = firstStringAlias(j, LAB_NAME_ALIASES);
    r.labWebsite = firstStringAlias(j, LAB_WEBSITE_ALIASES);
    r.labDiscoveryMethod = firstStringAlias(j, { "lab_discovery_method" });
    auto labConf = j.find("lab_discovery_confidence");
    if (labConf != j.end() && labConf->is_number()) r.labDiscoveryConfidence = labConf->get<double>();
    r.googleScholarUrl = firstStringAlias(j, SCHOLAR_URL_ALIASES);
    auto scholar = j.find("scholar_data");
    if (scholar != j.end() && scholar->is_object()) r.scholarData = *scholar;
    r.bio = firstStringAlias(j, BIO_ALIASES);
    r.researchInterests = stringListAlias(j, INTEREST_ALIASES);
    r.officeHours = firstStringAlias(j, { "office_hours" });
    for (const auto& key : LINK_ALIASES) {
        auto it = j.find(key);
        if (it != j.end() && it->is_array() && !it->empty()) {
            for (const auto& e : *it) r.links.push_back(e);
            break;
        }
    }
    for (const auto& key : RESEARCH_ALIASES) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) continue;
        if (it->is_object()) r.researchData = *it;
        else if (it->is_array() && !it->empty()) r.researchData = json{ { "publications", *it } };
        if (r.researchData) break;
    }
    return r;
}
