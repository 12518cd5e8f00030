#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <algorithm>
#include <exception>

#include "config.h"
#include "collaborators.h"
#include "confidence.h"
#include "html_parser.h"
#include "http_utils.h"
#include "log_utils.h"
#include "page_analysis.h"
#include "string_utils.h"
#include "university_pattern.h"
#include "url_utils.h"
#include "worker_pool.h"

using namespace std;

static const vector<string> DEPARTMENT_SKIP_TERMS = {
    "home", "contact", "about", "news", "events", "search", "login", "logout",
    "privacy", "terms", "copyright", "sitemap", "help", "support",
    "celebrates", "announces", "welcomes", "congratulates",
    "linkedin", "facebook", "twitter", "instagram",
    "click here", "read more", "learn more", "find out",
    "alumni", "admissions", "tuition", "financial aid",
    "parking", "dining", "housing", "campus map",
    "http://", "https://", "www.", "@"
};

static const vector<string> ACADEMIC_TERMS = {
    "department", "dept", "school", "college", "division", "program",
    "center", "institute", "faculty", "studies", "science", "arts",
    "psychology", "biology", "chemistry", "physics", "mathematics",
    "engineering", "business", "medicine", "law", "education"
};

static const vector<string> SUBDOMAIN_PROBE_PATHS = {
    "faculty/", "people/", "directory/", "staff/", "our-people/", "faculty-directory/"
};

// A subdomain page must mention at least this many distinct indicator words.
static const size_t MIN_SUBDOMAIN_INDICATOR_HITS = 2;

static const double CACHED_PATH_CONFIDENCE = 0.9;
static const double SUBDOMAIN_DEPARTMENT_CONFIDENCE = 0.8;
static const double LINKED_DEPARTMENT_CONFIDENCE = 0.5;
static const double HEADING_DEPARTMENT_CONFIDENCE = 0.6;
static const double PAGE_TITLE_DEPARTMENT_CONFIDENCE = 0.4;
static const double ASSISTANT_DEPARTMENT_FACTOR = 0.9;

// CMU: departments on the main site, in Dietrich College, and on their own subdomains.
static const map<string, string> CMU_MAIN_SITE_DEPARTMENTS = {
    { "philosophy", "philosophy" },
    { "history", "history" },
    { "english", "english" },
    { "modern languages", "modlang" },
    { "social and decision sciences", "sds" },
    { "statistics", "statistics" }
};

static const map<string, string> CMU_DIETRICH_DEPARTMENTS = {
    { "psychology", "psychology" },
    { "biological sciences", "biological-sciences" },
    { "chemistry", "chemistry" },
    { "economics", "economics" },
    { "mathematical sciences", "mathematical-sciences" },
    { "physics", "physics" },
    { "statistics", "statistics-datascience" }
};

static const map<string, string> CMU_SUBDOMAIN_DEPARTMENTS = {
    { "computer science", "cs.cmu.edu" },
    { "human-computer interaction", "hcii.cmu.edu" },
    { "robotics", "ri.cmu.edu" },
    { "machine learning", "ml.cmu.edu" },
    { "electrical and computer engineering", "ece.cmu.edu" },
    { "mechanical engineering", "meche.cmu.edu" },
    { "chemical engineering", "cheme.cmu.edu" },
    { "materials science", "mse.cmu.edu" },
    { "biomedical engineering", "bme.cmu.edu" },
    { "civil engineering", "cee.cmu.edu" },
    { "public policy", "heinz.cmu.edu" },
    { "business", "tepper.cmu.edu" },
    { "architecture", "soa.cmu.edu" },
    { "fine arts", "art.cmu.edu" },
    { "drama", "drama.cmu.edu" },
    { "music", "music.cmu.edu" }
};

static const vector<string> CMU_MAIN_SITE_FACULTY_PATHS = { "people/faculty.html", "people/", "faculty/", "faculty.html", "directory/" };
static const vector<string> CMU_DIETRICH_FACULTY_PATHS = { "people/faculty/", "people/", "faculty/", "faculty.html", "directory/" };
static const vector<string> CMU_SUBDOMAIN_FACULTY_PATHS = { "faculty/", "people/", "directory/", "people/faculty/", "faculty-directory/" };

static const string STANFORD_ACADEMIC_LIST_URL = "https://www.stanford.edu/list/academic/";

// Rejects link text that is navigation, news, social or service chrome.
inline bool isValidDepartmentName(const string& name) {
    if (name.size() < 3 || name.size() > 150) return false;
    string low = toLowerStr(name);
    for (const auto& term : DEPARTMENT_SKIP_TERMS) {
        if (low.find(term) != string::npos) return false;
    }
    if (name.size() < 20 && countKeywordHits(low, ACADEMIC_TERMS) == 0) return false;
    return true;
}

inline bool departmentNameMatches(const string& candidate, const string& target) {
    if (target.empty()) return true;
    string c = toLowerStr(candidate);
    string t = toLowerStr(target);
    return c.find(t) != string::npos || t.find(c) != string::npos;
}

// Turns a university pattern into department pages worth extracting, best first.
class DepartmentResolver {
public:
    DepartmentResolver(HttpClient& http, DiscoveryAssistant* assistant = nullptr, size_t workers = DEFAULT_WORKER_COUNT)
        : http_(http), assistant_(assistant), workers_(max<size_t>(1, workers)) {}

    // Never throws. An empty result means no department could be located.
    vector<DepartmentInfo> resolve(const UniversityPattern& pattern, const string& targetDepartment = string()) {
        vector<DepartmentInfo> departments;
        try {
            departments = collect(pattern, trimStr(targetDepartment));
        }
        catch (const std::exception& e) {
            logWarn("DepartmentResolver", "resolution failed for " + pattern.universityName + ": " + e.what());
        }
        vector<DepartmentInfo> unique;
        set<string> seen;
        for (auto& d : departments) {
            if (seen.insert(d.url).second) unique.push_back(std::move(d));
        }
        vector<DepartmentInfo> sorted = scoreAndSort(unique, targetDepartment);
        logInfo("Discovered " + to_string(sorted.size()) + " department candidates for " + pattern.universityName);
        return sorted;
    }

    vector<DepartmentInfo> departmentsFromDirectoryPage(const string& html, const string& pageUrl,
                                                        const string& targetDepartment) const {
        vector<DepartmentInfo> departments;
        HtmlDocument doc(html);
        if (!doc.valid()) return departments;
        set<string> seenNames;

        for (const auto& link : collectLinks(doc.root())) {
            if (!isDepartmentLink(link)) continue;
            optional<DepartmentInfo> info = departmentFromLink(link, pageUrl);
            if (!info || seenNames.count(info->name)) continue;
            if (!isValidDepartmentName(info->name)) continue;
            if (!targetDepartment.empty() && toLowerStr(info->name).find(toLowerStr(targetDepartment)) == string::npos) continue;
            seenNames.insert(info->name);
            departments.push_back(*info);
        }

        // Headings that introduce a faculty list further down the page.
        for (DomNode heading : elementsByTag(doc.root(), { "h1", "h2", "h3", "h4" })) {
            string name = nodeText(heading);
            string low = toLowerStr(name);
            if (low.find("department") == string::npos && low.find("school") == string::npos && low.find("college") == string::npos) continue;
            DomNode next = heading->next;
            while (next && !isElement(next)) next = next->next;
            if (!next || !containsFacultyIndicators(nodeText(next))) continue;
            if (seenNames.count(name) || !isValidDepartmentName(name)) continue;
            if (!targetDepartment.empty() && low.find(toLowerStr(targetDepartment)) == string::npos) continue;
            DepartmentInfo d;
            d.name = name;
            d.url = pageUrl;
            d.estimatedFacultyCount = estimateFacultyCount(next);
            d.structureType = detectStructureType(next);
            d.confidence = HEADING_DEPARTMENT_CONFIDENCE;
            seenNames.insert(name);
            departments.push_back(d);
        }

        if (departments.empty() && containsFacultyIndicators(nodeText(doc.root()))) {
            vector<DomNode> titles = elementsByTag(doc.root(), { "title" });
            string name = titles.empty() ? string("Faculty") : nodeText(titles.front());
            if (isValidDepartmentName(name)) {
                DepartmentInfo d;
                d.name = name;
                d.url = pageUrl;
                d.estimatedFacultyCount = estimateFacultyCount(doc.root());
                d.structureType = detectStructureType(doc.root());
                d.confidence = PAGE_TITLE_DEPARTMENT_CONFIDENCE;
                departments.push_back(d);
            }
        }
        return departments;
    }

private:
    vector<DepartmentInfo> collect(const UniversityPattern& pattern, const string& target) {
        vector<DepartmentInfo> departments;
        if (!target.empty() && !pattern.departments.empty()) {
            departments = fromCachedDepartmentPaths(pattern, target);
        }

        if (departments.empty()) {
            string uni = toLowerStr(pattern.universityName);
            if (uni.find("stanford") != string::npos) {
                departments = stanfordDepartments(pattern, target);
            }
            else if (uni.find("carnegie mellon") != string::npos || uni.find("cmu") != string::npos) {
                departments = cmuDepartments(pattern, target);
            }
        }

        if (departments.empty()) {
            vector<string> pageUrls;
            for (const auto& path : pattern.facultyDirectoryPaths) {
                pageUrls.push_back(resolveAgainstBase(pattern.baseUrl, path));
            }
            vector<vector<DepartmentInfo>> perPage = parallelMap<string, vector<DepartmentInfo>>(pageUrls, workers_,
                [this, &target](const string& url) -> vector<DepartmentInfo> {
                    HttpResponse r = http_.get(url);
                    if (r.status != 200) return {};
                    return departmentsFromDirectoryPage(r.body, url, target);
                });
            for (auto& list : perPage) {
                departments.insert(departments.end(), list.begin(), list.end());
            }
        }

        if (!pattern.departmentSubdomains.empty()) {
            vector<DepartmentInfo> sub = subdomainDepartments(pattern, target);
            departments.insert(departments.end(), sub.begin(), sub.end());
        }

        if (departments.empty() && !target.empty() && assistant_) {
            logInfo("Traditional methods found no departments, asking the assistant for " + target);
            departments = assistantDepartments(pattern, target);
        }
        return departments;
    }

    // Fetches url and builds a department entry if the page looks like a faculty listing.
    optional<DepartmentInfo> probeFacultyPage(const string& name, const string& url, double confidence,
                                              size_t minIndicatorHits = 1) {
        HttpResponse r = http_.get(url);
        if (r.status != 200) return nullopt;
        PageSummary summary = summarizePage(r.body);
        if (!summary.parsed || summary.indicatorHits < minIndicatorHits) return nullopt;
        DepartmentInfo d;
        d.name = name;
        d.url = url;
        d.estimatedFacultyCount = summary.estimatedFacultyCount;
        d.structureType = summary.structureType;
        d.confidence = clampConfidence(confidence);
        return d;
    }

    optional<DepartmentInfo> firstFacultyPage(const string& name, const string& base, const vector<string>& paths,
                                              double confidence, size_t minIndicatorHits = 1) {
        for (const auto& path : paths) {
            optional<DepartmentInfo> found = probeFacultyPage(name, urlJoin(ensureTrailingSlash(base), path), confidence, minIndicatorHits);
            if (found) return found;
        }
        return nullopt;
    }

    vector<DepartmentInfo> fromCachedDepartmentPaths(const UniversityPattern& pattern, const string& target) {
        vector<DepartmentInfo> departments;
        for (const auto& kv : pattern.departments) {
            if (!departmentNameMatches(kv.first, target)) continue;
            for (const auto& path : kv.second) {
                optional<DepartmentInfo> found = probeFacultyPage(titleCaseWords(kv.first),
                    resolveAgainstBase(pattern.baseUrl, path), CACHED_PATH_CONFIDENCE);
                if (found) {
                    logInfo("Found " + kv.first + " department at " + found->url);
                    departments.push_back(*found);
                    break;
                }
            }
        }
        return departments;
    }

    vector<DepartmentInfo> subdomainDepartments(const UniversityPattern& pattern, const string& target) {
        vector<pair<string, string>> candidates;
        for (const auto& kv : pattern.departmentSubdomains) {
            if (!target.empty() && toLowerStr(kv.first).find(toLowerStr(target)) == string::npos) continue;
            candidates.push_back(kv);
        }
        vector<optional<DepartmentInfo>> found = parallelMap<pair<string, string>, optional<DepartmentInfo>>(candidates, workers_,
            [this](const pair<string, string>& c) -> optional<DepartmentInfo> {
                optional<DepartmentInfo> d = firstFacultyPage(c.first, c.second, SUBDOMAIN_PROBE_PATHS,
                    SUBDOMAIN_DEPARTMENT_CONFIDENCE, MIN_SUBDOMAIN_INDICATOR_HITS);
                if (d) {
                    d->isSubdomain = true;
                    d->subdomainBaseUrl = c.second;
                }
                return d;
            });
        vector<DepartmentInfo> departments;
        for (auto& d : found) {
            if (d) departments.push_back(*d);
        }
        return departments;
    }

    vector<DepartmentInfo> cmuDepartments(const UniversityPattern& pattern, const string& target) {
        struct Probe {
            string name;
            string base;
            const vector<string>* paths;
            double confidence;
            bool subdomain;
        };
        string targetLower = toLowerStr(target);
        vector<Probe> probes;
        string base = stripTrailingSlash(pattern.baseUrl);
        for (const auto& kv : CMU_MAIN_SITE_DEPARTMENTS) {
            if (!targetLower.empty() && kv.first.find(targetLower) == string::npos) continue;
            probes.push_back(Probe{ kv.first, base + "/" + kv.second + "/", &CMU_MAIN_SITE_FACULTY_PATHS, 0.85, false });
        }
        for (const auto& kv : CMU_DIETRICH_DEPARTMENTS) {
            if (!targetLower.empty() && kv.first.find(targetLower) == string::npos) continue;
            probes.push_back(Probe{ kv.first, base + "/dietrich/" + kv.second + "/", &CMU_DIETRICH_FACULTY_PATHS, 0.85, false });
        }
        for (const auto& kv : CMU_SUBDOMAIN_DEPARTMENTS) {
            if (!targetLower.empty() && kv.first.find(targetLower) == string::npos) continue;
            probes.push_back(Probe{ kv.first, "https://" + kv.second, &CMU_SUBDOMAIN_FACULTY_PATHS, 0.9, true });
        }

        vector<optional<DepartmentInfo>> found = parallelMap<Probe, optional<DepartmentInfo>>(probes, workers_,
            [this](const Probe& p) -> optional<DepartmentInfo> {
                optional<DepartmentInfo> d = firstFacultyPage(titleCaseWords(p.name), p.base, *p.paths, p.confidence);
                if (d && p.subdomain) {
                    d->isSubdomain = true;
                    d->subdomainBaseUrl = p.base;
                }
                return d;
            });
        vector<DepartmentInfo> departments;
        for (auto& d : found) {
            if (!d) continue;
            logInfo("Found CMU department: " + d->name + " -> " + d->url);
            departments.push_back(*d);
        }
        return departments;
    }

    vector<DepartmentInfo> stanfordDepartments(const UniversityPattern& pattern, const string& target) {
        vector<DepartmentInfo> departments;
        string targetLower = toLowerStr(target);
        HttpResponse list = http_.get(STANFORD_ACADEMIC_LIST_URL);
        if (list.status == 200) {
            HtmlDocument doc(list.body);
            for (const auto& link : collectLinks(doc.root())) {
                string text = trimStr(link.text);
                string low = toLowerStr(text);
                if (text.size() <= 3 || text.size() >= 100) continue;
                if (low.find("department") == string::npos && low.find("school") == string::npos &&
                    low.find("program") == string::npos && low.find("studies") == string::npos) continue;
                if (!isValidDepartmentName(text)) continue;
                if (!targetLower.empty() && low.find(targetLower) == string::npos) continue;
                string url;
                if (startsWith(link.href, "/")) url = urlJoin(pattern.baseUrl, link.href);
                else if (isHttpUrl(link.href)) url = link.href;
                else continue;
                if (url.find("stanford.edu") != string::npos && url.find("/people/") == string::npos && url.find("/faculty") == string::npos) {
                    string facultyUrl = stripTrailingSlash(url) + "/people/faculty";
                    long status = http_.head(facultyUrl).status;
                    if (status == 200 || status == 301 || status == 302) url = facultyUrl;
                }
                DepartmentInfo d;
                d.name = text;
                d.url = url;
                d.confidence = 0.8;
                departments.push_back(d);
            }
        }

        if (!target.empty() && departments.empty()) {
            string slug = targetLower;
            vector<string> guesses = {
                "https://" + slug + ".stanford.edu/people/faculty",
                "https://" + slug + ".stanford.edu/faculty",
                "https://" + slug + ".stanford.edu/people",
                "https://www.stanford.edu/dept/" + slug + "/faculty"
            };
            for (const auto& url : guesses) {
                if (http_.head(url).status != 200) continue;
                DepartmentInfo d;
                d.name = titleCaseWords(target) + " Department";
                d.url = url;
                d.confidence = 0.6;
                departments.push_back(d);
                break;
            }
        }
        return departments;
    }

    vector<DepartmentInfo> assistantDepartments(const UniversityPattern& pattern, const string& target) {
        vector<DepartmentInfo> departments;
        optional<DiscoveryAssistantResult> result = assistant_->discoverFacultyDirectories(pattern.universityName, pattern.baseUrl, target);
        if (!result || result->departmentPaths.empty()) {
            logWarn("DepartmentResolver", "assistant could not find " + target);
            return departments;
        }
        double confidence = clampConfidence(result->confidence) * ASSISTANT_DEPARTMENT_FACTOR;
        for (const auto& kv : result->departmentPaths) {
            if (!departmentNameMatches(kv.first, target)) continue;
            for (const auto& path : kv.second) {
                optional<DepartmentInfo> found = probeFacultyPage(kv.first, resolveAgainstBase(pattern.baseUrl, path), confidence);
                if (found) {
                    logInfo("Assistant located " + kv.first + " at " + found->url);
                    departments.push_back(*found);
                    break;
                }
            }
        }
        return departments;
    }

    static bool isDepartmentLink(const PageLink& link) {
        string href = toLowerStr(link.href);
        if (href.find("department") != string::npos || href.find("dept") != string::npos) return true;
        if ((href.find("school") != string::npos || href.find("college") != string::npos) && href.find("of") != string::npos) return true;
        return hasAncestorClass(link.node, { "department", "dept" });
    }

    static optional<DepartmentInfo> departmentFromLink(const PageLink& link, const string& pageUrl) {
        string href = link.href;
        string low = toLowerStr(href);
        if (isHttpUrl(href) && low.find(".edu") == string::npos && low.find(".ac.") == string::npos) return nullopt;
        if (startsWith(low, "mailto:") || startsWith(low, "tel:") || startsWith(low, "javascript:") || startsWith(low, "#")) return nullopt;
        string name = trimStr(link.text);
        if (name.empty()) return nullopt;
        if (count(name.begin(), name.end(), '.') > 3 || name.find('?') != string::npos || name.find('!') != string::npos) return nullopt;
        if (name.find('@') != string::npos || startsWith(name, "http://") || startsWith(name, "https://") || startsWith(name, "www.")) return nullopt;
        DepartmentInfo d;
        d.name = name;
        d.url = urlJoin(pageUrl, href);
        d.confidence = LINKED_DEPARTMENT_CONFIDENCE;
        return d;
    }

    vector<DepartmentInfo> scoreAndSort(const vector<DepartmentInfo>& departments, const string& target) const {
        vector<pair<double, DepartmentInfo>> scored;
        ScoreQuery query = directoryScoreQuery(target);
        for (const auto& d : departments) {
            double score = d.confidence + scoreCandidate(ScoreCandidate{ d.url, d.name, string() }, query);
            score *= directoryUrlWeight(d.url);
            scored.push_back(make_pair(score, d));
        }
        stable_sort(scored.begin(), scored.end(),
            [](const pair<double, DepartmentInfo>& a, const pair<double, DepartmentInfo>& b) { return a.first > b.first; });
        vector<DepartmentInfo> out;
        for (size_t i = 0; i < scored.size(); ++i) {
            if (i < 3) logInfo("  candidate " + scored[i].second.url + " score " + to_string(scored[i].first));
            out.push_back(scored[i].second);
        }
        return out;
    }

    HttpClient& http_;
    DiscoveryAssistant* assistant_;
    size_t workers_;
};
