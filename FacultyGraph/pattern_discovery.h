#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <functional>
#include <algorithm>
#include <exception>

#include "config.h"
#include "collaborators.h"
#include "html_parser.h"
#include "http_utils.h"
#include "log_utils.h"
#include "page_analysis.h"
#include "pattern_cache.h"
#include "string_utils.h"
#include "time_utils.h"
#include "university_pattern.h"
#include "url_utils.h"
#include "worker_pool.h"

using namespace std;

static const vector<string> FACULTY_DIRECTORY_PATTERNS = {
    "faculty", "people", "staff", "directory", "our-people", "team", "members", "professors", "researchers"
};

static const vector<string> DEPARTMENT_PATTERNS = {
    "department", "dept", "school", "college", "division", "program", "center", "institute"
};

static const vector<string> COMMON_DEPARTMENT_SUBDOMAINS = {
    "{dept}.{domain}", "{dept}-dept.{domain}", "{dept}department.{domain}",
    "www-{dept}.{domain}", "{dept}.www.{domain}", "dept-{dept}.{domain}"
};

static const vector<string> SUBDOMAIN_DEPT_ABBREVIATIONS = {
    "psychology", "psych", "cs", "math", "physics", "chemistry", "bio",
    "english", "history", "econ", "philosophy", "sociology", "stats"
};

static const vector<string> SITEMAP_LOCATIONS = {
    "/sitemap.xml", "/sitemap_index.xml", "/sitemaps/sitemap.xml", "/sitemap/sitemap.xml"
};

static const vector<string> COMMON_FACULTY_PATHS = {
    "faculty", "people", "directory", "academics/faculty", "about/faculty",
    "our-faculty", "faculty-staff", "faculty-directory"
};

static const vector<string> SUBDOMAIN_FACULTY_PATHS = { "faculty/", "people/", "directory/" };

static const vector<string> NAVIGATION_TERMS = { "faculty", "people", "staff", "directory", "academics" };

static const vector<string> DEFAULT_PAGINATION_PATTERNS = { "page=", "/page/", "pager", "pagination" };

static const vector<string> FALLBACK_DIRECTORY_PATHS = { "faculty", "people", "directory" };

static const map<string, string> KNOWN_UNIVERSITY_URLS = {
    { "carnegie mellon university", "https://www.cmu.edu" },
    { "cmu", "https://www.cmu.edu" },
    { "stanford university", "https://www.stanford.edu" },
    { "stanford", "https://www.stanford.edu" },
    { "massachusetts institute of technology", "https://www.mit.edu" },
    { "mit", "https://www.mit.edu" },
    { "harvard university", "https://www.harvard.edu" },
    { "harvard", "https://www.harvard.edu" },
    { "university of california berkeley", "https://www.berkeley.edu" },
    { "university of california, berkeley", "https://www.berkeley.edu" },
    { "uc berkeley", "https://www.berkeley.edu" },
    { "university of arizona", "https://www.arizona.edu" },
    { "university of vermont", "https://www.uvm.edu" },
    { "princeton university", "https://www.princeton.edu" },
    { "princeton", "https://www.princeton.edu" },
    { "yale university", "https://www.yale.edu" },
    { "yale", "https://www.yale.edu" },
    { "columbia university", "https://www.columbia.edu" },
    { "columbia", "https://www.columbia.edu" }
};

static const double SITEMAP_CONFIDENCE = 0.85;
static const double SUBDOMAIN_ENUMERATION_CONFIDENCE = 0.75;
static const double NAVIGATION_CONFIDENCE = 0.7;
static const double COMMON_PATHS_CONFIDENCE = 0.6;
static const double ASSISTANT_MAX_CONFIDENCE = 0.75;

inline bool matchesFacultyPattern(const string& url) {
    string low = toLowerStr(url);
    for (const auto& p : FACULTY_DIRECTORY_PATTERNS) {
        if (low.find(p) != string::npos) return true;
    }
    return false;
}

inline string squashName(const string& s, bool keepHyphens) {
    string out;
    for (unsigned char c : s) {
        if (isalnum(c)) out.push_back((char)c);
        else if (c == ' ') out += keepHyphens ? "-" : "";
        else if (c == '-' && keepHyphens) out.push_back('-');
    }
    return out;
}

// Host names worth probing for a university, most specific first, no duplicates.
inline vector<string> domainGuessCandidates(const string& universityName) {
    string base = toLowerStr(collapseWhitespace(trimStr(universityName)));
    vector<string> patterns;
    if (startsWith(base, "university of ")) {
        string state = squashName(base.substr(14), false);
        patterns.push_back("www." + state + ".edu");
        patterns.push_back(state + ".edu");
        patterns.push_back("www.u" + state + ".edu");
    }
    if (endsWith(base, " university")) {
        string part = squashName(base.substr(0, base.size() - 11), false);
        patterns.push_back("www." + part + ".edu");
        patterns.push_back(part + ".edu");
        patterns.push_back(part + "u.edu");
    }
    if (endsWith(base, " college")) {
        string part = squashName(base.substr(0, base.size() - 8), false);
        patterns.push_back("www." + part + ".edu");
        patterns.push_back(part + ".edu");
        patterns.push_back(part + "college.edu");
    }
    string generic = replaceAllStr(replaceAllStr(base, " university", ""), " college", "");
    string clean = squashName(generic, false);
    string hyphen = squashName(generic, true);
    patterns.push_back("www." + clean + ".edu");
    patterns.push_back(clean + ".edu");
    patterns.push_back("www." + hyphen + ".edu");
    patterns.push_back(hyphen + ".edu");

    vector<string> unique;
    set<string> seen;
    for (const auto& p : patterns) {
        if (p.size() <= 4 || startsWith(p, ".") || p.find("..") != string::npos) continue;
        if (seen.insert(p).second) unique.push_back(p);
    }
    return unique;
}

inline bool isSitemapIndex(const string& xml) {
    return toLowerStr(xml).find("<sitemapindex") != string::npos;
}

// <loc> values in document order; tolerant of malformed XML.
inline vector<string> extractSitemapLocs(const string& xml) {
    vector<string> locs;
    string low = toLowerStr(xml);
    size_t pos = 0;
    while (true) {
        size_t open = low.find("<loc>", pos);
        if (open == string::npos) break;
        size_t start = open + 5;
        size_t close = low.find("</loc>", start);
        if (close == string::npos) break;
        string loc = trimStr(xml.substr(start, close - start));
        if (startsWith(loc, "<![CDATA[") && endsWith(loc, "]]>")) loc = loc.substr(9, loc.size() - 12);
        loc = replaceAllStr(loc, "&amp;", "&");
        if (!loc.empty()) locs.push_back(loc);
        pos = close + 6;
    }
    return locs;
}

// Department name taken from a subdomain host: "cognitive-science.x.edu" -> "Cognitive Science".
inline string departmentNameFromHost(const string& host) {
    vector<string> labels = splitOn(hostWithoutWww(host), '.');
    if (labels.size() <= 2) return string();
    return titleCaseWords(labels.front());
}

struct DiscoveryContext {
    string universityName;
    string baseUrl;
};

typedef function<optional<UniversityPattern>(const DiscoveryContext&)> DiscoveryStrategy;

// Guesses a university's URL layout through an ordered cascade of strategies.
class PatternDiscoveryEngine {
public:
    PatternDiscoveryEngine(HttpClient& http, PatternCache* cache = nullptr, DiscoveryAssistant* assistant = nullptr,
                           size_t workers = DEFAULT_WORKER_COUNT, ClockFn clock = systemClock())
        : http_(http), cache_(cache), assistant_(assistant), workers_(max<size_t>(1, workers)), clock_(std::move(clock)) {}

    // Never throws. Confidence is always within [0,1].
    UniversityPattern discover(const string& universityName, const string& baseUrl = string()) {
        try {
            return runCascade(universityName, baseUrl);
        }
        catch (const std::exception& e) {
            logWarn("Discovery", "cascade aborted for " + universityName + ": " + e.what());
            return fallbackPattern(DiscoveryContext{ universityName, stripTrailingSlash(baseUrl) });
        }
    }

    string resolveBaseUrl(const string& universityName) {
        string known = knownUniversityUrl(universityName);
        if (!known.empty()) {
            logInfo("Found " + universityName + " in known URLs: " + known);
            return known;
        }
        return guessUniversityUrl(universityName);
    }

    static string knownUniversityUrl(const string& universityName) {
        auto it = KNOWN_UNIVERSITY_URLS.find(toLowerStr(collapseWhitespace(trimStr(universityName))));
        return it == KNOWN_UNIVERSITY_URLS.end() ? string() : it->second;
    }

    // HEAD-probes templated host names; first candidate (in template order) answering 200 wins.
    string guessUniversityUrl(const string& universityName) {
        vector<string> candidates = domainGuessCandidates(universityName);
        vector<string> found = parallelMap<string, string>(candidates, workers_, [this](const string& host) -> string {
            HttpResponse r = http_.head("https://" + host);
            if (r.status != 200) return string();
            return stripTrailingSlash(r.finalUrl.empty() ? "https://" + host : r.finalUrl);
        });
        for (const auto& url : found) {
            if (!url.empty()) {
                logInfo("Discovered URL for " + universityName + ": " + url);
                return url;
            }
        }
        logWarn("Discovery", "no base URL found for " + universityName);
        return string();
    }

    optional<UniversityPattern> discoverViaSitemap(const DiscoveryContext& ctx) {
        string origin = urlOrigin(ctx.baseUrl);
        string baseHost = hostWithoutWww(urlHost(ctx.baseUrl));
        vector<string> facultyUrls;
        for (const auto& loc : SITEMAP_LOCATIONS) {
            HttpResponse resp = http_.get(origin + loc);
            if (!resp.ok() || resp.body.empty()) continue;
            if (isSitemapIndex(resp.body)) {
                vector<string> children = extractSitemapLocs(resp.body);
                if (children.size() > MAX_CHILD_SITEMAPS) children.resize(MAX_CHILD_SITEMAPS);
                vector<vector<string>> childUrls = parallelMap<string, vector<string>>(children, workers_,
                    [this](const string& child) -> vector<string> {
                        HttpResponse r = http_.get(child);
                        if (!r.ok()) return {};
                        return extractSitemapLocs(r.body);
                    });
                for (const auto& urls : childUrls) {
                    for (const auto& u : urls) {
                        if (matchesFacultyPattern(u)) facultyUrls.push_back(u);
                    }
                }
            }
            else {
                for (const auto& u : extractSitemapLocs(resp.body)) {
                    if (matchesFacultyPattern(u)) facultyUrls.push_back(u);
                }
            }
            if (!facultyUrls.empty()) break;
        }
        if (facultyUrls.empty()) return nullopt;

        UniversityPattern p = basePattern(ctx, "sitemap", SITEMAP_CONFIDENCE);
        set<string> seen;
        for (const auto& u : facultyUrls) {
            string host = hostWithoutWww(urlHost(u));
            string entry;
            if (host == baseHost) {
                entry = parseUrl(u).path;
                while (!entry.empty() && entry[0] == '/') entry.erase(0, 1);
                if (entry.empty()) continue;
            }
            else {
                entry = u;
                string dept = departmentNameFromHost(host);
                string subOrigin = urlOrigin(u);
                if (!dept.empty() && !p.departmentSubdomains.count(dept)) p.departmentSubdomains[dept] = subOrigin;
                if (find(p.subdomainPatterns.begin(), p.subdomainPatterns.end(), subOrigin) == p.subdomainPatterns.end()) {
                    p.subdomainPatterns.push_back(subOrigin);
                }
            }
            if (!seen.insert(entry).second) continue;
            p.facultyDirectoryPaths.push_back(entry);
            if (p.facultyDirectoryPaths.size() >= MAX_SITEMAP_PATHS) break;
        }
        if (p.facultyDirectoryPaths.empty() && p.departmentSubdomains.empty()) return nullopt;
        return p;
    }

    optional<UniversityPattern> discoverViaSubdomainEnumeration(const DiscoveryContext& ctx) {
        string domain = registrableDomain(urlHost(ctx.baseUrl));
        if (domain.find('.') == string::npos) return nullopt;

        struct Probe {
            string abbreviation;
            string origin;
        };
        vector<Probe> probes;
        for (size_t i = 0; i < min<size_t>(8, SUBDOMAIN_DEPT_ABBREVIATIONS.size()); ++i) {
            for (size_t t = 0; t < 3; ++t) {
                string host = replaceAllStr(replaceAllStr(COMMON_DEPARTMENT_SUBDOMAINS[t], "{dept}", SUBDOMAIN_DEPT_ABBREVIATIONS[i]), "{domain}", domain);
                probes.push_back(Probe{ SUBDOMAIN_DEPT_ABBREVIATIONS[i], "https://" + host });
            }
        }
        vector<string> hits = parallelMap<Probe, string>(probes, workers_, [this](const Probe& probe) -> string {
            HttpResponse r = http_.head(probe.origin);
            if (r.status != 200 && r.status != 301 && r.status != 302) return string();
            for (const auto& path : SUBDOMAIN_FACULTY_PATHS) {
                HttpResponse fr = http_.head(probe.origin + "/" + path);
                if (fr.status == 200 || fr.status == 301 || fr.status == 302) return probe.origin + "/" + path;
            }
            return string();
        });

        UniversityPattern p = basePattern(ctx, "subdomain_enumeration", SUBDOMAIN_ENUMERATION_CONFIDENCE);
        for (size_t i = 0; i < probes.size(); ++i) {
            if (hits[i].empty()) continue;
            string dept = titleCaseWords(probes[i].abbreviation);
            if (p.departmentSubdomains.count(dept)) continue;
            p.departmentSubdomains[dept] = probes[i].origin;
            p.subdomainPatterns.push_back(probes[i].origin);
            p.facultyDirectoryPaths.push_back(hits[i]);
            logInfo("Found department subdomain: " + dept + " -> " + probes[i].origin);
        }
        if (p.departmentSubdomains.empty()) return nullopt;
        return p;
    }

    optional<UniversityPattern> discoverViaNavigation(const DiscoveryContext& ctx) {
        HttpResponse resp = http_.get(ctx.baseUrl);
        if (!resp.ok()) return nullopt;
        HtmlDocument doc(resp.body);
        if (!doc.valid()) return nullopt;
        string baseHost = hostWithoutWww(urlHost(ctx.baseUrl));

        vector<string> paths;
        set<string> seen;
        for (const auto& link : collectLinks(doc.root())) {
            bool inNavigation = hasAncestorTag(link.node, { "nav", "header" }) ||
                hasAncestorClass(link.node, { "nav", "menu" });
            if (!inNavigation) continue;
            if (!containsAnyKeywordCaseInsensitive(link.text, NAVIGATION_TERMS)) continue;
            string low = toLowerStr(link.href);
            if (startsWith(low, "mailto:") || startsWith(low, "tel:") || startsWith(low, "javascript:") || link.href[0] == '#') continue;
            string full = urlJoin(ctx.baseUrl, link.href);
            if (hostWithoutWww(urlHost(full)) != baseHost) continue;
            string path = parseUrl(full).path;
            while (!path.empty() && path.front() == '/') path.erase(0, 1);
            while (!path.empty() && path.back() == '/') path.pop_back();
            if (path.empty() || !seen.insert(path).second) continue;
            paths.push_back(path);
            if (paths.size() >= 10) break;
        }
        if (paths.empty()) return nullopt;
        UniversityPattern p = basePattern(ctx, "navigation", NAVIGATION_CONFIDENCE);
        p.facultyDirectoryPaths = paths;
        return p;
    }

    optional<UniversityPattern> discoverViaCommonPaths(const DiscoveryContext& ctx) {
        vector<long> statuses = parallelMap<string, long>(COMMON_FACULTY_PATHS, workers_, [this, &ctx](const string& path) -> long {
            return http_.head(resolveAgainstBase(ctx.baseUrl, path)).status;
        });
        UniversityPattern p = basePattern(ctx, "common_paths", COMMON_PATHS_CONFIDENCE);
        for (size_t i = 0; i < COMMON_FACULTY_PATHS.size(); ++i) {
            if (statuses[i] == 200) p.facultyDirectoryPaths.push_back(COMMON_FACULTY_PATHS[i]);
        }
        if (p.facultyDirectoryPaths.empty()) return nullopt;
        return p;
    }

    // Lowest-trust strategy; its confidence is capped below the short-circuit bar.
    optional<UniversityPattern> discoverViaAssistant(const DiscoveryContext& ctx) {
        if (!assistant_) return nullopt;
        optional<DiscoveryAssistantResult> result = assistant_->discoverFacultyDirectories(ctx.universityName, ctx.baseUrl, string());
        if (!result) {
            logWarn("Discovery", "assistant returned nothing for " + ctx.universityName);
            return nullopt;
        }
        UniversityPattern p = basePattern(ctx, "llm_assistant", min(ASSISTANT_MAX_CONFIDENCE, clampConfidence(result->confidence)));
        p.facultyDirectoryPaths = result->facultyPaths;
        p.departments = result->departmentPaths;
        for (const auto& kv : result->departmentPaths) p.departmentPaths.push_back(kv.first);
        if (p.facultyDirectoryPaths.empty() && p.departments.empty()) return nullopt;
        return p;
    }

    UniversityPattern fallbackPattern(const DiscoveryContext& ctx) const {
        UniversityPattern p = basePattern(ctx, "fallback", FALLBACK_CONFIDENCE);
        p.facultyDirectoryPaths = FALLBACK_DIRECTORY_PATHS;
        p.departmentPaths = { "department", "school" };
        return p;
    }

private:
    UniversityPattern basePattern(const DiscoveryContext& ctx, const string& method, double confidence) const {
        UniversityPattern p;
        p.universityName = ctx.universityName;
        p.baseUrl = ctx.baseUrl;
        p.departmentPaths = DEPARTMENT_PATTERNS;
        p.facultyProfilePatterns = FACULTY_PROFILE_INDICATORS;
        p.paginationPatterns = DEFAULT_PAGINATION_PATTERNS;
        p.confidence = clampConfidence(confidence);
        p.successRate = p.confidence;
        p.discoveryMethod = method;
        p.lastUpdated = clock_();
        return p;
    }

    UniversityPattern runCascade(const string& universityName, const string& baseUrl) {
        if (cache_) {
            optional<UniversityPattern> cached = cache_->get(universityName);
            if (cached && cached->confidence > CACHE_REUSE_THRESHOLD) {
                logInfo("Using cached pattern for " + universityName);
                cached->confidence = clampConfidence(cached->confidence);
                return *cached;
            }
        }

        DiscoveryContext ctx{ universityName, stripTrailingSlash(trimStr(baseUrl)) };
        if (ctx.baseUrl.empty()) ctx.baseUrl = resolveBaseUrl(universityName);
        if (ctx.baseUrl.empty()) {
            logWarn("Discovery", "could not locate a base URL for " + universityName);
            return fallbackPattern(ctx);
        }

        vector<pair<string, DiscoveryStrategy>> strategies = {
            { "sitemap", [this](const DiscoveryContext& c) { return discoverViaSitemap(c); } },
            { "subdomain_enumeration", [this](const DiscoveryContext& c) { return discoverViaSubdomainEnumeration(c); } },
            { "navigation", [this](const DiscoveryContext& c) { return discoverViaNavigation(c); } },
            { "common_paths", [this](const DiscoveryContext& c) { return discoverViaCommonPaths(c); } },
            { "llm_assistant", [this](const DiscoveryContext& c) { return discoverViaAssistant(c); } }
        };

        optional<UniversityPattern> best;
        map<string, string> subdomains;
        for (const auto& strategy : strategies) {
            optional<UniversityPattern> found;
            try {
                found = strategy.second(ctx);
            }
            catch (const std::exception& e) {
                logWarn("Discovery", "strategy " + strategy.first + " failed: " + e.what());
                continue;
            }
            if (!found) continue;
            found->confidence = clampConfidence(found->confidence);
            for (const auto& kv : found->departmentSubdomains) subdomains.insert(kv);
            if (!best || found->confidence > best->confidence) best = found;
            if (best->confidence > SHORT_CIRCUIT_CONFIDENCE) break;
        }

        if (!best || (best->facultyDirectoryPaths.empty() && best->departmentSubdomains.empty())) {
            logWarn("Discovery", "no strategy found a usable pattern for " + universityName + ", using fallback");
            UniversityPattern fb = fallbackPattern(ctx);
            fb.departmentSubdomains = subdomains;
            return fb;
        }
        for (const auto& kv : subdomains) best->departmentSubdomains.insert(kv);
        logOk("Discovered pattern for " + universityName + " via " + best->discoveryMethod +
              " (confidence " + to_string(best->confidence) + ")");
        if (cache_) cache_->put(*best);
        return *best;
    }

    HttpClient& http_;
    PatternCache* cache_;
    DiscoveryAssistant* assistant_;
    size_t workers_;
    ClockFn clock_;
};
