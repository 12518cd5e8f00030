#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <atomic>
#include <optional>
#include <algorithm>
#include <nlohmann/json.hpp>

#include "config.h"
#include "collaborators.h"
#include "confidence.h"
#include "http_utils.h"
#include "log_utils.h"
#include "string_utils.h"
#include "time_utils.h"

using namespace std;
using json = nlohmann::json;

// Caps calls per trailing minute and per trailing hour. Never waits.
class SlidingWindowRateLimiter {
public:
    SlidingWindowRateLimiter(size_t perMinute, size_t perHour, ClockFn clock = systemClock())
        : perMinute_(perMinute), perHour_(perHour), clock_(std::move(clock)) {}

    bool tryAcquire() {
        lock_guard<mutex> lock(mu_);
        TimePoint now = clock_();
        while (!stamps_.empty() && now - stamps_.front() >= chrono::hours(1)) stamps_.pop_front();
        size_t lastMinute = 0;
        for (const auto& t : stamps_) {
            if (now - t < chrono::minutes(1)) ++lastMinute;
        }
        if (lastMinute >= perMinute_ || stamps_.size() >= perHour_) return false;
        stamps_.push_back(now);
        return true;
    }

    size_t callsLastHour() {
        lock_guard<mutex> lock(mu_);
        TimePoint now = clock_();
        while (!stamps_.empty() && now - stamps_.front() >= chrono::hours(1)) stamps_.pop_front();
        return stamps_.size();
    }

private:
    size_t perMinute_;
    size_t perHour_;
    ClockFn clock_;
    mutex mu_;
    deque<TimePoint> stamps_;
};

inline string searchCacheKey(const string& facultyName, const string& labName, const string& university) {
    return "search:" + stableHashHex(toLowerStr(facultyName + "|" + labName + "|" + university));
}

inline string buildLabSearchQuery(const string& facultyName, const string& labName, const string& university) {
    string faculty = replaceAllStr(replaceAllStr(facultyName, "Dr. ", ""), "Prof. ", "");
    return "\"" + faculty + "\" \"" + labName + "\" \"" + university + "\" (site:.edu OR site:.org)";
}

// Parses a Custom Search JSON response into scored, sorted results.
inline vector<LabSearchResult> parseCseResults(const string& body, const string& facultyName, const string& labName) {
    vector<LabSearchResult> results;
    json j = json::parse(body);
    if (j.contains("error")) {
        logWarn("LabSearch", "API error: " + j["error"].dump());
        return results;
    }
    if (!j.contains("items") || !j["items"].is_array()) return results;
    ScoreQuery query = labScoreQuery(facultyName, labName);
    for (auto& it : j["items"]) {
        LabSearchResult r;
        r.url = it.value("link", string());
        r.title = it.value("title", string());
        r.snippet = it.value("snippet", string());
        if (r.url.empty()) continue;
        r.confidence = scoreCandidate(ScoreCandidate{ r.url, r.title, r.snippet }, query);
        results.push_back(r);
    }
    stable_sort(results.begin(), results.end(),
        [](const LabSearchResult& a, const LabSearchResult& b) { return a.confidence > b.confidence; });
    return results;
}

// External search over the Google Custom Search JSON API.
class GoogleCseLabSearch : public LabSearch {
public:
    GoogleCseLabSearch(HttpClient& http, string apiKey, string cx,
                       size_t perMinute = SEARCH_MAX_PER_MINUTE, size_t perHour = SEARCH_MAX_PER_HOUR,
                       ClockFn clock = systemClock())
        : http_(http), apiKey_(std::move(apiKey)), cx_(std::move(cx)),
          limiter_(perMinute, perHour, clock), clock_(clock) {}

    vector<LabSearchResult> searchLabUrls(const string& facultyName, const string& labName,
                                          const string& university, size_t maxResults) override {
        string key = searchCacheKey(facultyName, labName, university);
        {
            lock_guard<mutex> lock(mu_);
            auto it = cache_.find(key);
            if (it != cache_.end()) {
                if (clock_() - it->second.storedAt <= SEARCH_CACHE_TTL) {
                    ++cacheHits_;
                    return truncated(it->second.results, maxResults);
                }
                cache_.erase(it);
            }
        }
        if (!limiter_.tryAcquire()) {
            ++throttled_;
            logWarn("LabSearch", "rate limit exceeded, skipping search for " + facultyName);
            return {};
        }
        if (apiKey_.empty() || cx_.empty()) {
            logWarn("LabSearch", "no API key configured");
            return {};
        }

        string query = buildLabSearchQuery(facultyName, labName, university);
        string apiUrl = GOOGLE_CSE_ENDPOINT + "?q=" + urlEncode(query) + "&key=" + apiKey_ + "&cx=" + cx_ +
            "&num=" + to_string(max<size_t>(1, min<size_t>(maxResults, 10)));
        ++networkQueries_;
        HttpResponse resp = http_.get(apiUrl);
        if (!resp.ok()) {
            logWarn("LabSearch", "request failed (" + to_string(resp.status) + ") " + resp.error);
            return {};
        }

        vector<LabSearchResult> results;
        try {
            results = parseCseResults(resp.body, facultyName, labName);
        }
        catch (const json::exception& e) {
            logWarn("LabSearch", string("failed to parse response: ") + e.what());
            return {};
        }
        if (!results.empty()) {
            lock_guard<mutex> lock(mu_);
            cache_[key] = CachedResults{ results, clock_() };
        }
        return truncated(results, maxResults);
    }

    json stats() {
        lock_guard<mutex> lock(mu_);
        json j;
        j["queries_last_hour"] = limiter_.callsLastHour();
        j["network_queries"] = networkQueries_.load();
        j["cache_hits"] = cacheHits_.load();
        j["throttled"] = throttled_.load();
        j["cache_size"] = cache_.size();
        return j;
    }

private:
    struct CachedResults {
        vector<LabSearchResult> results;
        TimePoint storedAt;
    };

    static vector<LabSearchResult> truncated(vector<LabSearchResult> results, size_t maxResults) {
        if (results.size() > maxResults) results.resize(maxResults);
        return results;
    }

    HttpClient& http_;
    string apiKey_;
    string cx_;
    SlidingWindowRateLimiter limiter_;
    ClockFn clock_;
    mutex mu_;
    map<string, CachedResults> cache_;
    atomic<size_t> networkQueries_{ 0 };
    atomic<size_t> cacheHits_{ 0 };
    atomic<size_t> throttled_{ 0 };
};
