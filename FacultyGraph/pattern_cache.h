#pragma once

#include <string>
#include <map>
#include <mutex>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>

#include "config.h"
#include "log_utils.h"
#include "string_utils.h"
#include "time_utils.h"
#include "university_pattern.h"

using namespace std;
using json = nlohmann::json;

// Successful discovery results keyed by normalized university name, with a TTL.
// Optionally mirrored to a JSON file.
class PatternCache {
public:
    explicit PatternCache(ClockFn clock = systemClock(), chrono::hours ttl = PATTERN_CACHE_TTL, string path = string())
        : clock_(std::move(clock)), ttl_(ttl), path_(std::move(path)) {}

    static string cacheKey(const string& universityName) {
        return "university_pattern:" + toLowerStr(collapseWhitespace(universityName));
    }

    optional<UniversityPattern> get(const string& universityName) {
        lock_guard<mutex> lock(mu_);
        auto it = entries_.find(cacheKey(universityName));
        if (it == entries_.end()) return nullopt;
        if (clock_() - it->second.storedAt > ttl_) {
            entries_.erase(it);
            return nullopt;
        }
        return it->second.pattern;
    }

    // Only patterns above the reuse threshold are kept.
    bool put(const UniversityPattern& pattern) {
        if (pattern.confidence <= CACHE_REUSE_THRESHOLD) return false;
        {
            lock_guard<mutex> lock(mu_);
            entries_[cacheKey(pattern.universityName)] = Entry{ pattern, clock_() };
        }
        if (!path_.empty()) save();
        return true;
    }

    size_t size() const {
        lock_guard<mutex> lock(mu_);
        return entries_.size();
    }

    bool load() {
        if (path_.empty()) return false;
        ifstream in(path_);
        if (!in) return false;
        try {
            json j = json::parse(in);
            lock_guard<mutex> lock(mu_);
            for (const auto& e : j.value("entries", json::array())) {
                TimePoint storedAt;
                if (!parseTimestamp(e.value("stored_at", string()), storedAt)) continue;
                UniversityPattern p = patternFromJson(e.at("pattern"));
                entries_[cacheKey(p.universityName)] = Entry{ p, storedAt };
            }
        }
        catch (const json::exception& e) {
            logWarn("PatternCache", "ignoring unreadable cache " + path_ + ": " + e.what());
            return false;
        }
        return true;
    }

    bool save() const {
        if (path_.empty()) return false;
        json j;
        j["entries"] = json::array();
        {
            lock_guard<mutex> lock(mu_);
            for (const auto& kv : entries_) {
                json e;
                e["key"] = kv.first;
                e["stored_at"] = formatTimestamp(kv.second.storedAt);
                e["pattern"] = toJson(kv.second.pattern);
                j["entries"].push_back(e);
            }
        }
        ofstream out(path_);
        if (!out) {
            logWarn("PatternCache", "cannot write " + path_);
            return false;
        }
        out << j.dump(2);
        return true;
    }

private:
    struct Entry {
        UniversityPattern pattern;
        TimePoint storedAt;
    };

    ClockFn clock_;
    chrono::hours ttl_;
    string path_;
    mutable mutex mu_;
    map<string, Entry> entries_;
};
