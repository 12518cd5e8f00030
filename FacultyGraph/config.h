#pragma once

#include <string>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

// Timeouts and limits
static const long CURL_CONNECT_TIMEOUT = 10L;
static const long CURL_TOTAL_TIMEOUT = 30L;
static const long PROBE_TIMEOUT = 8L;
static const size_t MAX_DOWNLOAD_BYTES = 8 * 1024 * 1024;
static const size_t MAX_CONTENT_CHARS = 20000;
static const size_t MAX_SCAN_TOKENS = 2000;
static const string HTTP_USER_AGENT = "Mozilla/5.0 (compatible; FacultyGraph/1.0)";

// Concurrency
static const size_t DEFAULT_WORKER_COUNT = 6;

// Pattern discovery
static const double CACHE_REUSE_THRESHOLD = 0.7;
static const double SHORT_CIRCUIT_CONFIDENCE = 0.8;
static const double FALLBACK_CONFIDENCE = 0.3;
static const chrono::hours PATTERN_CACHE_TTL(24 * 30);
static const size_t MAX_CHILD_SITEMAPS = 10;
static const size_t MAX_SITEMAP_PATHS = 10;

// Extraction
static const size_t MAX_EXTRA_PAGES = 5;
static const size_t MIN_SELECTOR_MATCHES = 3;
static const double LAB_CLASSIFIER_THRESHOLD = 0.7;

// External search
static const size_t SEARCH_MAX_PER_MINUTE = 10;
static const size_t SEARCH_MAX_PER_HOUR = 300;
static const chrono::hours SEARCH_CACHE_TTL(24 * 30);

// Entity store
static const double FRESHNESS_WINDOW_DAYS = 30.0;
static const double COMPLETENESS_TARGET = 5.0;

// External endpoints. Keys come from the environment or the config file.
static const string GEMINI_ENDPOINT = "https://generativelanguage.googleapis.com/v1beta/models/gemini-2.0-flash:generateContent";
static const string GOOGLE_CSE_ENDPOINT = "https://www.googleapis.com/customsearch/v1";

struct ScraperConfig {
    long connectTimeout = CURL_CONNECT_TIMEOUT;
    long totalTimeout = CURL_TOTAL_TIMEOUT;
    long probeTimeout = PROBE_TIMEOUT;
    size_t maxDownloadBytes = MAX_DOWNLOAD_BYTES;
    size_t workerCount = DEFAULT_WORKER_COUNT;
    size_t maxExtraPages = MAX_EXTRA_PAGES;
    size_t searchMaxPerMinute = SEARCH_MAX_PER_MINUTE;
    size_t searchMaxPerHour = SEARCH_MAX_PER_HOUR;
    bool enableLabDiscovery = true;
    bool enableExternalSearch = false;
    string userAgent = HTTP_USER_AGENT;
    string patternCachePath;
    string cseApiKey;
    string cseCx;
    string geminiApiKey;
};

inline string envOrEmpty(const char* name) {
    const char* v = getenv(name);
    return v ? string(v) : string();
}

inline void applyEnvironment(ScraperConfig& cfg) {
    string v = envOrEmpty("FACULTYGRAPH_CSE_KEY");
    if (!v.empty()) cfg.cseApiKey = v;
    v = envOrEmpty("FACULTYGRAPH_CSE_CX");
    if (!v.empty()) cfg.cseCx = v;
    v = envOrEmpty("FACULTYGRAPH_GEMINI_KEY");
    if (!v.empty()) cfg.geminiApiKey = v;
    v = envOrEmpty("FACULTYGRAPH_PATTERN_CACHE");
    if (!v.empty()) cfg.patternCachePath = v;
}

inline ScraperConfig scraperConfigFromJson(const json& j, ScraperConfig cfg = ScraperConfig()) {
    if (!j.is_object()) return cfg;
    cfg.connectTimeout = j.value("connect_timeout", cfg.connectTimeout);
    cfg.totalTimeout = j.value("total_timeout", cfg.totalTimeout);
    cfg.probeTimeout = j.value("probe_timeout", cfg.probeTimeout);
    cfg.maxDownloadBytes = j.value("max_download_bytes", cfg.maxDownloadBytes);
    cfg.workerCount = j.value("worker_count", cfg.workerCount);
    cfg.maxExtraPages = j.value("max_extra_pages", cfg.maxExtraPages);
    cfg.searchMaxPerMinute = j.value("search_max_per_minute", cfg.searchMaxPerMinute);
    cfg.searchMaxPerHour = j.value("search_max_per_hour", cfg.searchMaxPerHour);
    cfg.enableLabDiscovery = j.value("enable_lab_discovery", cfg.enableLabDiscovery);
    cfg.enableExternalSearch = j.value("enable_external_search", cfg.enableExternalSearch);
    cfg.userAgent = j.value("user_agent", cfg.userAgent);
    cfg.patternCachePath = j.value("pattern_cache_path", cfg.patternCachePath);
    cfg.cseApiKey = j.value("cse_api_key", cfg.cseApiKey);
    cfg.cseCx = j.value("cse_cx", cfg.cseCx);
    cfg.geminiApiKey = j.value("gemini_api_key", cfg.geminiApiKey);
    if (cfg.workerCount == 0) cfg.workerCount = 1;
    return cfg;
}

// Defaults, then the optional JSON file, then the environment.
inline ScraperConfig loadScraperConfig(const string& path) {
    ScraperConfig cfg;
    if (!path.empty()) {
        ifstream in(path);
        if (!in) {
            cerr << "[config] cannot open " << path << ", using defaults\n";
        }
        else {
            try {
                json j = json::parse(in);
                cfg = scraperConfigFromJson(j, cfg);
            }
            catch (const json::exception& e) {
                cerr << "[config] invalid JSON in " << path << ": " << e.what() << "\n";
            }
        }
    }
    applyEnvironment(cfg);
    return cfg;
}
