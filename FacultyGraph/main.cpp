#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

// Project headers
#include "config.h"
#include "http_utils.h"
#include "log_utils.h"
#include "pattern_cache.h"
#include "pattern_discovery.h"
#include "department_resolver.h"
#include "page_renderer.h"
#include "lab_classifier.h"
#include "lab_search.h"
#include "gemini_utils.h"
#include "adaptive_extractor.h"
#include "faculty_scraper.h"
#include "faculty_record.h"
#include "entity_store.h"
#include "entity_resolution.h"

using namespace std;
using json = nlohmann::json;

static CancellationToken g_cancel;

extern "C" void onInterrupt(int) {
    g_cancel.cancel();
}

struct CliOptions {
    string university;
    optional<string> department;
    optional<size_t> maxFaculty;
    optional<string> baseUrl;
    string configPath;
    string exportDir = "exports";
    string ingestPath;
    bool quiet = false;
};

static void printUsage() {
    cerr << "Usage:\n"
         << "  facultygraph <university> [--department D] [--max N] [--base-url U] [--config F] [--export DIR] [--quiet]\n"
         << "  facultygraph --ingest records.json [--export DIR]\n";
}

static bool parseArgs(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        auto value = [&](string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        string v;
        if (arg == "--department") {
            if (!value(v)) return false;
            opts.department = v;
        }
        else if (arg == "--max") {
            if (!value(v)) return false;
            try {
                long n = stol(v);
                if (n <= 0) return false;
                opts.maxFaculty = (size_t)n;
            }
            catch (const std::exception&) {
                cerr << "[ERROR] --max expects a positive number, got " << v << "\n";
                return false;
            }
        }
        else if (arg == "--base-url") {
            if (!value(v)) return false;
            opts.baseUrl = v;
        }
        else if (arg == "--config") {
            if (!value(opts.configPath)) return false;
        }
        else if (arg == "--export") {
            if (!value(opts.exportDir)) return false;
        }
        else if (arg == "--ingest") {
            if (!value(opts.ingestPath)) return false;
        }
        else if (arg == "--quiet") {
            opts.quiet = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            cerr << "[ERROR] unknown option " << arg << "\n";
            return false;
        }
        else if (opts.university.empty()) {
            opts.university = arg;
        }
        else {
            opts.university += " " + arg;
        }
    }
    return !opts.university.empty() || !opts.ingestPath.empty();
}

// Raw records from a JSON array, or from the "faculty" array of a saved scrape result.
static vector<RawFacultyRecord> loadRawRecords(const string& path) {
    vector<RawFacultyRecord> records;
    ifstream in(path);
    if (!in) {
        logError("cannot open " + path);
        return records;
    }
    try {
        json j = json::parse(in);
        const json& list = j.is_object() ? j.value("faculty", json::array()) : j;
        size_t skipped = 0;
        for (const auto& item : list) {
            optional<RawFacultyRecord> r = rawFacultyRecordFromJson(item);
            if (r) records.push_back(*r);
            else ++skipped;
        }
        if (skipped) logWarn("ingest", to_string(skipped) + " entries without a name skipped");
    }
    catch (const json::exception& e) {
        logError("invalid JSON in " + path + ": " + e.what());
    }
    return records;
}

static int ingestAndExport(const vector<RawFacultyRecord>& records, const string& sessionId, const string& exportDir) {
    InMemoryEntityRepository repo;
    EntityResolutionStore store(repo);
    IngestReport report = store.ingest(records, sessionId);
    cout << "[OK] " << report.created << " new faculty, " << report.merged << " merged, "
         << report.labsCreated << " labs, " << report.conflicts << " conflicts\n";
    try {
        for (const auto& kv : store.exportAggregatedViews(exportDir)) {
            cout << " " << kv.first << ": " << kv.second << "\n";
        }
    }
    catch (const FacultyGraphError& e) {
        logError(e.what());
        return 3;
    }
    return 0;
}

int main(int argc, char** argv) {
    ios::sync_with_stdio(false);

    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 1;
    }
    if (opts.quiet) setLogVerbosity(false);

    string sessionId = "scrape_" + fileTimestamp(chrono::system_clock::now());

    if (!opts.ingestPath.empty()) {
        cout << "[1/2] Loading raw records from " << opts.ingestPath << "...\n";
        vector<RawFacultyRecord> records = loadRawRecords(opts.ingestPath);
        if (records.empty()) {
            cerr << "[ERROR] No records to ingest. Exiting.\n";
            return 1;
        }
        cout << "[2/2] Resolving " << records.size() << " records into entities...\n";
        return ingestAndExport(records, sessionId, opts.exportDir);
    }

    ScraperConfig cfg = loadScraperConfig(opts.configPath);
    curl_global_init(CURL_GLOBAL_DEFAULT);
    signal(SIGINT, onInterrupt);

    int status = 0;
    {
        CurlHttpClient http(cfg);
        PatternCache cache(systemClock(), PATTERN_CACHE_TTL, cfg.patternCachePath);
        if (cache.load()) logInfo("Loaded " + to_string(cache.size()) + " cached patterns");

        unique_ptr<GeminiDiscoveryAssistant> assistant;
        if (!cfg.geminiApiKey.empty()) assistant.reset(new GeminiDiscoveryAssistant(http, cfg.geminiApiKey));
        unique_ptr<GoogleCseLabSearch> search;
        if (cfg.enableExternalSearch && !cfg.cseApiKey.empty() && !cfg.cseCx.empty()) {
            search.reset(new GoogleCseLabSearch(http, cfg.cseApiKey, cfg.cseCx, cfg.searchMaxPerMinute, cfg.searchMaxPerHour));
        }

        PatternDiscoveryEngine discovery(http, &cache, assistant.get(), cfg.workerCount);
        DepartmentResolver resolver(http, assistant.get(), cfg.workerCount);
        HttpPageRenderer renderer(http);
        KeywordLabClassifier classifier;
        ExtractorOptions extractorOptions;
        extractorOptions.maxExtraPages = cfg.maxExtraPages;
        extractorOptions.enableLabDiscovery = cfg.enableLabDiscovery;
        extractorOptions.enableExternalSearch = search != nullptr;
        AdaptiveExtractor extractor(renderer, &classifier, search.get(), extractorOptions);
        FacultyScraper scraper(discovery, resolver, extractor, cfg.workerCount, cfg.enableLabDiscovery);

        cout << "[1/3] Scraping faculty for " << opts.university << "...\n";
        ScrapeResult result = scraper.scrapeUniversityFaculty(opts.university, opts.department, opts.maxFaculty,
                                                              opts.baseUrl, &g_cancel);
        json resultJson = toJson(result);
        if (!result.success) {
            cerr << "[ERROR] " << result.error << "\n";
            cout << resultJson.dump(2) << "\n";
            status = 2;
        }
        else {
            std::error_code ec;
            filesystem::create_directories(opts.exportDir, ec);
            string scrapePath = (filesystem::path(opts.exportDir) / (sessionId + ".json")).string();
            ofstream out(scrapePath);
            if (out) {
                out << resultJson.dump(2);
                logOk("Scrape result written to " + scrapePath);
            }
            else {
                logWarn("main", "cannot write " + scrapePath);
            }
            cout << "[Summary] " << result.faculty.size() << " faculty, " << result.departmentsProcessed
                 << " departments, discovery confidence " << result.discoveryConfidence
                 << (result.cancelled ? " (cancelled)" : "") << "\n";

            cout << "[2/3] Resolving entities...\n";
            cout << "[3/3] Exporting aggregated views to " << opts.exportDir << "...\n";
            status = ingestAndExport(result.faculty, sessionId, opts.exportDir);
        }
        if (search) logInfo("Search stats: " + search->stats().dump());
        logInfo("Scraper stats: " + scraper.stats().dump());
    }

    curl_global_cleanup();
    if (status == 0) cout << "[DONE]\n";
    return status;
}
