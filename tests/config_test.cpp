#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <filesystem>

#include "config.h"

TEST(Config, DefaultsMatchConstants) {
    ScraperConfig cfg;
    EXPECT_EQ(cfg.workerCount, DEFAULT_WORKER_COUNT);
    EXPECT_EQ(cfg.maxExtraPages, MAX_EXTRA_PAGES);
    EXPECT_EQ(cfg.searchMaxPerMinute, 10u);
    EXPECT_TRUE(cfg.enableLabDiscovery);
    EXPECT_FALSE(cfg.enableExternalSearch);
}

TEST(Config, JsonOverridesOnlyNamedKeys) {
    json j = { { "worker_count", 3 }, { "enable_external_search", true }, { "cse_cx", "abc" } };
    ScraperConfig cfg = scraperConfigFromJson(j);
    EXPECT_EQ(cfg.workerCount, 3u);
    EXPECT_TRUE(cfg.enableExternalSearch);
    EXPECT_EQ(cfg.cseCx, "abc");
    EXPECT_EQ(cfg.totalTimeout, CURL_TOTAL_TIMEOUT);
}

TEST(Config, ZeroWorkersBecomesOne) {
    ScraperConfig cfg = scraperConfigFromJson(json{ { "worker_count", 0 } });
    EXPECT_EQ(cfg.workerCount, 1u);
}

TEST(Config, NonObjectJsonKeepsDefaults) {
    ScraperConfig cfg = scraperConfigFromJson(json::array({ 1, 2 }));
    EXPECT_EQ(cfg.workerCount, DEFAULT_WORKER_COUNT);
}

TEST(Config, MissingOrBrokenFileFallsBackToDefaults) {
    unsetenv("FACULTYGRAPH_GEMINI_KEY");
    ScraperConfig missing = loadScraperConfig("/nonexistent/facultygraph.json");
    EXPECT_EQ(missing.workerCount, DEFAULT_WORKER_COUNT);

    string path = (std::filesystem::temp_directory_path() / "facultygraph_broken_config.json").string();
    {
        ofstream out(path);
        out << "{ not json";
    }
    ScraperConfig broken = loadScraperConfig(path);
    EXPECT_EQ(broken.maxExtraPages, MAX_EXTRA_PAGES);
    std::remove(path.c_str());
}

TEST(Config, EnvironmentWinsOverFile) {
    string path = (std::filesystem::temp_directory_path() / "facultygraph_env_config.json").string();
    {
        ofstream out(path);
        out << R"({"gemini_api_key": "from-file", "max_extra_pages": 2})";
    }
    setenv("FACULTYGRAPH_GEMINI_KEY", "from-env", 1);
    ScraperConfig cfg = loadScraperConfig(path);
    unsetenv("FACULTYGRAPH_GEMINI_KEY");
    std::remove(path.c_str());
    EXPECT_EQ(cfg.geminiApiKey, "from-env");
    EXPECT_EQ(cfg.maxExtraPages, 2u);
}
