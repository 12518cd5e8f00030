#include <gtest/gtest.h>

#include "pattern_discovery.h"
#include "fake_http_client.h"

namespace {

const char* SITEMAP_INDEX =
    "<?xml version=\"1.0\"?><sitemapindex>"
    "<sitemap><loc>https://www.example.edu/sitemap-main.xml</loc></sitemap>"
    "<sitemap><loc>https://www.example.edu/sitemap-psych.xml</loc></sitemap>"
    "</sitemapindex>";

const char* MAIN_SITEMAP =
    "<urlset><url><loc>https://www.example.edu/faculty/</loc></url>"
    "<url><loc>https://www.example.edu/news/2024/award</loc></url></urlset>";

const char* PSYCH_SITEMAP =
    "<urlset><url><loc>https://psychology.example.edu/people</loc></url></urlset>";

class StubAssistant : public DiscoveryAssistant {
public:
    optional<DiscoveryAssistantResult> discoverFacultyDirectories(const string&, const string&, const string&) override {
        ++calls;
        DiscoveryAssistantResult r;
        r.facultyPaths = { "academics/faculty-list" };
        r.departmentPaths = { { "Psychology", { "psychology/people" } } };
        r.confidence = 0.95;
        return r;
    }
    int calls = 0;
};

}

TEST(PatternDiscovery, DomainGuessesForUniversityOf) {
    vector<string> guesses = domainGuessCandidates("University of Vermont");
    ASSERT_FALSE(guesses.empty());
    EXPECT_EQ(guesses.front(), "www.vermont.edu");
    EXPECT_NE(find(guesses.begin(), guesses.end(), "www.uvermont.edu"), guesses.end());
}

TEST(PatternDiscovery, SitemapLocsAndSubdomainNames) {
    vector<string> locs = extractSitemapLocs("<loc> <![CDATA[https://x.edu/a?b=1&amp;c=2]]> </loc><loc>https://x.edu/b</loc>");
    ASSERT_EQ(locs.size(), 2u);
    EXPECT_EQ(locs[0], "https://x.edu/a?b=1&c=2");
    EXPECT_TRUE(isSitemapIndex(SITEMAP_INDEX));
    EXPECT_EQ(departmentNameFromHost("cognitive-science.example.edu"), "Cognitive Science");
    EXPECT_EQ(departmentNameFromHost("example.edu"), "");
}

TEST(PatternDiscovery, UnknownUniversityNeverThrows) {
    FakeHttpClient http;
    PatternDiscoveryEngine engine(http);
    UniversityPattern p;
    ASSERT_NO_THROW(p = engine.discover("Nonexistent Polytechnic of Nowhere"));
    EXPECT_EQ(p.discoveryMethod, "fallback");
    EXPECT_TRUE(p.baseUrl.empty());
    EXPECT_DOUBLE_EQ(p.confidence, FALLBACK_CONFIDENCE);
    EXPECT_EQ(p.facultyDirectoryPaths, FALLBACK_DIRECTORY_PATHS);
}

TEST(PatternDiscovery, UnreachableKnownSiteFallsBackWithGenericPaths) {
    FakeHttpClient http;
    PatternDiscoveryEngine engine(http);
    UniversityPattern p = engine.discover("Carnegie Mellon University");
    EXPECT_EQ(p.baseUrl, "https://www.cmu.edu");
    EXPECT_EQ(p.discoveryMethod, "fallback");
    EXPECT_DOUBLE_EQ(p.confidence, FALLBACK_CONFIDENCE);
    EXPECT_EQ(p.facultyDirectoryPaths, FALLBACK_DIRECTORY_PATHS);
}

TEST(PatternDiscovery, GuessedUrlFollowsRedirect) {
    FakeHttpClient http;
    http.addRedirect("https://www.vermont.edu", "https://www.uvm.edu/");
    PatternDiscoveryEngine engine(http);
    EXPECT_EQ(engine.guessUniversityUrl("University of Vermont"), "https://www.uvm.edu");
}

TEST(PatternDiscovery, SitemapIndexWithTwoChildren) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu/sitemap.xml", SITEMAP_INDEX);
    http.addPage("https://www.example.edu/sitemap-main.xml", MAIN_SITEMAP);
    http.addPage("https://www.example.edu/sitemap-psych.xml", PSYCH_SITEMAP);
    PatternDiscoveryEngine engine(http);

    UniversityPattern p = engine.discover("Example University", "https://www.example.edu/");
    EXPECT_EQ(p.discoveryMethod, "sitemap");
    EXPECT_DOUBLE_EQ(p.confidence, 0.85);
    ASSERT_EQ(p.facultyDirectoryPaths.size(), 2u);
    EXPECT_EQ(p.facultyDirectoryPaths[0], "faculty/");
    EXPECT_EQ(p.facultyDirectoryPaths[1], "https://psychology.example.edu/people");
    ASSERT_EQ(p.departmentSubdomains.size(), 1u);
    EXPECT_EQ(p.departmentSubdomains.at("Psychology"), "https://psychology.example.edu");
    // Sitemap clears the short-circuit bar, so no subdomain probing happened.
    EXPECT_EQ(http.requestsMatching("HEAD"), 0u);
}

TEST(PatternDiscovery, SubdomainEnumerationFindsDepartmentSites) {
    FakeHttpClient http;
    http.addPage("https://psychology.example.edu", "ok");
    http.addPage("https://psychology.example.edu/faculty", "ok");
    http.addRedirect("https://math-dept.example.edu", "https://math-dept.example.edu/home");
    http.addPage("https://math-dept.example.edu/people", "ok");
    // Host answers but none of the faculty paths do.
    http.addPage("https://physics.example.edu", "ok");
    PatternDiscoveryEngine engine(http);

    UniversityPattern p = engine.discover("Example University", "https://www.example.edu");
    EXPECT_EQ(p.discoveryMethod, "subdomain_enumeration");
    EXPECT_DOUBLE_EQ(p.confidence, 0.75);
    ASSERT_EQ(p.departmentSubdomains.size(), 2u);
    EXPECT_EQ(p.departmentSubdomains.at("Psychology"), "https://psychology.example.edu");
    EXPECT_EQ(p.departmentSubdomains.at("Math"), "https://math-dept.example.edu");
    EXPECT_EQ(p.facultyDirectoryPaths, (vector<string>{
        "https://psychology.example.edu/faculty/", "https://math-dept.example.edu/people/" }));
    EXPECT_EQ(http.requestsMatching("HEAD https://physics.example.edu/directory/"), 1u);
    // Below the short-circuit bar, so the cascade went on to the later strategies.
    EXPECT_EQ(http.requestsMatching("HEAD https://www.example.edu/faculty-directory"), 1u);
}

TEST(PatternDiscovery, NavigationLinksInsideNavOnly) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu",
        "<html><body><nav><a href=\"/people/\">People</a><a href=\"/about\">About</a>"
        "<a href=\"https://other.org/faculty\">Faculty elsewhere</a></nav>"
        "<main><a href=\"/faculty\">Faculty</a></main></body></html>");
    PatternDiscoveryEngine engine(http);
    UniversityPattern p = engine.discover("Example University", "https://www.example.edu");
    EXPECT_EQ(p.discoveryMethod, "navigation");
    EXPECT_DOUBLE_EQ(p.confidence, 0.7);
    ASSERT_EQ(p.facultyDirectoryPaths.size(), 1u);
    EXPECT_EQ(p.facultyDirectoryPaths[0], "people");
}

TEST(PatternDiscovery, CommonPathsProbe) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu/faculty", "ok");
    http.addPage("https://www.example.edu/faculty-directory", "ok");
    PatternDiscoveryEngine engine(http);
    UniversityPattern p = engine.discover("Example University", "https://www.example.edu");
    EXPECT_EQ(p.discoveryMethod, "common_paths");
    EXPECT_DOUBLE_EQ(p.confidence, 0.6);
    EXPECT_EQ(p.facultyDirectoryPaths, (vector<string>{ "faculty", "faculty-directory" }));
}

TEST(PatternDiscovery, AssistantConfidenceIsCapped) {
    FakeHttpClient http;
    StubAssistant assistant;
    PatternDiscoveryEngine engine(http, nullptr, &assistant);
    UniversityPattern p = engine.discover("Example University", "https://www.example.edu");
    EXPECT_EQ(assistant.calls, 1);
    EXPECT_EQ(p.discoveryMethod, "llm_assistant");
    EXPECT_DOUBLE_EQ(p.confidence, ASSISTANT_MAX_CONFIDENCE);
    EXPECT_EQ(p.departments.at("Psychology").front(), "psychology/people");
}

TEST(PatternDiscovery, CachedPatternSkipsNetwork) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu/sitemap.xml", SITEMAP_INDEX);
    http.addPage("https://www.example.edu/sitemap-main.xml", MAIN_SITEMAP);
    http.addPage("https://www.example.edu/sitemap-psych.xml", PSYCH_SITEMAP);
    PatternCache cache;
    PatternDiscoveryEngine engine(http, &cache);

    UniversityPattern first = engine.discover("Example University", "https://www.example.edu");
    ASSERT_EQ(cache.size(), 1u);
    size_t before = http.requestCount();
    UniversityPattern second = engine.discover("example  university");
    EXPECT_EQ(http.requestCount(), before);
    EXPECT_EQ(second.facultyDirectoryPaths, first.facultyDirectoryPaths);
}
