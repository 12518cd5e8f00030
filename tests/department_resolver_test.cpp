#include <gtest/gtest.h>

#include "department_resolver.h"
#include "fake_http_client.h"

namespace {

const char* FACULTY_LISTING =
    "<html><head><title>Faculty</title></head><body><ul>"
    "<li>Dr. Jane Smith, Professor, jsmith@example.edu, Office 301</li>"
    "<li>Dr. Alan Turing, Professor, aturing@example.edu, Office 302</li>"
    "</ul></body></html>";

UniversityPattern examplePattern() {
    UniversityPattern p;
    p.universityName = "Example University";
    p.baseUrl = "https://www.example.edu";
    p.confidence = 0.7;
    p.discoveryMethod = "navigation";
    return p;
}

class StubAssistant : public DiscoveryAssistant {
public:
    optional<DiscoveryAssistantResult> discoverFacultyDirectories(const string&, const string&, const string& department) override {
        lastDepartment = department;
        DiscoveryAssistantResult r;
        r.departmentPaths = { { "Psychology", { "missing/path", "psychology/people" } } };
        r.confidence = 0.8;
        return r;
    }
    string lastDepartment;
};

const DepartmentInfo* findDepartment(const vector<DepartmentInfo>& departments, const string& name) {
    for (const auto& d : departments) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

UniversityPattern knownPattern(const string& name, const string& baseUrl) {
    UniversityPattern p = examplePattern();
    p.universityName = name;
    p.baseUrl = baseUrl;
    p.facultyDirectoryPaths = { "faculty" };
    return p;
}

}

TEST(DepartmentResolver, DepartmentNameValidation) {
    EXPECT_TRUE(isValidDepartmentName("Department of Psychology"));
    EXPECT_TRUE(isValidDepartmentName("Psychology"));
    EXPECT_TRUE(isValidDepartmentName("Human-Computer Interaction Institute"));
    EXPECT_FALSE(isValidDepartmentName("Read More"));
    EXPECT_FALSE(isValidDepartmentName("News"));
    EXPECT_FALSE(isValidDepartmentName("Follow us on Twitter"));
    EXPECT_FALSE(isValidDepartmentName("Jane Smith"));
    EXPECT_FALSE(isValidDepartmentName("Ph"));
    EXPECT_FALSE(isValidDepartmentName("Psychology Department celebrates 50 years"));
}

TEST(DepartmentResolver, NameMatchingIsSubstringEitherWay) {
    EXPECT_TRUE(departmentNameMatches("Department of Psychology", "psychology"));
    EXPECT_TRUE(departmentNameMatches("Psychology", "Department of Psychology"));
    EXPECT_TRUE(departmentNameMatches("Physics", ""));
    EXPECT_FALSE(departmentNameMatches("Physics", "Psychology"));
}

TEST(DepartmentResolver, DepartmentsFromDirectoryLinks) {
    FakeHttpClient http;
    DepartmentResolver resolver(http);
    string html =
        "<html><body>"
        "<a href=\"/departments/psychology\">Department of Psychology</a>"
        "<a href=\"/dept/physics\">Physics</a>"
        "<a href=\"/departments/news\">Department News</a>"
        "<a href=\"mailto:dept@example.edu\">Email the department</a>"
        "<a href=\"/about\">About</a>"
        "</body></html>";
    vector<DepartmentInfo> all = resolver.departmentsFromDirectoryPage(html, "https://www.example.edu/academics", "");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "Department of Psychology");
    EXPECT_EQ(all[0].url, "https://www.example.edu/departments/psychology");
    EXPECT_EQ(all[1].name, "Physics");

    vector<DepartmentInfo> filtered = resolver.departmentsFromDirectoryPage(html, "https://www.example.edu/academics", "psych");
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0].name, "Department of Psychology");
}

TEST(DepartmentResolver, StaffListingsSortBelowFacultyListings) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu/academics",
        "<html><body>"
        "<a href=\"/departments/biology/staff\">Department of Biology</a>"
        "<a href=\"/departments/chemistry/faculty\">Department of Chemistry</a>"
        "</body></html>");
    UniversityPattern pattern = examplePattern();
    pattern.facultyDirectoryPaths = { "academics" };
    DepartmentResolver resolver(http);
    vector<DepartmentInfo> departments = resolver.resolve(pattern);
    ASSERT_EQ(departments.size(), 2u);
    EXPECT_EQ(departments[0].name, "Department of Chemistry");
    EXPECT_EQ(departments[1].name, "Department of Biology");
}

TEST(DepartmentResolver, SubdomainDepartmentsAreProbed) {
    FakeHttpClient http;
    http.addPage("https://psych.example.edu/faculty/", FACULTY_LISTING);
    UniversityPattern pattern = examplePattern();
    pattern.departmentSubdomains = { { "Psychology", "https://psych.example.edu" },
                                     { "History", "https://history.example.edu" } };
    DepartmentResolver resolver(http);
    vector<DepartmentInfo> departments = resolver.resolve(pattern);
    ASSERT_EQ(departments.size(), 1u);
    EXPECT_EQ(departments[0].name, "Psychology");
    EXPECT_TRUE(departments[0].isSubdomain);
    EXPECT_EQ(departments[0].subdomainBaseUrl, "https://psych.example.edu");
    EXPECT_EQ(departments[0].structureType, StructureType::List);
    EXPECT_EQ(departments[0].estimatedFacultyCount, 2u);
}

TEST(DepartmentResolver, CachedDepartmentPathsWinForTarget) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu/psychology/faculty", FACULTY_LISTING);
    UniversityPattern pattern = examplePattern();
    pattern.departments = { { "psychology", { "psychology/faculty" } } };
    DepartmentResolver resolver(http);
    vector<DepartmentInfo> departments = resolver.resolve(pattern, "Psychology");
    ASSERT_EQ(departments.size(), 1u);
    EXPECT_EQ(departments[0].name, "Psychology");
    EXPECT_DOUBLE_EQ(departments[0].confidence, 0.9);
}

TEST(DepartmentResolver, AssistantIsLastResortForNamedDepartment) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu/psychology/people", FACULTY_LISTING);
    StubAssistant assistant;
    DepartmentResolver resolver(http, &assistant);
    vector<DepartmentInfo> departments = resolver.resolve(examplePattern(), "Psychology");
    EXPECT_EQ(assistant.lastDepartment, "Psychology");
    ASSERT_EQ(departments.size(), 1u);
    EXPECT_EQ(departments[0].url, "https://www.example.edu/psychology/people");
    EXPECT_NEAR(departments[0].confidence, 0.72, 1e-9);
}

TEST(DepartmentResolver, NothingFoundIsEmptyNotAnError) {
    FakeHttpClient http;
    DepartmentResolver resolver(http);
    UniversityPattern pattern = examplePattern();
    pattern.facultyDirectoryPaths = { "faculty", "people" };
    EXPECT_TRUE(resolver.resolve(pattern, "Astrology").empty());
}

TEST(DepartmentResolver, CmuLayoutCoversDietrichAndSubdomains) {
    FakeHttpClient http;
    http.addPage("https://www.cmu.edu/dietrich/psychology/people/faculty/", FACULTY_LISTING);
    http.addPage("https://ri.cmu.edu/people/", FACULTY_LISTING);
    DepartmentResolver resolver(http);

    vector<DepartmentInfo> departments = resolver.resolve(knownPattern("Carnegie Mellon University", "https://www.cmu.edu"));
    ASSERT_EQ(departments.size(), 2u);
    const DepartmentInfo* psychology = findDepartment(departments, "Psychology");
    ASSERT_NE(psychology, nullptr);
    EXPECT_EQ(psychology->url, "https://www.cmu.edu/dietrich/psychology/people/faculty/");
    EXPECT_DOUBLE_EQ(psychology->confidence, 0.85);
    EXPECT_FALSE(psychology->isSubdomain);
    const DepartmentInfo* robotics = findDepartment(departments, "Robotics");
    ASSERT_NE(robotics, nullptr);
    EXPECT_EQ(robotics->url, "https://ri.cmu.edu/people/");
    EXPECT_DOUBLE_EQ(robotics->confidence, 0.9);
    EXPECT_TRUE(robotics->isSubdomain);
    EXPECT_EQ(robotics->subdomainBaseUrl, "https://ri.cmu.edu");
    // The generic directory pages are not consulted once the known layout answered.
    EXPECT_EQ(http.requestsMatching("GET https://www.cmu.edu/faculty"), 0u);

    vector<DepartmentInfo> targeted = resolver.resolve(knownPattern("CMU", "https://www.cmu.edu"), "psychology");
    ASSERT_EQ(targeted.size(), 1u);
    EXPECT_EQ(targeted[0].name, "Psychology");
}

TEST(DepartmentResolver, StanfordAcademicListAndFacultySubpages) {
    FakeHttpClient http;
    http.addPage("https://www.stanford.edu/list/academic/",
        "<html><body><ul>"
        "<li><a href=\"https://psychology.stanford.edu/\">Department of Psychology</a></li>"
        "<li><a href=\"https://ee.stanford.edu\">Department of Electrical Engineering</a></li>"
        "<li><a href=\"/news\">Stanford News</a></li>"
        "</ul></body></html>");
    http.addPage("https://psychology.stanford.edu/people/faculty", FACULTY_LISTING);
    DepartmentResolver resolver(http);

    vector<DepartmentInfo> departments = resolver.resolve(knownPattern("Stanford University", "https://www.stanford.edu"));
    ASSERT_EQ(departments.size(), 2u);
    const DepartmentInfo* psychology = findDepartment(departments, "Department of Psychology");
    ASSERT_NE(psychology, nullptr);
    EXPECT_EQ(psychology->url, "https://psychology.stanford.edu/people/faculty");
    EXPECT_DOUBLE_EQ(psychology->confidence, 0.8);
    const DepartmentInfo* ee = findDepartment(departments, "Department of Electrical Engineering");
    ASSERT_NE(ee, nullptr);
    EXPECT_EQ(ee->url, "https://ee.stanford.edu");
}

TEST(DepartmentResolver, StanfordNamedDepartmentFallsBackToSubdomainGuesses) {
    FakeHttpClient http;
    http.addPage("https://linguistics.stanford.edu/faculty", FACULTY_LISTING);
    DepartmentResolver resolver(http);

    vector<DepartmentInfo> departments = resolver.resolve(knownPattern("Stanford University", "https://www.stanford.edu"), "linguistics");
    ASSERT_EQ(departments.size(), 1u);
    EXPECT_EQ(departments[0].name, "Linguistics Department");
    EXPECT_EQ(departments[0].url, "https://linguistics.stanford.edu/faculty");
    EXPECT_DOUBLE_EQ(departments[0].confidence, 0.6);
    EXPECT_EQ(http.requestsMatching("HEAD https://linguistics.stanford.edu/people/faculty"), 1u);
}
