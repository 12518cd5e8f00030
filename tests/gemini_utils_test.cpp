#include <gtest/gtest.h>

#include "gemini_utils.h"
#include "fake_http_client.h"

namespace {

json geminiReply(const string& text) {
    json part;
    part["text"] = text;
    json content;
    content["parts"] = json::array({ part });
    json candidate;
    candidate["content"] = content;
    json reply;
    reply["candidates"] = json::array({ candidate });
    return reply;
}

}

TEST(Gemini, ExtractsFirstTextPart) {
    EXPECT_EQ(extractGeminiText(geminiReply("hello").dump()), "hello");
    EXPECT_EQ(extractGeminiText(R"({"candidates": [{"content": "plain"}]})"), "plain");
    EXPECT_EQ(extractGeminiText(R"({"error": {"code": 429}})"), "");
}

TEST(Gemini, JsonObjectInsideFencesAndProse) {
    string answer = "Sure, here it is:\n```json\n{\"reasoning\": \"nav has {braces}\", \"confidence_score\": 0.6}\n```";
    EXPECT_EQ(extractFirstJsonObject(answer), "{\"reasoning\": \"nav has {braces}\", \"confidence_score\": 0.6}");
    EXPECT_EQ(extractFirstJsonObject("no object here"), "");
}

TEST(Gemini, ParsesAssistantAnswer) {
    DiscoveryAssistantResult r = parseAssistantAnswer(
        R"({"faculty_directory_paths": ["/faculty", 7], "department_paths": {"Psychology": ["/psych/people"], "Bad": "x"},
            "confidence_score": 0.65, "reasoning": "menu links"})");
    EXPECT_EQ(r.facultyPaths, vector<string>{ "/faculty" });
    ASSERT_EQ(r.departmentPaths.size(), 1u);
    EXPECT_EQ(r.departmentPaths.at("Psychology").front(), "/psych/people");
    EXPECT_DOUBLE_EQ(r.confidence, 0.65);
    EXPECT_EQ(r.reasoning, "menu links");
}

TEST(Gemini, PromptNamesDepartmentWhenGiven) {
    string prompt = buildDiscoveryPrompt("Example University", "https://www.example.edu", "<body>", "Psychology");
    EXPECT_NE(prompt.find("Department: Psychology"), string::npos);
    EXPECT_NE(prompt.find("Base URL: https://www.example.edu"), string::npos);
    string general = buildDiscoveryPrompt("Example University", "https://www.example.edu", "<body>", "");
    EXPECT_EQ(general.find("Department:"), string::npos);
}

TEST(Gemini, AssistantRoundTripThroughHttp) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu", "<html><head><script>x</script></head><body><nav>Faculty</nav></body></html>");
    http.setPostResponse(GEMINI_ENDPOINT, geminiReply(
        "{\"faculty_directory_paths\": [\"/people\"], \"department_paths\": {}, \"confidence_score\": 0.9}"));
    GeminiDiscoveryAssistant assistant(http, "test-key");
    optional<DiscoveryAssistantResult> r = assistant.discoverFacultyDirectories("Example University", "https://www.example.edu", "");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->facultyPaths, vector<string>{ "/people" });
    EXPECT_EQ(http.requestsMatching("key=test-key"), 1u);
    json payload = http.lastPayload();
    string sentPrompt = payload["contents"][0]["parts"][0]["text"].get<string>();
    EXPECT_NE(sentPrompt.find("<body><nav>Faculty</nav>"), string::npos);
    EXPECT_EQ(sentPrompt.find("<script>"), string::npos);
}

TEST(Gemini, NoKeyOrBadAnswerGivesNothing) {
    FakeHttpClient http;
    http.addPage("https://www.example.edu", "<html><body></body></html>");
    GeminiDiscoveryAssistant keyless(http, "");
    EXPECT_FALSE(keyless.discoverFacultyDirectories("Example University", "https://www.example.edu", "").has_value());
    EXPECT_EQ(http.requestCount(), 0u);

    http.setPostResponse(GEMINI_ENDPOINT, geminiReply("I could not find anything, sorry."));
    GeminiDiscoveryAssistant assistant(http, "test-key");
    EXPECT_FALSE(assistant.discoverFacultyDirectories("Example University", "https://www.example.edu", "").has_value());
}
