#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

#include "config.h"
#include "collaborators.h"
#include "http_utils.h"
#include "log_utils.h"
#include "string_utils.h"

using namespace std;
using json = nlohmann::json;

static const size_t ASSISTANT_HTML_SNIPPET_CHARS = 4000;

// Pulls the answer text out of a generateContent response.
inline string extractGeminiText(const string& resp) {
    json top = json::parse(resp);
    if (top.contains("candidates") && top["candidates"].is_array()) {
        for (auto& c : top["candidates"]) {
            if (!c.is_object() || !c.contains("content")) continue;
            if (c["content"].is_string()) return c["content"].get<string>();
            if (c["content"].is_object() && c["content"].contains("parts") && c["content"]["parts"].is_array()) {
                for (auto& p : c["content"]["parts"]) {
                    if (p.is_object() && p.contains("text") && p["text"].is_string()) {
                        return p["text"].get<string>();
                    }
                }
            }
        }
    }
    if (top.contains("error")) {
        logWarn("Gemini", "API error: " + top["error"].dump());
    }
    return string();
}

inline string extractFirstJsonObject(const string& text) {
    string clean = text;
    // Drop ```json fences
    size_t fencePos = clean.find("```");
    if (fencePos != string::npos) {
        size_t endFence = clean.find("```", fencePos + 3);
        if (endFence != string::npos) {
            clean = clean.substr(fencePos + 3, endFence - (fencePos + 3));
        }
    }
    size_t start = clean.find('{');
    if (start == string::npos) return "";
    int depth = 0;
    bool inString = false;
    for (size_t i = start; i < clean.size(); ++i) {
        char c = clean[i];
        if (inString) {
            if (c == '\\') ++i;
            else if (c == '"') inString = false;
            continue;
        }
        if (c == '"') inString = true;
        else if (c == '{') ++depth;
        else if (c == '}') {
            --depth;
            if (depth == 0) {
                return clean.substr(start, i - start + 1);
            }
        }
    }
    return "";
}

// Throws json::exception when the object is not valid JSON.
inline DiscoveryAssistantResult parseAssistantAnswer(const string& answerText) {
    DiscoveryAssistantResult result;
    string maybeJson = extractFirstJsonObject(answerText);
    if (maybeJson.empty()) return result;
    json parsed = json::parse(maybeJson);
    if (parsed.contains("faculty_directory_paths") && parsed["faculty_directory_paths"].is_array()) {
        for (auto& p : parsed["faculty_directory_paths"]) {
            if (p.is_string()) result.facultyPaths.push_back(p.get<string>());
        }
    }
    if (parsed.contains("department_paths") && parsed["department_paths"].is_object()) {
        for (auto& kv : parsed["department_paths"].items()) {
            if (!kv.value().is_array()) continue;
            for (auto& p : kv.value()) {
                if (p.is_string()) result.departmentPaths[kv.key()].push_back(p.get<string>());
            }
        }
    }
    if (parsed.contains("confidence_score") && parsed["confidence_score"].is_number()) {
        result.confidence = parsed["confidence_score"].get<double>();
    }
    result.reasoning = parsed.value("reasoning", string());
    return result;
}

inline string buildDiscoveryPrompt(const string& universityName, const string& baseUrl,
                                   const string& htmlSnippet, const string& department) {
    string prompt;
    prompt += "You find faculty and department directory pages on university websites.\n";
    prompt += "Look at navigation, menus and footer links for Faculty, People, Directory, Academics, Departments, Schools.\n";
    prompt += "Ignore Admissions, Contact, News, Events and Login links.\n";
    prompt += "Output ONLY a single JSON object (no prose, no backticks) shaped like:\n";
    prompt += "{\"faculty_directory_paths\":[\"/faculty\"],\"department_paths\":{\"Psychology\":[\"/psych/people\"]},";
    prompt += "\"confidence_score\":0.8,\"reasoning\":\"...\"}\n";
    prompt += "University: " + universityName + "\n";
    if (!department.empty()) prompt += "Department: " + department + "\n";
    prompt += "Base URL: " + baseUrl + "\n";
    prompt += "HTML Snippet:\n---\n" + htmlSnippet + "\n---\n";
    if (!department.empty()) {
        prompt += "Task: find the faculty directory path for the " + department + " department.\n";
    }
    else {
        prompt += "Task: find the main faculty directory and the faculty page of every department you can see.\n";
    }
    return prompt;
}

// Discovery assistant backed by the Gemini generateContent API.
class GeminiDiscoveryAssistant : public DiscoveryAssistant {
public:
    GeminiDiscoveryAssistant(HttpClient& http, string apiKey)
        : http_(http), apiKey_(std::move(apiKey)) {}

    optional<DiscoveryAssistantResult> discoverFacultyDirectories(const string& universityName,
                                                                 const string& baseUrl,
                                                                 const string& department) override {
        if (apiKey_.empty()) {
            logWarn("Gemini", "no API key configured, skipping assistant");
            return nullopt;
        }
        HttpResponse home = http_.get(baseUrl);
        if (!home.ok()) {
            logWarn("Gemini", "cannot fetch " + baseUrl + " for analysis");
            return nullopt;
        }
        string snippet = home.body;
        size_t bodyPos = toLowerStr(snippet).find("<body");
        if (bodyPos != string::npos) snippet = snippet.substr(bodyPos);
        if (snippet.size() > ASSISTANT_HTML_SNIPPET_CHARS) snippet.resize(ASSISTANT_HTML_SNIPPET_CHARS);

        json body;
        body["contents"] = json::array();
        json contentObj;
        contentObj["parts"] = json::array();
        json part;
        part["text"] = buildDiscoveryPrompt(universityName, baseUrl, snippet, department);
        contentObj["parts"].push_back(part);
        body["contents"].push_back(contentObj);

        HttpResponse resp = http_.postJson(GEMINI_ENDPOINT + "?key=" + apiKey_, body, {});
        if (!resp.ok()) {
            logWarn("Gemini", "request failed (" + to_string(resp.status) + ") " + resp.error);
            return nullopt;
        }
        try {
            string answer = extractGeminiText(resp.body);
            if (answer.empty()) return nullopt;
            DiscoveryAssistantResult result = parseAssistantAnswer(answer);
            if (result.facultyPaths.empty() && result.departmentPaths.empty()) return nullopt;
            return result;
        }
        catch (const json::exception& e) {
            logWarn("Gemini", string("unparseable answer: ") + e.what());
            return nullopt;
        }
    }

private:
    HttpClient& http_;
    string apiKey_;
};
