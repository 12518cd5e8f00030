#pragma once

#include <string>
#include <vector>
#include <cmath>
#include <algorithm>

#include "string_utils.h"
#include "name_utils.h"

using namespace std;

static const vector<string> LAB_URL_PATTERNS = { "lab", "laboratory", "research", "center", "group" };
static const vector<string> DIRECTORY_URL_PATTERNS = { "faculty", "people", "directory" };

struct ScoreCandidate {
    string url;
    string title;
    string snippet;
};

// What the candidate is expected to be about. Empty fields contribute nothing.
struct ScoreQuery {
    string personName;
    string topic;
    vector<string> urlPatterns;
};

inline double clampConfidence(double v) {
    if (std::isnan(v)) return 0.0;
    return min(1.0, max(0.0, v));
}

inline double roundScore(double v) {
    return std::round(v * 1000.0) / 1000.0;
}

// Additive heuristic, clamped to [0,1]:
//   .edu host +0.4, .org +0.2, .gov +0.15
//   any name token (>2 chars) in url or title +0.3
//   topic words (>3 chars) in url/title/snippet +0.1 each, at most +0.3
//   any url pattern in the url +0.2
inline double scoreCandidate(const ScoreCandidate& candidate, const ScoreQuery& query) {
    string url = toLowerStr(candidate.url);
    string title = toLowerStr(candidate.title);
    string snippet = toLowerStr(candidate.snippet);
    double score = 0.0;

    if (url.find(".edu") != string::npos) score += 0.4;
    else if (url.find(".org") != string::npos) score += 0.2;
    else if (url.find(".gov") != string::npos) score += 0.15;

    for (const auto& part : splitWords(normalizeName(query.personName))) {
        if (part.size() > 2 && (url.find(part) != string::npos || title.find(part) != string::npos)) {
            score += 0.3;
            break;
        }
    }

    size_t topicHits = 0;
    for (const auto& word : splitWords(toLowerStr(query.topic))) {
        if (word.size() <= 3) continue;
        if (url.find(word) != string::npos || title.find(word) != string::npos || snippet.find(word) != string::npos) {
            ++topicHits;
        }
    }
    if (topicHits > 0) score += min(0.3, 0.1 * (double)topicHits);

    for (const auto& pattern : query.urlPatterns) {
        if (url.find(pattern) != string::npos) {
            score += 0.2;
            break;
        }
    }
    return roundScore(clampConfidence(score));
}

inline ScoreQuery labScoreQuery(const string& facultyName, const string& labName) {
    return ScoreQuery{ facultyName, labName, LAB_URL_PATTERNS };
}

inline ScoreQuery directoryScoreQuery(const string& targetDepartment) {
    return ScoreQuery{ string(), targetDepartment, DIRECTORY_URL_PATTERNS };
}

// Sort weight for a department page: staff-only listings sink, faculty listings rise.
inline double directoryUrlWeight(const string& url) {
    string low = toLowerStr(url);
    bool staff = low.find("staff") != string::npos;
    bool faculty = low.find("faculty") != string::npos;
    if (staff && !faculty) return 0.1;
    if (faculty && !staff) return 1.5;
    return 1.0;
}
