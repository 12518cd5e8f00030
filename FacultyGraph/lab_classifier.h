#pragma once

#include <string>
#include <vector>
#include <set>

#include "collaborators.h"
#include "string_utils.h"

using namespace std;

static const set<string> LAB_KEYWORDS = { "lab", "laboratory", "center", "centre", "group", "clinic", "institute", "facility", "unit" };

static const vector<string> NOT_LAB_PATTERNS = {
    "email", "phone", "address", "contact", "copyright",
    "all rights reserved", "privacy policy", "terms of service",
    "home", "about", "news", "events", "calendar",
    "login", "register", "search", "menu", "navigation"
};

inline bool isObviouslyNotLab(const string& text) {
    if (text.empty()) return true;
    string low = toLowerStr(text);
    for (const auto& p : NOT_LAB_PATTERNS) {
        if (low.find(p) != string::npos) return true;
    }
    return alphaRatio(text) < 0.5;
}

// Keyword heuristic stand-in for the trained classifier.
class KeywordLabClassifier : public LabClassifier {
public:
    LabPrediction predict(const string& text) const override {
        LabPrediction p;
        string s = trimStr(collapseWhitespace(text));
        if (s.size() < 3 || isObviouslyNotLab(s)) {
            p.confidence = 0.05;
            return p;
        }
        vector<string> words = splitWords(s);
        bool keyword = false;
        size_t capitalised = 0;
        for (const auto& w : words) {
            string bare = toLowerStr(trimPunctEdges(w));
            string singular = (bare.size() > 1 && bare.back() == 's') ? bare.substr(0, bare.size() - 1) : bare;
            if (LAB_KEYWORDS.count(bare) || LAB_KEYWORDS.count(singular)) keyword = true;
            if (!w.empty() && isupper((unsigned char)w[0])) ++capitalised;
        }
        if (!keyword) {
            p.confidence = 0.1;
            return p;
        }
        double conf = 0.55;
        if (words.size() >= 2 && words.size() <= 8) conf += 0.1;
        if (capitalised * 2 >= words.size()) conf += 0.15;
        string low = toLowerStr(s);
        string last = toLowerStr(trimPunctEdges(words.back()));
        if (LAB_KEYWORDS.count(last) || startsWith(low, "laboratory of") || startsWith(low, "center for") ||
            startsWith(low, "centre for") || startsWith(low, "institute for")) {
            conf += 0.1;
        }
        if (s.back() == '.') conf -= 0.1;
        p.confidence = min(1.0, conf);
        p.isLabName = p.confidence >= 0.5;
        return p;
    }
};
