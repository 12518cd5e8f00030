#pragma once

#include <string>
#include <vector>
#include <cctype>
#include <cstdio>
#include <cstdint>
#include <sstream>
#include <algorithm>

using namespace std;

inline string toLowerStr(const string& s) {
    string r(s);
    transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return (char)tolower(c); });
    return r;
}

inline string trimStr(const string& s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == string::npos) return string();
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

inline string collapseWhitespace(const string& s) {
    string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (unsigned char c : s) {
        if (isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out.push_back(' ');
        pendingSpace = false;
        out.push_back((char)c);
    }
    return out;
}

inline string stripTags(const string& html) {
    string out;
    out.reserve(html.size());
    bool inTag = false;
    for (char c : html) {
        if (c == '<') inTag = true;
        else if (c == '>') inTag = false;
        else if (!inTag) {
            if (c == '\n' || c == '\r' || c == '\t') out.push_back(' ');
            else out.push_back(c);
        }
    }
    return out;
}

inline string trimPunctEdges(const string& s) {
    size_t i = 0, j = s.size();
    while (i < j && ispunct((unsigned char)s[i])) ++i;
    while (j > i && ispunct((unsigned char)s[j - 1])) --j;
    if (i >= j) return string();
    return s.substr(i, j - i);
}

inline bool containsAnyKeywordCaseInsensitive(const string& text, const vector<string>& keywords) {
    if (text.empty() || keywords.empty()) return false;
    string lowerText = toLowerStr(text);
    for (const string& kw : keywords) {
        string lowerKw = toLowerStr(kw);
        if (!lowerKw.empty() && lowerText.find(lowerKw) != string::npos) {
            return true;
        }
    }
    return false;
}

inline size_t countKeywordHits(const string& lowerText, const vector<string>& keywords) {
    size_t hits = 0;
    for (const auto& kw : keywords) {
        if (lowerText.find(kw) != string::npos) ++hits;
    }
    return hits;
}

inline vector<string> splitWords(const string& s) {
    vector<string> words;
    istringstream iss(s);
    string w;
    while (iss >> w) words.push_back(w);
    return words;
}

inline vector<string> splitOn(const string& s, char delim) {
    vector<string> parts;
    string cur;
    for (char c : s) {
        if (c == delim) {
            parts.push_back(cur);
            cur.clear();
        }
        else cur.push_back(c);
    }
    parts.push_back(cur);
    return parts;
}

inline string joinStrings(const vector<string>& parts, const string& sep) {
    string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

inline bool startsWith(const string& s, const string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const string& s, const string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline string replaceAllStr(string s, const string& from, const string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// "computer-science" -> "Computer Science"
inline string titleCaseWords(const string& s) {
    string spaced = replaceAllStr(replaceAllStr(s, "-", " "), "_", " ");
    vector<string> words = splitWords(spaced);
    for (auto& w : words) {
        w = toLowerStr(w);
        if (!w.empty()) w[0] = (char)toupper((unsigned char)w[0]);
    }
    return joinStrings(words, " ");
}

// Letters, digits and single spaces only.
inline string stripPunctuation(const string& s) {
    string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (isalnum(c) || isspace(c) || c >= 0x80) out.push_back((char)c);
    }
    return out;
}

inline double alphaRatio(const string& s) {
    if (s.empty()) return 0.0;
    size_t alpha = 0;
    for (unsigned char c : s) {
        if (isalpha(c)) ++alpha;
    }
    return (double)alpha / (double)s.size();
}

// FNV-1a, 64 bit, as hex.
inline string stableHashHex(const string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
    return string(buf);
}
