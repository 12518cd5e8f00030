#pragma once

#include <string>
#include <vector>
#include <set>
#include <cctype>

#include "string_utils.h"

using namespace std;

static const set<string> NAME_TITLE_TOKENS = { "dr", "prof", "professor", "phd", "mr", "mrs", "ms" };

static const set<string> NAME_PARTICLES = { "van", "von", "de", "da", "del", "della", "der", "den", "la", "le", "di", "du", "bin", "al", "el", "dos", "das", "st" };

// Words that never appear in a listed person's name but do appear in link text.
static const set<string> GENERIC_LINK_WORDS = {
    "faculty", "directory", "staff", "people", "person", "department", "dept", "school", "college",
    "university", "program", "programs", "research", "news", "events", "event", "contact", "about",
    "home", "more", "view", "read", "learn", "click", "here", "profile", "profiles", "website", "page",
    "login", "search", "menu", "apply", "admissions", "graduate", "undergraduate", "students", "student",
    "alumni", "courses", "course", "center", "centre", "institute", "lab", "laboratory", "office",
    "resources", "services", "calendar", "giving", "jobs", "careers", "library", "campus", "privacy",
    "policy", "accessibility", "map", "directions", "next", "previous", "back", "top", "sitemap",
    "overview", "areas", "sciences", "studies", "emeriti", "emeritus", "affiliated", "adjunct",
    "email", "phone", "bio", "cv", "publications", "site", "all", "our", "us", "the", "and", "for", "with",
    "scholar", "google", "homepage", "personal", "webpage", "web", "vitae", "curriculum", "resume", "orcid",
    "linkedin", "github", "twitter", "researchgate", "science", "engineering", "computer", "group", "download"
};

// Lower-cased, honorifics and punctuation removed, single-spaced.
inline string normalizeName(const string& name) {
    string cleaned = stripPunctuation(toLowerStr(name));
    vector<string> kept;
    for (const auto& tok : splitWords(cleaned)) {
        if (NAME_TITLE_TOKENS.count(tok)) continue;
        kept.push_back(tok);
    }
    return joinStrings(kept, " ");
}

inline string normalizeInstitutionName(const string& name) {
    string cleaned = stripPunctuation(toLowerStr(name));
    vector<string> kept;
    for (const auto& tok : splitWords(cleaned)) {
        if (tok == "university" || tok == "college" || tok == "institute") continue;
        kept.push_back(tok);
    }
    return joinStrings(kept, " ");
}

inline string nameSurname(const string& name) {
    vector<string> words = splitWords(normalizeName(name));
    return words.empty() ? string() : words.back();
}

inline bool isNameToken(const string& tok) {
    if (tok.empty()) return false;
    bool hasAlpha = false;
    for (unsigned char c : tok) {
        if (isalpha(c) || c >= 0x80) hasAlpha = true;
        else if (c != '.' && c != '\'' && c != '-') return false;
    }
    if (!hasAlpha) return false;
    unsigned char first = (unsigned char)tok[0];
    if (isupper(first) || first >= 0x80) return true;
    return NAME_PARTICLES.count(toLowerStr(tok)) > 0;
}

// 2 to 6 capitalised tokens, no generic directory words, leading honorific allowed.
inline bool isPlausiblePersonName(const string& text) {
    string s = collapseWhitespace(text);
    if (s.size() < 4 || s.size() > 60) return false;
    vector<string> tokens = splitWords(s);
    while (!tokens.empty() && NAME_TITLE_TOKENS.count(toLowerStr(trimPunctEdges(tokens.front())))) {
        tokens.erase(tokens.begin());
    }
    // Trailing credentials: "Jane Smith, PhD"
    while (!tokens.empty() && NAME_TITLE_TOKENS.count(toLowerStr(trimPunctEdges(tokens.back())))) {
        tokens.pop_back();
    }
    if (tokens.size() < 2 || tokens.size() > 6) return false;
    size_t substantive = 0;
    for (auto tok : tokens) {
        if (!tok.empty() && tok.back() == ',') tok.pop_back();
        if (!isNameToken(tok)) return false;
        string low = toLowerStr(trimPunctEdges(tok));
        if (GENERIC_LINK_WORDS.count(low)) return false;
        if (low.size() > 1) ++substantive;
    }
    return substantive >= 2;
}

// Display form of a listed name: whitespace collapsed, trailing comma dropped.
inline string cleanPersonName(const string& text) {
    string s = trimStr(collapseWhitespace(text));
    while (!s.empty() && (s.back() == ',' || s.back() == ';')) s.pop_back();
    return s;
}
