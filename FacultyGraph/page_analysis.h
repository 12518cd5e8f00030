#pragma once

#include <string>
#include <vector>
#include <algorithm>

#include "contact_utils.h"
#include "html_parser.h"
#include "string_utils.h"
#include "university_pattern.h"

using namespace std;

static const vector<string> FACULTY_PROFILE_INDICATORS = {
    "faculty", "professor", "dr.", "phd", "research", "teaching", "email", "office", "phone", "cv", "publications"
};

static const vector<string> PERSON_CLASS_TOKENS = { "faculty", "person", "profile", "member" };
static const vector<string> PERSON_CLASS_FRAGMENTS = { "faculty", "person", "profile" };

// Number of distinct faculty indicator words in a piece of text.
inline size_t facultyIndicatorHits(const string& text) {
    return countKeywordHits(toLowerStr(text), FACULTY_PROFILE_INDICATORS);
}

inline bool containsFacultyIndicators(const string& text) {
    return facultyIndicatorHits(text) > 0;
}

inline StructureType detectStructureType(DomNode root) {
    if (!root) return StructureType::Unknown;
    if (hasDescendantTag(root, { "table" })) return StructureType::Table;
    vector<DomNode> found;
    collectElements(root, [](DomNode n) { return classContains(n, "card"); }, found);
    if (!found.empty()) return StructureType::Cards;
    collectElements(root, [](DomNode n) {
        return hasClassToken(n, "grid") || hasClassToken(n, "row") || classContains(n, "grid");
    }, found);
    if (!found.empty()) return StructureType::Grid;
    if (hasDescendantTag(root, { "ul", "ol" })) return StructureType::List;
    return StructureType::Unknown;
}

// Largest of: person-like class elements, e-mail addresses, "Dr."/"Prof." mentions.
inline size_t estimateFacultyCount(DomNode root) {
    if (!root) return 0;
    size_t classCount = 0;
    vector<DomNode> all;
    collectElements(root, [](DomNode) { return true; }, all);
    for (DomNode n : all) {
        for (const auto& token : PERSON_CLASS_TOKENS) {
            if (hasClassToken(n, token)) ++classCount;
        }
        for (const auto& fragment : PERSON_CLASS_FRAGMENTS) {
            if (classContains(n, fragment)) ++classCount;
        }
    }
    string text = nodeText(root);
    size_t emailCount = findEmailsInText(text).size();
    size_t titleCount = countTitledNames(text);
    return max(classCount, max(emailCount, titleCount));
}

struct PageSummary {
    bool parsed = false;
    string title;
    string text;
    size_t indicatorHits = 0;
    size_t estimatedFacultyCount = 0;
    StructureType structureType = StructureType::Unknown;
};

inline PageSummary summarizePage(const string& html) {
    PageSummary s;
    HtmlDocument doc(html);
    if (!doc.valid()) return s;
    s.parsed = true;
    vector<DomNode> titles = elementsByTag(doc.root(), { "title" });
    if (!titles.empty()) s.title = nodeText(titles.front());
    s.text = nodeText(doc.root());
    s.indicatorHits = facultyIndicatorHits(s.text);
    s.estimatedFacultyCount = estimateFacultyCount(doc.root());
    s.structureType = detectStructureType(doc.root());
    return s;
}
