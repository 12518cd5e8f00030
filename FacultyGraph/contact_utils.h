#pragma once

#include <string>
#include <vector>
#include <cctype>
#include <cstddef>
#include <algorithm>
#include <sstream>
#include <set>

#include "config.h"
#include "string_utils.h"

using namespace std;

// Academic rank and role words that mark a line as a title.
static const vector<string> TITLE_KEYWORDS = {
    "professor", "lecturer", "instructor", "dean", "director", "chair", "head of",
    "emeritus", "emerita", "postdoc", "postdoctoral", "researcher", "research scientist",
    "scientist", "fellow", "provost", "president", "coordinator", "adjunct", "visiting",
    "faculty member", "teaching"
};

inline bool looksLikeEmail(const string& token) {
    auto atPos = token.find('@');
    if (atPos == string::npos) return false;
    if (atPos == 0 || atPos + 1 >= token.size()) return false;
    string domain = token.substr(atPos + 1);
    auto dotPos = domain.rfind('.');
    if (dotPos == string::npos) return false;
    if (dotPos == 0 || domain.size() - dotPos - 1 < 2) return false;
    if (count(token.begin(), token.end(), '@') != 1) return false;
    if (token.size() < 5 || token.size() > 254) return false;
    return true;
}

inline bool looksLikeStrictPhone(const std::string& token) {
    if (token.empty()) return false;
    if (token.size() > 40) return false;
    if (token[0] != '+' && token[0] != '(' && !isdigit((unsigned char)token[0])) return false;
    int digits = 0;
    for (char c : token) {
        if (isdigit((unsigned char)c)) ++digits;
        else if (c == '+' || c == '-' || c == ' ' || c == '(' || c == ')' || c == '.') continue;
        else return false;
    }
    return (digits >= 7 && digits <= 15);
}

inline bool looksLikeTitle(const string& text) {
    return containsAnyKeywordCaseInsensitive(text, TITLE_KEYWORDS);
}

// Plain-text emails, found by growing outward from each '@'.
inline vector<string> findEmailsInText(const string& text) {
    vector<string> results;
    size_t pos = 0;
    while (true) {
        size_t atPos = text.find('@', pos);
        if (atPos == string::npos) break;

        size_t left = atPos;
        while (left > 0 &&
            (isalnum((unsigned char)text[left - 1]) ||
                text[left - 1] == '.' || text[left - 1] == '_' ||
                text[left - 1] == '-' || text[left - 1] == '+' || text[left - 1] == '%'))
            left--;

        size_t right = atPos + 1;
        while (right < text.size() &&
            (isalnum((unsigned char)text[right]) || text[right] == '.' || text[right] == '-'))
            right++;

        string candidate = trimPunctEdges(text.substr(left, right - left));
        if (looksLikeEmail(candidate) &&
            find(results.begin(), results.end(), candidate) == results.end()) {
            results.push_back(candidate);
        }
        pos = right > atPos ? right : atPos + 1;
    }
    return results;
}

inline string emailFromMailto(const string& href) {
    string low = toLowerStr(href);
    if (!startsWith(low, "mailto:")) return string();
    string email = href.substr(7);
    size_t q = email.find('?');
    if (q != string::npos) email = email.substr(0, q);
    email = trimPunctEdges(trimStr(email));
    return looksLikeEmail(email) ? email : string();
}

inline string phoneFromTel(const string& href) {
    string low = toLowerStr(href);
    if (!startsWith(low, "tel:")) return string();
    string phone = trimStr(href.substr(4));
    return looksLikeStrictPhone(phone) ? phone : string();
}

// First phone number in free text; tokens are joined pairwise so "(412) 268-1234" is seen whole.
inline string findPhoneInText(const string& text) {
    vector<string> tokens;
    {
        istringstream iss(text);
        string tok;
        while (iss >> tok) {
            tokens.push_back(tok);
            if (tokens.size() >= MAX_SCAN_TOKENS) break;
        }
    }
    for (size_t i = 0; i < tokens.size(); ++i) {
        string single = tokens[i];
        while (!single.empty() && (single.back() == ',' || single.back() == ';')) single.pop_back();
        if (looksLikeStrictPhone(single)) return single;
        if (i + 1 < tokens.size()) {
            string pairTok = tokens[i] + " " + tokens[i + 1];
            while (!pairTok.empty() && (pairTok.back() == ',' || pairTok.back() == ';')) pairTok.pop_back();
            if (looksLikeStrictPhone(pairTok)) return pairTok;
        }
    }
    return string();
}

inline size_t countTitledNames(const string& text) {
    size_t hits = 0;
    for (const string& prefix : { string("Dr. "), string("Prof. "), string("Professor ") }) {
        size_t pos = 0;
        while ((pos = text.find(prefix, pos)) != string::npos) {
            size_t next = pos + prefix.size();
            if (next < text.size() && isalnum((unsigned char)text[next])) ++hits;
            pos = next;
        }
    }
    return hits;
}
