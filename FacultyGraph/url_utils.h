#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <algorithm>

#include "string_utils.h"

using namespace std;

struct ParsedUrl {
    string scheme;
    string host;
    string port;
    string path;
    string query;
    string fragment;
};

inline ParsedUrl parseUrl(const string& url) {
    ParsedUrl p;
    string rest = trimStr(url);
    size_t schemeEnd = rest.find("://");
    if (schemeEnd != string::npos) {
        p.scheme = toLowerStr(rest.substr(0, schemeEnd));
        rest = rest.substr(schemeEnd + 3);
    }
    else if (startsWith(rest, "//")) {
        rest = rest.substr(2);
    }
    else {
        // Relative reference, no authority
        size_t hashPos = rest.find('#');
        if (hashPos != string::npos) {
            p.fragment = rest.substr(hashPos + 1);
            rest = rest.substr(0, hashPos);
        }
        size_t qPos = rest.find('?');
        if (qPos != string::npos) {
            p.query = rest.substr(qPos + 1);
            rest = rest.substr(0, qPos);
        }
        p.path = rest;
        return p;
    }
    size_t authEnd = rest.find_first_of("/?#");
    string authority = rest.substr(0, authEnd);
    rest = authEnd == string::npos ? string() : rest.substr(authEnd);
    size_t at = authority.rfind('@');
    if (at != string::npos) authority = authority.substr(at + 1);
    size_t colon = authority.find(':');
    if (colon != string::npos) {
        p.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
    }
    p.host = toLowerStr(authority);
    size_t hashPos = rest.find('#');
    if (hashPos != string::npos) {
        p.fragment = rest.substr(hashPos + 1);
        rest = rest.substr(0, hashPos);
    }
    size_t qPos = rest.find('?');
    if (qPos != string::npos) {
        p.query = rest.substr(qPos + 1);
        rest = rest.substr(0, qPos);
    }
    p.path = rest.empty() ? "/" : rest;
    return p;
}

inline string urlHost(const string& url) {
    return parseUrl(url).host;
}

inline string urlOrigin(const string& url) {
    ParsedUrl p = parseUrl(url);
    if (p.host.empty()) return string();
    string origin = (p.scheme.empty() ? "https" : p.scheme) + "://" + p.host;
    if (!p.port.empty()) origin += ":" + p.port;
    return origin;
}

inline string stripTrailingSlash(string url) {
    while (url.size() > 1 && url.back() == '/') url.pop_back();
    return url;
}

inline string ensureTrailingSlash(const string& url) {
    if (url.empty() || url.back() == '/') return url;
    return url + "/";
}

inline string urlWithoutFragment(const string& url) {
    size_t hashPos = url.find('#');
    return hashPos == string::npos ? url : url.substr(0, hashPos);
}

inline bool isHttpUrl(const string& url) {
    string low = toLowerStr(url);
    return startsWith(low, "http://") || startsWith(low, "https://");
}

// Resolves "." and ".." segments of an absolute path.
inline string normalizeUrlPath(const string& path) {
    vector<string> out;
    vector<string> segments = splitOn(path, '/');
    for (size_t i = 0; i < segments.size(); ++i) {
        const string& seg = segments[i];
        if (seg == ".") continue;
        if (seg == "..") {
            if (out.size() > 1) out.pop_back();
            continue;
        }
        if (seg.empty() && i != 0 && i + 1 != segments.size()) continue;
        out.push_back(seg);
    }
    string joined = joinStrings(out, "/");
    if (joined.empty() || joined[0] != '/') joined = "/" + joined;
    bool trailing = !path.empty() && (path.back() == '/' || endsWith(path, "/.") || endsWith(path, "/.."));
    if (trailing && joined.back() != '/') joined += "/";
    return joined;
}

inline string urlJoin(const string& base, const string& ref) {
    string r = trimStr(ref);
    if (r.empty()) return urlWithoutFragment(base);
    size_t colon = r.find(':');
    if (colon != string::npos && colon > 0 && colon < r.find_first_of("/?#")) {
        bool isScheme = isalpha((unsigned char)r[0]) != 0;
        for (size_t i = 1; i < colon && isScheme; ++i) {
            unsigned char c = (unsigned char)r[i];
            isScheme = isalnum(c) || c == '+' || c == '-' || c == '.';
        }
        if (isScheme) return r;
    }
    ParsedUrl b = parseUrl(base);
    string scheme = b.scheme.empty() ? "https" : b.scheme;
    if (startsWith(r, "//")) return scheme + ":" + r;
    string origin = scheme + "://" + b.host + (b.port.empty() ? "" : ":" + b.port);
    if (r[0] == '#') return urlWithoutFragment(base) + r;
    if (r[0] == '?') return origin + b.path + r;
    string suffix;
    size_t cut = r.find_first_of("?#");
    if (cut != string::npos) {
        suffix = r.substr(cut);
        r = r.substr(0, cut);
    }
    string path;
    if (r[0] == '/') {
        path = r;
    }
    else {
        string dir = b.path.empty() ? "/" : b.path.substr(0, b.path.rfind('/') + 1);
        path = dir + r;
    }
    return origin + normalizeUrlPath(path) + suffix;
}

// "www.psych.arizona.edu" -> "arizona.edu"; keeps three labels for "ox.ac.uk" style hosts.
inline string registrableDomain(const string& host) {
    vector<string> labels = splitOn(toLowerStr(host), '.');
    if (labels.size() <= 2) return toLowerStr(host);
    size_t keep = 2;
    const string& tld = labels.back();
    const string& second = labels[labels.size() - 2];
    if (tld.size() == 2 && (second == "ac" || second == "edu" || second == "co" || second == "gov" || second == "org")) {
        keep = 3;
    }
    vector<string> tail(labels.end() - (ptrdiff_t)min(keep, labels.size()), labels.end());
    return joinStrings(tail, ".");
}

inline string hostWithoutWww(const string& host) {
    return startsWith(host, "www.") ? host.substr(4) : host;
}

// Key for URL de-duplication: no fragment, no trailing slash, lower-cased host.
inline string urlDedupKey(const string& url) {
    ParsedUrl p = parseUrl(url);
    string path = stripTrailingSlash(p.path);
    if (path == "/") path.clear();
    return hostWithoutWww(p.host) + path + (p.query.empty() ? "" : "?" + p.query);
}

// Directory-path entries are either absolute URLs or fragments relative to the site root.
inline string resolveAgainstBase(const string& baseUrl, const string& pathOrUrl) {
    if (isHttpUrl(pathOrUrl)) return pathOrUrl;
    string path = pathOrUrl;
    while (!path.empty() && path[0] == '/') path.erase(0, 1);
    return urlJoin(ensureTrailingSlash(baseUrl), path);
}
