#pragma once

#include <string>
#include <vector>
#include <set>
#include <functional>
#include <optional>
#include <algorithm>
#include <exception>

#include "collaborators.h"
#include "config.h"
#include "contact_utils.h"
#include "faculty_record.h"
#include "html_parser.h"
#include "lab_classifier.h"
#include "log_utils.h"
#include "name_utils.h"
#include "page_analysis.h"
#include "page_renderer.h"
#include "pipeline_issue.h"
#include "string_utils.h"
#include "university_pattern.h"
#include "url_utils.h"

using namespace std;

// Exact class tokens used by directory templates for one person.
static const set<string> PERSON_ITEM_CLASSES = {
    "faculty-member", "faculty-card", "faculty-item", "faculty-listing", "person", "person-card",
    "profile", "profile-card", "staff-member", "people-item", "people-card", "directory-item",
    "directory-entry", "views-row", "member"
};

static const set<string> BLOCK_TAGS = { "div", "li", "tr", "p", "section", "article", "dd" };
static const set<string> CHROME_TAGS = { "nav", "header", "footer", "aside" };
static const set<string> CHROME_CLASS_TOKENS = { "nav", "navbar", "menu", "breadcrumb", "breadcrumbs", "pagination", "pager", "footer" };
static const vector<string> PAGINATION_CLASS_FRAGMENTS = { "pagination", "pager" };
static const vector<string> BOILERPLATE_LINK_TEXT = {
    "read more", "view profile", "full profile", "more info", "learn more", "website", "homepage", "email", "cv"
};
static const vector<string> LAB_LINK_EXCLUDES = {
    "mailto:", "tel:", "javascript:", "facebook.com", "twitter.com", "linkedin.com", "instagram.com",
    "youtube.com", "contact", "email", "phone", "address", "cv.pdf", "resume.pdf"
};
static const vector<string> LAB_LINK_URL_PATTERNS = { "/lab", "/laboratory", "/research", "/center", "/institute", "/~" };
static const vector<string> LAB_LINK_STRONG_PHRASES = { "visit our lab", "visit lab", "lab website", "laboratory website", "lab homepage" };
static const size_t MAX_PAGINATION_LINKS = 10;
static const size_t MAX_SEARCH_RESULTS = 2;
static const double MIN_SEARCH_CONFIDENCE = 0.5;
static const double DEFAULT_ITEM_CONFIDENCE = 0.5;

struct ItemSelector {
    string name;
    function<bool(DomNode)> matches;
};

// Inside nav/header/footer/aside, a role=navigation block, or a menu-like class.
inline bool inNavigationChrome(DomNode node) {
    for (DomNode p = node; p != nullptr; p = p->parent) {
        if (!isElement(p)) continue;
        if (CHROME_TAGS.count(nodeTag(p))) return true;
        if (toLowerStr(nodeAttr(p, "role")) == "navigation") return true;
        for (const auto& token : CHROME_CLASS_TOKENS) {
            if (hasClassToken(p, token)) return true;
        }
    }
    return false;
}

inline bool isNonNavigationalHref(const string& href) {
    string low = toLowerStr(trimStr(href));
    if (low.empty() || low[0] == '#') return false;
    return !startsWith(low, "mailto:") && !startsWith(low, "tel:") && !startsWith(low, "javascript:");
}

inline size_t navigationalLinkCount(DomNode node) {
    size_t n = 0;
    for (const auto& link : collectLinks(node)) {
        if (isNonNavigationalHref(link.href)) ++n;
    }
    return n;
}

inline bool isBoilerplateLinkText(const string& text) {
    string low = toLowerStr(trimStr(text));
    for (const auto& b : BOILERPLATE_LINK_TEXT) {
        if (low == b || startsWith(low, b + " ")) return true;
    }
    return false;
}

// Links a listed person is likely named by: navigational, not boilerplate, a plausible name.
inline vector<PageLink> nameAnchors(DomNode item) {
    vector<PageLink> out;
    for (auto& link : collectLinks(item)) {
        if (!isNonNavigationalHref(link.href)) continue;
        string text = cleanPersonName(link.text);
        if (text.size() < 4 || isBoilerplateLinkText(text)) continue;
        if (!isPlausiblePersonName(text)) continue;
        link.text = text;
        out.push_back(link);
    }
    return out;
}

// Heading or bold text naming the person, paired with the anchor wrapping it, else the
// first valid link after it, else the nearest one before it.
inline optional<pair<string, string>> headingWithNearestLink(DomNode item) {
    for (DomNode label : elementsByTag(item, { "h2", "h3", "h4", "h5", "strong", "b" })) {
        string name = cleanPersonName(nodeText(label));
        if (!isPlausiblePersonName(name)) continue;
        vector<DomNode> all;
        collectElements(item, [](DomNode) { return true; }, all);
        string before;
        bool passed = false;
        for (DomNode n : all) {
            if (n == label) passed = true;
            if (nodeTag(n) != "a") continue;
            string href = nodeAttr(n, "href");
            if (!isNonNavigationalHref(href) || (!passed && isBoilerplateLinkText(nodeText(n)))) continue;
            if (isDescendantOf(label, n) || passed) return make_pair(name, href);
            before = href;
        }
        if (!before.empty()) return make_pair(name, before);
    }
    return nullopt;
}

// Relative hrefs, and absolute ones on the listing page's registrable domain.
inline bool isSameSiteHref(const string& href, const string& pageUrl) {
    string host = urlHost(href);
    if (host.empty()) return true;
    string pageHost = urlHost(pageUrl);
    return !pageHost.empty() && registrableDomain(host) == registrableDomain(pageHost);
}

// Distinct same-site pages the name anchors point at. More than one means several people.
inline size_t distinctProfileTargets(const vector<PageLink>& anchors, const string& pageUrl) {
    set<string> targets;
    for (const auto& a : anchors) {
        if (!isSameSiteHref(a.href, pageUrl)) continue;
        string target = urlWithoutFragment(trimStr(a.href));
        targets.insert(pageUrl.empty() ? stripTrailingSlash(target) : urlDedupKey(urlJoin(pageUrl, target)));
    }
    return targets.size();
}

// Same-site anchors win over off-site ones, then the longest visible text.
inline optional<PageLink> bestProfileAnchor(DomNode item, const string& pageUrl) {
    vector<PageLink> anchors = nameAnchors(item);
    if (anchors.empty()) return nullopt;
    auto best = max_element(anchors.begin(), anchors.end(), [&pageUrl](const PageLink& a, const PageLink& b) {
        bool aLocal = isSameSiteHref(a.href, pageUrl);
        bool bLocal = isSameSiteHref(b.href, pageUrl);
        if (aLocal != bLocal) return bLocal;
        return a.text.size() < b.text.size();
    });
    return *best;
}

inline bool namesAPerson(DomNode item) {
    return !nameAnchors(item).empty() || headingWithNearestLink(item).has_value();
}

// Each text node of a subtree, trimmed, in document order.
inline vector<string> textSegments(DomNode root) {
    vector<string> out;
    vector<DomNode> stack;
    if (root) stack.push_back(root);
    while (!stack.empty()) {
        DomNode cur = stack.back();
        stack.pop_back();
        if (cur->type == LXB_DOM_NODE_TYPE_ELEMENT && NON_CONTENT_TAGS.count(nodeTag(cur))) continue;
        if (cur->type == LXB_DOM_NODE_TYPE_TEXT) {
            lxb_dom_character_data_t* cd = lxb_dom_interface_character_data(cur);
            if (cd && cd->data.data && cd->data.length > 0) {
                string t = trimStr(collapseWhitespace(string((const char*)cd->data.data, cd->data.length)));
                if (!t.empty()) out.push_back(t);
            }
            continue;
        }
        for (DomNode child = cur->last_child; child != nullptr; child = child->prev) stack.push_back(child);
    }
    return out;
}

// Ordered item selectors. Specific person patterns first, the structure's own rows next,
// the generic one-link block last.
inline vector<ItemSelector> itemSelectorCascade(StructureType structure) {
    ItemSelector personClass{ "person-class", [](DomNode n) {
        for (const auto& c : PERSON_ITEM_CLASSES) {
            if (hasClassToken(n, c)) return true;
        }
        return false;
    } };
    ItemSelector personFragment{ "person-class-fragment", [](DomNode n) {
        return BLOCK_TAGS.count(nodeTag(n)) &&
            (classContains(n, "faculty") || classContains(n, "person") || classContains(n, "profile"));
    } };
    ItemSelector card{ "card", [](DomNode n) { return classContains(n, "card"); } };
    ItemSelector tableRow{ "table-row", [](DomNode n) {
        return nodeTag(n) == "tr" && hasDescendantTag(n, { "td" });
    } };
    ItemSelector listItem{ "list-item", [](DomNode n) { return nodeTag(n) == "li"; } };
    ItemSelector grid{ "grid-column", [](DomNode n) {
        return hasClassToken(n, "col") || hasClassToken(n, "item") || classContains(n, "col-");
    } };
    ItemSelector generic{ "generic-block", [](DomNode n) {
        return BLOCK_TAGS.count(nodeTag(n)) && navigationalLinkCount(n) == 1 && nodeText(n).size() > 5;
    } };

    vector<ItemSelector> cascade = { personClass, personFragment };
    switch (structure) {
    case StructureType::Table:
        cascade.push_back(tableRow);
        cascade.push_back(card);
        cascade.push_back(listItem);
        break;
    case StructureType::List:
        cascade.push_back(listItem);
        cascade.push_back(card);
        cascade.push_back(tableRow);
        break;
    case StructureType::Grid:
        cascade.push_back(grid);
        cascade.push_back(card);
        cascade.push_back(listItem);
        cascade.push_back(tableRow);
        break;
    default:
        cascade.push_back(card);
        cascade.push_back(tableRow);
        cascade.push_back(listItem);
        break;
    }
    cascade.push_back(generic);
    return cascade;
}

// Keeps matches naming exactly one person, outermost first: containers whose name links reach
// several profile pages, matches with no name and matches nested in another kept match are dropped.
inline vector<DomNode> refineItems(const vector<DomNode>& matches, const string& pageUrl = string()) {
    vector<DomNode> singles;
    for (DomNode n : matches) {
        if (inNavigationChrome(n)) continue;
        if (distinctProfileTargets(nameAnchors(n), pageUrl) > 1 || !namesAPerson(n)) continue;
        singles.push_back(n);
    }
    vector<DomNode> kept;
    for (DomNode n : singles) {
        bool nested = false;
        for (DomNode other : singles) {
            if (other != n && isDescendantOf(n, other)) {
                nested = true;
                break;
            }
        }
        if (!nested) kept.push_back(n);
    }
    return kept;
}

struct ItemSelection {
    string selector;
    vector<DomNode> items;
};

// First selector with at least MIN_SELECTOR_MATCHES items wins. Otherwise the generic
// selector's result, or failing that the first selector that matched anything.
inline ItemSelection selectFacultyItems(DomNode root, StructureType structure, const string& pageUrl = string()) {
    ItemSelection fallback;
    ItemSelection generic;
    for (const auto& sel : itemSelectorCascade(structure)) {
        vector<DomNode> matches;
        collectElements(root, sel.matches, matches);
        vector<DomNode> items = refineItems(matches, pageUrl);
        if (items.size() >= MIN_SELECTOR_MATCHES) return ItemSelection{ sel.name, items };
        if (sel.name == "generic-block") generic = ItemSelection{ sel.name, items };
        else if (fallback.items.empty() && !items.empty()) fallback = ItemSelection{ sel.name, items };
    }
    return generic.items.empty() ? fallback : generic;
}

// .edu/.org/.gov host, lab words in the text, lab-like path, strong "lab website" phrasing.
inline double labLinkScore(const string& url, const string& text) {
    string u = toLowerStr(url);
    string t = toLowerStr(text);
    double score = 0.0;
    if (u.find(".edu") != string::npos) score += 0.4;
    else if (u.find(".org") != string::npos) score += 0.2;
    else if (u.find(".gov") != string::npos) score += 0.15;
    for (const auto& w : splitWords(stripPunctuation(t))) {
        if (LAB_KEYWORDS.count(w)) score += 0.3;
    }
    for (const auto& p : LAB_LINK_URL_PATTERNS) {
        if (u.find(p) != string::npos) {
            score += 0.2;
            break;
        }
    }
    if (text.size() > 100) score -= 0.1;
    for (const auto& p : LAB_LINK_STRONG_PHRASES) {
        if (t.find(p) != string::npos) {
            score += 0.2;
            break;
        }
    }
    return max(0.0, score);
}

inline bool textHasLabKeyword(const string& text) {
    for (const auto& w : splitWords(stripPunctuation(toLowerStr(text)))) {
        if (LAB_KEYWORDS.count(w)) return true;
    }
    return false;
}

// Pagination anchors: inside pager blocks, page= / /page/ hrefs, or "next" links.
inline vector<string> findPaginationLinks(DomNode root, const string& pageUrl) {
    vector<string> out;
    set<string> seen = { urlDedupKey(pageUrl) };
    for (const auto& link : collectLinks(root)) {
        if (!isNonNavigationalHref(link.href)) continue;
        string low = toLowerStr(link.href);
        bool pager = hasAncestorClass(link.node, PAGINATION_CLASS_FRAGMENTS) ||
            low.find("page=") != string::npos || low.find("/page/") != string::npos ||
            classContains(link.node, "next") || toLowerStr(trimStr(link.text)) == "next";
        if (!pager) continue;
        string url = urlWithoutFragment(urlJoin(pageUrl, link.href));
        if (!isHttpUrl(url)) continue;
        if (!seen.insert(urlDedupKey(url)).second) continue;
        out.push_back(url);
        if (out.size() >= MAX_PAGINATION_LINKS) break;
    }
    return out;
}

struct ExtractorOptions {
    size_t maxExtraPages = MAX_EXTRA_PAGES;
    bool enableLabDiscovery = true;
    bool enableExternalSearch = false;
};

struct DepartmentExtraction {
    vector<RawFacultyRecord> records;
    StructureType structureType = StructureType::Unknown;
    string selector;
    size_t pagesVisited = 0;
    size_t itemsSeen = 0;
    size_t rejected = 0;
    bool cancelled = false;
    vector<PipelineIssue> issues;
};

// Renders department directory pages and turns listed people into raw records.
class AdaptiveExtractor {
public:
    AdaptiveExtractor(PageRenderer& renderer, const LabClassifier* classifier = nullptr,
                      LabSearch* search = nullptr, ExtractorOptions options = ExtractorOptions())
        : renderer_(renderer), classifier_(classifier), search_(search), options_(options) {}

    // Never throws. A page or item that fails is logged, recorded and skipped.
    DepartmentExtraction scrape(const DepartmentInfo& department, const string& universityName,
                                optional<size_t> maxFaculty = nullopt,
                                const function<bool()>& cancelled = function<bool()>()) {
        DepartmentExtraction out;
        set<string> seenProfiles;
        RenderedPage first = renderer_.render(department.url);
        if (!first.ok()) {
            out.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, department.url, first.error });
            return out;
        }
        string firstUrl = first.finalUrl.empty() ? department.url : first.finalUrl;
        vector<string> nextPages;
        try {
            HtmlDocument doc(first.html);
            if (!doc.valid()) {
                out.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, department.url, "unparseable HTML" });
                return out;
            }
            out.structureType = detectStructureType(doc.root());
            extractPage(doc.root(), firstUrl, department, universityName, maxFaculty, seenProfiles, out);
            nextPages = findPaginationLinks(doc.root(), firstUrl);
        }
        catch (const std::exception& e) {
            logWarn("Extractor", department.url + " : " + e.what());
            out.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, department.url, e.what() });
        }
        ++out.pagesVisited;

        size_t extra = 0;
        for (const auto& pageUrl : nextPages) {
            if (extra >= options_.maxExtraPages) break;
            if (maxFaculty && out.records.size() >= *maxFaculty) break;
            if (cancelled && cancelled()) {
                out.cancelled = true;
                break;
            }
            ++extra;
            RenderedPage page = renderer_.render(pageUrl);
            if (!page.ok()) {
                out.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, pageUrl, page.error });
                continue;
            }
            try {
                HtmlDocument doc(page.html);
                if (!doc.valid()) continue;
                extractPage(doc.root(), page.finalUrl.empty() ? pageUrl : page.finalUrl, department, universityName,
                            maxFaculty, seenProfiles, out);
                ++out.pagesVisited;
            }
            catch (const std::exception& e) {
                logWarn("Extractor", pageUrl + " : " + e.what());
                out.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, pageUrl, e.what() });
            }
        }
        logInfo(department.name + ": " + to_string(out.records.size()) + " faculty from " +
                to_string(out.pagesVisited) + " page(s) via " + (out.selector.empty() ? string("none") : out.selector));
        return out;
    }

    // Single-page extraction with no pagination and no rendering, for already fetched HTML.
    vector<RawFacultyRecord> extractFromHtml(const string& html, const string& pageUrl,
                                             const DepartmentInfo& department, const string& universityName) {
        DepartmentExtraction out;
        set<string> seenProfiles;
        HtmlDocument doc(html);
        if (!doc.valid()) return out.records;
        extractPage(doc.root(), pageUrl, department, universityName, nullopt, seenProfiles, out);
        return out.records;
    }

    // One listed person, or nullopt when no name with a resolvable profile URL is present.
    optional<RawFacultyRecord> extractItem(DomNode item, const string& pageUrl,
                                           const DepartmentInfo& department, const string& universityName) {
        optional<PageLink> anchor = bestProfileAnchor(item, pageUrl);
        string name;
        string href;
        if (anchor) {
            name = anchor->text;
            href = anchor->href;
        }
        else {
            optional<pair<string, string>> fallback = headingWithNearestLink(item);
            if (!fallback) return nullopt;
            name = fallback->first;
            href = fallback->second;
        }
        string profileUrl = urlWithoutFragment(urlJoin(pageUrl, href));
        if (!isHttpUrl(profileUrl)) return nullopt;

        RawFacultyRecord r;
        r.name = name;
        r.profileUrl = profileUrl;
        r.sourceUrl = pageUrl;
        r.department = department.name;
        if (!universityName.empty()) r.university = universityName;
        r.extractionMethod = "adaptive";
        r.confidence = department.confidence > 0.0 ? department.confidence : DEFAULT_ITEM_CONFIDENCE;

        vector<PageLink> links = collectLinks(item);
        vector<string> segments = textSegments(item);
        string text = nodeText(item);

        for (const auto& link : links) {
            string email = emailFromMailto(link.href);
            if (!email.empty()) {
                r.email = email;
                break;
            }
        }
        if (!r.email) {
            vector<string> emails = findEmailsInText(text);
            if (!emails.empty()) r.email = emails.front();
        }

        for (const auto& link : links) {
            string phone = phoneFromTel(link.href);
            if (!phone.empty()) {
                r.phone = phone;
                break;
            }
        }
        if (!r.phone) {
            string phone = findPhoneInText(text);
            if (!phone.empty()) r.phone = phone;
        }

        string lowName = toLowerStr(name);
        for (const auto& seg : segments) {
            string low = toLowerStr(seg);
            if (low == lowName || seg.size() > 150) continue;
            if (!r.title && looksLikeTitle(seg) && low.find(lowName) == string::npos) r.title = trimPunctEdges(seg);
            if (!r.office && startsWith(low, "office")) {
                size_t colon = seg.find(':');
                string office = trimStr(colon == string::npos ? seg.substr(6) : seg.substr(colon + 1));
                if (!office.empty()) r.office = office;
            }
        }

        if (options_.enableLabDiscovery) discoverLab(links, segments, pageUrl, universityName, r);
        return r;
    }

private:
    void extractPage(DomNode root, const string& pageUrl, const DepartmentInfo& department,
                     const string& universityName, optional<size_t> maxFaculty,
                     set<string>& seenProfiles, DepartmentExtraction& out) {
        if (out.structureType == StructureType::Unknown) out.structureType = detectStructureType(root);
        ItemSelection selection = selectFacultyItems(root, out.structureType, pageUrl);
        if (out.selector.empty()) out.selector = selection.selector;
        for (DomNode item : selection.items) {
            if (maxFaculty && out.records.size() >= *maxFaculty) break;
            ++out.itemsSeen;
            try {
                optional<RawFacultyRecord> r = extractItem(item, pageUrl, department, universityName);
                if (!r) {
                    ++out.rejected;
                    continue;
                }
                if (!seenProfiles.insert(urlDedupKey(*r->profileUrl)).second) continue;
                out.records.push_back(*r);
            }
            catch (const std::exception& e) {
                logWarn("Extractor", "item on " + pageUrl + " skipped: " + e.what());
                out.issues.push_back(PipelineIssue{ ErrorKind::ExtractionFailure, pageUrl, e.what() });
            }
        }
        if (out.rejected) {
            logInfo(pageUrl + ": " + to_string(out.rejected) + " candidate(s) without a usable name or profile link");
        }
    }

    // Link heuristics first, then the classifier over the item's text, then external search.
    void discoverLab(const vector<PageLink>& links, const vector<string>& segments,
                     const string& pageUrl, const string& universityName, RawFacultyRecord& r) {
        double bestScore = 0.0;
        const PageLink* bestLink = nullptr;
        for (const auto& link : links) {
            string low = toLowerStr(link.href);
            bool excluded = low.empty() || low[0] == '#';
            for (const auto& ex : LAB_LINK_EXCLUDES) {
                if (low.find(ex) != string::npos) excluded = true;
            }
            if (excluded || !textHasLabKeyword(link.text)) continue;
            double score = labLinkScore(urlJoin(pageUrl, link.href), link.text);
            if (score > bestScore) {
                bestScore = score;
                bestLink = &link;
            }
        }
        if (bestLink) {
            r.labWebsite = urlJoin(pageUrl, bestLink->href);
            string text = trimStr(bestLink->text);
            bool strongPhrase = false;
            for (const auto& p : LAB_LINK_STRONG_PHRASES) {
                if (toLowerStr(text).find(p) != string::npos) strongPhrase = true;
            }
            if (!strongPhrase && !isObviouslyNotLab(text)) r.labName = text;
            r.labDiscoveryMethod = string("link_heuristics");
            r.labDiscoveryConfidence = min(1.0, bestScore);
            return;
        }

        if (classifier_) {
            for (const auto& seg : segments) {
                if (seg.size() <= 10) continue;
                LabPrediction p = classifier_->predict(seg);
                if (p.isLabName && p.confidence > LAB_CLASSIFIER_THRESHOLD) {
                    r.labName = seg.size() > 100 ? seg.substr(0, 100) : seg;
                    r.labDiscoveryMethod = string("ml_classification");
                    r.labDiscoveryConfidence = p.confidence;
                    return;
                }
            }
        }

        if (search_ && options_.enableExternalSearch) {
            vector<LabSearchResult> results = search_->searchLabUrls(r.name, r.name + " lab", universityName, MAX_SEARCH_RESULTS);
            const LabSearchResult* top = nullptr;
            for (const auto& res : results) {
                if (res.confidence < MIN_SEARCH_CONFIDENCE) continue;
                if (!top || res.confidence > top->confidence) top = &res;
            }
            if (top) {
                r.labWebsite = top->url;
                r.labDiscoveryMethod = string("external_search");
                r.labDiscoveryConfidence = top->confidence;
            }
        }
    }

    PageRenderer& renderer_;
    const LabClassifier* classifier_;
    LabSearch* search_;
    ExtractorOptions options_;
};
