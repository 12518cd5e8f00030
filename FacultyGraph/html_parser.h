#pragma once

#include <string>
#include <vector>
#include <set>
#include <functional>
#include <cstddef>
#include <cctype>

// Lexbor headers
#include <lexbor/html/parser.h>
#include <lexbor/dom/interfaces/document.h>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/dom/interfaces/node.h>
#include <lexbor/dom/interfaces/character_data.h>

#include "config.h"
#include "string_utils.h"

using namespace std;

typedef lxb_dom_node_t* DomNode;

// Owns one parsed lexbor document.
class HtmlDocument {
public:
    explicit HtmlDocument(const string& html) : doc_(lxb_html_document_create()), parsed_(false) {
        if (!doc_) return;
        lxb_status_t status = lxb_html_document_parse(doc_, (const lxb_char_t*)html.c_str(), html.size());
        parsed_ = (status == LXB_STATUS_OK);
    }

    ~HtmlDocument() {
        if (doc_) lxb_html_document_destroy(doc_);
    }

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    bool valid() const { return doc_ != nullptr && parsed_; }

    DomNode root() const {
        return valid() ? lxb_dom_interface_node(doc_) : nullptr;
    }

    DomNode body() const {
        if (!valid()) return nullptr;
        lxb_html_body_element_t* b = lxb_html_document_body_element(doc_);
        return b ? lxb_dom_interface_node(b) : nullptr;
    }

private:
    lxb_html_document_t* doc_;
    bool parsed_;
};

inline bool isElement(DomNode node) {
    return node && node->type == LXB_DOM_NODE_TYPE_ELEMENT;
}

inline string nodeTag(DomNode node) {
    if (!isElement(node)) return string();
    size_t len = 0;
    const lxb_char_t* name = lxb_dom_element_local_name(lxb_dom_interface_element(node), &len);
    if (!name || len == 0) return string();
    return toLowerStr(string((const char*)name, len));
}

inline string nodeAttr(DomNode node, const string& attr) {
    if (!isElement(node)) return string();
    size_t len = 0;
    const lxb_char_t* v = lxb_dom_element_get_attribute(lxb_dom_interface_element(node),
        (const lxb_char_t*)attr.c_str(), attr.size(), &len);
    if (!v || len == 0) return string();
    return string((const char*)v, len);
}

inline string classAttrLower(DomNode node) {
    return toLowerStr(nodeAttr(node, "class"));
}

// [class*="fragment"]
inline bool classContains(DomNode node, const string& fragment) {
    return classAttrLower(node).find(fragment) != string::npos;
}

inline bool hasClassToken(DomNode node, const string& token) {
    for (const auto& c : splitWords(classAttrLower(node))) {
        if (c == token) return true;
    }
    return false;
}

static const set<string> NON_CONTENT_TAGS = { "script", "style", "noscript", "template", "svg" };

// Whitespace-collapsed text of a subtree, text nodes separated by spaces.
inline string nodeText(DomNode node) {
    if (!node) return string();
    string out;
    vector<DomNode> stack;
    stack.push_back(node);
    while (!stack.empty()) {
        DomNode cur = stack.back();
        stack.pop_back();
        if (cur->type == LXB_DOM_NODE_TYPE_ELEMENT && NON_CONTENT_TAGS.count(nodeTag(cur))) continue;
        if (cur->type == LXB_DOM_NODE_TYPE_TEXT) {
            lxb_dom_character_data_t* cd = lxb_dom_interface_character_data(cur);
            if (cd && cd->data.data && cd->data.length > 0) {
                out.append((const char*)cd->data.data, cd->data.length);
                out.push_back(' ');
            }
            continue;
        }
        for (DomNode child = cur->last_child; child != nullptr; child = child->prev) {
            stack.push_back(child);
        }
    }
    return collapseWhitespace(out);
}

// Pre-order, document order.
inline void collectElements(DomNode root, const function<bool(DomNode)>& pred, vector<DomNode>& out) {
    if (!root) return;
    vector<DomNode> stack;
    stack.push_back(root);
    while (!stack.empty()) {
        DomNode cur = stack.back();
        stack.pop_back();
        if (isElement(cur) && pred(cur)) out.push_back(cur);
        for (DomNode child = cur->last_child; child != nullptr; child = child->prev) {
            stack.push_back(child);
        }
    }
}

inline vector<DomNode> elementsByTag(DomNode root, const set<string>& tags) {
    vector<DomNode> out;
    collectElements(root, [&tags](DomNode n) { return tags.count(nodeTag(n)) > 0; }, out);
    return out;
}

inline bool hasDescendantTag(DomNode root, const set<string>& tags) {
    return !elementsByTag(root, tags).empty();
}

inline bool isDescendantOf(DomNode node, DomNode ancestor) {
    for (DomNode p = node ? node->parent : nullptr; p != nullptr; p = p->parent) {
        if (p == ancestor) return true;
    }
    return false;
}

inline bool hasAncestorTag(DomNode node, const set<string>& tags) {
    for (DomNode p = node ? node->parent : nullptr; p != nullptr; p = p->parent) {
        if (tags.count(nodeTag(p))) return true;
    }
    return false;
}

inline bool hasAncestorClass(DomNode node, const vector<string>& fragments) {
    for (DomNode p = node ? node->parent : nullptr; p != nullptr; p = p->parent) {
        if (!isElement(p)) continue;
        string cls = classAttrLower(p);
        if (cls.empty()) continue;
        for (const auto& f : fragments) {
            if (cls.find(f) != string::npos) return true;
        }
    }
    return false;
}

struct PageLink {
    string href;
    string text;
    DomNode node = nullptr;
};

inline vector<PageLink> collectLinks(DomNode root) {
    vector<PageLink> links;
    for (DomNode a : elementsByTag(root, { "a" })) {
        string href = trimStr(nodeAttr(a, "href"));
        if (href.empty()) continue;
        links.push_back(PageLink{ href, nodeText(a), a });
    }
    return links;
}

// Visible body text, chrome elements skipped.
inline string extractVisibleText(const string& html) {
    HtmlDocument doc(html);
    DomNode start = doc.body();
    if (!start) return string();
    string extracted;
    vector<DomNode> stack;
    stack.push_back(start);
    while (!stack.empty()) {
        DomNode node = stack.back();
        stack.pop_back();
        if (node->type == LXB_DOM_NODE_TYPE_ELEMENT) {
            string tag = nodeTag(node);
            if (tag == "script" || tag == "style" || tag == "noscript" ||
                tag == "nav" || tag == "header" || tag == "footer" ||
                tag == "aside" || tag == "button" || tag == "form") {
                continue;
            }
        }
        if (node->type == LXB_DOM_NODE_TYPE_TEXT) {
            lxb_dom_character_data_t* cd = lxb_dom_interface_character_data(node);
            if (cd && cd->data.data && cd->data.length > 0) {
                string trimmed = trimStr(string((const char*)cd->data.data, cd->data.length));
                if (trimmed.length() > 2) {
                    extracted.append(trimmed);
                    extracted.push_back(' ');
                }
            }
            continue;
        }
        for (DomNode child = node->last_child; child != nullptr; child = child->prev) {
            stack.push_back(child);
        }
    }
    if (extracted.size() > MAX_CONTENT_CHARS) extracted.resize(MAX_CONTENT_CHARS);
    return extracted;
}
