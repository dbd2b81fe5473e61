/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "payment_model.hpp"
#include "text_util.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace paymsg {

// ---------- Helpers (namespace-agnostic, only classic loops) ----------
inline const char* ln(const pugi::xml_node& n) {
    if (!n) return "";
    const char* full = n.name();
    const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_node& n, const char* wanted) {
    return n.type() == pugi::node_element && std::strcmp(ln(n), wanted) == 0;
}

inline const char* ln(const pugi::xml_attribute& a) {
    if (!a) return "";
    const char* full = a.name(); const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_attribute& a, const char* wanted) { return std::strcmp(ln(a), wanted) == 0; }

// direct child with local name
inline pugi::xml_node child_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (isln(c, name)) return c;
    return pugi::xml_node();
}

// depth search (recursive) over all descendants
inline pugi::xml_node desc_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling()) {
        if (isln(c, name)) return c;
        pugi::xml_node found = desc_any(c, name);
        if (found) return found;
    }
    return pugi::xml_node();
}

// visit every descendant with local name, document order
template <class F>
inline void for_each_desc(const pugi::xml_node& p, const char* name, F&& f) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling()) {
        if (isln(c, name)) f(c);
        for_each_desc(c, name, f);
    }
}

inline pugi::xml_node first_element(const pugi::xml_node& p) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (c.type() == pugi::node_element) return c;
    return pugi::xml_node();
}

inline bool is_text_node(const pugi::xml_node& n) {
    return n.type() == pugi::node_pcdata || n.type() == pugi::node_cdata;
}

// all direct text children joined, so a comment inside <Nm> does not cut the value
inline std::string txt(const pugi::xml_node& n) {
    std::string s;
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling())
        if (is_text_node(c)) s += c.value(); // UTF-8
    return trim_copy(s);
}

// null when the element is absent, "" when present but empty
inline OptString opt_txt(const pugi::xml_node& n) {
    if (!n) return std::nullopt;
    return txt(n);
}

inline OptString attr_any(const pugi::xml_node& n, const char* name) {
    for (pugi::xml_attribute at = n.first_attribute(); at; at = at.next_attribute())
        if (isln(at, name)) return trim_copy(at.value());
    return std::nullopt;
}

inline std::vector<std::string> split_path(const char* path) {
    std::vector<std::string> parts;
    std::string cur;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') { if (!cur.empty()) parts.push_back(cur); cur.clear(); }
        else cur.push_back(*p);
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

// Namespace URI bound to the node's prefix (or the default namespace).
inline std::string namespace_uri(const pugi::xml_node& n) {
    if (!n) return std::string();
    const char* full = n.name();
    const char* colon = std::strchr(full, ':');
    const std::string attr = colon ? "xmlns:" + std::string(full, colon) : std::string("xmlns");
    for (pugi::xml_node cur = n; cur; cur = cur.parent()) {
        if (cur.type() != pugi::node_element) continue;
        pugi::xml_attribute a = cur.attribute(attr.c_str());
        if (a) return a.value();
    }
    return std::string();
}

// Resolves "A/B/C": A is searched at any depth (schema versions nest it
// differently), B and C must be direct children. Every occurrence of A is
// tried in document order; the first complete match wins. Only elements in
// the namespace of scope take part, so supplementary data under a foreign
// namespace never answers for a field.
inline pugi::xml_node find_path(const pugi::xml_node& scope, const char* path) {
    const std::vector<std::string> parts = split_path(path);
    if (parts.empty()) return pugi::xml_node();
    const std::string ns = namespace_uri(scope);

    auto child_in_ns = [&](const pugi::xml_node& p, const char* name) -> pugi::xml_node {
        for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
            if (isln(c, name) && namespace_uri(c) == ns) return c;
        return pugi::xml_node();
    };
    auto walk_rest = [&](const pugi::xml_node& head) -> pugi::xml_node {
        pugi::xml_node cur = head;
        for (size_t i = 1; i < parts.size() && cur; ++i)
            cur = child_in_ns(cur, parts[i].c_str());
        return cur;
    };

    // classic DFS with early exit
    std::vector<pugi::xml_node> stack;
    for (pugi::xml_node c = scope.last_child(); c; c = c.previous_sibling()) stack.push_back(c);
    while (!stack.empty()) {
        pugi::xml_node n = stack.back(); stack.pop_back();
        if (isln(n, parts[0].c_str()) && namespace_uri(n) == ns) {
            pugi::xml_node hit = walk_rest(n);
            if (hit) return hit;
        }
        for (pugi::xml_node c = n.last_child(); c; c = c.previous_sibling()) stack.push_back(c);
    }
    return pugi::xml_node();
}

// ---------- Payload discovery ----------

// The ISO 20022 Document element: the root itself, or beneath an envelope
// (e.g. a business application header wrapper).
inline pugi::xml_node find_document(const pugi::xml_node& root) {
    if (isln(root, "Document")) return root;
    pugi::xml_node d = desc_any(root, "Document");
    return d ? d : root;
}

// First element below Document (FIToFICstmrCdtTrf, BkToCstmrStmt, ...).
// A bare payload without a Document wrapper is returned as is.
inline pugi::xml_node find_payload(const pugi::xml_node& document) {
    if (!isln(document, "Document")) return document;
    return first_element(document);
}

struct MxIdentity {
    std::string namespace_uri;   // as declared on Document
    std::string family;          // "pacs.008"
    std::string version;         // "001.08"
    std::string root;            // payload root local name
};

// urn:iso:std:iso:20022:tech:xsd:pacs.008.001.08 -> {pacs.008, 001.08}
inline bool split_message_urn(const std::string& ns, std::string& family, std::string& version) {
    const size_t pos = ns.rfind(':');
    const std::string id = (pos == std::string::npos) ? ns : ns.substr(pos + 1);
    const auto parts = split_char(id, '.');
    if (parts.size() < 2 || parts[0].size() != 4 || !all_of(parts[0], is_alpha) ||
        parts[1].size() != 3 || !all_of(parts[1], is_digit))
        return false;
    family = parts[0] + "." + parts[1];
    version.clear();
    for (size_t i = 2; i < parts.size(); ++i) {
        if (!version.empty()) version.push_back('.');
        version += parts[i];
    }
    return true;
}

} // namespace paymsg
