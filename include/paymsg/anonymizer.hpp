/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "checksum.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "mt_engine.hpp"
#include "mx_engine.hpp"
#include "payment_model.hpp"
#include "text_util.hpp"
#include "xml_util.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace paymsg {

struct AnonymizerOptions {
    std::string salt = "paymsg-default-salt";
    std::string name_prefix = "CUST";          // CUST_1A2B3C4D
    std::string address_placeholder = "MASKED";
    std::string account_prefix = "ACCT";       // non-IBAN accounts
    std::string id_prefix = "ID";              // private identifiers
};

inline std::string xml_escape_text(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;";  break;
            case '>': out += "&gt;";  break;
            default:  out.push_back(c);
        }
    }
    return out;
}

class Anonymizer {
public:
    explicit Anonymizer(AnonymizerOptions opt = {}) : opt_(std::move(opt)) {}

    // Deterministic per salt. Spellings that fold alike ("Jane Smith",
    // "JANE SMITH") share a placeholder.
    std::string alias(std::string_view original, const std::string& prefix) const {
        const std::uint64_t h = fnv1a64(fold_text(original), fnv1a64(opt_.salt + '\x1f'));
        return prefix + "_" + hex_upper(h >> 32, 8);
    }

    // Same country and length, new BBAN (digit->digit, letter->letter),
    // fresh check digits. The result always differs from the input.
    std::string regenerate_iban(std::string_view iban) const {
        const std::string c = compact_iban(iban);
        const std::string country = c.substr(0, 2);
        const std::string bban = c.substr(4);

        std::mt19937_64 rng(fnv1a64(c, fnv1a64(opt_.salt + '|')));
        std::string fresh;
        for (int attempt = 0; attempt < 16; ++attempt) {
            fresh = bban;
            for (char& ch : fresh) {
                if (is_digit(ch))      ch = static_cast<char>('0' + rng() % 10);
                else if (is_upper(ch)) ch = static_cast<char>('A' + rng() % 26);
            }
            if (fresh != bban) break;
        }
        if (fresh == bban) {
            // all draws collided: rotate the last digit or letter
            for (auto it = fresh.rbegin(); it != fresh.rend(); ++it) {
                if (is_digit(*it)) { *it = static_cast<char>('0' + (*it - '0' + 1) % 10); break; }
                if (is_upper(*it)) { *it = static_cast<char>('A' + (*it - 'A' + 1) % 26); break; }
            }
        }
        return country + iban_check_digits(country, fresh) + fresh;
    }

    // IBAN-shaped -> regenerated IBAN, anything else -> ACCT_<hash>
    std::string regenerate_account(std::string_view account) const {
        const std::string c = compact_iban(account);
        if (is_iban_candidate(c) && c.size() >= 15 && c.size() <= 34 && all_of(c, is_upper_alnum))
            return regenerate_iban(c);
        Logger::debug("anonymizer: account is not IBAN-shaped, opaque placeholder used");
        return alias(trim_copy(account), opt_.account_prefix);
    }

    // New model instance. raw_source is scrubbed too when present.
    PaymentMessage anonymize(const PaymentMessage& m) const {
        PaymentMessage out = m;
        if (out.debtor_name)      out.debtor_name = alias(*out.debtor_name, opt_.name_prefix);
        if (out.creditor_name)    out.creditor_name = alias(*out.creditor_name, opt_.name_prefix);
        if (out.debtor_account)   out.debtor_account = regenerate_account(*out.debtor_account);
        if (out.creditor_account) out.creditor_account = regenerate_account(*out.creditor_account);
        if (out.debtor_address)   mask_address(*out.debtor_address);
        if (out.creditor_address) mask_address(*out.creditor_address);
        if (!out.raw_source.empty()) {
            out.raw_source = (out.format == WireFormat::Mx) ? anonymize_xml(out.raw_source)
                                                            : anonymize_mt(out.raw_source);
        }
        return out;
    }

    // Substitutes text-node content in place. Bytes outside the replaced
    // text nodes are copied unchanged. Throws ParseError on malformed XML.
    std::string anonymize_xml(std::string_view bytes) const {
        pugi::xml_document doc;
        MxEngine::load(bytes, doc);
        pugi::xml_node document = find_document(doc.document_element());
        const std::string ns = namespace_uri(document);

        std::vector<Replacement> reps;
        collect(document, ns, bytes, reps);
        std::sort(reps.begin(), reps.end(),
                  [](const Replacement& a, const Replacement& b) { return a.begin < b.begin; });

        std::string out;
        out.reserve(bytes.size());
        size_t pos = 0;
        for (const auto& r : reps) {
            out.append(bytes.substr(pos, r.begin - pos));
            out += r.text;
            pos = r.end;
        }
        out.append(bytes.substr(pos));
        return out;
    }

    // Party fields :50a:, :58a: and :59a: rewritten line by line, the rest untouched.
    std::string anonymize_mt(std::string_view bytes) const {
        std::string out;
        out.reserve(bytes.size());

        bool in_b4 = false, done = false, in_party = false, name_seen = false;
        char option = ' ';
        int party_line = 0;

        size_t pos = 0;
        while (pos <= bytes.size()) {
            const size_t nl = bytes.find('\n', pos);
            std::string_view line = bytes.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
            const bool cr = !line.empty() && line.back() == '\r';
            if (cr) line.remove_suffix(1);

            std::string rewritten(line);
            if (!done) {
                if (!in_b4) {
                    if (line.find("{4:") != std::string_view::npos) in_b4 = true;
                } else if (starts_with(line, "-}")) {
                    in_b4 = false;
                    done = true;
                    in_party = false;
                } else if (const size_t n = mt_tag_prefix(line)) {
                    const std::string tag(line.substr(1, n));
                    in_party = is_party_tag(tag);
                    option = n == 3 ? tag[2] : ' ';
                    party_line = 0;
                    name_seen = false;
                    if (in_party)
                        rewritten = std::string(line.substr(0, n + 2)) +
                                    party_line_value(line.substr(n + 2), option, party_line++, name_seen);
                } else if (in_party) {
                    rewritten = party_line_value(line, option, party_line++, name_seen);
                }
            }

            out += rewritten;
            if (cr) out.push_back('\r');
            if (nl == std::string_view::npos) break;
            out.push_back('\n');
            pos = nl + 1;
        }
        return out;
    }

    const AnonymizerOptions& options() const { return opt_; }

private:
    AnonymizerOptions opt_;

    struct Replacement {
        size_t begin;
        size_t end;
        std::string text;
    };

    // the tags MtEngine reads debtor and creditor from
    static bool is_party_tag(const std::string& tag) {
        return tag == "50K" || tag == "50A" || tag == "50F" || tag == "50H" ||
               tag == "59" || tag == "59A" || tag == "59F" || tag == "58A" || tag == "58D";
    }

    // mirrors parse_mt_party, so the model and the raw text scrub alike
    std::string party_line_value(std::string_view value, char option, int index, bool& name_seen) const {
        const std::string v = trim_copy(value);
        if (v.empty()) return std::string(value);
        if (index == 0 && v[0] == '/') return "/" + regenerate_account(trim_copy(std::string_view(v).substr(1)));
        if (option == 'A') return std::string(value);   // BIC line
        if (option == 'F') {
            if (v.size() >= 2 && is_digit(v[0]) && v[1] == '/') {
                if (v[0] == '1') return "1/" + alias(trim_copy(std::string_view(v).substr(2)), opt_.name_prefix);
                return v.substr(0, 2) + opt_.address_placeholder;
            }
            if (index == 0 && v.find('/') != std::string::npos) return regenerate_account(v);
            return opt_.address_placeholder;
        }
        if (!name_seen) {
            name_seen = true;
            return alias(v, opt_.name_prefix);
        }
        return opt_.address_placeholder;
    }

    // country stays, every other part becomes the placeholder
    void mask_address(PostalAddress& a) const {
        for (OptString* part : {&a.street_name, &a.building_number, &a.post_code, &a.town_name})
            if (*part) *part = opt_.address_placeholder;
        for (auto& l : a.address_lines) l = opt_.address_placeholder;
    }

    static bool in_namespace(const pugi::xml_node& n, const std::string& ns) {
        return namespace_uri(n) == ns;
    }

    static bool under_account(const pugi::xml_node& othr) {
        // <DbtrAcct><Id><Othr><Id>
        pugi::xml_node id = othr.parent();
        if (!isln(id, "Id")) return false;
        const std::string acct = ln(id.parent());
        return acct.size() >= 4 && acct.compare(acct.size() - 4, 4, "Acct") == 0;
    }

    // FinInstnId standing for the debtor or creditor itself (pacs.009), not an agent
    static bool is_party_institution(const pugi::xml_node& fin) {
        if (!isln(fin, "FinInstnId")) return false;
        const pugi::xml_node party = fin.parent();
        return isln(party, "Dbtr") || isln(party, "Cdtr");
    }

    static bool has_ancestor(const pugi::xml_node& n, const char* name) {
        for (pugi::xml_node p = n.parent(); p; p = p.parent())
            if (isln(p, name)) return true;
        return false;
    }

    // false when the element carries no PII
    bool replacement_for(const pugi::xml_node& el, const std::string& value, std::string& out) const {
        const char* name = ln(el);
        const pugi::xml_node parent = el.parent();

        if (std::strcmp(name, "Nm") == 0) {
            if (isln(parent, "FinInstnId") && !is_party_institution(parent)) return false;
            out = alias(value, opt_.name_prefix);
            return true;
        }
        if (isln(parent, "PstlAdr")) {
            if (isln(parent.parent(), "FinInstnId") && !is_party_institution(parent.parent())) return false;
            static const char* kAddressParts[] = {"StrtNm", "BldgNb", "PstCd", "TwnNm", "AdrLine"};
            for (const char* a : kAddressParts) {
                if (std::strcmp(name, a) == 0) { out = opt_.address_placeholder; return true; }
            }
            return false;
        }
        if (std::strcmp(name, "IBAN") == 0) {
            out = regenerate_account(value);
            return true;
        }
        if (std::strcmp(name, "Id") == 0 && isln(parent, "Othr")) {
            if (under_account(parent)) out = regenerate_account(value);
            else if (has_ancestor(el, "PrvtId")) out = alias(value, opt_.id_prefix);
            else return false;
            return true;
        }
        return false;
    }

    void collect(const pugi::xml_node& scope, const std::string& ns, std::string_view bytes,
                 std::vector<Replacement>& reps) const {
        for (pugi::xml_node c = scope.first_child(); c; c = c.next_sibling()) {
            if (c.type() != pugi::node_element) continue;
            collect(c, ns, bytes, reps);
            if (!in_namespace(c, ns)) continue;

            // every text child goes: the first takes the replacement, the rest are emptied
            std::vector<pugi::xml_node> texts;
            for (pugi::xml_node t = c.first_child(); t; t = t.next_sibling())
                if (is_text_node(t)) texts.push_back(t);
            if (texts.empty()) continue;
            const std::string value = txt(c);
            if (value.empty()) continue;

            std::string fresh;
            if (!replacement_for(c, value, fresh)) continue;

            for (size_t k = 0; k < texts.size(); ++k)
                reps.push_back(text_replacement(texts[k], k == 0 ? fresh : std::string(), c, bytes));
        }
    }

    static Replacement text_replacement(const pugi::xml_node& text, const std::string& fresh,
                                        const pugi::xml_node& el, std::string_view bytes) {
        const std::ptrdiff_t off = text.offset_debug();
        if (off < 0 || static_cast<size_t>(off) > bytes.size())
            throw ParseError("cannot locate text of <" + std::string(ln(el)) + "> in the source");

        Replacement r;
        r.begin = static_cast<size_t>(off);
        if (text.type() == pugi::node_cdata) {
            r.end = bytes.find("]]>", r.begin);
            r.text = fresh;
        } else {
            r.end = bytes.find('<', r.begin);
            r.text = xml_escape_text(fresh);
        }
        if (r.end == std::string_view::npos) r.end = bytes.size();

        // keep surrounding whitespace of the text node
        const std::string_view raw = bytes.substr(r.begin, r.end - r.begin);
        size_t lead = 0, trail = 0;
        while (lead < raw.size() && is_ascii_space(static_cast<unsigned char>(raw[lead]))) ++lead;
        while (trail < raw.size() - lead && is_ascii_space(static_cast<unsigned char>(raw[raw.size() - 1 - trail]))) ++trail;
        r.begin += lead;
        r.end -= trail;
        return r;
    }
};

} // namespace paymsg
