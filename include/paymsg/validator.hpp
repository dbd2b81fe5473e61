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
#include "format_detector.hpp"
#include "logger.hpp"
#include "mt_engine.hpp"
#include "mx_engine.hpp"
#include "payment_model.hpp"
#include "registry.hpp"
#include "xml_util.hpp"
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace paymsg {

struct ValidationReport {
    bool is_valid = true;
    std::vector<std::string> errors;   // every violation, in check order

    void add(std::string e) {
        is_valid = false;
        errors.push_back(std::move(e));
    }
};

// ---------- Structural checks (raw bytes) ----------

inline void check_mx_structure(std::string_view bytes, ValidationReport& r) {
    pugi::xml_document doc;
    pugi::xml_parse_result ok = doc.load_buffer(bytes.data(), bytes.size(),
                                                pugi::parse_default | pugi::parse_declaration);
    if (!ok) {
        r.add(std::string("XML not well-formed: ") + ok.description() +
              " at offset " + std::to_string(ok.offset));
        return;
    }
    pugi::xml_node document = find_document(doc.document_element());
    pugi::xml_node payload = find_payload(document);
    if (!payload) {
        r.add("empty ISO 20022 Document");
        return;
    }

    const MxIdentity id = identify(document, payload);
    const SchemaProfile* profile = find_schema_profile(id.namespace_uri, id.family, id.root);
    if (!profile) {
        Logger::info("no structural profile for '" + (id.family.empty() ? id.root : id.family) +
                     "', well-formedness only");
        return;
    }

    if (profile->root != id.root)
        r.add("unexpected payload root <" + id.root + ">, expected <" + profile->root + ">");
    for (const auto& req : profile->required) {
        if (!child_any(payload, req.c_str()))
            r.add("missing required element <" + req + "> under <" + id.root + ">");
    }
}

// F01 + LT address (12) + session (4) + sequence (6)
inline void check_mt_block1(const std::string& c, ValidationReport& r) {
    if (c.size() != 25) {
        r.add("block 1: expected 25 characters, got " + std::to_string(c.size()));
        return;
    }
    if ((c[0] != 'F' && c[0] != 'A' && c[0] != 'L') || c.substr(1, 2) != "01")
        r.add("block 1: invalid application/service identifier '" + c.substr(0, 3) + "'");
    const std::string lt = c.substr(3, 12);
    if (!is_valid_bic(lt.substr(0, 8)) || !all_of(std::string_view(lt).substr(8), is_upper_alnum))
        r.add("block 1: invalid LT address '" + lt + "'");
    if (!all_of(std::string_view(c).substr(15), is_digit))
        r.add("block 1: session/sequence number must be numeric");
}

inline void check_mt_block2(const std::string& c, ValidationReport& r) {
    if (c.size() < 4 || (c[0] != 'I' && c[0] != 'O') || !all_of(std::string_view(c).substr(1, 3), is_digit)) {
        r.add("block 2: expected I|O followed by a 3-digit message type");
        return;
    }
    if (c[0] == 'I' && (c.size() < 16 || !all_of(std::string_view(c).substr(4, 12), is_upper_alnum)))
        r.add("block 2: invalid receiver LT address");
}

inline void check_mt_structure(std::string_view bytes, ValidationReport& r) {
    const MtTokens tok = tokenize_mt(bytes);
    for (const auto& i : tok.issues) r.add(i.message);

    std::string type;
    if (const MtBlock* b2 = tok.block(2)) {
        check_mt_block2(b2->content, r);
        if (b2->content.size() >= 4) type = b2->content.substr(1, 3);
    } else {
        r.add("missing block 2");
    }
    if (const MtBlock* b1 = tok.block(1)) check_mt_block1(b1->content, r);
    else r.add("missing block 1");

    const bool system_message = !type.empty() && type[0] == '0';
    if (!tok.block(4)) {
        if (!system_message) r.add("missing block 4");
        return;
    }

    const MtTag* t20 = tok.tag("20");
    if (!t20 || trim_copy(t20->value).empty()) r.add("missing mandatory tag :20:");
    if (const MtTag* t32 = tok.tag("32A")) {
        MtAmountField f;
        if (!parse_mt_amount_field(t32->value, true, f))
            r.add("tag :32A: invalid date/currency/amount '" + trim_copy(t32->value) + "'");
    }
}

// ---------- Logical checks (canonical model) ----------

inline bool uetr_mandatory(const std::string& message_type) {
    return message_type == "pacs.008" || message_type == "pacs.009" || message_type == "pacs.004";
}

inline void check_account(const char* field, const OptString& v, ValidationReport& r) {
    if (!v || !is_iban_candidate(*v)) return;   // domestic account formats are not checked
    std::string reason;
    if (!check_iban(*v, &reason)) r.add(std::string(field) + ": invalid IBAN (" + reason + ")");
}

inline void check_bic(const char* field, const OptString& v, ValidationReport& r) {
    if (v && !is_valid_bic(*v)) r.add(std::string(field) + ": invalid BIC '" + *v + "'");
}

class Validator {
public:
    // Never throws for content; an unknown format is one more error.
    ValidationReport validate_schema(std::string_view bytes, const DetectorOptions& opt = {}) const {
        ValidationReport r;
        WireFormat fmt = WireFormat::Mx;
        try {
            fmt = detect_format(bytes, opt);
        } catch (const FormatError& e) {
            r.add(e.what());
            return r;
        }
        if (fmt == WireFormat::Mx) check_mx_structure(bytes, r);
        else check_mt_structure(bytes, r);
        return r;
    }

    ValidationReport validate(const PaymentMessage& m) const {
        ValidationReport r;
        if (m.message_id.empty()) r.add("message_id: missing");

        check_account("debtor_account", m.debtor_account, r);
        check_account("creditor_account", m.creditor_account, r);

        check_bic("sender_bic", m.sender_bic, r);
        check_bic("receiver_bic", m.receiver_bic, r);
        check_bic("ordering_institution", m.ordering_institution, r);

        if (m.uetr) {
            if (!is_valid_uetr(*m.uetr)) r.add("uetr: not a version 4 UUID '" + *m.uetr + "'");
        } else if (uetr_mandatory(m.message_type)) {
            r.add("uetr: required for " + m.message_type);
        }

        if (m.currency && !is_currency_code(*m.currency))
            r.add("currency: expected 3 uppercase letters, got '" + *m.currency + "'");
        if (m.amount && !is_canonical_decimal(*m.amount))
            r.add("amount: not a decimal '" + *m.amount + "'");
        return r;
    }
};

} // namespace paymsg
