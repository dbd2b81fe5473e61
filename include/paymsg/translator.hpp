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
#include "payment_model.hpp"
#include "text_util.hpp"
#include "xml_util.hpp"
#include <pugixml.hpp>
#include <ctime>
#include <sstream>
#include <algorithm>
#include <string>
#include <string_view>

namespace paymsg {

struct TranslatorOptions {
    std::string pacs_version = "001.08";   // pacs.008 / pacs.009 without a version suffix
    std::string pain_version = "001.09";   // pain.001 without a version suffix
    // :32A: date when the model carries neither settlement date nor creation
    // time. YYYY-MM-DD; empty means the current UTC date.
    std::string fallback_date;
};

inline constexpr const char* kMxNamespacePrefix = "urn:iso:std:iso:20022:tech:xsd:";

// current UTC date, YYYY-MM-DD
inline std::string utc_today() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buf[11];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

class Translator {
public:
    explicit Translator(TranslatorOptions opt = {}) : opt_(std::move(opt)) {}

    // "pacs.008", "pacs.008.001.02", "pacs.009", "pain.001[.001.xx]"
    std::string to_mx(const PaymentMessage& m, std::string_view schema_name) const {
        std::string family, version;
        resolve_schema(schema_name, family, version);

        pugi::xml_document doc;
        pugi::xml_node decl = doc.append_child(pugi::node_declaration);
        decl.append_attribute("version") = "1.0";
        decl.append_attribute("encoding") = "UTF-8";

        pugi::xml_node document = doc.append_child("Document");
        const std::string ns = kMxNamespacePrefix + family + "." + version;
        document.append_attribute("xmlns") = ns.c_str();

        if (family == "pain.001") write_pain001(document, m, version);
        else write_pacs(document, m, family, version);

        std::ostringstream oss;
        doc.save(oss, "  ", pugi::format_default, pugi::encoding_utf8);
        return oss.str();
    }

    // "103", "202", also "MT103" / "MT202"
    std::string to_mt(const PaymentMessage& m, std::string_view mt_type) const {
        std::string type = upper_trim(mt_type);
        if (starts_with(type, "MT")) type = type.substr(2);
        if (type != "103" && type != "202")
            throw UnsupportedFormatError("unsupported MT target: " + std::string(mt_type));

        std::string out;
        out += "{1:F01" + bic_to_lt(m.sender_bic) + "0000000000}";
        out += "{2:I" + type + bic_to_lt(m.receiver_bic) + "N}";
        if (m.uetr) out += "{3:{121:" + *m.uetr + "}}";

        out += "{4:\r\n";
        auto tag = [&](const char* name, const std::string& value) {
            out += ":";
            out += name;
            out += ":";
            out += value;
            out += "\r\n";
        };

        tag("20", m.message_id);
        if (type == "202") tag("21", m.end_to_end_id.value_or("NONREF"));
        if (type == "103") tag("23B", m.message_subtype.value_or("CRED"));

        if (m.amount && m.currency)
            tag("32A", mt_date(m) + *m.currency + to_mt_amount(*m.amount));
        else if (m.amount)
            Logger::info("to_mt: amount without currency, :32A: omitted");

        if (type == "103") {
            if (auto v = party_value(m.debtor_account, m.debtor_name, m.debtor_address)) tag("50K", *v);
            if (m.ordering_institution) tag("52A", *m.ordering_institution);
            if (auto v = party_value(m.creditor_account, m.creditor_name, m.creditor_address)) tag("59", *v);
            if (m.remittance_info) tag("70", *m.remittance_info);
            if (m.charges) {
                if (auto c = iso_charges_to_mt(*m.charges)) tag("71A", *c);
            }
        } else {
            if (m.ordering_institution) tag("52A", *m.ordering_institution);
            if (auto v = party_value(m.creditor_account, m.creditor_name, m.creditor_address)) tag("58D", *v);
        }
        out += "-}";
        return out;
    }

    const TranslatorOptions& options() const { return opt_; }

private:
    TranslatorOptions opt_;

    void resolve_schema(std::string_view schema_name, std::string& family, std::string& version) const {
        const std::string name = trim_copy(schema_name);
        const auto parts = split_char(name, '.');
        if (parts.size() < 2)
            throw UnsupportedFormatError("unsupported MX target: " + name);
        family = parts[0] + "." + parts[1];
        if (family != "pacs.008" && family != "pacs.009" && family != "pain.001")
            throw UnsupportedFormatError("unsupported MX target: " + name);

        if (parts.size() == 2) {
            version = (family == "pain.001") ? opt_.pain_version : opt_.pacs_version;
            return;
        }
        if (parts.size() != 4 || parts[2].size() != 3 || parts[3].size() != 2 ||
            !all_of(parts[2], is_digit) || !all_of(parts[3], is_digit))
            throw UnsupportedFormatError("unsupported MX version: " + name);
        version = parts[2] + "." + parts[3];
    }

    std::string mt_date(const PaymentMessage& m) const {
        OptString d;
        if (m.settlement_date) d = iso_to_mt_date(*m.settlement_date);
        if (!d && m.creation_date_time) d = iso_to_mt_date(*m.creation_date_time);
        if (!d && !opt_.fallback_date.empty()) d = iso_to_mt_date(opt_.fallback_date);
        if (!d) d = iso_to_mt_date(utc_today());
        return *d;
    }

    // "/account\nname\naddress...", either of the first two may be missing.
    // Address lines follow the name only, at most three of 35 characters.
    static OptString party_value(const OptString& account, const OptString& name, const OptAddress& address) {
        if (!account && !name) return std::nullopt;
        std::string v;
        if (account) v += "/" + *account;
        if (name) {
            if (!v.empty()) v += "\r\n";
            v += *name;
            if (address) {
                const auto parts = address_parts(*address);
                if (parts.size() > 3 || std::any_of(parts.begin(), parts.end(),
                                                    [](const std::string& p) { return p.size() > 35; }))
                    Logger::warn("to_mt: party address exceeds 3 lines of 35 characters, truncated");
                for (size_t i = 0; i < parts.size() && i < 3; ++i) v += "\r\n" + parts[i].substr(0, 35);
            }
        }
        return v;
    }

    // PstlAdr children in schema sequence
    static void postal_address(pugi::xml_node parent, const OptAddress& address) {
        if (!address) return;
        const PostalAddress& a = *address;
        pugi::xml_node adr = parent.append_child("PstlAdr");
        if (a.street_name)     text_child(adr, "StrtNm", *a.street_name);
        if (a.building_number) text_child(adr, "BldgNb", *a.building_number);
        if (a.post_code)       text_child(adr, "PstCd", *a.post_code);
        if (a.town_name)       text_child(adr, "TwnNm", *a.town_name);
        if (a.country)         text_child(adr, "Ctry", *a.country);
        for (const auto& l : a.address_lines) text_child(adr, "AdrLine", l);
    }

    // <Dbtr><Nm/><PstlAdr/></Dbtr>, under FinInstnId for institution transfers
    static void party(pugi::xml_node parent, const char* name, const OptString& nm, const OptAddress& address,
                      bool institution) {
        if (!nm && !address) return;
        pugi::xml_node p = parent.append_child(name);
        if (institution) p = p.append_child("FinInstnId");
        if (nm) text_child(p, "Nm", *nm);
        postal_address(p, address);
    }

    static void text_child(pugi::xml_node parent, const char* name, const std::string& value) {
        parent.append_child(name).text().set(value.c_str());
    }

    static void agent(pugi::xml_node parent, const char* name, const std::string& bic, const char* bic_tag) {
        pugi::xml_node fi = parent.append_child(name).append_child("FinInstnId");
        text_child(fi, bic_tag, bic);
    }

    static void account(pugi::xml_node parent, const char* name, const std::string& acct) {
        pugi::xml_node id = parent.append_child(name).append_child("Id");
        if (is_iban_candidate(acct)) text_child(id, "IBAN", acct);
        else text_child(id.append_child("Othr"), "Id", acct);
    }

    static void amount(pugi::xml_node parent, const char* name, const PaymentMessage& m) {
        if (!m.amount) return;
        pugi::xml_node a = parent.append_child(name);
        if (m.currency) a.append_attribute("Ccy") = m.currency->c_str();
        a.text().set(m.amount->c_str());
    }

    static void group_header(pugi::xml_node root, const PaymentMessage& m, bool settlement) {
        pugi::xml_node gh = root.append_child("GrpHdr");
        text_child(gh, "MsgId", m.message_id);
        if (m.creation_date_time) text_child(gh, "CreDtTm", *m.creation_date_time);
        text_child(gh, "NbOfTxs", "1");
        if (settlement) text_child(gh.append_child("SttlmInf"), "SttlmMtd", "INDA");
    }

    static void payment_id(pugi::xml_node tx, const PaymentMessage& m, bool with_uetr) {
        pugi::xml_node pid = tx.append_child("PmtId");
        text_child(pid, "EndToEndId", m.end_to_end_id.value_or("NOTPROVIDED"));
        if (m.uetr && with_uetr) text_child(pid, "UETR", *m.uetr);
        else if (m.uetr) Logger::info("to_mx: UETR not representable in this schema version, dropped");
    }

    // pacs.008 and pacs.009 share the transaction skeleton, pacs.009 parties are institutions.
    static void write_pacs(pugi::xml_node document, const PaymentMessage& m,
                           const std::string& family, const std::string& version) {
        const bool fi_transfer = (family == "pacs.009");
        const char* bic_tag = (version <= "001.03") ? "BIC" : "BICFI";

        pugi::xml_node root = document.append_child(fi_transfer ? "FICdtTrf" : "FIToFICstmrCdtTrf");
        group_header(root, m, true);

        pugi::xml_node tx = root.append_child("CdtTrfTxInf");
        payment_id(tx, m, version >= "001.07");
        amount(tx, "IntrBkSttlmAmt", m);
        if (m.settlement_date) text_child(tx, "IntrBkSttlmDt", *m.settlement_date);
        if (m.charges && !fi_transfer) text_child(tx, "ChrgBr", *m.charges);
        if (m.sender_bic)   agent(tx, "InstgAgt", *m.sender_bic, bic_tag);
        if (m.receiver_bic) agent(tx, "InstdAgt", *m.receiver_bic, bic_tag);

        party(tx, "Dbtr", m.debtor_name, m.debtor_address, fi_transfer);
        if (m.debtor_account) account(tx, "DbtrAcct", *m.debtor_account);
        if (m.ordering_institution) agent(tx, "DbtrAgt", *m.ordering_institution, bic_tag);

        party(tx, "Cdtr", m.creditor_name, m.creditor_address, fi_transfer);
        if (m.creditor_account) account(tx, "CdtrAcct", *m.creditor_account);
        if (m.remittance_info) text_child(tx.append_child("RmtInf"), "Ustrd", *m.remittance_info);
    }

    // pain.001: DbtrAgt is the sender, CdtrAgt the receiver.
    static void write_pain001(pugi::xml_node document, const PaymentMessage& m, const std::string& version) {
        const char* bic_tag = (version <= "001.03") ? "BIC" : "BICFI";
        pugi::xml_node root = document.append_child("CstmrCdtTrfInitn");
        group_header(root, m, false);

        pugi::xml_node pmt = root.append_child("PmtInf");
        text_child(pmt, "PmtInfId", m.message_id);
        text_child(pmt, "PmtMtd", "TRF");
        if (m.settlement_date) {
            if (version >= "001.08") text_child(pmt.append_child("ReqdExctnDt"), "Dt", *m.settlement_date);
            else text_child(pmt, "ReqdExctnDt", *m.settlement_date);
        }
        party(pmt, "Dbtr", m.debtor_name, m.debtor_address, false);
        if (m.debtor_account) account(pmt, "DbtrAcct", *m.debtor_account);
        const OptString& dbtr_agt = m.sender_bic ? m.sender_bic : m.ordering_institution;
        if (dbtr_agt) agent(pmt, "DbtrAgt", *dbtr_agt, bic_tag);
        if (m.charges) text_child(pmt, "ChrgBr", *m.charges);

        pugi::xml_node tx = pmt.append_child("CdtTrfTxInf");
        payment_id(tx, m, version >= "001.09");
        if (m.amount) amount(tx.append_child("Amt"), "InstdAmt", m);
        if (m.receiver_bic) agent(tx, "CdtrAgt", *m.receiver_bic, bic_tag);
        party(tx, "Cdtr", m.creditor_name, m.creditor_address, false);
        if (m.creditor_account) account(tx, "CdtrAcct", *m.creditor_account);
        if (m.remittance_info) text_child(tx.append_child("RmtInf"), "Ustrd", *m.remittance_info);
    }
};

} // namespace paymsg
