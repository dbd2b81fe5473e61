/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "errors.hpp"
#include "logger.hpp"
#include "payment_model.hpp"
#include "registry.hpp"
#include "xml_util.hpp"
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace paymsg {

// ---------- Field table ----------

enum class MxField {
    MessageId, EndToEndId, Amount, SenderBic, ReceiverBic,
    DebtorName, DebtorAccount, CreditorName, CreditorAccount, Uetr,
    CreationDateTime, SettlementDate, OriginalMessageId, CaseId,
    RemittanceInfo, Charges, OrderingInstitution,
    DebtorAddress, CreditorAddress
};

struct MxFieldPath {
    MxField field;
    const char* path;   // local names, see find_path()
};

// Ordered: for each field the first path that resolves wins.
inline const std::vector<MxFieldPath>& mx_field_table() {
    static const std::vector<MxFieldPath> T{
        {MxField::MessageId,           "GrpHdr/MsgId"},
        {MxField::MessageId,           "Assgnmt/Id"},
        {MxField::EndToEndId,          "PmtId/EndToEndId"},
        {MxField::EndToEndId,          "OrgnlEndToEndId"},
        {MxField::EndToEndId,          "Refs/EndToEndId"},
        {MxField::Amount,              "IntrBkSttlmAmt"},
        {MxField::Amount,              "InstdAmt"},
        {MxField::Amount,              "RtrdIntrBkSttlmAmt"},
        {MxField::Amount,              "OrgnlIntrBkSttlmAmt"},
        {MxField::Amount,              "Ntry/Amt"},
        {MxField::SenderBic,           "InstgAgt/FinInstnId/BICFI"},
        {MxField::SenderBic,           "InstgAgt/FinInstnId/BIC"},
        {MxField::SenderBic,           "DbtrAgt/FinInstnId/BICFI"},
        {MxField::SenderBic,           "DbtrAgt/FinInstnId/BIC"},
        {MxField::ReceiverBic,         "InstdAgt/FinInstnId/BICFI"},
        {MxField::ReceiverBic,         "InstdAgt/FinInstnId/BIC"},
        {MxField::ReceiverBic,         "CdtrAgt/FinInstnId/BICFI"},
        {MxField::ReceiverBic,         "CdtrAgt/FinInstnId/BIC"},
        {MxField::DebtorName,          "Dbtr/Nm"},
        {MxField::DebtorName,          "Dbtr/Pty/Nm"},
        {MxField::DebtorName,          "Dbtr/FinInstnId/Nm"},
        {MxField::DebtorAccount,       "DbtrAcct/Id/IBAN"},
        {MxField::DebtorAccount,       "DbtrAcct/Id/Othr/Id"},
        {MxField::CreditorName,        "Cdtr/Nm"},
        {MxField::CreditorName,        "Cdtr/Pty/Nm"},
        {MxField::CreditorName,        "Cdtr/FinInstnId/Nm"},
        {MxField::CreditorAccount,     "CdtrAcct/Id/IBAN"},
        {MxField::CreditorAccount,     "CdtrAcct/Id/Othr/Id"},
        {MxField::Uetr,                "PmtId/UETR"},
        {MxField::Uetr,                "OrgnlUETR"},
        {MxField::Uetr,                "UETR"},
        {MxField::CreationDateTime,    "GrpHdr/CreDtTm"},
        {MxField::CreationDateTime,    "Assgnmt/CreDtTm"},
        {MxField::SettlementDate,      "IntrBkSttlmDt"},
        {MxField::SettlementDate,      "ReqdExctnDt/Dt"},
        {MxField::SettlementDate,      "ReqdExctnDt"},
        {MxField::OriginalMessageId,   "OrgnlGrpInfAndSts/OrgnlMsgId"},
        {MxField::OriginalMessageId,   "OrgnlGrpInf/OrgnlMsgId"},
        {MxField::OriginalMessageId,   "OrgnlMsgId"},
        {MxField::CaseId,              "Case/Id"},
        {MxField::RemittanceInfo,      "RmtInf/Ustrd"},
        {MxField::Charges,             "ChrgBr"},
        {MxField::OrderingInstitution, "DbtrAgt/FinInstnId/BICFI"},
        {MxField::OrderingInstitution, "DbtrAgt/FinInstnId/BIC"},
        {MxField::DebtorAddress,       "Dbtr/PstlAdr"},
        {MxField::DebtorAddress,       "Dbtr/Pty/PstlAdr"},
        {MxField::DebtorAddress,       "Dbtr/FinInstnId/PstlAdr"},
        {MxField::CreditorAddress,     "Cdtr/PstlAdr"},
        {MxField::CreditorAddress,     "Cdtr/Pty/PstlAdr"},
        {MxField::CreditorAddress,     "Cdtr/FinInstnId/PstlAdr"},
    };
    return T;
}

// Placeholders the schemas use for "no value"
inline bool is_not_provided(const std::string& v) {
    return v == "NOTPROVIDED" || v == "NONREF";
}

// ---------- Extraction helpers ----------

// first resolving path for a field, relative to scope
inline pugi::xml_node lookup_node(const pugi::xml_node& scope, MxField field) {
    for (const auto& fp : mx_field_table()) {
        if (fp.field != field) continue;
        pugi::xml_node n = find_path(scope, fp.path);
        if (n) return n;
    }
    return pugi::xml_node();
}

inline OptString lookup(const pugi::xml_node& scope, MxField field) {
    return opt_txt(lookup_node(scope, field));
}

// Amount text paired with its Ccy attribute. The amount never depends on
// the currency being present.
inline void parse_amount(const pugi::xml_node& amt, OptString& amount, OptString& currency) {
    amount.reset();
    currency.reset();
    if (!amt) return;

    OptString ccy = attr_any(amt, "Ccy");
    if (ccy) {
        std::string c = upper_trim(*ccy);
        if (is_currency_code(c)) currency = c;
        else Logger::debug("ignoring malformed Ccy attribute on <" + std::string(ln(amt)) + ">");
    }

    amount = normalize_decimal(txt(amt), '.', currency.value_or(std::string()));
    if (!amount) {
        currency.reset();
        Logger::debug("amount in <" + std::string(ln(amt)) + "> is not a decimal, amount and currency mapped to null");
    }
}

inline OptAddress parse_address(const pugi::xml_node& adr) {
    if (!adr) return std::nullopt;
    PostalAddress a;
    a.country         = opt_txt(child_any(adr, "Ctry"));
    a.town_name       = opt_txt(child_any(adr, "TwnNm"));
    a.post_code       = opt_txt(child_any(adr, "PstCd"));
    a.street_name     = opt_txt(child_any(adr, "StrtNm"));
    a.building_number = opt_txt(child_any(adr, "BldgNb"));
    for (pugi::xml_node c = adr.first_child(); c; c = c.next_sibling())
        if (isln(c, "AdrLine")) a.address_lines.push_back(txt(c));
    return a;
}

inline OptString drop_not_provided(OptString v) {
    if (v && is_not_provided(*v)) return std::nullopt;
    return v;
}

inline MxIdentity identify(const pugi::xml_node& document, const pugi::xml_node& payload) {
    MxIdentity id;
    id.namespace_uri = namespace_uri(document);
    id.root = ln(payload);

    std::string family, version;
    if (split_message_urn(id.namespace_uri, family, version)) {
        id.family  = family;
        id.version = version;
    }
    // namespace without a known family: fall back to the payload root
    const std::string by_root = family_for_root(id.root);
    if (!by_root.empty() && (id.family.empty() || family_of(id.family) == MessageFamily::Unknown))
        id.family = by_root;
    return id;
}

// Sender/receiver fallback from a business application header next to Document.
inline void apply_app_header(const pugi::xml_node& root, PaymentMessage& m) {
    pugi::xml_node hdr = desc_any(root, "AppHdr");
    if (!hdr) return;
    if (!m.sender_bic) {
        pugi::xml_node fr = child_any(hdr, "Fr");
        if (fr) m.sender_bic = canonical_bic(opt_txt(find_path(fr, "FinInstnId/BICFI")));
    }
    if (!m.receiver_bic) {
        pugi::xml_node to = child_any(hdr, "To");
        if (to) m.receiver_bic = canonical_bic(opt_txt(find_path(to, "FinInstnId/BICFI")));
    }
}

inline void extract_canonical(const pugi::xml_node& root, const pugi::xml_node& payload,
                              const MxIdentity& id, PaymentMessage& m) {
    m.format = WireFormat::Mx;
    m.message_type = id.family.empty() ? id.root : id.family;
    if (!id.version.empty()) m.schema_version = id.version;

    OptString msg_id = lookup(payload, MxField::MessageId);
    if (!msg_id || msg_id->empty())
        throw ParseError("message id (MsgId) missing in <" + id.root + ">");
    m.message_id = *msg_id;

    m.end_to_end_id = drop_not_provided(lookup(payload, MxField::EndToEndId));
    parse_amount(lookup_node(payload, MxField::Amount), m.amount, m.currency);
    m.sender_bic           = canonical_bic(lookup(payload, MxField::SenderBic));
    m.receiver_bic         = canonical_bic(lookup(payload, MxField::ReceiverBic));
    m.debtor_name          = lookup(payload, MxField::DebtorName);
    m.debtor_account       = lookup(payload, MxField::DebtorAccount);
    m.creditor_name        = lookup(payload, MxField::CreditorName);
    m.creditor_account     = lookup(payload, MxField::CreditorAccount);
    m.uetr                 = lookup(payload, MxField::Uetr);
    m.creation_date_time   = lookup(payload, MxField::CreationDateTime);
    m.settlement_date      = lookup(payload, MxField::SettlementDate);
    m.original_message_id  = lookup(payload, MxField::OriginalMessageId);
    m.case_id              = lookup(payload, MxField::CaseId);
    m.remittance_info      = lookup(payload, MxField::RemittanceInfo);
    m.charges              = lookup(payload, MxField::Charges);
    m.ordering_institution = canonical_bic(lookup(payload, MxField::OrderingInstitution));
    m.debtor_address       = parse_address(lookup_node(payload, MxField::DebtorAddress));
    m.creditor_address     = parse_address(lookup_node(payload, MxField::CreditorAddress));

    apply_app_header(root, m);
}

// ---------- Detailed payloads ----------

inline Entry parse_entry(const pugi::xml_node& ntry) {
    Entry e;
    parse_amount(child_any(ntry, "Amt"), e.amount, e.currency);

    if (pugi::xml_node c = child_any(ntry, "CdtDbtInd")) e.credit_debit = txt(c);

    auto read_date_choice = [&](const char* name) -> OptString {
        pugi::xml_node n = child_any(ntry, name);
        if (!n) return std::nullopt;
        pugi::xml_node d = child_any(n, "Dt");
        if (d) return txt(d);
        pugi::xml_node dtm = child_any(n, "DtTm");
        if (dtm) return txt(dtm).substr(0, 10); // "YYYY-MM-DD"
        return txt(n); // rare
    };
    e.booking_date = read_date_choice("BookgDt");
    e.value_date   = read_date_choice("ValDt");

    // <Sts>BOOK</Sts> (up to camt.053.001.04) or <Sts><Cd>BOOK</Cd></Sts>
    if (pugi::xml_node st = child_any(ntry, "Sts")) {
        pugi::xml_node cd = child_any(st, "Cd");
        e.status = cd ? txt(cd) : txt(st);
    }

    e.reference = opt_txt(child_any(ntry, "NtryRef"));
    if (!e.reference) e.reference = opt_txt(child_any(ntry, "AcctSvcrRef"));
    if (!e.reference) e.reference = drop_not_provided(opt_txt(find_path(ntry, "Refs/EndToEndId")));

    e.remittance_info = opt_txt(desc_any(ntry, "Ustrd"));
    return e;
}

// <Bal><Tp><CdOrPrtry><Cd>OPBD</Cd></CdOrPrtry></Tp><Amt Ccy=..>..</Amt><CdtDbtInd/><Dt><Dt/></Dt></Bal>
inline Balance parse_balance(const pugi::xml_node& bal) {
    Balance b;
    b.type = opt_txt(find_path(bal, "Tp/CdOrPrtry/Cd"));
    if (!b.type) b.type = opt_txt(find_path(bal, "Tp/CdOrPrtry/Prtry"));
    parse_amount(child_any(bal, "Amt"), b.amount, b.currency);
    b.credit_debit = opt_txt(child_any(bal, "CdtDbtInd"));
    if (pugi::xml_node dt = child_any(bal, "Dt")) {
        if (pugi::xml_node d = child_any(dt, "Dt")) b.date = txt(d);
        else if (pugi::xml_node dtm = child_any(dt, "DtTm")) b.date = txt(dtm).substr(0, 10);
    }
    return b;
}

inline StatementDetails parse_statements(const pugi::xml_node& payload) {
    StatementDetails s;
    int ordinal = 0;
    for (pugi::xml_node st = payload.first_child(); st; st = st.next_sibling()) {
        if (!isln(st, "Stmt") && !isln(st, "Rpt") && !isln(st, "Ntfctn")) continue;

        if (!s.statement_id) s.statement_id = opt_txt(child_any(st, "Id"));
        if (pugi::xml_node acct = child_any(st, "Acct")) {
            if (!s.account_id) {
                s.account_id = opt_txt(find_path(acct, "Id/IBAN"));
                if (!s.account_id) s.account_id = opt_txt(find_path(acct, "Id/Othr/Id"));
            }
            if (!s.account_currency) s.account_currency = opt_txt(child_any(acct, "Ccy"));
            if (!s.account_owner) s.account_owner = opt_txt(find_path(acct, "Ownr/Nm"));
            if (!s.account_servicer) {
                s.account_servicer = canonical_bic(opt_txt(find_path(acct, "Svcr/FinInstnId/BICFI")));
                if (!s.account_servicer)
                    s.account_servicer = canonical_bic(opt_txt(find_path(acct, "Svcr/FinInstnId/BIC")));
            }
        }

        for (pugi::xml_node b = st.first_child(); b; b = b.next_sibling())
            if (isln(b, "Bal")) s.balances.push_back(parse_balance(b));

        if (pugi::xml_node sum = child_any(st, "TxsSummry")) {
            if (!s.total_credit_entries) {
                s.total_credit_entries = opt_txt(find_path(sum, "TtlCdtNtries/NbOfNtries"));
                s.total_credit_amount  = opt_txt(find_path(sum, "TtlCdtNtries/Sum"));
            }
            if (!s.total_debit_entries) {
                s.total_debit_entries = opt_txt(find_path(sum, "TtlDbtNtries/NbOfNtries"));
                s.total_debit_amount  = opt_txt(find_path(sum, "TtlDbtNtries/Sum"));
            }
        }

        // entries: directly under the statement, original XML order
        for (pugi::xml_node n = st.first_child(); n; n = n.next_sibling()) {
            if (!isln(n, "Ntry")) continue;
            Entry e = parse_entry(n);
            e.ordinal = ordinal++;
            s.entries.push_back(std::move(e));
        }
    }
    return s;
}

// field of a transaction, falling back to the enclosing block (pain.001
// carries debtor data on PmtInf, not on each CdtTrfTxInf)
inline pugi::xml_node tx_lookup_node(const pugi::xml_node& tx, MxField field) {
    pugi::xml_node v = lookup_node(tx, field);
    if (v || !tx.parent()) return v;
    for (pugi::xml_node sib = tx.parent().first_child(); sib; sib = sib.next_sibling()) {
        if (sib == tx || isln(sib, ln(tx))) continue;
        if (sib.type() != pugi::node_element) continue;
        const char* name = ln(sib);
        for (const auto& fp : mx_field_table()) {
            if (fp.field != field) continue;
            const auto parts = split_path(fp.path);
            if (!parts.empty() && parts[0] == name) {
                pugi::xml_node hit = sib;
                for (size_t i = 1; i < parts.size() && hit; ++i) hit = child_any(hit, parts[i].c_str());
                if (hit) return hit;
            }
        }
    }
    return pugi::xml_node();
}

inline OptString tx_lookup(const pugi::xml_node& tx, MxField field) {
    return opt_txt(tx_lookup_node(tx, field));
}

inline TransferDetails parse_transfers(const pugi::xml_node& payload) {
    TransferDetails t;
    if (pugi::xml_node gh = child_any(payload, "GrpHdr")) {
        t.number_of_transactions = opt_txt(child_any(gh, "NbOfTxs"));
        t.settlement_method      = opt_txt(find_path(gh, "SttlmInf/SttlmMtd"));
    }

    int ordinal = 0;
    auto visit = [&](const pugi::xml_node& tx) {
        TransactionInfo ti;
        ti.end_to_end_id = drop_not_provided(lookup(tx, MxField::EndToEndId));
        ti.uetr          = lookup(tx, MxField::Uetr);
        parse_amount(lookup_node(tx, MxField::Amount), ti.amount, ti.currency);
        ti.debtor_name      = tx_lookup(tx, MxField::DebtorName);
        ti.debtor_account   = tx_lookup(tx, MxField::DebtorAccount);
        ti.creditor_name    = tx_lookup(tx, MxField::CreditorName);
        ti.creditor_account = tx_lookup(tx, MxField::CreditorAccount);
        ti.ordinal = ordinal++;
        t.transactions.push_back(std::move(ti));
    };
    for_each_desc(payload, "CdtTrfTxInf", visit);
    if (t.transactions.empty()) for_each_desc(payload, "TxInf", visit); // pacs.004
    return t;
}

inline StatusDetails parse_status(const pugi::xml_node& payload) {
    StatusDetails s;
    s.original_message_name = opt_txt(desc_any(payload, "OrgnlMsgNmId"));
    s.group_status = opt_txt(find_path(payload, "OrgnlGrpInfAndSts/GrpSts"));
    if (!s.group_status) s.group_status = opt_txt(find_path(payload, "Sts/Conf"));

    auto visit = [&](const pugi::xml_node& n) {
        TransactionStatus ts;
        ts.original_end_to_end_id = drop_not_provided(opt_txt(desc_any(n, "OrgnlEndToEndId")));
        ts.status = opt_txt(child_any(n, "TxSts"));
        if (!ts.status) ts.status = opt_txt(child_any(n, "TxCxlSts"));
        ts.reason = opt_txt(find_path(n, "StsRsnInf/Rsn/Cd"));
        if (!ts.reason) ts.reason = opt_txt(find_path(n, "CxlStsRsnInf/Rsn/Cd"));
        s.transaction_statuses.push_back(std::move(ts));
    };
    for_each_desc(payload, "TxInfAndSts", visit);
    if (s.transaction_statuses.empty()) for_each_desc(payload, "CxlDtls", visit);
    return s;
}

// ---------- Records ----------

inline bool is_record(const pugi::xml_node& n) {
    return isln(n, "CdtTrfTxInf") || isln(n, "TxInf") || isln(n, "Ntry");
}

// Record-level fields replace the message-level ones; identity, group header
// data and agents stay those of the enclosing message.
inline void extract_record(const pugi::xml_node& rec, PaymentMessage& m) {
    const bool entry = isln(rec, "Ntry");
    m.end_to_end_id = drop_not_provided(lookup(rec, MxField::EndToEndId));
    m.uetr          = lookup(rec, MxField::Uetr);
    parse_amount(entry ? child_any(rec, "Amt") : lookup_node(rec, MxField::Amount), m.amount, m.currency);

    m.debtor_name      = tx_lookup(rec, MxField::DebtorName);
    m.debtor_account   = tx_lookup(rec, MxField::DebtorAccount);
    m.debtor_address   = parse_address(tx_lookup_node(rec, MxField::DebtorAddress));
    m.creditor_name    = tx_lookup(rec, MxField::CreditorName);
    m.creditor_account = tx_lookup(rec, MxField::CreditorAccount);
    m.creditor_address = parse_address(tx_lookup_node(rec, MxField::CreditorAddress));
    m.remittance_info  = lookup(rec, MxField::RemittanceInfo);

    if (OptString d = lookup(rec, MxField::SettlementDate)) m.settlement_date = d;
    else if (entry) m.settlement_date = parse_entry(rec).booking_date;
    if (OptString c = lookup(rec, MxField::Charges)) m.charges = c;
}

// ---------- Engine ----------

class MxEngine {
public:
    PaymentMessage parse(std::string_view bytes) const {
        pugi::xml_document doc;
        load(bytes, doc);
        pugi::xml_node root = doc.document_element();
        pugi::xml_node document = find_document(root);
        pugi::xml_node payload = find_payload(document);
        if (!payload) throw ParseError("empty ISO 20022 Document");

        PaymentMessage m;
        extract_canonical(root, payload, identify(document, payload), m);
        m.raw_source.assign(bytes.data(), bytes.size());
        return m;
    }

    DetailedMessage parse_detailed(std::string_view bytes) const {
        pugi::xml_document doc;
        load(bytes, doc);
        pugi::xml_node root = doc.document_element();
        pugi::xml_node document = find_document(root);
        pugi::xml_node payload = find_payload(document);
        if (!payload) throw ParseError("empty ISO 20022 Document");

        DetailedMessage d;
        const MxIdentity id = identify(document, payload);
        extract_canonical(root, payload, id, d.message);
        d.message.raw_source.assign(bytes.data(), bytes.size());
        d.family = family_of(d.message.message_type);

        switch (d.family) {
            case MessageFamily::Statement: d.payload = parse_statements(payload); break;
            case MessageFamily::Transfer:  d.payload = parse_transfers(payload);  break;
            case MessageFamily::Status:    d.payload = parse_status(payload);     break;
            default: break;
        }
        return d;
    }

    // One message per transaction or entry (CdtTrfTxInf, TxInf, Ntry), in
    // document order. f is called with each record as soon as it is built.
    template <class F>
    void for_each_record(std::string_view bytes, F&& f) const {
        pugi::xml_document doc;
        load(bytes, doc);
        pugi::xml_node root = doc.document_element();
        pugi::xml_node document = find_document(root);
        pugi::xml_node payload = find_payload(document);
        if (!payload) throw ParseError("empty ISO 20022 Document");

        PaymentMessage base;
        extract_canonical(root, payload, identify(document, payload), base);
        base.raw_source.assign(bytes.data(), bytes.size());
        const std::string ns = namespace_uri(payload);

        std::vector<pugi::xml_node> stack;
        for (pugi::xml_node c = payload.last_child(); c; c = c.previous_sibling()) stack.push_back(c);
        while (!stack.empty()) {
            pugi::xml_node n = stack.back(); stack.pop_back();
            if (n.type() != pugi::node_element) continue;
            if (is_record(n) && namespace_uri(n) == ns) {
                PaymentMessage rec = base;
                extract_record(n, rec);
                f(std::move(rec));
                continue;
            }
            for (pugi::xml_node c = n.last_child(); c; c = c.previous_sibling()) stack.push_back(c);
        }
    }

    std::vector<PaymentMessage> parse_records(std::string_view bytes) const {
        std::vector<PaymentMessage> out;
        for_each_record(bytes, [&](PaymentMessage m) { out.push_back(std::move(m)); });
        return out;
    }

    // Throws ParseError for anything pugixml refuses, including truncation.
    static void load(std::string_view bytes, pugi::xml_document& doc) {
        pugi::xml_parse_result ok = doc.load_buffer(bytes.data(), bytes.size(),
                                                    pugi::parse_default | pugi::parse_declaration);
        if (!ok)
            throw ParseError(std::string("XML parse error: ") + ok.description(),
                             static_cast<std::ptrdiff_t>(ok.offset));
        if (!doc.document_element())
            throw ParseError("Empty document");
    }
};

} // namespace paymsg
