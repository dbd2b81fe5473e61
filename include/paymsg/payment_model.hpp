/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace paymsg {

// std::nullopt marks a field absent in the source; "" is a present, empty value.
using OptString = std::optional<std::string>;

enum class WireFormat { Mx, Mt };

// PstlAdr | MT party lines after the name
struct PostalAddress {
    OptString country;           // Ctry
    OptString town_name;         // TwnNm
    OptString post_code;         // PstCd
    OptString street_name;       // StrtNm
    OptString building_number;   // BldgNb
    std::vector<std::string> address_lines;   // AdrLine, in order

    bool empty() const {
        return !country && !town_name && !post_code && !street_name && !building_number &&
               address_lines.empty();
    }
};

inline bool operator==(const PostalAddress& a, const PostalAddress& b) {
    return a.country == b.country && a.town_name == b.town_name && a.post_code == b.post_code &&
           a.street_name == b.street_name && a.building_number == b.building_number &&
           a.address_lines == b.address_lines;
}
inline bool operator!=(const PostalAddress& a, const PostalAddress& b) { return !(a == b); }

using OptAddress = std::optional<PostalAddress>;

// Display order: street and number, free lines, post code and town, country.
inline std::vector<std::string> address_parts(const PostalAddress& a) {
    auto join2 = [](const OptString& x, const OptString& y) {
        std::string s = x.value_or(std::string());
        if (y && !y->empty()) s += (s.empty() ? "" : " ") + *y;
        return s;
    };
    std::vector<std::string> parts;
    const std::string street = join2(a.street_name, a.building_number);
    const std::string town = join2(a.post_code, a.town_name);
    if (!street.empty()) parts.push_back(street);
    for (const auto& l : a.address_lines) if (!l.empty()) parts.push_back(l);
    if (!town.empty()) parts.push_back(town);
    if (a.country && !a.country->empty()) parts.push_back(*a.country);
    return parts;
}

// One line: "Hauptstrasse 1, 10115 Berlin, DE"
inline std::string format_address(const PostalAddress& a) {
    std::string out;
    for (const auto& p : address_parts(a)) {
        if (!out.empty()) out += ", ";
        out += p;
    }
    return out;
}

// --- Canonical model ---
struct PaymentMessage {
    std::string message_id;          // GrpHdr/MsgId | :20: (required)
    OptString end_to_end_id;         // PmtId/EndToEndId | OrgnlEndToEndId | :21:
    OptString amount;                // "1000.50", '.' separator, never a float
    OptString currency;              // "EUR", always 3 uppercase letters
    OptString sender_bic;            // InstgAgt | Block 1
    OptString receiver_bic;          // InstdAgt | Block 2
    OptString debtor_name;           // Dbtr/Nm | :50K:
    OptString debtor_account;        // DbtrAcct/Id/IBAN | :50K: /account
    OptString creditor_name;         // Cdtr/Nm | :59:
    OptString creditor_account;      // CdtrAcct/Id/IBAN | :59: /account
    OptAddress debtor_address;       // Dbtr/PstlAdr | :50K: lines after the name
    OptAddress creditor_address;     // Cdtr/PstlAdr | :59: lines after the name
    OptString uetr;                  // PmtId/UETR | Block 3 {121:}
    std::string message_type;        // "pacs.008", "camt.053", "MT103", ...
    WireFormat format{WireFormat::Mx};
    std::string raw_source;          // original bytes, untouched

    OptString schema_version;        // "001.08" (MX only)
    OptString creation_date_time;    // GrpHdr/CreDtTm | ISO
    OptString settlement_date;       // IntrBkSttlmDt | :32A: date, YYYY-MM-DD
    OptString original_message_id;   // OrgnlMsgId | :21: on MTn92/n95/n96/n99
    OptString case_id;               // Case/Id (camt.056, camt.029)
    OptString message_subtype;       // :23B: (CRED, SPAY, ...)
    OptString remittance_info;       // RmtInf/Ustrd | :70:
    OptString charges;               // ChrgBr | :71A: mapped to DEBT/CRED/SHAR
    OptString ordering_institution;  // DbtrAgt BIC | :52A:
};

// Statement / notification line (Ntry, :61:)
struct Entry {
    OptString reference;        // NtryRef | AcctSvcrRef | :61: customer reference
    OptString amount;
    OptString currency;
    OptString booking_date;     // BookgDt/Dt | ISO
    OptString status;           // Sts (BOOK, PDNG, INFO)
    OptString credit_debit;     // CRDT | DBIT
    OptString value_date;       // ValDt/Dt | ISO
    OptString remittance_info;  // Ustrd | :86:
    int ordinal{-1};            // position in the source document
};

// Single credit transfer inside a transfer message (CdtTrfTxInf)
struct TransactionInfo {
    OptString end_to_end_id;
    OptString uetr;
    OptString amount;
    OptString currency;
    OptString debtor_name;
    OptString debtor_account;
    OptString creditor_name;
    OptString creditor_account;
    int ordinal{-1};
};

// Stmt/Bal | :60a: :62a: :64: :65:
struct Balance {
    OptString type;             // Tp/CdOrPrtry/Cd: OPBD, CLBD, ITBD, CLAV, FWAV, ...
    OptString amount;
    OptString currency;
    OptString credit_debit;     // CRDT | DBIT
    OptString date;             // Dt/Dt | ISO
};

struct TransactionStatus {
    OptString original_end_to_end_id;   // OrgnlEndToEndId
    OptString status;                   // TxSts | TxCxlSts
    OptString reason;                   // StsRsnInf/Rsn/Cd
};

// --- Family payloads ---
struct TransferDetails {
    OptString number_of_transactions;   // GrpHdr/NbOfTxs
    OptString settlement_method;        // SttlmInf/SttlmMtd
    std::vector<TransactionInfo> transactions;
};

struct StatementDetails {
    OptString statement_id;             // Stmt/Id | :28C:
    OptString account_id;               // Acct/Id/IBAN | :25:
    OptString account_currency;         // Acct/Ccy | :60F: currency
    OptString account_owner;            // Acct/Ownr/Nm
    OptString account_servicer;         // Acct/Svcr BIC | Block 1 sender
    std::vector<Balance> balances;      // source order
    OptString total_credit_entries;     // TxsSummry/TtlCdtNtries/NbOfNtries | :90C: count
    OptString total_credit_amount;      // TtlCdtNtries/Sum | :90C: amount
    OptString total_debit_entries;      // TtlDbtNtries/NbOfNtries | :90D: count
    OptString total_debit_amount;       // TtlDbtNtries/Sum | :90D: amount
    std::vector<Entry> entries;         // source order, never re-sorted
};

struct StatusDetails {
    OptString original_message_name;    // OrgnlMsgNmId
    OptString group_status;             // GrpSts | Sts/Conf
    std::vector<TransactionStatus> transaction_statuses;
};

enum class MessageFamily { Unknown, Transfer, Statement, Status, Investigation };

using FamilyPayload = std::variant<std::monostate, TransferDetails, StatementDetails, StatusDetails>;

// Canonical model plus family-specific detail
struct DetailedMessage {
    PaymentMessage message;
    MessageFamily family{MessageFamily::Unknown};
    FamilyPayload payload;

    // statement entries in document order, empty for non-statement families
    const std::vector<Entry>& entries() const {
        static const std::vector<Entry> kNone;
        if (auto* s = std::get_if<StatementDetails>(&payload)) return s->entries;
        return kNone;
    }
};

inline MessageFamily family_of(const std::string& message_type) {
    static const char* kTransfer[]  = {"pacs.008","pacs.009","pacs.004","pain.001","pain.008",
                                       "MT101","MT103","MT202","MT205"};
    static const char* kStatement[] = {"camt.052","camt.053","camt.054","MT940","MT942","MT950"};
    static const char* kStatus[]    = {"pacs.002","pain.002","camt.029"};
    for (const char* t : kTransfer)  if (message_type == t) return MessageFamily::Transfer;
    for (const char* t : kStatement) if (message_type == t) return MessageFamily::Statement;
    for (const char* t : kStatus)    if (message_type == t) return MessageFamily::Status;
    if (message_type == "camt.056") return MessageFamily::Investigation;
    return MessageFamily::Unknown;
}

} // namespace paymsg
