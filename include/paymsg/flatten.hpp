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
#include <array>
#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace paymsg {

enum class Field {
    MessageId,
    EndToEndId,
    Amount,
    Currency,
    SenderBic,
    ReceiverBic,
    DebtorName,
    DebtorAccount,
    CreditorName,
    CreditorAccount,
    Uetr,
    MessageType,
    Format,
    SchemaVersion,
    CreationDateTime,
    SettlementDate,
    OriginalMessageId,
    CaseId,
    MessageSubtype,
    RemittanceInfo,
    Charges,
    OrderingInstitution,
    DebtorAddress,
    CreditorAddress,
    Count // Array size
};

constexpr std::size_t to_index(Field f) noexcept {
    return static_cast<std::size_t>(f);
}

inline const char* field_name(Field f) {
    static const std::array<const char*, to_index(Field::Count)> kNames{{
        "message_id", "end_to_end_id", "amount", "currency", "sender_bic", "receiver_bic",
        "debtor_name", "debtor_account", "creditor_name", "creditor_account", "uetr",
        "message_type", "format", "schema_version", "creation_date_time", "settlement_date",
        "original_message_id", "case_id", "message_subtype", "remittance_info", "charges",
        "ordering_institution", "debtor_address", "creditor_address"
    }};
    return kNames[to_index(f)];
}

// addresses flatten to their one-line form
inline OptString address_value(const OptAddress& a) {
    if (!a) return std::nullopt;
    return format_address(*a);
}

inline OptString field_value(const PaymentMessage& m, Field f) {
    switch (f) {
        case Field::MessageId:           return m.message_id;
        case Field::EndToEndId:          return m.end_to_end_id;
        case Field::Amount:              return m.amount;
        case Field::Currency:            return m.currency;
        case Field::SenderBic:           return m.sender_bic;
        case Field::ReceiverBic:         return m.receiver_bic;
        case Field::DebtorName:          return m.debtor_name;
        case Field::DebtorAccount:       return m.debtor_account;
        case Field::CreditorName:        return m.creditor_name;
        case Field::CreditorAccount:     return m.creditor_account;
        case Field::Uetr:                return m.uetr;
        case Field::MessageType:         return m.message_type;
        case Field::Format:              return std::string(m.format == WireFormat::Mx ? "MX" : "MT");
        case Field::SchemaVersion:       return m.schema_version;
        case Field::CreationDateTime:    return m.creation_date_time;
        case Field::SettlementDate:      return m.settlement_date;
        case Field::OriginalMessageId:   return m.original_message_id;
        case Field::CaseId:              return m.case_id;
        case Field::MessageSubtype:      return m.message_subtype;
        case Field::RemittanceInfo:      return m.remittance_info;
        case Field::Charges:             return m.charges;
        case Field::OrderingInstitution: return m.ordering_institution;
        case Field::DebtorAddress:       return address_value(m.debtor_address);
        case Field::CreditorAddress:     return address_value(m.creditor_address);
        case Field::Count:               break;
    }
    return std::nullopt;
}

// Every canonical field by name; raw_source is not a field.
inline std::map<std::string, OptString> flatten(const PaymentMessage& m) {
    std::map<std::string, OptString> out;
    for (std::size_t i = 0; i < to_index(Field::Count); ++i) {
        const Field f = static_cast<Field>(i);
        out.emplace(field_name(f), field_value(m, f));
    }
    return out;
}

// ---------- CSV export ----------

struct ExportOptions {
    char delimiter = ';';
    bool include_header = true;
    bool write_utf8_bom = false;   // Excel-compatible
    std::string null_text;         // written for null fields
};

inline std::string csv_escape(const std::string& s, char delimiter) {
    bool needQuotes = s.find(delimiter) != std::string::npos ||
                      s.find('"')       != std::string::npos ||
                      s.find('\n')      != std::string::npos ||
                      s.find('\r')      != std::string::npos;
    std::string out = s;
    // double quotes
    for (size_t pos = 0; (pos = out.find('"', pos)) != std::string::npos; pos += 2)
        out.insert(pos, "\"");
    if (needQuotes) {
        out.insert(out.begin(), '"');
        out.push_back('"');
    }
    return out;
}

inline void write_bom(std::ostream& os, const ExportOptions& opt) {
    if (!opt.write_utf8_bom) return;
    const unsigned char bom[3] = {0xEF,0xBB,0xBF};
    os.write(reinterpret_cast<const char*>(bom), 3);
}

inline void write_row(std::ostream& os, const std::vector<OptString>& cols, const ExportOptions& opt) {
    for (size_t i = 0; i < cols.size(); ++i) {
        if (i) os << opt.delimiter;
        os << csv_escape(cols[i].value_or(opt.null_text), opt.delimiter);
    }
    os << "\r\n";
}

// One row per message, one column per canonical field.
inline void export_messages_csv(const std::vector<PaymentMessage>& messages, std::ostream& os,
                                const ExportOptions& opt = {}) {
    write_bom(os, opt);
    const char D = opt.delimiter;
    if (opt.include_header) {
        for (std::size_t i = 0; i < to_index(Field::Count); ++i) {
            if (i) os << D;
            os << field_name(static_cast<Field>(i));
        }
        os << "\r\n";
    }
    std::vector<OptString> cols(to_index(Field::Count));
    for (const auto& m : messages) {
        for (std::size_t i = 0; i < cols.size(); ++i) cols[i] = field_value(m, static_cast<Field>(i));
        write_row(os, cols, opt);
    }
}

// Statement entries in document order.
inline void export_entries_csv(const DetailedMessage& doc, std::ostream& os, const ExportOptions& opt = {}) {
    write_bom(os, opt);
    const char D = opt.delimiter;
    if (opt.include_header) {
        os << "EntryOrdinal" << D << "BookingDate" << D << "ValueDate" << D << "Amount" << D
           << "Currency" << D << "CreditDebit" << D << "Status" << D << "Reference" << D
           << "RemittanceLine" << "\r\n";
    }
    for (const auto& e : doc.entries()) {
        write_row(os, {std::to_string(e.ordinal), e.booking_date, e.value_date, e.amount, e.currency,
                       e.credit_debit, e.status, e.reference, e.remittance_info}, opt);
    }
}

} // namespace paymsg
