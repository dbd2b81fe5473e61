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
#include "text_util.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace paymsg {

// ---------- Tokenizer ----------

struct MtIssue {
    std::string message;
    std::ptrdiff_t offset{-1};
    bool fatal{false};          // the engine refuses the message, the validator reports it
};

struct MtBlock {
    int number{0};
    std::string content;        // between "{N:" and the closing brace / terminator
    std::ptrdiff_t offset{-1};
};

struct MtTag {
    std::string tag;            // "32A"
    std::string value;          // continuation lines joined with '\n'
    int line{0};                // 1-based line inside block 4
};

struct MtTokens {
    std::vector<MtBlock> blocks;    // source order
    std::vector<MtTag> tags;        // block 4, source order, repeats kept
    std::vector<MtIssue> issues;

    const MtBlock* block(int number) const {
        for (const auto& b : blocks) if (b.number == number) return &b;
        return nullptr;
    }

    // first occurrence of a tag
    const MtTag* tag(std::string_view name) const {
        for (const auto& t : tags) if (t.tag == name) return &t;
        return nullptr;
    }

    bool has_fatal() const {
        for (const auto& i : issues) if (i.fatal) return true;
        return false;
    }
};

// ":20:", ":32A:" -> tag length (without colons), 0 if the line is not a tag line
inline size_t mt_tag_prefix(std::string_view line) {
    if (line.size() < 4 || line[0] != ':' || !is_digit(line[1]) || !is_digit(line[2])) return 0;
    if (line[3] == ':') return 2;
    if (line.size() >= 5 && is_upper(line[3]) && line[4] == ':') return 3;
    return 0;
}

inline void split_block4(const MtBlock& b4, MtTokens& out) {
    const auto lines = split_lines(b4.content);
    MtTag* cur = nullptr;
    int lineno = 0;
    for (const auto& line : lines) {
        ++lineno;
        const size_t n = mt_tag_prefix(line);
        if (n) {
            MtTag t;
            t.tag = line.substr(1, n);
            t.value = line.substr(n + 2);
            t.line = lineno;
            out.tags.push_back(std::move(t));
            cur = &out.tags.back();
            continue;
        }
        if (!line.empty() && line[0] == ':') {
            out.issues.push_back({"block 4 line " + std::to_string(lineno) +
                                  ": malformed tag '" + line.substr(0, 8) + "'", b4.offset, false});
            continue;
        }
        if (line.empty()) continue;
        if (!cur) {
            out.issues.push_back({"block 4 line " + std::to_string(lineno) +
                                  ": text before the first tag", b4.offset, false});
            continue;
        }
        cur->value.push_back('\n');
        cur->value += line;
    }
}

// Single pass over the block structure. Never throws; problems land in issues.
inline MtTokens tokenize_mt(std::string_view text) {
    MtTokens out;
    const size_t n = text.size();
    size_t pos = 0;
    int last_number = 0;

    while (pos < n) {
        if (is_ascii_space(static_cast<unsigned char>(text[pos]))) { ++pos; continue; }
        if (text[pos] != '{') {
            out.issues.push_back({"unexpected character outside blocks", static_cast<std::ptrdiff_t>(pos), false});
            const size_t next = text.find('{', pos);
            if (next == std::string_view::npos) break;
            pos = next;
            continue;
        }
        if (pos + 2 >= n || text[pos + 1] < '1' || text[pos + 1] > '5' || text[pos + 2] != ':') {
            out.issues.push_back({"malformed block header", static_cast<std::ptrdiff_t>(pos), true});
            break;
        }

        MtBlock b;
        b.number = text[pos + 1] - '0';
        b.offset = static_cast<std::ptrdiff_t>(pos);
        const size_t start = pos + 3;
        const std::string num = std::to_string(b.number);

        if (b.number == 4) {
            // terminator: "-}" at the start of a line
            size_t end = std::string_view::npos;
            for (size_t i = start; i + 1 < n; ++i) {
                if (text[i] == '-' && text[i + 1] == '}' && (i == start || text[i - 1] == '\n')) { end = i; break; }
            }
            if (end == std::string_view::npos) {
                out.issues.push_back({"unterminated block 4 (missing '-}' line)", b.offset, true});
                b.content.assign(text.substr(start));
                pos = n;
            } else {
                b.content.assign(text.substr(start, end - start));
                pos = end + 2;
            }
        } else if (b.number == 3 || b.number == 5) {
            // {tag:value} sub-blocks
            int depth = 1;
            size_t i = start;
            for (; i < n && depth > 0; ++i) {
                if (text[i] == '{') ++depth;
                else if (text[i] == '}') --depth;
            }
            if (depth != 0) {
                out.issues.push_back({"unterminated block " + num, b.offset, true});
                b.content.assign(text.substr(start));
                pos = n;
            } else {
                b.content.assign(text.substr(start, i - 1 - start));
                pos = i;
            }
        } else {
            const size_t end = text.find('}', start);
            if (end == std::string_view::npos) {
                out.issues.push_back({"unterminated block " + num, b.offset, true});
                b.content.assign(text.substr(start));
                pos = n;
            } else {
                b.content.assign(text.substr(start, end - start));
                pos = end + 1;
            }
        }

        if (out.block(b.number)) {
            out.issues.push_back({"duplicate block " + num, b.offset, false});
            continue;
        }
        if (b.number < last_number)
            out.issues.push_back({"block " + num + " out of order", b.offset, false});
        last_number = b.number;
        out.blocks.push_back(std::move(b));
    }

    if (const MtBlock* b4 = out.block(4)) split_block4(*b4, out);
    return out;
}

// "{121:uuid}{108:ref}" -> value for one sub-block tag
inline OptString mt_subblock(const std::string& content, std::string_view tag) {
    const std::string open = "{" + std::string(tag) + ":";
    const size_t p = content.find(open);
    if (p == std::string::npos) return std::nullopt;
    const size_t start = p + open.size();
    const size_t end = content.find('}', start);
    if (end == std::string::npos) return std::nullopt;
    return trim_copy(std::string_view(content).substr(start, end - start));
}

// ---------- Field grammar ----------

// 12-char logical terminal: BIC8 + terminal code + branch.
// "BANKDEFFAXXX" -> "BANKDEFF", "BANKDEFFA123" -> "BANKDEFF123".
inline OptString lt_to_bic(std::string_view lt) {
    const std::string s = upper_trim(lt);
    if (s.size() == 12) {
        if (all_of(s, [](char c) { return c == 'X'; })) return std::nullopt;
        const std::string branch = s.substr(9, 3);
        if (branch == "XXX") return s.substr(0, 8);
        return s.substr(0, 8) + branch;
    }
    if (s.size() == 8 || s.size() == 11) return canonical_bic(s);
    return std::nullopt;
}

// inverse of lt_to_bic, terminal code 'X'
inline std::string bic_to_lt(const OptString& bic) {
    if (!bic) return std::string(12, 'X');
    const std::string s = upper_trim(*bic);
    if (s.size() == 8)  return s + "XXXX";
    if (s.size() == 11) return s.substr(0, 8) + "X" + s.substr(8);
    std::string out = s.substr(0, 12);
    out.resize(12, 'X');
    return out;
}

// YYMMDD -> YYYY-MM-DD (YY >= 80 is 19YY)
inline OptString mt_date_to_iso(std::string_view yymmdd) {
    if (yymmdd.size() != 6 || !all_of(yymmdd, is_digit)) return std::nullopt;
    const int yy = (yymmdd[0] - '0') * 10 + (yymmdd[1] - '0');
    const int mm = (yymmdd[2] - '0') * 10 + (yymmdd[3] - '0');
    const int dd = (yymmdd[4] - '0') * 10 + (yymmdd[5] - '0');
    if (mm < 1 || mm > 12 || dd < 1 || dd > 31) return std::nullopt;
    return std::string(yy >= 80 ? "19" : "20") + std::string(yymmdd.substr(0, 2)) + "-" +
           std::string(yymmdd.substr(2, 2)) + "-" + std::string(yymmdd.substr(4, 2));
}

// YYYY-MM-DD (or an ISO date-time) -> YYMMDD
inline OptString iso_to_mt_date(std::string_view iso) {
    if (iso.size() < 10 || iso[4] != '-' || iso[7] != '-') return std::nullopt;
    std::string out;
    out += iso.substr(2, 2);
    out += iso.substr(5, 2);
    out += iso.substr(8, 2);
    if (!all_of(out, is_digit)) return std::nullopt;
    return out;
}

struct MtAmountField {
    OptString date;      // ISO, 32A only
    OptString currency;
    OptString amount;    // canonical
};

// :32A: YYMMDDCCCamount  /  :32B: CCCamount
// Returns false when the value does not follow the grammar.
inline bool parse_mt_amount_field(std::string_view value, bool with_date, MtAmountField& out) {
    const std::string v = trim_copy(value);
    size_t i = 0;
    if (with_date) {
        if (v.size() < 6) return false;
        out.date = mt_date_to_iso(std::string_view(v).substr(0, 6));
        if (!out.date) return false;
        i = 6;
    }
    if (v.size() < i + 4) return false;
    const std::string ccy = v.substr(i, 3);
    if (!is_currency_code(ccy)) return false;
    out.currency = ccy;
    // MT amounts always carry the comma, "100," is legal
    const std::string raw = v.substr(i + 3);
    if (raw.find(',') == std::string::npos) return false;
    out.amount = normalize_decimal(raw, ',', ccy);
    return out.amount.has_value();
}

// canonical "1000.5" -> MT "1000,5"
inline std::string to_mt_amount(const std::string& canonical) {
    std::string out = canonical;
    const size_t p = out.find('.');
    if (p == std::string::npos) out += ",";
    else out[p] = ',';
    return out;
}

struct MtParty {
    OptString account;
    OptString name;
    OptAddress address;
};

// 50K/59: "/account" first line, then name and address lines.
// 50F/59F: numbered lines, "1/" carries the name, "2/" and "3/" the address.
inline MtParty parse_mt_party(const std::string& value, char option) {
    MtParty p;
    auto lines = split_lines(value);
    size_t i = 0;
    if (!lines.empty() && !lines[0].empty() && lines[0][0] == '/') {
        p.account = trim_copy(std::string_view(lines[0]).substr(1));
        i = 1;
    } else if (option == 'F' && !lines.empty() && lines[0].find('/') != std::string::npos &&
               !starts_with(lines[0], "1/")) {
        p.account = trim_copy(lines[0]); // party identifier, "IBAN/..." style
        i = 1;
    }
    if (p.account && p.account->empty()) p.account.reset();
    if (option == 'A') return p;

    PostalAddress adr;
    for (; i < lines.size(); ++i) {
        std::string l = trim_copy(lines[i]);
        if (l.empty()) continue;
        if (option == 'F') {
            if (l.size() < 2 || !is_digit(l[0]) || l[1] != '/') continue;
            const char n = l[0];
            l = trim_copy(std::string_view(l).substr(2));
            if (n == '1' && !p.name) p.name = l;
            else if (n == '2' || n == '3') adr.address_lines.push_back(l);
            continue;
        }
        if (!p.name) p.name = l;
        else adr.address_lines.push_back(l);
    }
    if (!adr.empty()) p.address = adr;
    return p;
}

// OUR/BEN/SHA <-> ISO charge bearer codes
inline std::string mt_charges_to_iso(const std::string& code) {
    if (code == "OUR") return "DEBT";
    if (code == "BEN") return "CRED";
    if (code == "SHA") return "SHAR";
    return code;
}

inline OptString iso_charges_to_mt(const std::string& code) {
    if (code == "DEBT") return std::string("OUR");
    if (code == "CRED") return std::string("BEN");
    if (code == "SHAR" || code == "SLEV") return std::string("SHA");
    return std::nullopt;
}

// MTn92, n95, n96, n99: :21: references the original message
inline bool references_original(const std::string& type) {
    if (type.size() != 3) return false;
    const std::string tail = type.substr(1);
    return tail == "92" || tail == "95" || tail == "96" || tail == "99";
}

// ---------- Statement lines ----------

// :61: YYMMDD[MMDD]{C|D|RC|RD}[funds]amount{N|F|S}xxx reference[//bank ref]
inline bool parse_statement_line(const std::string& value, const OptString& currency, Entry& e) {
    const auto lines = split_lines(value);
    if (lines.empty()) return false;
    const std::string& v = lines[0];
    const size_t n = v.size();
    size_t i = 0;

    if (n < 6) return false;
    e.value_date = mt_date_to_iso(std::string_view(v).substr(0, 6));
    if (!e.value_date) return false;
    i = 6;
    e.booking_date = e.value_date;
    if (i + 4 <= n && all_of(std::string_view(v).substr(i, 4), is_digit)) {
        e.booking_date = e.value_date->substr(0, 5) + v.substr(i, 2) + "-" + v.substr(i + 2, 2);
        i += 4;
    }

    if (i + 2 <= n && v[i] == 'R' && (v[i + 1] == 'C' || v[i + 1] == 'D')) {
        e.credit_debit = v[i + 1] == 'C' ? "DBIT" : "CRDT"; // reversal
        i += 2;
    } else if (i < n && (v[i] == 'C' || v[i] == 'D')) {
        e.credit_debit = v[i] == 'C' ? "CRDT" : "DBIT";
        i += 1;
    } else {
        return false;
    }

    if (i + 1 < n && is_upper(v[i]) && is_digit(v[i + 1])) ++i; // funds code

    const size_t amount_start = i;
    while (i < n && (is_digit(v[i]) || v[i] == ',')) ++i;
    e.amount = normalize_decimal(std::string_view(v).substr(amount_start, i - amount_start), ',',
                                 currency.value_or(std::string()));
    if (!e.amount) return false;
    e.currency = currency;

    if (i + 4 > n) return true;   // no type code, no reference
    i += 4;

    const std::string rest = v.substr(i);
    const size_t slash = rest.find("//");
    std::string ref = trim_copy(slash == std::string::npos ? rest : rest.substr(0, slash));
    if (!ref.empty() && ref != "NONREF") e.reference = ref;
    return true;
}

// ISO balance type codes for the MT balance tags
inline const char* balance_type(const std::string& tag) {
    if (tag == "60F") return "OPBD";
    if (tag == "60M" || tag == "62M") return "ITBD";
    if (tag == "62F") return "CLBD";
    if (tag == "64")  return "CLAV";
    if (tag == "65")  return "FWAV";
    return nullptr;
}

// "C240229EUR1000,00": mark, date, currency, amount
inline bool parse_mt_balance(const std::string& value, Balance& b) {
    const std::string v = trim_copy(value);
    if (v.size() < 11 || (v[0] != 'C' && v[0] != 'D')) return false;
    MtAmountField f;
    if (!parse_mt_amount_field(std::string_view(v).substr(1), true, f)) return false;
    b.credit_debit = v[0] == 'C' ? "CRDT" : "DBIT";
    b.date = f.date;
    b.currency = f.currency;
    b.amount = f.amount;
    return true;
}

// :90C:/:90D: "72EUR100,00": number of entries, currency, sum
inline void parse_mt_total(const std::string& value, OptString& count, OptString& sum) {
    const std::string v = trim_copy(value);
    size_t i = 0;
    while (i < v.size() && is_digit(v[i])) ++i;
    if (i == 0 || i > 5) return;
    MtAmountField f;
    if (!parse_mt_amount_field(std::string_view(v).substr(i), false, f)) return;
    count = v.substr(0, i);
    sum = f.amount;
}

// ---------- Engine ----------

class MtEngine {
public:
    PaymentMessage parse(std::string_view bytes) const {
        const MtTokens tok = tokenize(bytes);
        PaymentMessage m;
        extract(tok, m);
        m.raw_source.assign(bytes.data(), bytes.size());
        return m;
    }

    DetailedMessage parse_detailed(std::string_view bytes) const {
        const MtTokens tok = tokenize(bytes);
        DetailedMessage d;
        extract(tok, d.message);
        d.message.raw_source.assign(bytes.data(), bytes.size());
        d.family = family_of(d.message.message_type);

        if (d.family == MessageFamily::Statement) {
            StatementDetails s = statement(tok, d.message.message_type);
            s.account_servicer = d.message.sender_bic;   // the statement comes from the servicing bank
            d.payload = std::move(s);
        } else if (d.family == MessageFamily::Transfer) {
            TransferDetails t;
            TransactionInfo ti;
            ti.end_to_end_id    = d.message.end_to_end_id;
            ti.uetr             = d.message.uetr;
            ti.amount           = d.message.amount;
            ti.currency         = d.message.currency;
            ti.debtor_name      = d.message.debtor_name;
            ti.debtor_account   = d.message.debtor_account;
            ti.creditor_name    = d.message.creditor_name;
            ti.creditor_account = d.message.creditor_account;
            ti.ordinal = 0;
            t.transactions.push_back(std::move(ti));
            d.payload = std::move(t);
        }
        return d;
    }

    // Throws ParseError on the first fatal tokenizer issue.
    static MtTokens tokenize(std::string_view bytes) {
        MtTokens tok = tokenize_mt(bytes);
        for (const auto& i : tok.issues) {
            if (i.fatal) throw ParseError(i.message, i.offset);
            Logger::debug("MT: " + i.message);
        }
        return tok;
    }

private:
    static void extract(const MtTokens& tok, PaymentMessage& m) {
        m.format = WireFormat::Mt;
        std::string type;
        OptString b1_lt;

        if (const MtBlock* b1 = tok.block(1)) {
            if (b1->content.size() >= 15) b1_lt = b1->content.substr(3, 12);
        }
        if (b1_lt) m.sender_bic = lt_to_bic(*b1_lt);

        if (const MtBlock* b2 = tok.block(2)) {
            const std::string& c = b2->content;
            if (c.size() >= 4) type = c.substr(1, 3);
            if (!c.empty() && c[0] == 'O' && c.size() >= 26) {
                // output: MIR carries the original sender, block 1 is the receiver
                m.sender_bic = lt_to_bic(std::string_view(c).substr(14, 12));
                m.receiver_bic = b1_lt ? lt_to_bic(*b1_lt) : std::nullopt;
            } else if (c.size() >= 16) {
                m.receiver_bic = lt_to_bic(std::string_view(c).substr(4, 12));
            }
        }
        m.message_type = type.empty() ? std::string() : "MT" + type;

        if (const MtBlock* b3 = tok.block(3)) m.uetr = mt_subblock(b3->content, "121");

        const MtTag* t20 = tok.tag("20");
        if (!t20 || trim_copy(t20->value).empty())
            throw ParseError("mandatory tag :20: missing");
        m.message_id = trim_copy(t20->value);

        bool have_amount = false;
        for (const auto& t : tok.tags) {
            const std::string v = trim_copy(t.value);
            if (t.tag == "21") {
                if (v.empty() || v == "NONREF") continue;
                if (references_original(type)) { if (!m.original_message_id) m.original_message_id = v; }
                else if (!m.end_to_end_id) m.end_to_end_id = v;
            } else if (t.tag == "23B") {
                m.message_subtype = v;
            } else if ((t.tag == "32A" || t.tag == "32B") && !have_amount) {
                MtAmountField f;
                if (parse_mt_amount_field(v, t.tag == "32A", f)) {
                    m.settlement_date = f.date;
                    m.currency = f.currency;
                    m.amount = f.amount;
                    have_amount = true;
                } else {
                    Logger::debug(":" + t.tag + ": does not follow the date/currency/amount grammar");
                }
            } else if (t.tag == "50K" || t.tag == "50A" || t.tag == "50F" || t.tag == "50H") {
                if (m.debtor_name || m.debtor_account) continue;
                MtParty p = parse_mt_party(t.value, t.tag[2]);
                m.debtor_account = p.account;
                m.debtor_name = p.name;
                m.debtor_address = p.address;
            } else if (t.tag == "59" || t.tag == "59A" || t.tag == "59F" || t.tag == "58D" || t.tag == "58A") {
                if (m.creditor_name || m.creditor_account) continue;
                MtParty p = parse_mt_party(t.value, t.tag.size() == 3 ? t.tag[2] : ' ');
                m.creditor_account = p.account;
                m.creditor_name = p.name;
                m.creditor_address = p.address;
            } else if (t.tag == "52A") {
                auto lines = split_lines(t.value);
                while (!lines.empty() && trim_copy(lines.back()).empty()) lines.pop_back();
                if (!lines.empty()) m.ordering_institution = lt_to_bic(lines.back());
            } else if (t.tag == "70") {
                m.remittance_info = trim_copy(t.value);
            } else if (t.tag == "71A") {
                m.charges = mt_charges_to_iso(v);
            }
        }
    }

    static StatementDetails statement(const MtTokens& tok, const std::string& type) {
        StatementDetails s;
        if (const MtTag* t = tok.tag("25"))  s.account_id = trim_copy(t->value);
        if (const MtTag* t = tok.tag("28C")) s.statement_id = trim_copy(t->value);

        // opening balance: C/D mark, date, currency. MT942 has a floor limit instead.
        const MtTag* bal = tok.tag("60F");
        if (!bal) bal = tok.tag("60M");
        if (bal && bal->value.size() >= 10) s.account_currency = bal->value.substr(7, 3);
        if (!bal) {
            if (const MtTag* fl = tok.tag("34F"); fl && fl->value.size() >= 3) s.account_currency = fl->value.substr(0, 3);
        }
        if (s.account_currency && !is_currency_code(*s.account_currency)) s.account_currency.reset();

        for (const auto& t : tok.tags) {
            const char* kind = balance_type(t.tag);
            if (!kind) continue;
            Balance b;
            b.type = std::string(kind);
            if (!parse_mt_balance(t.value, b))
                Logger::debug("MT: :" + t.tag + ": line " + std::to_string(t.line) + " not understood, kept with null fields");
            s.balances.push_back(std::move(b));
        }
        if (const MtTag* t = tok.tag("90C")) parse_mt_total(t->value, s.total_credit_entries, s.total_credit_amount);
        if (const MtTag* t = tok.tag("90D")) parse_mt_total(t->value, s.total_debit_entries, s.total_debit_amount);

        const std::string status = (type == "MT942") ? "PDNG" : "BOOK";
        int ordinal = 0;
        Entry* last = nullptr;
        for (const auto& t : tok.tags) {
            if (t.tag == "61") {
                Entry e;
                if (!parse_statement_line(t.value, s.account_currency, e)) {
                    Logger::debug("MT: :61: line " + std::to_string(t.line) + " not understood, kept with null fields");
                }
                e.status = status;
                e.ordinal = ordinal++;
                s.entries.push_back(std::move(e));
                last = &s.entries.back();
            } else if (t.tag == "86") {
                if (last && !last->remittance_info) last->remittance_info = trim_copy(t.value);
            } else {
                last = nullptr;
            }
        }
        return s;
    }
};

} // namespace paymsg
