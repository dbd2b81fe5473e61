/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#ifdef PAYMSG_USE_UTF8PROC
#include <utf8proc.h>
#include <memory>
#endif

namespace paymsg {

// ----------------------- minimal ASCII utilities (UTF-8 safe) ------------------
inline bool is_ascii_space(unsigned char c) {
    return c==' '||c=='\t'||c=='\n'||c=='\r'||c=='\f'||c=='\v';
}

inline std::string trim_copy(std::string_view sv) {
    size_t b = 0, e = sv.size();
    while (b < e && is_ascii_space(static_cast<unsigned char>(sv[b]))) ++b;
    while (e > b && is_ascii_space(static_cast<unsigned char>(sv[e-1]))) --e;
    return std::string(sv.substr(b, e - b));
}

inline std::string ascii_upper(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(c < 0x80 ? std::toupper(c) : c));
    }
    return out;
}

inline std::string upper_trim(std::string_view s) {
    return ascii_upper(trim_copy(s));
}

inline std::string ascii_strip_all_spaces(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (unsigned char c : s) {
        if (is_ascii_space(c)) continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

// ---------------------- identity folding of party text ----------------------
// NFC, case folded, whitespace and zero-width characters removed. Two
// spellings of one party name fold to the same key.

#ifdef PAYMSG_USE_UTF8PROC

struct Utf8ProcFree {
    void operator()(utf8proc_uint8_t* p) const noexcept { if (p) free(p); }
};

inline bool is_fold_dropped(utf8proc_int32_t cp) {
    switch (utf8proc_category(cp)) {
        case UTF8PROC_CATEGORY_ZS:
        case UTF8PROC_CATEGORY_ZL:
        case UTF8PROC_CATEGORY_ZP:
            return true;
        default:
            break;
    }
    return (cp >= 0x09 && cp <= 0x0D) ||
           cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0xFEFF;
}

inline std::string fold_text(std::string_view in) {
    utf8proc_uint8_t* raw = nullptr;
    const utf8proc_ssize_t n = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(in.data()),
                                            static_cast<utf8proc_ssize_t>(in.size()), &raw,
                                            static_cast<utf8proc_option_t>(UTF8PROC_COMPOSE | UTF8PROC_CASEFOLD));
    if (n < 0 || !raw) return ascii_strip_all_spaces(in);   // not valid UTF-8
    std::unique_ptr<utf8proc_uint8_t, Utf8ProcFree> norm(raw);

    std::string out;
    out.reserve(static_cast<size_t>(n));
    const utf8proc_uint8_t* p = norm.get();
    const utf8proc_uint8_t* end = p + n;
    while (p < end) {
        utf8proc_int32_t cp = 0;
        const utf8proc_ssize_t adv = utf8proc_iterate(p, end - p, &cp);
        if (adv <= 0) { ++p; continue; }
        p += adv;
        if (is_fold_dropped(cp)) continue;
        utf8proc_uint8_t buf[4];
        const utf8proc_ssize_t w = utf8proc_encode_char(cp, buf);
        if (w > 0) out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(w));
    }
    return out;
}

#else

// ASCII only: drops ASCII whitespace, lowercases A-Z, keeps other bytes
inline std::string fold_text(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (is_ascii_space(c)) continue;
        out.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
    }
    return out;
}

#endif // PAYMSG_USE_UTF8PROC

inline bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
inline bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
inline bool is_alpha(char c) { return is_upper(c) || (c >= 'a' && c <= 'z'); }
inline bool is_upper_alnum(char c) { return is_upper(c) || is_digit(c); }

inline bool all_of(std::string_view s, bool (*pred)(char)) {
    for (char c : s) if (!pred(c)) return false;
    return true;
}

inline std::vector<std::string> split_char(std::string_view line, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= line.size()) {
        size_t pos = line.find(sep, start);
        if (pos == std::string_view::npos) {
            out.emplace_back(trim_copy(line.substr(start)));
            break;
        }
        out.emplace_back(trim_copy(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

inline std::vector<std::string> split_semicolon(std::string_view line) {
    return split_char(line, ';');
}

// Splits on '\n', dropping a trailing '\r' from every line.
inline std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t pos = text.find('\n', start);
        std::string_view line = text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        out.emplace_back(line);
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

// ISO-4217 exponents (short list)
inline int ccy_exp(const std::string& ccy){
    static const std::unordered_map<std::string,int> m{
        {"JPY",0},{"KRW",0},{"VND",0},{"ISK",0},{"CLP",0},
        {"BHD",3},{"KWD",3},{"OMR",3},{"TND",3},{"JOD",3},{"IQD",3},{"LYD",3},
        {"CLF",4}
    };
    auto it = m.find(ccy);
    return (it==m.end()) ? 2 : it->second;
}

inline bool is_currency_code(std::string_view s) {
    return s.size() == 3 && all_of(s, is_upper);
}

// Canonical decimal: digits, '.', digits. The fraction is never rounded or
// truncated. "50000,00" -> "50000.00", "100," -> "100.". A bare integer gets
// the currency's minor-unit zeros ("100" EUR -> "100.00", JPY -> "100.").
// With '.' as separator the xs:decimal forms "+10.00" and ".5" are read too
// ("10.00", "0.5"). Grouping separators, minus signs and exponents are not
// amounts here.
inline std::optional<std::string> normalize_decimal(std::string_view raw, char sep,
                                                    const std::string& ccy = std::string()) {
    std::string s = trim_copy(raw);
    if (sep == '.' && !s.empty() && s[0] == '+') s.erase(0, 1);
    if (s.empty()) return std::nullopt;

    const size_t pos = s.find(sep);
    std::string intp = (pos == std::string::npos) ? s : s.substr(0, pos);
    std::string frac = (pos == std::string::npos) ? std::string() : s.substr(pos + 1);

    if (sep == '.' && intp.empty() && !frac.empty()) intp = "0";
    if (intp.empty() || !all_of(intp, is_digit) || !all_of(frac, is_digit)) return std::nullopt;

    if (pos == std::string::npos) {
        const int exp = ccy_exp(ccy);
        return intp + "." + std::string(static_cast<size_t>(exp), '0');
    }
    return intp + "." + frac;
}

// "XXX" is the primary-office branch: BIC11 "DEUTDEFFXXX" and BIC8
// "DEUTDEFF" name one institution, the model keeps the BIC8 form.
inline std::optional<std::string> canonical_bic(std::optional<std::string> bic) {
    if (bic && bic->size() == 11 && bic->compare(8, 3, "XXX") == 0) bic->resize(8);
    return bic;
}

inline bool is_canonical_decimal(std::string_view s) {
    const size_t pos = s.find('.');
    if (pos == std::string_view::npos || pos == 0) return false;
    return all_of(s.substr(0, pos), is_digit) && all_of(s.substr(pos + 1), is_digit);
}

// FNV-1a 64, stable across platforms (std::hash is not)
inline std::uint64_t fnv1a64(std::string_view s, std::uint64_t h = 1469598103934665603ull) {
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

inline std::string hex_upper(std::uint64_t v, int digits) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out(static_cast<size_t>(digits), '0');
    for (int i = digits - 1; i >= 0; --i) {
        out[static_cast<size_t>(i)] = kHex[v & 0xF];
        v >>= 4;
    }
    return out;
}

} // namespace paymsg
