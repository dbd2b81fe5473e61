/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "registry.hpp"
#include "text_util.hpp"
#include <string>
#include <string_view>

namespace paymsg {

// "gb29 nwbk 6016..." -> "GB29NWBK6016..."
inline std::string compact_iban(std::string_view s) {
    return ascii_upper(ascii_strip_all_spaces(s));
}

// Two letters followed by two digits: checked as an IBAN. Anything else is a
// domestic account number.
inline bool is_iban_candidate(std::string_view s) {
    const std::string c = compact_iban(s);
    return c.size() >= 4 && is_upper(c[0]) && is_upper(c[1]) && is_digit(c[2]) && is_digit(c[3]);
}

// Remainder of the transliterated number (A=10 .. Z=35), computed piecewise.
inline int mod97(std::string_view alnum) {
    int rem = 0;
    for (char c : alnum) {
        if (is_digit(c))      rem = (rem * 10 + (c - '0')) % 97;
        else if (is_upper(c)) rem = (rem * 100 + (c - 'A' + 10)) % 97;
    }
    return rem;
}

// Check digits for country + BBAN, e.g. ("GB", "NWBK60161331926819") -> "29"
inline std::string iban_check_digits(std::string_view country, std::string_view bban) {
    std::string rearranged(bban);
    rearranged += country;
    rearranged += "00";
    const int check = 98 - mod97(rearranged);
    std::string out;
    out.push_back(static_cast<char>('0' + check / 10));
    out.push_back(static_cast<char>('0' + check % 10));
    return out;
}

// Grammar first, then Modulo-97. reason receives the first failure.
inline bool check_iban(std::string_view value, std::string* reason = nullptr) {
    auto fail = [&](const char* why) { if (reason) *reason = why; return false; };

    const std::string c = compact_iban(value);
    if (c.size() < 15 || c.size() > 34) return fail("invalid length");
    if (!all_of(c, is_upper_alnum)) return fail("invalid characters");
    if (!is_upper(c[0]) || !is_upper(c[1]) || !is_digit(c[2]) || !is_digit(c[3]))
        return fail("invalid country code or check digits");

    const int expected = iban_length_for(c.substr(0, 2));
    if (expected != 0 && static_cast<int>(c.size()) != expected)
        return fail("invalid length for country");

    const std::string rearranged = c.substr(4) + c.substr(0, 4);
    if (mod97(rearranged) != 1) return fail("checksum mismatch");
    return true;
}

inline bool is_valid_iban(std::string_view value) { return check_iban(value); }

// 4 letters institution, 2 letters country, 2 alnum location, optional 3 alnum branch
inline bool is_valid_bic(std::string_view value) {
    const std::string b = trim_copy(value);
    if (b.size() != 8 && b.size() != 11) return false;
    if (!all_of(std::string_view(b).substr(0, 6), is_upper)) return false;
    if (!all_of(std::string_view(b).substr(6), is_upper_alnum)) return false;
    return is_country_code(b.substr(4, 2));
}

inline bool is_hex(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// xxxxxxxx-xxxx-4xxx-[89ab]xxx-xxxxxxxxxxxx, either case
inline bool is_valid_uetr(std::string_view value) {
    if (value.size() != 36) return false;
    for (size_t i = 0; i < value.size(); ++i) {
        const bool dash = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash ? value[i] != '-' : !is_hex(value[i])) return false;
    }
    if (value[14] != '4') return false;
    const char v = value[19];
    return v == '8' || v == '9' || v == 'a' || v == 'b' || v == 'A' || v == 'B';
}

} // namespace paymsg
