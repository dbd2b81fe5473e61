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
#include "format_detector.hpp"
#include "mt_engine.hpp"
#include "mx_engine.hpp"
#include "payment_model.hpp"
#include <istream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace paymsg {

// Raw bytes -> canonical model. Throws FormatError or ParseError.
inline PaymentMessage parse(std::string_view bytes, const DetectorOptions& opt = {}) {
    if (detect_format(bytes, opt) == WireFormat::Mx) return MxEngine().parse(bytes);
    return MtEngine().parse(bytes);
}

inline DetailedMessage parse_detailed(std::string_view bytes, const DetectorOptions& opt = {}) {
    if (detect_format(bytes, opt) == WireFormat::Mx) return MxEngine().parse_detailed(bytes);
    return MtEngine().parse_detailed(bytes);
}

// Per-transaction view of an MX document. MT input has no record level.
template <class F>
inline void for_each_record(std::string_view bytes, F&& f, const DetectorOptions& opt = {}) {
    if (detect_format(bytes, opt) != WireFormat::Mx)
        throw UnsupportedFormatError("record iteration needs an MX (ISO 20022) document");
    MxEngine().for_each_record(bytes, std::forward<F>(f));
}

inline std::vector<PaymentMessage> parse_records(std::string_view bytes, const DetectorOptions& opt = {}) {
    std::vector<PaymentMessage> out;
    for_each_record(bytes, [&](PaymentMessage m) { out.push_back(std::move(m)); }, opt);
    return out;
}

// Non-throwing front end: false plus a message instead of an exception.
class Parser {
public:
    explicit Parser(DetectorOptions opt = {}) : opt_(opt) {}

    bool parse_string(const std::string& bytes, PaymentMessage& out, std::string* error=nullptr) const {
        try {
            out = parse(bytes, opt_);
            return true;
        } catch (const Error& e) {
            if (error) *error = e.what();
            return false;
        }
    }

    bool parse_string(const std::string& bytes, DetailedMessage& out, std::string* error=nullptr) const {
        try {
            out = parse_detailed(bytes, opt_);
            return true;
        } catch (const Error& e) {
            if (error) *error = e.what();
            return false;
        }
    }

    bool parse_stream(std::istream& is, DetailedMessage& out, std::string* error=nullptr) const {
        std::string bytes((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
        if (is.bad()) { if (error) *error = "stream read error"; return false; }
        return parse_string(bytes, out, error);
    }

private:
    DetectorOptions opt_;
};

} // namespace paymsg
