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
#include "payment_model.hpp"
#include "text_util.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace paymsg {

struct DetectorOptions {
    size_t scan_limit = 1024;   // bytes inspected for a signature
};

// '<' (XML declaration or element) -> Mx, "{1:" -> Mt, else FormatError.
inline WireFormat detect_format(std::string_view bytes, const DetectorOptions& opt = {}) {
    std::string_view head = bytes.substr(0, opt.scan_limit);

    size_t i = 0;
    if (starts_with(head, "\xEF\xBB\xBF")) i = 3; // UTF-8 BOM
    while (i < head.size() && is_ascii_space(static_cast<unsigned char>(head[i]))) ++i;

    if (i < head.size() && head[i] == '<') return WireFormat::Mx;
    if (head.find("{1:", i) != std::string_view::npos) return WireFormat::Mt;

    throw FormatError("no MX or MT signature in the first " + std::to_string(head.size()) + " bytes");
}

} // namespace paymsg
