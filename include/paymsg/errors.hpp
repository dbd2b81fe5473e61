/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 * 
 */

#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace paymsg {

// Common base, so callers can catch everything the engine throws in one place.
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// No recognized top-level wire format (neither XML nor MT block text).
struct FormatError : Error {
    using Error::Error;
};

// Structurally malformed input inside a recognized format. Fatal.
struct ParseError : Error {
    explicit ParseError(const std::string& what, std::ptrdiff_t offset = -1)
        : Error(what), offset_(offset) {}

    // byte offset into the source, -1 if unknown
    std::ptrdiff_t offset() const noexcept { return offset_; }

private:
    std::ptrdiff_t offset_;
};

// Unknown translation target (schema name or MT type).
struct UnsupportedFormatError : Error {
    using Error::Error;
};

} // namespace paymsg
