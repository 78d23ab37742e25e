/*
 * Part of the OidcTransport (OT) project.
 *
 * SPDX-FileCopyrightText: 2025 OidcTransport contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OidcTransport (OT). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>

namespace ot::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

std::string lower_copy(std::string s);

// Hex helpers
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Lenient boolean parsing: "true"/"false" in any case, surrounding whitespace ignored.
// Returns false when the text is neither.
bool parse_bool(const std::string& text, bool& out);

// Whole-file read. Returns false if the file cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace ot::internal
