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

namespace ot {

// Thread-safe logging (to file + stdout).
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// Drain the OpenSSL error queue into the log, one line per queued error.
void log_openssl_errors(const char* tag, const char* where);

} // namespace ot
