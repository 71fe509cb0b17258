/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <cstddef>
#include <cstdint>

namespace ses::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to host:port, bounded by connect_timeout_sec;
    // io_timeout_sec applies to each later send/recv.
    bool open(const std::string& host, std::uint16_t port,
              int connect_timeout_sec, int io_timeout_sec, std::string& err);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    // Appends what is available; returns bytes read, 0 on EOF, -1 on error.
    long recv_some(char* d, std::size_t len);

private:
    int _fd = -1;
};

// Parse status line + headers. hdr_end_off points past "\r\n\r\n".
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

// Decodes a complete chunked body (trailers ignored).
// Returns false while data is incomplete or malformed; `complete` tells which.
bool decode_chunked(const std::string& in, std::string& out, bool& complete);

// Case-insensitive header lookup.
std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name);

} // namespace ses::internal
