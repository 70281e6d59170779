/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file ewsc.hpp
 * @brief EWSC - Embedded WebSocket Client (umbrella header)
 *
 * Client side of the WebSocket opening handshake for embedded Linux:
 * URI resolution, TLS policy, request construction, response validation and
 * the CONNECTING -> OPEN -> CLOSED state machine. TCP through sockpp, TLS
 * through mbedTLS (EWSC_WITH_TLS).
 *
 * Usage:
 *   #include "ewsc.hpp"
 *
 *   int main() {
 *     ewsc::Client client;
 *     client.set_subprotocols({"chat"});
 *     auto conn = client.connect("ws://localhost:8080/chat");
 *     if (!conn) return 1;
 *     // conn.value()->subprotocol(), conn.value()->response_headers() ...
 *   }
 *
 * @see RFC 6455: The WebSocket Protocol
 */

#ifndef EWSC_HPP_
#define EWSC_HPP_

#include "ewsc/vocabulary.hpp"
#include "ewsc/log.hpp"
#include "ewsc/utils.hpp"
#include "ewsc/uri.hpp"
#include "ewsc/tls.hpp"
#include "ewsc/transport.hpp"
#include "ewsc/handshake.hpp"
#include "ewsc/http.hpp"
#include "ewsc/connection.hpp"
#include "ewsc/client.hpp"

#endif  // EWSC_HPP_
