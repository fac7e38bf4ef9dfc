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
 * @file wsshake.hpp
 * @brief wsshake - server side of the RFC 6455 opening handshake
 *
 * Reads an HTTP upgrade request from an accepted connection, validates it,
 * negotiates extensions and answers with 101 Switching Protocols or a
 * rejection. Frame handling after the handshake is left to the caller.
 *
 * Usage:
 *   #include "wsshake.hpp"
 *
 *   wsshake::ExtensionRegistry registry;
 *   registry.add(std::make_shared<wsshake::DeflateExtension>());
 *
 *   wsshake::SocketStream stream(std::move(sock));
 *   wsshake::Handshaker handshaker(registry);
 *   auto outcome = handshaker.negotiate(stream);
 *
 * @see RFC 6455: The WebSocket Protocol
 * @see RFC 7692: Compression Extensions for WebSocket
 */

#ifndef WSSHAKE_HPP_
#define WSSHAKE_HPP_

#include "wsshake/config.hpp"
#include "wsshake/deflate_extension.hpp"
#include "wsshake/extension.hpp"
#include "wsshake/handshaker.hpp"
#include "wsshake/http_request.hpp"
#include "wsshake/http_response.hpp"
#include "wsshake/line_reader.hpp"
#include "wsshake/log.hpp"
#include "wsshake/request_parser.hpp"
#include "wsshake/socket_stream.hpp"
#include "wsshake/stream.hpp"
#include "wsshake/utils.hpp"
#include "wsshake/vocabulary.hpp"

#endif  // WSSHAKE_HPP_
