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

#ifndef WSSHAKE_REQUEST_PARSER_HPP_
#define WSSHAKE_REQUEST_PARSER_HPP_

#include "config.hpp"
#include "http_request.hpp"
#include "line_reader.hpp"
#include "vocabulary.hpp"

#include <string_view>
#include <vector>

namespace wsshake {

// ============================================================================
// HTTP upgrade request parsing
// ============================================================================

// "GET <relative-uri> HTTP/1.x". Fills request.uri and request.version.
// error(kMalformedRequest) if the line is blank, does not start with GET,
// does not split into exactly three space-separated tokens, or the target
// is not a relative URI.
expected<void, ErrorCode> parse_request_line(std::string_view line, Request& request);

// Relative reference only: non-empty, no whitespace or control characters,
// no leading "scheme:".
expected<RequestUri, ErrorCode> parse_request_uri(std::string_view target);

// "Name: value". The value starts two characters after the first colon.
// Lines without a colon are ignored (success, nothing added).
expected<void, ErrorCode> parse_header_line(std::string_view line, HeaderCollection& headers,
                                            DuplicateHeaderPolicy policy);

// "a=1; b=2" from a Cookie header. Cookies are appended to out with the
// port-less host as their domain.
// error(kMalformedRequest) for a pair without '=' or with an empty name.
expected<void, ErrorCode> parse_cookies(std::string_view cookie_header, std::string_view host,
                                        std::vector<Cookie>& out);

// Read the request line and header block (up to a blank line or end of
// stream). Cookies and extensions are left for the caller to derive.
expected<Request, ErrorCode> read_request(LineReader& reader, const HandshakeConfig& config);

}  // namespace wsshake

#endif  // WSSHAKE_REQUEST_PARSER_HPP_
