#ifndef WIRE_HEADERS_HEADER_PARSERS_HPP
#define WIRE_HEADERS_HEADER_PARSERS_HPP

#include "wireheaders/HeaderValue.hpp"
#include <functional>
#include <string>
#include <vector>

namespace wireheaders {

  // Parses a raw header value into one or more parsed values. Returns false
  // and leaves `values` untouched when the text does not match the grammar.
  typedef std::function<bool(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values)> HeaderParser;

  namespace HeaderParsers {

    // Comma separated list of tokens (Connection, Transfer-Encoding, Vary, ...).
    bool parseTokenList(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values);

    // Comma separated list of name[=value] items (Expect, Pragma, Cache-Control).
    bool parseNameValueList(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values);

    // Exactly one non-negative decimal (Content-Length, Age, Max-Forwards).
    bool parseInteger(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values);

    // Everything else: the text is kept verbatim as a single value. Never fails.
    bool parseRaw(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values);

    // Splits on commas outside quoted strings; elements are trimmed and empty
    // ones dropped. Returns false on an unterminated quoted string.
    bool splitList(const std::string& input, std::vector<std::string>& elements);

    // Parser registered for a header name (case-insensitive), parseRaw when none is.
    const HeaderParser& find(const std::string& name);

  } // namespace HeaderParsers

} // namespace wireheaders

#endif // WIRE_HEADERS_HEADER_PARSERS_HPP
