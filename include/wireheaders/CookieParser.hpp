#ifndef WIRE_HEADERS_COOKIE_PARSER_HPP
#define WIRE_HEADERS_COOKIE_PARSER_HPP

#include "wireheaders/Results.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace wireheaders {

  /**
   * Splits a Set-Cookie value holding several comma separated cookies into
   * one definition per cookie ("name=value; attr; attr=value").
   *
   * A comma directly after the weekday of an Expires attribute
   * ("Expires=Wed, 09 Jun 2021 10:18:14 GMT") is part of the date and does
   * not end the cookie. Commas inside quoted strings never do.
   */
  class CookieParser {
    public:
      explicit CookieParser(const std::string& header);

      // SUCCESS with the next definition in `cookie`, COOKIE_END when the
      // value is exhausted, or the error that stopped the parser. Once an
      // error is returned every later call returns it again.
      wireheaders::HeaderResult next(std::string& cookie);

    private:
      std::string header_;
      size_t position_;
      wireheaders::HeaderResult error_;

      bool isExpiresDateComma(size_t attributeStart, size_t comma) const;
  };

  namespace Cookies {

    // Every definition the parser can produce. Parsing stops at the first
    // malformed definition; the ones before it are kept and the error is logged.
    std::vector<std::string> getCookiesFromHeader(const std::string& setCookieHeader);

  } // namespace Cookies

} // namespace wireheaders

#endif // WIRE_HEADERS_COOKIE_PARSER_HPP
