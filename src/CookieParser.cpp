#include "wireheaders/CookieParser.hpp"
#include "wireheaders/Buffer.hpp"
#include "wireheaders/Logs.hpp"
#include <cctype>
#include <string>
#include <vector>

namespace wireheaders {

  static const std::string EXPIRES_TOKEN = "expires=";
  static const char* const WEEKDAYS[] = { "mon", "tue", "wed", "thu", "fri", "sat", "sun" };

  static bool isWeekdayName(const std::string& header, size_t start, size_t length) {
    if (length < 3) return false;

    for (size_t i = start; i < start + length; ++i) {
      if (!std::isalpha(static_cast<unsigned char>(header[i]))) return false;
    }

    for (const char* weekday : WEEKDAYS) {
      if (wireheaders::Buffer::equalsIgnoreCase(weekday, header.data(), start, 3)) return true;
    }
    return false;
  }

  CookieParser::CookieParser(const std::string& header)
    : header_(header), position_(0), error_(HeaderResult::SUCCESS) {}

  wireheaders::HeaderResult CookieParser::next(std::string& cookie) {
    if (this->error_ != HeaderResult::SUCCESS) {
      return this->error_;
    }

    // Skip separators left by the previous definition and empty definitions.
    while (this->position_ < this->header_.size() &&
           (this->header_[this->position_] == ',' || std::isspace(static_cast<unsigned char>(this->header_[this->position_])))) {
      this->position_++;
    }

    if (this->position_ >= this->header_.size()) {
      return HeaderResult::COOKIE_END;
    }

    const size_t start = this->position_;
    size_t attributeStart = start;
    bool quoted = false;
    size_t i = start;

    for (; i < this->header_.size(); ++i) {
      const char c = this->header_[i];

      if (quoted) {
        if (c == '"') quoted = false;
        continue;
      }

      if (c == '"') {
        quoted = true;
      } else if (c == ';') {
        attributeStart = i + 1;
      } else if (c == ',' && !this->isExpiresDateComma(attributeStart, i)) {
        break;
      }
    }

    if (quoted) {
      wireheaders_log("[CookieParser] Unterminated quoted string at offset " << start);
      this->error_ = HeaderResult::COOKIE_UNTERMINATED_QUOTE;
      return this->error_;
    }

    size_t definitionStart = start;
    size_t definitionLength = i - start;
    wireheaders::Buffer::trim(this->header_.data(), definitionStart, definitionLength);

    if (this->header_[definitionStart] == '=' || this->header_[definitionStart] == ';') {
      wireheaders_log("[CookieParser] Cookie without a name at offset " << definitionStart);
      this->error_ = HeaderResult::COOKIE_EMPTY_NAME;
      return this->error_;
    }

    cookie = this->header_.substr(definitionStart, definitionLength);
    this->position_ = i < this->header_.size() ? i + 1 : i;
    return HeaderResult::SUCCESS;
  }

  bool CookieParser::isExpiresDateComma(size_t attributeStart, size_t comma) const {
    size_t start = attributeStart;
    size_t length = comma - attributeStart;
    wireheaders::Buffer::trim(this->header_.data(), start, length);

    if (length <= EXPIRES_TOKEN.size()) return false;
    if (!wireheaders::Buffer::equalsIgnoreCase(EXPIRES_TOKEN, this->header_.data(), start, EXPIRES_TOKEN.size())) return false;

    size_t dateStart = start + EXPIRES_TOKEN.size();
    size_t dateLength = length - EXPIRES_TOKEN.size();
    wireheaders::Buffer::trim(this->header_.data(), dateStart, dateLength);

    // Only "Expires=<weekday>," qualifies, a later comma in the same attribute ends the cookie.
    return isWeekdayName(this->header_, dateStart, dateLength);
  }

  namespace Cookies {

    std::vector<std::string> getCookiesFromHeader(const std::string& setCookieHeader) {
      std::vector<std::string> cookies;
      CookieParser parser(setCookieHeader);
      std::string cookie;

      wireheaders::HeaderResult result;
      while ((result = parser.next(cookie)) == HeaderResult::SUCCESS) {
        cookies.push_back(cookie);
      }

      if (result != HeaderResult::COOKIE_END) {
        wireheaders_error("[Cookies] Dropping the rest of Set-Cookie after " << cookies.size()
          << " cookie(s): " << wireheaders::getErrorMessage(result));
      }

      return cookies;
    }

  } // namespace Cookies

} // namespace wireheaders
