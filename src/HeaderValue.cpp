#include "wireheaders/HeaderValue.hpp"
#include "wireheaders/Buffer.hpp"
#include "wireheaders/Results.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace wireheaders {

  TokenValue::TokenValue(const std::string& token) : token_(token) {}

  std::string TokenValue::toString() const {
    return this->token_;
  }

  bool TokenValue::equals(const HeaderValue& other) const {
    const TokenValue* token = dynamic_cast<const TokenValue*>(&other);
    if (token == nullptr) return false;
    return wireheaders::Buffer::equalsIgnoreCase(this->token_, token->token_);
  }

  NameValueValue::NameValueValue(const std::string& name, const std::string& value)
    : name_(name), value_(value) {}

  std::string NameValueValue::toString() const {
    if (this->value_.empty()) return this->name_;
    return this->name_ + "=" + this->value_;
  }

  bool NameValueValue::equals(const HeaderValue& other) const {
    const NameValueValue* nameValue = dynamic_cast<const NameValueValue*>(&other);
    if (nameValue == nullptr) return false;
    if (!wireheaders::Buffer::equalsIgnoreCase(this->name_, nameValue->name_)) return false;

    // Quoted strings are compared as-is, tokens ignore case.
    if (!this->value_.empty() && this->value_[0] == '"') {
      return this->value_ == nameValue->value_;
    }
    return wireheaders::Buffer::equalsIgnoreCase(this->value_, nameValue->value_);
  }

  IntegerValue::IntegerValue(uint64_t value) : value_(value) {}

  std::string IntegerValue::toString() const {
    return std::to_string(this->value_);
  }

  bool IntegerValue::equals(const HeaderValue& other) const {
    const IntegerValue* integer = dynamic_cast<const IntegerValue*>(&other);
    return integer != nullptr && integer->value_ == this->value_;
  }

  RawValue::RawValue(const std::string& text) : text_(text) {}

  std::string RawValue::toString() const {
    return this->text_;
  }

  bool RawValue::equals(const HeaderValue& other) const {
    const RawValue* raw = dynamic_cast<const RawValue*>(&other);
    return raw != nullptr && raw->text_ == this->text_;
  }

  namespace utils {

    bool isTokenChar(const char c) {
      if (c >= 'a' && c <= 'z') return true;
      if (c >= 'A' && c <= 'Z') return true;
      if (c >= '0' && c <= '9') return true;
      return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
    }

    bool isValidToken(const std::string& token) {
      if (token.empty()) return false;
      for (char c : token) {
        if (!isTokenChar(c)) return false;
      }
      return true;
    }

    void checkValidToken(const std::string& token) {
      if (!isValidToken(token)) {
        throw std::invalid_argument(wireheaders::getErrorMessage(HeaderResult::INVALID_HEADER_VALUE) + ": " + token);
      }
    }

  } // namespace utils

} // namespace wireheaders
