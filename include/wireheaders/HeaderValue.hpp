#ifndef WIRE_HEADERS_HEADER_VALUE_HPP
#define WIRE_HEADERS_HEADER_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace wireheaders {

  // A parsed header value. Subclasses define the wire form and the equality
  // the header's grammar uses (tokens compare case-insensitively, raw text does not).
  class HeaderValue {
    public:
      virtual ~HeaderValue() = default;

      virtual std::string toString() const = 0;
      virtual bool equals(const HeaderValue& other) const = 0;
  };

  using HeaderValuePtr = std::shared_ptr<HeaderValue>;

  // Single RFC 7230 token, e.g. "close", "chunked", "gzip".
  class TokenValue : public HeaderValue {
    public:
      explicit TokenValue(const std::string& token);

      const std::string& token() const { return token_; }

      std::string toString() const override;
      bool equals(const HeaderValue& other) const override;

      static std::shared_ptr<TokenValue> create(const std::string& token) {
        return std::make_shared<TokenValue>(token);
      }

    private:
      std::string token_;
  };

  // name[=value], e.g. "100-continue", "no-cache", "max-age=0", "foo=\"a, b\"".
  class NameValueValue : public HeaderValue {
    public:
      explicit NameValueValue(const std::string& name, const std::string& value = "");

      const std::string& name() const { return name_; }
      const std::string& value() const { return value_; }

      std::string toString() const override;
      bool equals(const HeaderValue& other) const override;

      static std::shared_ptr<NameValueValue> create(const std::string& name, const std::string& value = "") {
        return std::make_shared<NameValueValue>(name, value);
      }

    private:
      std::string name_;
      std::string value_;
  };

  class IntegerValue : public HeaderValue {
    public:
      explicit IntegerValue(uint64_t value);

      uint64_t value() const { return value_; }

      std::string toString() const override;
      bool equals(const HeaderValue& other) const override;

    private:
      uint64_t value_;
  };

  // Opaque text stored as received, compared ordinally.
  class RawValue : public HeaderValue {
    public:
      explicit RawValue(const std::string& text);

      const std::string& text() const { return text_; }

      std::string toString() const override;
      bool equals(const HeaderValue& other) const override;

      static std::shared_ptr<RawValue> create(const std::string& text) {
        return std::make_shared<RawValue>(text);
      }

    private:
      std::string text_;
  };

  namespace utils {

    // tchar per RFC 7230 section 3.2.6.
    bool isTokenChar(const char c);
    bool isValidToken(const std::string& token);

    // Validator used by the token-typed collection views.
    void checkValidToken(const std::string& token);

  } // namespace utils

} // namespace wireheaders

#endif // WIRE_HEADERS_HEADER_VALUE_HPP
