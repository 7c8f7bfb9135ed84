#include "wireheaders/Headers.hpp"
#include "wireheaders/CookieParser.hpp"
#include "wireheaders/HeaderReader.hpp"
#include "wireheaders/KnownHeaders.hpp"
#include "wireheaders/Logs.hpp"
#include <memory>
#include <string>
#include <vector>

namespace wireheaders {

  static void validateToken(const HeaderValueCollection<TokenValue>& collection, const std::shared_ptr<TokenValue>& value) {
    (void)collection;
    wireheaders::utils::checkValidToken(value->token());
  }

  Headers Headers::parse(const std::string& rawHeaders) {
    Headers headers;
    headers.load(rawHeaders);
    return headers;
  }

  void Headers::load(const std::string& rawHeaders) {
    wireheaders::HeaderReader reader(rawHeaders);
    std::string name;
    std::string value;

    while (reader.readHeader(name, value)) {
      if (!this->store_.tryAdd(name, value)) {
        wireheaders_error("[Headers] Dropping invalid header " << name << ": " << value);
      }
    }
  }

  std::string Headers::dump() const {
    std::string result;
    for (const std::string& name : this->store_.names()) {
      result += name + ": " + this->store_.getHeaderString(name) + "\r\n";
    }
    return result;
  }

  std::vector<std::string> Headers::keys() const {
    return this->store_.names();
  }

  std::string Headers::get(const std::string& key) const {
    return this->store_.getHeaderString(key);
  }

  void Headers::set(const std::string& key, const std::string& value) {
    // Parse into a scratch store first so a bad value leaves the old one in place.
    wireheaders::HeaderStore parsed;
    parsed.add(key, value);

    this->store_.remove(key);
    for (const auto& item : parsed.getParsedValues(key)->values()) {
      this->store_.addParsedValue(key, item);
    }
  }

  bool Headers::has(const std::string& key) const {
    return this->store_.contains(key);
  }

  void Headers::remove(const std::string& key) {
    this->store_.remove(key);
  }

  HeaderValueCollection<TokenValue> Headers::connection() {
    return HeaderValueCollection<TokenValue>(KnownHeaders::Connection, this->store_, TokenValue::create("close"), validateToken);
  }

  HeaderValueCollection<TokenValue> Headers::transferEncoding() {
    return HeaderValueCollection<TokenValue>(KnownHeaders::TransferEncoding, this->store_, TokenValue::create("chunked"), validateToken);
  }

  HeaderValueCollection<TokenValue> Headers::contentEncoding() {
    return HeaderValueCollection<TokenValue>(KnownHeaders::ContentEncoding, this->store_, validateToken);
  }

  HeaderValueCollection<NameValueValue> Headers::expect() {
    return HeaderValueCollection<NameValueValue>(KnownHeaders::Expect, this->store_, NameValueValue::create("100-continue"));
  }

  bool Headers::connectionClose() {
    return this->connection().isSpecialValueSet();
  }

  void Headers::setConnectionClose(bool value) {
    if (value) this->connection().setSpecialValue();
    else this->connection().removeSpecialValue();
  }

  bool Headers::transferEncodingChunked() {
    return this->transferEncoding().isSpecialValueSet();
  }

  void Headers::setTransferEncodingChunked(bool value) {
    if (value) this->transferEncoding().setSpecialValue();
    else this->transferEncoding().removeSpecialValue();
  }

  bool Headers::expectContinue() {
    return this->expect().isSpecialValueSet();
  }

  void Headers::setExpectContinue(bool value) {
    if (value) this->expect().setSpecialValue();
    else this->expect().removeSpecialValue();
  }

  std::vector<std::string> Headers::setCookies() const {
    std::vector<std::string> cookies;
    const HeaderEntry* entry = this->store_.getParsedValues(KnownHeaders::SetCookie);
    if (entry == nullptr) return cookies;

    for (const auto& value : entry->values()) {
      std::vector<std::string> split = wireheaders::Cookies::getCookiesFromHeader(value->toString());
      cookies.insert(cookies.end(), split.begin(), split.end());
    }
    return cookies;
  }

} // namespace wireheaders
