#ifndef WIRE_HEADERS_HEADERS_HPP
#define WIRE_HEADERS_HEADERS_HPP

#include "wireheaders/HeaderStore.hpp"
#include "wireheaders/HeaderValue.hpp"
#include "wireheaders/HeaderValueCollection.hpp"
#include <string>
#include <vector>

namespace wireheaders {

  // Headers of one request or response: the store plus typed views for the
  // well-known list headers.
  class Headers {
    public:
      static Headers parse(const std::string& rawHeaders);

      void load(const std::string& rawHeaders);
      std::string dump() const;
      std::vector<std::string> keys() const;
      std::string get(const std::string& key) const;
      void set(const std::string& key, const std::string& value);
      bool has(const std::string& key) const;
      void remove(const std::string& key);

      wireheaders::HeaderStore& store() { return store_; }
      const wireheaders::HeaderStore& store() const { return store_; }

      HeaderValueCollection<TokenValue> connection();
      HeaderValueCollection<TokenValue> transferEncoding();
      HeaderValueCollection<TokenValue> contentEncoding();
      HeaderValueCollection<NameValueValue> expect();

      bool connectionClose();
      void setConnectionClose(bool value);

      bool transferEncodingChunked();
      void setTransferEncodingChunked(bool value);

      bool expectContinue();
      void setExpectContinue(bool value);

      // Cookie definitions from every Set-Cookie value, in order.
      std::vector<std::string> setCookies() const;

    private:
      wireheaders::HeaderStore store_;
  };

} // namespace wireheaders

#endif // WIRE_HEADERS_HEADERS_HPP
