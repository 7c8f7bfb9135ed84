#include "wireheaders/HeaderParsers.hpp"
#include "wireheaders/Buffer.hpp"
#include "wireheaders/KnownHeaders.hpp"
#include "wireheaders/Logs.hpp"
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace wireheaders {

  namespace HeaderParsers {

    static std::string trimmed(const std::string& text, size_t start, size_t length) {
      wireheaders::Buffer::trim(text.data(), start, length);
      return text.substr(start, length);
    }

    static bool isQuotedString(const std::string& text) {
      if (text.size() < 2 || text.front() != '"' || text.back() != '"') return false;

      for (size_t i = 1; i < text.size() - 1; ++i) {
        if (text[i] == '\\') {
          i++; // quoted-pair
          if (i >= text.size() - 1) return false;
        } else if (text[i] == '"') {
          return false;
        }
      }

      return true;
    }

    bool splitList(const std::string& input, std::vector<std::string>& elements) {
      std::vector<std::string> result;
      bool quoted = false;
      size_t start = 0;

      for (size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];

        if (quoted) {
          if (c == '\\') i++;
          else if (c == '"') quoted = false;
          continue;
        }

        if (c == '"') {
          quoted = true;
        } else if (c == ',') {
          std::string element = trimmed(input, start, i - start);
          if (!element.empty()) result.push_back(element);
          start = i + 1;
        }
      }

      if (quoted) {
        wireheaders_log("[HeaderParsers] Unterminated quoted string in: " << input);
        return false;
      }

      std::string last = trimmed(input, start, input.size() - start);
      if (!last.empty()) result.push_back(last);

      elements.swap(result);
      return true;
    }

    bool parseTokenList(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values) {
      std::vector<std::string> elements;
      if (!splitList(input, elements) || elements.empty()) return false;

      std::vector<wireheaders::HeaderValuePtr> parsed;
      for (const std::string& element : elements) {
        if (!wireheaders::utils::isValidToken(element)) {
          wireheaders_log("[HeaderParsers] Invalid token: " << element);
          return false;
        }
        parsed.push_back(TokenValue::create(element));
      }

      values.insert(values.end(), parsed.begin(), parsed.end());
      return true;
    }

    bool parseNameValueList(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values) {
      std::vector<std::string> elements;
      if (!splitList(input, elements) || elements.empty()) return false;

      std::vector<wireheaders::HeaderValuePtr> parsed;
      for (const std::string& element : elements) {
        size_t equals = element.find('=');
        std::string name = equals == std::string::npos ? element : trimmed(element, 0, equals);

        if (!wireheaders::utils::isValidToken(name)) {
          wireheaders_log("[HeaderParsers] Invalid name in name/value item: " << element);
          return false;
        }

        std::string value;
        if (equals != std::string::npos) {
          value = trimmed(element, equals + 1, element.size() - equals - 1);
          if (!wireheaders::utils::isValidToken(value) && !isQuotedString(value)) {
            wireheaders_log("[HeaderParsers] Invalid value in name/value item: " << element);
            return false;
          }
        }

        parsed.push_back(NameValueValue::create(name, value));
      }

      values.insert(values.end(), parsed.begin(), parsed.end());
      return true;
    }

    bool parseInteger(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values) {
      std::string text = trimmed(input, 0, input.size());
      if (text.empty()) return false;

      uint64_t result = 0;
      for (char c : text) {
        if (c < '0' || c > '9') return false;

        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
          wireheaders_log("[HeaderParsers] Integer value overflows: " << text);
          return false;
        }
        result = result * 10 + digit;
      }

      values.push_back(std::make_shared<IntegerValue>(result));
      return true;
    }

    bool parseRaw(const std::string& input, std::vector<wireheaders::HeaderValuePtr>& values) {
      values.push_back(RawValue::create(trimmed(input, 0, input.size())));
      return true;
    }

    static std::map<std::string, HeaderParser> buildRegistry() {
      using namespace wireheaders::KnownHeaders;
      std::map<std::string, HeaderParser> registry;

      for (const std::string* name : { &Connection, &TransferEncoding, &ContentEncoding, &ContentLanguage, &Trailer, &Vary, &Allow }) {
        registry[wireheaders::Buffer::toLower(*name)] = parseTokenList;
      }

      for (const std::string* name : { &Expect, &Pragma, &CacheControl }) {
        registry[wireheaders::Buffer::toLower(*name)] = parseNameValueList;
      }

      for (const std::string* name : { &ContentLength, &Age, &MaxForwards }) {
        registry[wireheaders::Buffer::toLower(*name)] = parseInteger;
      }

      return registry;
    }

    const HeaderParser& find(const std::string& name) {
      static const std::map<std::string, HeaderParser> registry = buildRegistry();
      static const HeaderParser raw = parseRaw;

      auto it = registry.find(wireheaders::Buffer::toLower(name));
      return it != registry.end() ? it->second : raw;
    }

  } // namespace HeaderParsers

} // namespace wireheaders
