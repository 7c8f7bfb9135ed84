#include "wireheaders/Buffer.hpp"
#include <algorithm>
#include <cstddef>
#include <string>

namespace wireheaders {

  namespace Buffer {

    static inline char asciiLower(const char c) {
      return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    size_t indexOf(const char* buffer, const size_t& start, const size_t& length, const char to_find) {
      if (buffer == nullptr || length == 0) {
        return wireheaders::Buffer::error; // No data to search
      }

      for (size_t i = start; i < start + length; ++i) {
        if (buffer[i] == to_find) {
          return i;
        }
      }

      return wireheaders::Buffer::error; // Not found
    }

    void trim(const char* buffer, size_t& start, size_t& length) {
      if (buffer == nullptr) {
        length = 0;
        return;
      }

      while (length > 0 && isWhitespace(buffer[start])) {
        start++;
        length--;
      }

      while (length > 0 && isWhitespace(buffer[start + length - 1])) {
        length--;
      }
    }

    bool equalsIgnoreCase(const std::string& expected, const char* buffer, const size_t& start, const size_t& length) {
      if (expected.size() != length) return false;
      if (length == 0) return true;
      if (buffer == nullptr) return false;

      for (size_t i = 0; i < length; ++i) {
        if (asciiLower(expected[i]) != asciiLower(buffer[start + i])) {
          return false;
        }
      }

      return true;
    }

    bool equalsIgnoreCase(const std::string& left, const std::string& right) {
      return equalsIgnoreCase(left, right.data(), 0, right.size());
    }

    std::string toLower(const std::string& value) {
      std::string result = value;
      std::transform(result.begin(), result.end(), result.begin(), asciiLower);
      return result;
    }

    bool isWhitespace(const char c) {
      return c == ' ' || c == '\t';
    }

  } // namespace Buffer

} // namespace wireheaders
