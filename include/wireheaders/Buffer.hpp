#ifndef WIRE_HEADERS_BUFFER_HPP
#define WIRE_HEADERS_BUFFER_HPP

#include <cstddef>
#include <string>

namespace wireheaders {

  // Helpers over (buffer, start, length) character windows, so the header
  // reader can inspect a line without copying it first.
  namespace Buffer {

    const size_t error = static_cast<size_t>(-1);

    // Absolute index of the first `to_find` in [start, start + length), or Buffer::error.
    size_t indexOf(const char* buffer, const size_t& start, const size_t& length, const char to_find);

    // Narrows the window past leading and trailing spaces and tabs.
    void trim(const char* buffer, size_t& start, size_t& length);

    bool equalsIgnoreCase(const std::string& expected, const char* buffer, const size_t& start, const size_t& length);
    bool equalsIgnoreCase(const std::string& left, const std::string& right);

    std::string toLower(const std::string& value);

    bool isWhitespace(const char c);

  } // namespace Buffer

} // namespace wireheaders

#endif // WIRE_HEADERS_BUFFER_HPP
