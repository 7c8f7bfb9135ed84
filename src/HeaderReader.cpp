#include "wireheaders/HeaderReader.hpp"
#include "wireheaders/Buffer.hpp"
#include "wireheaders/KnownHeaders.hpp"
#include "wireheaders/Logs.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace wireheaders {

  const std::string HeaderReader::Gzip = "gzip";
  const std::string HeaderReader::Deflate = "deflate";

  HeaderReader::HeaderReader(const char* buffer, size_t startIndex, size_t length)
    : buffer_(buffer), position_(startIndex), end_(startIndex + length) {
    if (buffer == nullptr && length > 0) {
      throw std::invalid_argument("Header buffer cannot be null");
    }
  }

  HeaderReader::HeaderReader(const char* block)
    : HeaderReader(block, 0, block != nullptr ? std::strlen(block) : 0) {}

  HeaderReader::HeaderReader(const std::string& block)
    : HeaderReader(block.data(), 0, block.size()) {}

  bool HeaderReader::readHeader(std::string& name, std::string& value) {
    size_t startIndex = 0;
    size_t length = 0;

    while (this->readLine(startIndex, length)) {
      // Skip empty lines.
      if (length == 0) {
        continue;
      }

      size_t colonIndex = wireheaders::Buffer::indexOf(this->buffer_, startIndex, length, ':');
      if (colonIndex == wireheaders::Buffer::error) {
        wireheaders_log("[HeaderReader] Skipping header line without colon: " << std::string(this->buffer_ + startIndex, length));
        continue;
      }

      size_t nameLength = colonIndex - startIndex;
      const std::string* knownName = wireheaders::KnownHeaders::find(this->buffer_, startIndex, nameLength);
      if (knownName != nullptr) {
        name = *knownName;
      } else {
        name.assign(this->buffer_ + startIndex, nameLength);
      }

      size_t valueStartIndex = colonIndex + 1;
      size_t valueLength = startIndex + length - colonIndex - 1;
      wireheaders::Buffer::trim(this->buffer_, valueStartIndex, valueLength);

      value = getHeaderValue(knownName, this->buffer_, valueStartIndex, valueLength);
      return true;
    }

    name.clear();
    value.clear();
    return false;
  }

  bool HeaderReader::readLine() {
    size_t startIndex = 0;
    size_t length = 0;
    return this->readLine(startIndex, length);
  }

  bool HeaderReader::readLine(size_t& startIndex, size_t& length) {
    size_t i = this->position_;

    while (i < this->end_) {
      if (this->buffer_[i] == '\r') {
        size_t next = i + 1;
        if (next < this->end_ && this->buffer_[next] == '\n') {
          startIndex = this->position_;
          length = i - this->position_;
          this->position_ = i + 2;
          return true;
        }
      }
      i++;
    }

    // Last line without a trailing CRLF.
    if (i > this->position_) {
      startIndex = this->position_;
      length = i - this->position_;
      this->position_ = i;
      return true;
    }

    startIndex = 0;
    length = 0;
    return false;
  }

  std::string HeaderReader::getHeaderValue(const std::string* knownName, const char* buffer, size_t startIndex, size_t length) {
    if (length == 0) {
      return std::string();
    }

    // Content-Encoding is nearly always gzip or deflate, hand back the shared spelling.
    if (knownName == &wireheaders::KnownHeaders::ContentEncoding) {
      if (wireheaders::Buffer::equalsIgnoreCase(Gzip, buffer, startIndex, length)) {
        return Gzip;
      } else if (wireheaders::Buffer::equalsIgnoreCase(Deflate, buffer, startIndex, length)) {
        return Deflate;
      }
    }

    return std::string(buffer + startIndex, length);
  }

} // namespace wireheaders
