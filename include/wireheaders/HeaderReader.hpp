#ifndef WIRE_HEADERS_HEADER_READER_HPP
#define WIRE_HEADERS_HEADER_READER_HPP

#include <cstddef>
#include <string>

namespace wireheaders {

  /**
   * Reads the header lines of an HTTP response, each line terminated by "\r\n".
   *
   * The reader never throws on malformed input: empty lines and lines without
   * a colon are skipped, and a final line missing its "\r\n" is still returned
   * once. The buffer is borrowed and must outlive the reader.
   */
  class HeaderReader {
    public:
      HeaderReader(const char* buffer, size_t startIndex, size_t length);
      explicit HeaderReader(const char* block);
      explicit HeaderReader(const std::string& block);
      HeaderReader(std::string&& block) = delete;

      // Reads the next "name: value" pair. Returns false once every line has been consumed.
      bool readHeader(std::string& name, std::string& value);

      // Skips one line. Returns false once every line has been consumed.
      bool readLine();

      static const std::string Gzip;
      static const std::string Deflate;

    private:
      const char* buffer_;
      size_t position_;
      size_t end_;

      bool readLine(size_t& startIndex, size_t& length);

      static std::string getHeaderValue(const std::string* knownName, const char* buffer, size_t startIndex, size_t length);
  };

} // namespace wireheaders

#endif // WIRE_HEADERS_HEADER_READER_HPP
