#ifndef WIRE_HEADERS_DECOMPRESS_HPP
#define WIRE_HEADERS_DECOMPRESS_HPP

#include "wireheaders/Headers.hpp"
#include "wireheaders/Results.hpp"
#include <miniz/miniz.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#ifndef WIRE_HEADERS_DECOMPRESS_OUTPUT_CHUNK_SIZE
#define WIRE_HEADERS_DECOMPRESS_OUTPUT_CHUNK_SIZE 16384 // 16 kb
#endif

namespace wireheaders {

  enum DecompressionAlgorithm {
    NONE,
    GZIP,
    DEFLATE,
    UNSUPPORTED
  };

  enum DecompressionState {
    INITIALIZED,
    DECOMPRESSING,
    FINISHED,
    DECOMPRESS_ERROR
  };

  class Decompressor {
    private:
      mz_stream stream_;
      DecompressionAlgorithm algorithm_;
      DecompressionState state_;
      bool initialized_ = false;
      bool header_processed_ = false;

      static size_t getGzipHeaderLength(const uint8_t* data, size_t size);

    public:
      explicit Decompressor(DecompressionAlgorithm algorithm);
      ~Decompressor();

      Decompressor(const Decompressor&) = delete;
      Decompressor& operator=(const Decompressor&) = delete;

      DecompressionState init();
      DecompressionState decompress(
        const unsigned char* input,
        size_t input_size,
        std::function<void(const unsigned char* buffer, const size_t& size)> output_callback
      );

      // gzip / x-gzip, deflate, identity; anything else is UNSUPPORTED.
      static DecompressionAlgorithm algorithmFromCoding(const std::string& coding);
  };

  // Undoes every coding listed in Content-Encoding, last applied first.
  // `decoded` is only written on SUCCESS.
  wireheaders::HeaderResult decodeContent(wireheaders::Headers& headers, const std::string& body, std::string& decoded);

} // namespace wireheaders

#endif // WIRE_HEADERS_DECOMPRESS_HPP
