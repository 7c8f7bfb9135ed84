#include "wireheaders/Decompress.hpp"
#include "wireheaders/Buffer.hpp"
#include "wireheaders/Logs.hpp"
#include <miniz/miniz.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

namespace wireheaders {

  Decompressor::Decompressor(DecompressionAlgorithm algorithm)
    : algorithm_(algorithm), state_(DecompressionState::DECOMPRESS_ERROR) {
    std::memset(&this->stream_, 0, sizeof(this->stream_));
  }

  Decompressor::~Decompressor() {
    if (this->initialized_) {
      wireheaders_log("[Decompressor] Cleaning up decompressor");
      mz_inflateEnd(&this->stream_);
    }
  }

  DecompressionState Decompressor::init() {
    if (this->algorithm_ != DecompressionAlgorithm::DEFLATE && this->algorithm_ != DecompressionAlgorithm::GZIP) {
      this->state_ = DecompressionState::DECOMPRESS_ERROR;
      return this->state_;
    }

    // gzip: the member header is skipped by hand and the body inflated raw.
    // deflate: zlib wrapped stream.
    int window_bits = this->algorithm_ == DecompressionAlgorithm::GZIP ? -MZ_DEFAULT_WINDOW_BITS : MZ_DEFAULT_WINDOW_BITS;

    int ret = mz_inflateInit2(&this->stream_, window_bits);
    if (ret != MZ_OK) {
      wireheaders_error("[Decompressor] Failed to initialize decompressor: " << ret);
      this->state_ = DecompressionState::DECOMPRESS_ERROR;
      return this->state_;
    }

    this->initialized_ = true;
    this->state_ = DecompressionState::INITIALIZED;
    return this->state_;
  }

  size_t Decompressor::getGzipHeaderLength(const uint8_t* data, size_t size) {
    // The minimum length of a GZIP header is 10 bytes.
    if (size < 10) return 0;

    // Magic numbers and DEFLATE method.
    if (data[0] != 0x1f || data[1] != 0x8b || data[2] != 8) return 0;

    const uint8_t flags = data[3];
    size_t header_len = 10;

    // FEXTRA
    if (flags & 0x04) {
      if (header_len + 2 > size) return 0;
      uint16_t extra_len = static_cast<uint16_t>(data[header_len] | (data[header_len + 1] << 8));
      header_len += 2 + extra_len;
    }

    // FNAME, FCOMMENT: zero terminated
    for (uint8_t flag : { static_cast<uint8_t>(0x08), static_cast<uint8_t>(0x10) }) {
      if (flags & flag) {
        while (header_len < size && data[header_len] != 0) header_len++;
        if (header_len < size) header_len++;
      }
    }

    // FHCRC
    if (flags & 0x02) {
      header_len += 2;
    }

    return (header_len <= size) ? header_len : 0;
  }

  DecompressionState Decompressor::decompress(
    const unsigned char* input,
    size_t input_size,
    std::function<void(const unsigned char* buffer, const size_t& size)> output_callback
  ) {
    if (!this->initialized_ || input == nullptr || input_size == 0) {
      this->state_ = DecompressionState::DECOMPRESS_ERROR;
      return this->state_;
    }

    size_t header_length = 0;
    if (this->algorithm_ == DecompressionAlgorithm::GZIP && !this->header_processed_) {
      header_length = getGzipHeaderLength(input, input_size);
      if (header_length == 0) {
        wireheaders_error("[Decompressor] Invalid gzip header");
        this->state_ = DecompressionState::DECOMPRESS_ERROR;
        return this->state_;
      }
      this->header_processed_ = true;
    }

    this->stream_.next_in = input + header_length;
    this->stream_.avail_in = static_cast<unsigned int>(input_size - header_length);
    this->state_ = DecompressionState::DECOMPRESSING;

    wireheaders_log("[Decompressor] Decompressing " << this->stream_.avail_in << " bytes of data.");

    unsigned char output[WIRE_HEADERS_DECOMPRESS_OUTPUT_CHUNK_SIZE];
    bool done = false;

    while (!done) {
      this->stream_.next_out = output;
      this->stream_.avail_out = WIRE_HEADERS_DECOMPRESS_OUTPUT_CHUNK_SIZE;

      int status = mz_inflate(&this->stream_, MZ_NO_FLUSH);

      if ((status == MZ_OK || status == MZ_STREAM_END) && this->stream_.avail_out != WIRE_HEADERS_DECOMPRESS_OUTPUT_CHUNK_SIZE) {
        size_t out_size = WIRE_HEADERS_DECOMPRESS_OUTPUT_CHUNK_SIZE - this->stream_.avail_out;
        output_callback(output, out_size);
      }

      switch (status) {
        case MZ_OK:
          this->state_ = DecompressionState::DECOMPRESSING;
          break;
        case MZ_BUF_ERROR: // needs more input
          done = true;
          this->state_ = DecompressionState::DECOMPRESSING;
          break;
        case MZ_STREAM_END:
          done = true;
          this->state_ = DecompressionState::FINISHED;
          break;
        default:
          wireheaders_error("[Decompressor] Decompression error: " << status);
          done = true;
          this->state_ = DecompressionState::DECOMPRESS_ERROR;
          break;
      }
    }

    return this->state_;
  }

  DecompressionAlgorithm Decompressor::algorithmFromCoding(const std::string& coding) {
    if (wireheaders::Buffer::equalsIgnoreCase("gzip", coding) || wireheaders::Buffer::equalsIgnoreCase("x-gzip", coding)) {
      return DecompressionAlgorithm::GZIP;
    }
    if (wireheaders::Buffer::equalsIgnoreCase("deflate", coding)) {
      return DecompressionAlgorithm::DEFLATE;
    }
    if (wireheaders::Buffer::equalsIgnoreCase("identity", coding)) {
      return DecompressionAlgorithm::NONE;
    }
    return DecompressionAlgorithm::UNSUPPORTED;
  }

  wireheaders::HeaderResult decodeContent(wireheaders::Headers& headers, const std::string& body, std::string& decoded) {
    std::vector<std::string> codings;
    for (const auto& coding : headers.contentEncoding()) {
      codings.push_back(coding->token());
    }

    std::string current = body;
    for (auto it = codings.rbegin(); it != codings.rend(); ++it) {
      DecompressionAlgorithm algorithm = Decompressor::algorithmFromCoding(*it);
      if (algorithm == DecompressionAlgorithm::UNSUPPORTED) {
        wireheaders_error("[Decompressor] Unsupported content coding: " << *it);
        return HeaderResult::UNSUPPORTED_CONTENT_ENCODING;
      }
      if (algorithm == DecompressionAlgorithm::NONE || current.empty()) continue;

      Decompressor decompressor(algorithm);
      if (decompressor.init() != DecompressionState::INITIALIZED) {
        return HeaderResult::DECOMPRESS_FAILED;
      }

      std::string output;
      DecompressionState state = decompressor.decompress(
        reinterpret_cast<const unsigned char*>(current.data()),
        current.size(),
        [&output](const unsigned char* buffer, const size_t& size) {
          output.append(reinterpret_cast<const char*>(buffer), size);
        }
      );

      if (state != DecompressionState::FINISHED) {
        wireheaders_error("[Decompressor] Failed to decode " << *it << " content, state: " << state);
        return HeaderResult::DECOMPRESS_FAILED;
      }

      current.swap(output);
    }

    decoded.swap(current);
    return HeaderResult::SUCCESS;
  }

} // namespace wireheaders
