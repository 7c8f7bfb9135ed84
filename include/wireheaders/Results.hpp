#ifndef WIRE_HEADERS_RESULTS_HPP
#define WIRE_HEADERS_RESULTS_HPP

#include <string>

namespace wireheaders {

  typedef enum {

    // HEADER STORE

    INVALID_HEADER_NAME = -300,
    INVALID_HEADER_VALUE = -299,
    NULL_HEADER_VALUE = -298,
    SPECIAL_VALUE_NOT_CONFIGURED = -297,
    HEADER_VALUE_TYPE_MISMATCH = -296,

    // COLLECTION VIEW

    COPY_DESTINATION_NULL = -200,
    COPY_INDEX_OUT_OF_RANGE = -199,
    COPY_DESTINATION_TOO_SMALL = -198,

    // COOKIES

    COOKIE_UNTERMINATED_QUOTE = -150,
    COOKIE_EMPTY_NAME = -149,
    COOKIE_END = -148,

    // CONTENT

    UNSUPPORTED_CONTENT_ENCODING = -100,
    DECOMPRESS_FAILED = -99,

    // GENERIC
    UNKNOWN_ERROR = 0,
    SUCCESS = 1,

  } HeaderResult;



  inline std::string getErrorMessage(wireheaders::HeaderResult code) {
    switch (code) {

      // HEADER STORE

      case HeaderResult::INVALID_HEADER_NAME:
        return "INVALID_HEADER_NAME";
      case HeaderResult::INVALID_HEADER_VALUE:
        return "INVALID_HEADER_VALUE";
      case HeaderResult::NULL_HEADER_VALUE:
        return "NULL_HEADER_VALUE";
      case HeaderResult::SPECIAL_VALUE_NOT_CONFIGURED:
        return "SPECIAL_VALUE_NOT_CONFIGURED";
      case HeaderResult::HEADER_VALUE_TYPE_MISMATCH:
        return "HEADER_VALUE_TYPE_MISMATCH";

      // COLLECTION VIEW

      case HeaderResult::COPY_DESTINATION_NULL:
        return "COPY_DESTINATION_NULL";
      case HeaderResult::COPY_INDEX_OUT_OF_RANGE:
        return "COPY_INDEX_OUT_OF_RANGE";
      case HeaderResult::COPY_DESTINATION_TOO_SMALL:
        return "COPY_DESTINATION_TOO_SMALL";

      // COOKIES

      case HeaderResult::COOKIE_UNTERMINATED_QUOTE:
        return "COOKIE_UNTERMINATED_QUOTE";
      case HeaderResult::COOKIE_EMPTY_NAME:
        return "COOKIE_EMPTY_NAME";
      case HeaderResult::COOKIE_END:
        return "COOKIE_END";

      // CONTENT

      case HeaderResult::UNSUPPORTED_CONTENT_ENCODING:
        return "UNSUPPORTED_CONTENT_ENCODING";
      case HeaderResult::DECOMPRESS_FAILED:
        return "DECOMPRESS_FAILED";

      // GENERIC

      case HeaderResult::UNKNOWN_ERROR:
        return "UNKNOWN_ERROR";
      case HeaderResult::SUCCESS:
        return "SUCCESS";
      default:
        return "INVALID ERROR (" + std::to_string(code) + ")";

    }
  }

  inline std::string getErrorMessage(int code) {
    return wireheaders::getErrorMessage(static_cast<wireheaders::HeaderResult>(code));
  }

} // namespace wireheaders

#endif // WIRE_HEADERS_RESULTS_HPP
