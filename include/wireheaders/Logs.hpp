#ifndef WIRE_HEADERS_LOGS_HPP
#define WIRE_HEADERS_LOGS_HPP

#include "wireheaders/Timestamp.hpp"

// Both macros take a stream expression: wireheaders_log("read " << n << " bytes").
// Each one compiles to nothing unless its USE_WIRE_HEADERS_* switch is defined.

#if defined(USE_WIRE_HEADERS_LOG) || defined(USE_WIRE_HEADERS_ERR)
#include <iostream>
#define WIRE_HEADERS_LOG_LINE(stream, level, ...) \
  (stream << "[" << wireheaders::Timestamp::getFormatedTimestamp() << "] [WIREHEADERS] [" level "] " << __VA_ARGS__ << std::endl)
#endif

#ifdef USE_WIRE_HEADERS_LOG
#define wireheaders_log(...) WIRE_HEADERS_LOG_LINE(std::cout, "LOG", __VA_ARGS__)
#else
#define wireheaders_log(...) ((void)0)
#endif

#ifdef USE_WIRE_HEADERS_ERR
#define wireheaders_error(...) WIRE_HEADERS_LOG_LINE(std::cerr, "ERR", __VA_ARGS__)
#else
#define wireheaders_error(...) ((void)0)
#endif

#endif // WIRE_HEADERS_LOGS_HPP
