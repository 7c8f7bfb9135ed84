#ifndef WIRE_HEADERS_TIMESTAMP_HPP
#define WIRE_HEADERS_TIMESTAMP_HPP

#include <cstdint>
#include <string>

namespace wireheaders {

  namespace Timestamp {

    // Milliseconds since the unix epoch.
    int64_t getCurrentTimestamp();

    // Local time as "YYYY-mm-dd HH:MM:SS.mmm", used as the log prefix.
    std::string getFormatedTimestamp();

  } // namespace Timestamp

} // namespace wireheaders

#endif // WIRE_HEADERS_TIMESTAMP_HPP
