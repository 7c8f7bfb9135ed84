#include "wireheaders/Timestamp.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace wireheaders {

  namespace Timestamp {

    int64_t getCurrentTimestamp() {
      return std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();
    }

    std::string getFormatedTimestamp() {
      const int64_t millis = getCurrentTimestamp();
      std::time_t seconds = static_cast<std::time_t>(millis / 1'000);

      std::tm parts{};
#ifdef _WIN32
      localtime_s(&parts, &seconds);
#else
      localtime_r(&seconds, &parts);
#endif

      std::ostringstream oss;
      oss << std::put_time(&parts, "%Y-%m-%d %H:%M:%S");
      oss << "." << std::setfill('0') << std::setw(3) << (millis % 1'000);
      return oss.str();
    }

  } // namespace Timestamp

} // namespace wireheaders
