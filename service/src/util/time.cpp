#include <tasklist/util/time.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tasklist {

Timestamp system_now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

namespace util {

std::string format_timestamp(Timestamp ts) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
    const auto millis = (ts - seconds).count();

    const std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::int64_t to_epoch_ms(Timestamp ts) {
    return ts.time_since_epoch().count();
}

Timestamp from_epoch_ms(std::int64_t ms) {
    return Timestamp{std::chrono::milliseconds{ms}};
}

} // namespace util
} // namespace tasklist
