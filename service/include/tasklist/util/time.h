#ifndef TASKLIST_UTIL_TIME_H
#define TASKLIST_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace tasklist {

// Wall-clock instant at millisecond resolution
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

// Source of "now"; injectable so tests can control time
using Clock = std::function<Timestamp()>;

Timestamp system_now();

namespace util {

// ISO-8601 UTC, e.g. 2024-01-31T12:00:00.000Z
std::string format_timestamp(Timestamp ts);

std::int64_t to_epoch_ms(Timestamp ts);
Timestamp from_epoch_ms(std::int64_t ms);

} // namespace util
} // namespace tasklist

#endif
