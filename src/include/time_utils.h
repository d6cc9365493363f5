#pragma once

#include <cstdint>
#include <ctime>
#include <string>

/**
 * @brief Formats an offset from UTC in seconds as Git's "+HHMM" / "-HHMM".
 */
std::string formatTimezoneOffset(long offsetSeconds);

/**
 * @brief The local timezone offset for the given instant, in Git's "+HHMM" format.
 */
std::string localTimezoneOffset(std::time_t when);
