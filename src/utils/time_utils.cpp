#include <string>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include "../include/time_utils.h"

std::string formatTimezoneOffset(long offsetSeconds) {
    char sign = (offsetSeconds >= 0) ? '+' : '-';
    long absOffset = std::labs(offsetSeconds);
    long hours = absOffset / 3600;
    long minutes = (absOffset % 3600) / 60;

    std::ostringstream oss;
    oss << sign
        << std::setw(2) << std::setfill('0') << hours
        << std::setw(2) << std::setfill('0') << minutes;
    return oss.str();
}

std::string localTimezoneOffset(std::time_t when) {
    std::tm local_tm{};
    localtime_r(&when, &local_tm);
    return formatTimezoneOffset(local_tm.tm_gmtoff);
}
