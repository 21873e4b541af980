#include "cadence/core/time_utils.h"

#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace cadence {

double random_unit() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return distribution(generator);
}

namespace {

std::string plural(long long value, const char* unit) {
    return std::to_string(value) + " " + unit + (value == 1 ? "" : "s");
}

} // anonymous namespace

std::string pretty_time_delta(Seconds delta) {
    double seconds = delta.count();
    std::string sign;
    if (seconds < 0) {
        sign = "-";
        seconds = -seconds;
    }

    if (seconds < 1.0) {
        return sign + plural(std::llround(seconds * 1000.0), "millisecond");
    }

    if (seconds < 60.0) {
        std::ostringstream oss;
        oss << sign << std::fixed << std::setprecision(1) << seconds << " seconds";
        return oss.str();
    }

    auto whole = static_cast<long long>(seconds);
    if (whole < 3600) {
        std::string text = sign + plural(whole / 60, "minute");
        if (whole % 60 != 0) text += " " + plural(whole % 60, "second");
        return text;
    }

    if (whole < 86400) {
        std::string text = sign + plural(whole / 3600, "hour");
        if ((whole % 3600) / 60 != 0) text += " " + plural((whole % 3600) / 60, "minute");
        return text;
    }

    std::string text = sign + plural(whole / 86400, "day");
    if ((whole % 86400) / 3600 != 0) text += " " + plural((whole % 86400) / 3600, "hour");
    return text;
}

} // namespace cadence
