#include "flbplug/clock.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <limits>

namespace flbplug {

bool realtime_now(Timestamp* out, std::string* err) {
    struct timespec tm{};
    if (clock_gettime(CLOCK_REALTIME, &tm) != 0) {
        if (err) *err = std::string("clock_gettime failed: ") + std::strerror(errno);
        return false;
    }
    if (tm.tv_sec < 0 || static_cast<unsigned long long>(tm.tv_sec) > std::numeric_limits<uint32_t>::max()) {
        if (err) *err = "wall clock outside the 32-bit event time range";
        return false;
    }
    out->sec = static_cast<uint32_t>(tm.tv_sec);
    out->nsec = static_cast<uint32_t>(tm.tv_nsec);
    return true;
}

} // namespace flbplug
