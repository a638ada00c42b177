#include <cmath>
#include "timeCompensator.hpp"

namespace SEIS{

    timeCompensator::timeCompensator(bool drop_on_backward, WallClock now)
        : drop_on_backward_(drop_on_backward), now_(std::move(now)) {}

    bool timeCompensator::compensate(float sensor_time, Clock::time_point& out){
        using namespace std::chrono;

        if (!std::isfinite(sensor_time)) return false;

        const Anchor anchor = anchor_ ? *anchor_ : Anchor{now_(), sensor_time};

        // Difference in double so small steps survive far from the anchor;
        // truncated to whole microseconds.
        const double diff = static_cast<double>(sensor_time) - static_cast<double>(anchor.sensor_time);

        // The result has to fit Clock::duration. Keep a margin below its
        // limit so rounding in double cannot push the casts over.
        const double since_epoch = duration<double>(anchor.wallclock.time_since_epoch()).count();
        const double limit = 0.99 * duration<double>(Clock::duration::max()).count();
        if (!std::isfinite(diff) || std::fabs(diff) >= limit || std::fabs(since_epoch + diff) >= limit) {
            return false;
        }

        const auto delta = duration_cast<microseconds>(duration<double>(diff));
        anchor_ = anchor;
        out = anchor.wallclock + duration_cast<Clock::duration>(delta);
        return true;
    }

    bool timeCompensator::accept(Clock::time_point t){
        if (drop_on_backward_ && last_accepted_ && t < *last_accepted_) {
            return false;
        }
        last_accepted_ = t;
        return true;
    }
}
