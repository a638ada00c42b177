#pragma once

#include <functional>
#include <optional>
#include "SEISsample.hpp"

namespace SEIS{

    // Maps sensor-relative time onto the local wall clock. The sensor's
    // clock has an arbitrary epoch, so the first reading is pinned to "now"
    // and everything after is offset from that pair. Wraparound of the
    // sensor clock is not corrected.
    class timeCompensator {
    public:
        using WallClock = std::function<Clock::time_point()>;

        explicit timeCompensator(bool drop_on_backward = true,
                                 WallClock now = [] { return Clock::now(); });

        // Absolute time for `sensor_time`. The first finite reading sets the
        // anchor. Returns false, leaving all state untouched, when the reading
        // is NaN/inf or lands outside what Clock can represent.
        bool compensate(float sensor_time, Clock::time_point& out);

        // Ordering filter. Returns false if `t` goes backwards and dropping
        // is enabled; state is left untouched in that case.
        bool accept(Clock::time_point t);

        bool anchored() const { return anchor_.has_value(); }
        Clock::time_point anchorWallclock() const { return anchor_->wallclock; }
        float anchorSensorTime() const { return anchor_->sensor_time; }
        const std::optional<Clock::time_point>& lastAccepted() const { return last_accepted_; }

        bool dropOnBackward() const { return drop_on_backward_; }
        void setDropOnBackward(bool on) { drop_on_backward_ = on; }

    private:
        struct Anchor {
            Clock::time_point wallclock;
            float sensor_time;
        };

        bool drop_on_backward_;
        WallClock now_;
        std::optional<Anchor> anchor_;
        std::optional<Clock::time_point> last_accepted_;
    };
}
