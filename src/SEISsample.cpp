#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include "SEISsample.hpp"

namespace SEIS{

    SEISsample::SEISsample(Clock::time_point t, double x_, double y_, double z_,
                           std::optional<std::string> src)
        : timestamp(t), x(x_), y(y_), z(z_), source(std::move(src)) {}

    SEISsample SEISsample::clone(double nx, double ny, double nz) const {
        return SEISsample(timestamp, nx, ny, nz, source);
    }

    SEISsample SEISsample::operator*(double n) const {
        return clone(x * n, y * n, z * n);
    }

    SEISsample SEISsample::operator/(double n) const {
        return clone(x / n, y / n, z / n);
    }

    SEISsample SEISsample::operator-() const {
        return clone(-x, -y, -z);
    }

    SEISsample SEISsample::operator+() const {
        return clone(+x, +y, +z);
    }

    SEISsample SEISsample::operator~() const {
        // Outside int64 range the integer conversion is undefined.
        auto inv = [](double v) {
            if (!(v >= -9223372036854775808.0 && v < 9223372036854775808.0)) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return static_cast<double>(~static_cast<int64_t>(v));
        };
        return clone(inv(x), inv(y), inv(z));
    }

    SEISsample operator*(double n, const SEISsample& s){
        return s * n;
    }

    SEISsample abs(const SEISsample& s){
        return s.clone(std::fabs(s.getX()), std::fabs(s.getY()), std::fabs(s.getZ()));
    }

    std::string format_timestamp(Clock::time_point t){
        using namespace std::chrono;
        const auto us = duration_cast<microseconds>(t.time_since_epoch()).count();
        std::time_t secs = static_cast<std::time_t>(us / 1000000);
        long frac = static_cast<long>(us % 1000000);
        if (frac < 0) {
            frac += 1000000;
            --secs;
        }

        std::tm tm{};
        localtime_r(&secs, &tm);

        std::ostringstream os;
        os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << frac;
        return os.str();
    }

    nlohmann::json sample_to_json(const SEISsample& s){
        using nlohmann::json; using namespace std::chrono;
        auto us = duration_cast<microseconds>(s.getTimestamp().time_since_epoch()).count();
        json j{
            {"t_us", us},
            {"x", s.getX()},
            {"y", s.getY()},
            {"z", s.getZ()}
        };
        if (s.getSource()) {
            j["source"] = *s.getSource();
        }
        return j;
    }

    std::ostream& operator<<(std::ostream& os, const SEISsample& sample){
        std::ostringstream line;
        line << "<Measurement at " << format_timestamp(sample.timestamp);
        if (sample.source && !sample.source->empty()) {
            line << " from " << *sample.source;
        }
        line << ": (" << std::showpos << std::fixed << std::setprecision(6)
             << sample.x << ", " << sample.y << ", " << sample.z << ")>";
        os << line.str();
        return os;
    }
}
