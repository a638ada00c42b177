#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>

namespace SEIS{

    using Clock = std::chrono::system_clock;

    // Detects values that expose three axes, either as public data members
    // (x, y, z) or through the getX()/getY()/getZ() accessors SEISsample uses.
    template <typename T, typename = void>
    struct has_axis_members : std::false_type {};

    template <typename T>
    struct has_axis_members<T, std::void_t<decltype(std::declval<const T&>().x + 0.0),
                                           decltype(std::declval<const T&>().y + 0.0),
                                           decltype(std::declval<const T&>().z + 0.0)>>
        : std::true_type {};

    template <typename T, typename = void>
    struct has_axis_getters : std::false_type {};

    template <typename T>
    struct has_axis_getters<T, std::void_t<decltype(std::declval<const T&>().getX() + 0.0),
                                           decltype(std::declval<const T&>().getY() + 0.0),
                                           decltype(std::declval<const T&>().getZ() + 0.0)>>
        : std::true_type {};

    template <typename T>
    constexpr bool has_axes_v = has_axis_members<T>::value || has_axis_getters<T>::value;

    template <typename T>
    std::array<double, 3> axes_of(const T& v){
        if constexpr (has_axis_getters<T>::value) {
            return {static_cast<double>(v.getX()), static_cast<double>(v.getY()),
                    static_cast<double>(v.getZ())};
        } else {
            return {static_cast<double>(v.x), static_cast<double>(v.y), static_cast<double>(v.z)};
        }
    }

    // One accelerometer reading. Immutable: every operation returns a new
    // sample carrying this sample's timestamp and source.
    class SEISsample {
    public:
        SEISsample(Clock::time_point t, double x, double y, double z,
                   std::optional<std::string> source = std::nullopt);

        Clock::time_point getTimestamp() const { return timestamp; }
        const std::optional<std::string>& getSource() const { return source; }
        double getX() const { return x; }
        double getY() const { return y; }
        double getZ() const { return z; }
        std::array<double, 3> getValues() const { return {x, y, z}; }

        // Same timestamp and source, new accelerometer data.
        SEISsample clone(double nx, double ny, double nz) const;

        template <typename V, typename = std::enable_if_t<has_axes_v<V>>>
        SEISsample operator+(const V& o) const {
            const auto a = axes_of(o);
            return clone(x + a[0], y + a[1], z + a[2]);
        }

        template <typename V, typename = std::enable_if_t<has_axes_v<V>>>
        SEISsample operator-(const V& o) const {
            const auto a = axes_of(o);
            return clone(x - a[0], y - a[1], z - a[2]);
        }

        SEISsample operator*(double n) const;
        SEISsample operator/(double n) const;
        SEISsample operator-() const;
        SEISsample operator+() const;
        // Bitwise complement of the integer-truncated axes. An axis that is
        // NaN/inf or outside the int64 range becomes NaN.
        SEISsample operator~() const;

        friend std::ostream& operator<<(std::ostream& os, const SEISsample& sample);

    private:
        Clock::time_point timestamp;
        double x;
        double y;
        double z;
        std::optional<std::string> source;
    };

    SEISsample operator*(double n, const SEISsample& s);
    SEISsample abs(const SEISsample& s);

    // Local time with microseconds, e.g. "2010-05-20 15:28:46.990220".
    std::string format_timestamp(Clock::time_point t);

    nlohmann::json sample_to_json(const SEISsample& s);
}
