#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace SEIS{

    // Message types are bit flags; a datagram carries exactly one.
    enum class MsgType : uint16_t {
        Announce    = 1 << 0,   // reserved, no payload defined yet
        Measurement = 1 << 1,
    };

    constexpr std::size_t kHeaderSize      = 4;          // u16 type + u16 size
    constexpr std::size_t kMeasurementSize = 4 + 3 * 8;  // f32 time + 3 x f64

    enum class DecodeStatus {
        Ok,
        Truncated,      // fewer bytes than declared / required
        TrailingData,   // bytes left over after the fixed-width fields
    };

    // Diagnostics for a failed decode. `data` holds the bytes that were
    // being interpreted when the mismatch was found.
    struct FramingError {
        DecodeStatus kind = DecodeStatus::Ok;
        std::size_t num_got = 0;
        std::size_t num_want = 0;
        std::vector<uint8_t> data;
    };

    struct FrameHeader {
        uint16_t msg_type = 0;
        uint16_t declared_size = 0;
        const uint8_t* body = nullptr;   // points into the decoded buffer
        std::size_t body_size = 0;
    };

    struct MeasurementBody {
        float rel_time = 0.0f;
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    // Splits the header off a datagram. The body must be exactly
    // declared_size bytes long, otherwise Truncated is returned and `out`
    // must not be used.
    DecodeStatus decode_header(const uint8_t* data, std::size_t len,
                               FrameHeader& out, FramingError* err = nullptr);

    DecodeStatus decode_measurement(const uint8_t* body, std::size_t len,
                                    MeasurementBody& out, FramingError* err = nullptr);

    void encode_header(uint16_t msg_type, uint16_t declared_size, std::vector<uint8_t>& out);
    void encode_measurement(const MeasurementBody& m, std::vector<uint8_t>& out);

    // Header + measurement body, ready to hand to sendto().
    std::vector<uint8_t> encode_measurement_frame(const MeasurementBody& m);

    const char* to_string(DecodeStatus s);
}
