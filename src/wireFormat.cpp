#include <cstring>
#include <netinet/in.h>
#include "wireFormat.hpp"

namespace SEIS{

    static uint16_t read_u16(const uint8_t* p){
        uint16_t v;
        std::memcpy(&v, p, sizeof(v));
        return ntohs(v);
    }

    static float read_f32(const uint8_t* p){
        uint32_t bits;
        std::memcpy(&bits, p, sizeof(bits));
        bits = ntohl(bits);
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    static double read_f64(const uint8_t* p){
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits = (bits << 8) | p[i];
        }
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    static void write_u16(uint16_t v, std::vector<uint8_t>& out){
        out.push_back(static_cast<uint8_t>(v >> 8));
        out.push_back(static_cast<uint8_t>(v & 0xFF));
    }

    static void write_f32(float v, std::vector<uint8_t>& out){
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        for (int shift = 24; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
        }
    }

    static void write_f64(double v, std::vector<uint8_t>& out){
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
        }
    }

    static DecodeStatus fail(DecodeStatus kind, std::size_t got, std::size_t want,
                             const uint8_t* data, std::size_t len, FramingError* err){
        if (err) {
            err->kind = kind;
            err->num_got = got;
            err->num_want = want;
            err->data.assign(data, data + len);
        }
        return kind;
    }

    DecodeStatus decode_header(const uint8_t* data, std::size_t len,
                               FrameHeader& out, FramingError* err){
        if (len < kHeaderSize) {
            return fail(DecodeStatus::Truncated, len, kHeaderSize, data, len, err);
        }

        const uint16_t type = read_u16(data);
        const uint16_t size = read_u16(data + 2);
        const std::size_t rest = len - kHeaderSize;
        if (rest != size) {
            return fail(DecodeStatus::Truncated, rest, size, data, len, err);
        }

        out.msg_type = type;
        out.declared_size = size;
        out.body = data + kHeaderSize;
        out.body_size = rest;
        return DecodeStatus::Ok;
    }

    DecodeStatus decode_measurement(const uint8_t* body, std::size_t len,
                                    MeasurementBody& out, FramingError* err){
        if (len < kMeasurementSize) {
            return fail(DecodeStatus::Truncated, len, kMeasurementSize, body, len, err);
        }
        // No extension mechanism: surplus bytes mean a format mismatch.
        if (len > kMeasurementSize) {
            return fail(DecodeStatus::TrailingData, len, kMeasurementSize, body, len, err);
        }

        out.rel_time = read_f32(body);
        out.x = read_f64(body + 4);
        out.y = read_f64(body + 12);
        out.z = read_f64(body + 20);
        return DecodeStatus::Ok;
    }

    void encode_header(uint16_t msg_type, uint16_t declared_size, std::vector<uint8_t>& out){
        write_u16(msg_type, out);
        write_u16(declared_size, out);
    }

    void encode_measurement(const MeasurementBody& m, std::vector<uint8_t>& out){
        write_f32(m.rel_time, out);
        write_f64(m.x, out);
        write_f64(m.y, out);
        write_f64(m.z, out);
    }

    std::vector<uint8_t> encode_measurement_frame(const MeasurementBody& m){
        std::vector<uint8_t> frame;
        frame.reserve(kHeaderSize + kMeasurementSize);
        encode_header(static_cast<uint16_t>(MsgType::Measurement),
                      static_cast<uint16_t>(kMeasurementSize), frame);
        encode_measurement(m, frame);
        return frame;
    }

    const char* to_string(DecodeStatus s){
        switch (s) {
            case DecodeStatus::Ok:           return "ok";
            case DecodeStatus::Truncated:    return "truncated";
            case DecodeStatus::TrailingData: return "trailing data";
        }
        return "unknown";
    }
}
