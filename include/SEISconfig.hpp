#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Compile-time defaults; override with -D at build time.
#ifndef SEIS_PORT
#define SEIS_PORT 5612
#endif

#ifndef SEIS_MAX_DATAGRAM
#define SEIS_MAX_DATAGRAM 4096
#endif

namespace SEIS{

    struct ReceiverConfig {
        bool ipv6 = false;
        // Left empty, resolves to 0.0.0.0 (or :: with ipv6).
        std::string bind;
        uint16_t port = SEIS_PORT;
        // Drop samples whose timestamp is older than the last accepted one.
        bool drop_on_backward = true;
        // 0 blocks forever.
        int receive_timeout_ms = 0;
        std::size_t buffer_size = SEIS_MAX_DATAGRAM;

        std::string bindAddress() const {
            if (!bind.empty()) return bind;
            return ipv6 ? "::" : "0.0.0.0";
        }
    };

    // Reads a JSON object into `out`. Keys are optional; unknown ones are
    // ignored. On any error `out` is left as it was and false is returned.
    bool parse_config(const std::string& text, ReceiverConfig& out);
    bool load_config(const std::string& path, ReceiverConfig& out);
}
