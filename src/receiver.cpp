#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <signal.h>
#include <unistd.h>

#include "SEISconfig.hpp"
#include "SEISreceiver.hpp"

static std::atomic<bool> running{true};

static void on_sigint(int){
    running.store(false);
}

static void usage(const char* prog){
    std::fprintf(stderr,
        "usage: %s [--config FILE] [--bind ADDR] [--port N] [--ipv6] [--keep-backward] [--json]\n",
        prog);
}

static bool parse_port(const char* s, uint16_t& out){
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

static void report(const SEIS::Received& r){
    using SEIS::RecvStatus;
    const char* from = r.source ? r.source->c_str() : "?";
    switch (r.status) {
        case RecvStatus::Truncated:
        case RecvStatus::TrailingData:
            std::fprintf(stderr, "[receiver] %s from %s: wanted %zu bytes, got %zu\n",
                         SEIS::to_string(r.status), from, r.error.num_want, r.error.num_got);
            break;
        case RecvStatus::BadTimestamp:
            std::fprintf(stderr, "[receiver] dropped measurement from %s: bad timestamp\n", from);
            break;
        case RecvStatus::Unsupported:
            std::fprintf(stderr, "[receiver] message type %u from %s not supported\n",
                         static_cast<unsigned>(r.msg_type), from);
            break;
        case RecvStatus::SocketError:
            if (r.os_error != EINTR) {
                std::fprintf(stderr, "[receiver] recv failed: %s\n", std::strerror(r.os_error));
            }
            break;
        default:
            break;
    }
}

int main(int argc, char** argv)
{
    SEIS::ReceiverConfig cfg;
    bool json_lines = false;

    // Config file first so flags can override it.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (!SEIS::load_config(argv[i + 1], cfg)) {
                std::fprintf(stderr, "invalid config file %s\n", argv[i + 1]);
                return 1;
            }
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc)
            ++i;
        else if (a == "--bind" && i + 1 < argc)
            cfg.bind = argv[++i];
        else if (a == "--port" && i + 1 < argc) {
            if (!parse_port(argv[++i], cfg.port)) {
                std::fprintf(stderr, "invalid port %s\n", argv[i]);
                return 1;
            }
        }
        else if (a == "--ipv6")
            cfg.ipv6 = true;
        else if (a == "--keep-backward")
            cfg.drop_on_backward = false;
        else if (a == "--json")
            json_lines = true;
        else {
            usage(argv[0]);
            return 1;
        }
    }

    // No SA_RESTART: a pending recvfrom() returns EINTR so the loop can stop.
    struct sigaction sa{};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Wake up regularly to notice a stop request even when no data arrives.
    if (cfg.receive_timeout_ms == 0) cfg.receive_timeout_ms = 200;

    try {
        SEIS::SEISreceiver rx(cfg);

        // ANSI "erase line" only makes sense on a terminal.
        const bool tty = !json_lines && ::isatty(STDOUT_FILENO);
        if (tty) {
            std::cout << "Awaiting initial measurement..." << std::flush;
        }

        for (const auto& r : rx.measurements()) {
            if (!running.load()) break;
            if (r.status == SEIS::RecvStatus::TimedOut) continue;
            if (!r.accepted()) {
                report(r);
                continue;
            }

            if (json_lines) {
                std::cout << SEIS::sample_to_json(*r.sample).dump() << "\n";
            } else if (tty) {
                std::cout << "\x1b[2K\r" << *r.sample;
            } else {
                std::cout << *r.sample << "\n";
            }
            std::cout.flush();
        }

        if (tty) std::cout << "\x1b[2K\rBye!\n";
        rx.close();
    } catch (const SEIS::BindError& e) {
        std::fprintf(stderr, "socket bind failed: %s\n", e.what());
        return 1;
    }
    return 0;
}
