#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "SEISconfig.hpp"
#include "wireFormat.hpp"

#define SA struct sockaddr

// Sends measurement frames with a slowly rotating gravity vector, for
// driving SEIS_receiver by hand.
int main(int argc, char** argv)
{
    std::string host = "127.0.0.1";
    int port = SEIS_PORT;
    long count = 100;
    long interval_ms = 20;
    double start = 0.0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--host" && i + 1 < argc)
            host = argv[++i];
        else if (a == "--port" && i + 1 < argc)
            port = std::atoi(argv[++i]);
        else if (a == "--count" && i + 1 < argc)
            count = std::atol(argv[++i]);
        else if (a == "--interval-ms" && i + 1 < argc)
            interval_ms = std::atol(argv[++i]);
        else if (a == "--start" && i + 1 < argc)
            start = std::atof(argv[++i]);
        else {
            std::fprintf(stderr,
                "usage: %s [--host ADDR] [--port N] [--count N] [--interval-ms N] [--start T]\n", argv[0]);
            return 1;
        }
    }
    if (port <= 0 || port > 65535 || interval_ms < 0) {
        std::fprintf(stderr, "invalid port or interval\n");
        return 1;
    }

    const bool v6 = host.find(':') != std::string::npos;
    sockaddr_storage dst{};
    socklen_t dstlen = 0;
    if (v6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&dst);
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET6, host.c_str(), &in6->sin6_addr) != 1) {
            std::fprintf(stderr, "invalid address %s\n", host.c_str());
            return 1;
        }
        dstlen = sizeof(sockaddr_in6);
    } else {
        auto* in4 = reinterpret_cast<sockaddr_in*>(&dst);
        in4->sin_family = AF_INET;
        in4->sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, host.c_str(), &in4->sin_addr) != 1) {
            std::fprintf(stderr, "invalid address %s\n", host.c_str());
            return 1;
        }
        dstlen = sizeof(sockaddr_in);
    }

    int sockfd = socket(v6 ? AF_INET6 : AF_INET, SOCK_DGRAM, 0);
    if (sockfd < 0) {
        std::perror("socket");
        return 1;
    }

    const double step = interval_ms / 1000.0;
    for (long k = 0; k < count; ++k) {
        const double phase = 0.05 * k;
        SEIS::MeasurementBody m;
        m.rel_time = static_cast<float>(start + k * step);
        m.x = 0.1 * std::sin(phase);
        m.y = 0.1 * std::cos(phase);
        m.z = -0.98;

        const auto frame = SEIS::encode_measurement_frame(m);
        if (sendto(sockfd, frame.data(), frame.size(), 0, (SA*)&dst, dstlen) < 0) {
            std::perror("sendto");
            close(sockfd);
            return 1;
        }
        if (k % 100 == 0 || k + 1 == count) {
            std::fprintf(stderr, "[sender] sent %ld/%ld\n", k + 1, count);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }

    close(sockfd);
    return 0;
}
