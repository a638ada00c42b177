#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "SEISreceiver.hpp"

namespace SEIS{

    static std::string peer_to_string(const sockaddr_storage& addr){
        char host[INET6_ADDRSTRLEN]{};
        if (addr.ss_family == AF_INET) {
            const auto* in4 = reinterpret_cast<const sockaddr_in*>(&addr);
            inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
            return std::string(host) + ":" + std::to_string(ntohs(in4->sin_port));
        }
        if (addr.ss_family == AF_INET6) {
            const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
            inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
            return "[" + std::string(host) + "]:" + std::to_string(ntohs(in6->sin6_port));
        }
        return "unknown";
    }

    static std::string bind_failure(const char* what, const std::string& addr, uint16_t port, int err){
        return std::string(what) + " " + addr + ":" + std::to_string(port) + ": " + std::strerror(err);
    }

    SEISreceiver::SEISreceiver(const ReceiverConfig& cfg)
        : cfg_(cfg), comp_(cfg.drop_on_backward), buf_(cfg.buffer_size ? cfg.buffer_size : SEIS_MAX_DATAGRAM)
    {
        const int family = cfg_.ipv6 ? AF_INET6 : AF_INET;
        const std::string addr = cfg_.bindAddress();

        sockaddr_storage servaddr{};
        socklen_t addrlen = 0;
        if (family == AF_INET) {
            auto* in4 = reinterpret_cast<sockaddr_in*>(&servaddr);
            in4->sin_family = AF_INET;
            in4->sin_port = htons(cfg_.port);
            if (inet_pton(AF_INET, addr.c_str(), &in4->sin_addr) != 1) {
                throw BindError(bind_failure("invalid IPv4 bind address", addr, cfg_.port, EINVAL), EINVAL);
            }
            addrlen = sizeof(sockaddr_in);
        } else {
            auto* in6 = reinterpret_cast<sockaddr_in6*>(&servaddr);
            in6->sin6_family = AF_INET6;
            in6->sin6_port = htons(cfg_.port);
            if (inet_pton(AF_INET6, addr.c_str(), &in6->sin6_addr) != 1) {
                throw BindError(bind_failure("invalid IPv6 bind address", addr, cfg_.port, EINVAL), EINVAL);
            }
            addrlen = sizeof(sockaddr_in6);
        }

        sockfd_ = ::socket(family, SOCK_DGRAM, 0);
        if (sockfd_ < 0) {
            const int err = errno;
            throw BindError(bind_failure("socket() failed for", addr, cfg_.port, err), err);
        }

        if (::bind(sockfd_, (SA*)&servaddr, addrlen) != 0) {
            const int err = errno;
            ::close(sockfd_);
            sockfd_ = -1;
            throw BindError(bind_failure("bind() failed on", addr, cfg_.port, err), err);
        }

        std::fprintf(stderr, "[receiver] listening on UDP %s port %u\n", addr.c_str(),
                     static_cast<unsigned>(local_port()));
    }

    SEISreceiver::~SEISreceiver(){
        release();
    }

    SEISreceiver::SEISreceiver(SEISreceiver&& other) noexcept
        : sockfd_(std::exchange(other.sockfd_, -1)),
          closing_(other.closing_.load()),
          cfg_(std::move(other.cfg_)),
          comp_(std::move(other.comp_)),
          buf_(std::move(other.buf_)) {}

    SEISreceiver& SEISreceiver::operator=(SEISreceiver&& other) noexcept {
        if (this != &other) {
            release();
            sockfd_ = std::exchange(other.sockfd_, -1);
            closing_.store(other.closing_.load());
            cfg_ = std::move(other.cfg_);
            comp_ = std::move(other.comp_);
            buf_ = std::move(other.buf_);
        }
        return *this;
    }

    void SEISreceiver::close(){
        if (sockfd_ < 0 || closing_.exchange(true)) return;
        // Unconnected UDP reports ENOTCONN here but still wakes readers,
        // whose recvfrom() then returns 0.
        ::shutdown(sockfd_, SHUT_RDWR);
    }

    void SEISreceiver::release(){
        if (sockfd_ < 0) return;
        ::close(sockfd_);
        sockfd_ = -1;
    }

    uint16_t SEISreceiver::local_port() const {
        if (!isOpen()) return 0;
        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        if (::getsockname(sockfd_, (SA*)&addr, &len) != 0) {
            std::perror("getsockname");
            return 0;
        }
        if (addr.ss_family == AF_INET6) {
            return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
        }
        return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }

    Received SEISreceiver::receive_one(){
        Received r;
        if (!isOpen()) {
            r.status = RecvStatus::Closed;
            return r;
        }

        if (cfg_.receive_timeout_ms > 0) {
            fd_set rfds;
            FD_ZERO(&rfds);
            FD_SET(sockfd_, &rfds);

            timeval tv{};
            tv.tv_sec = cfg_.receive_timeout_ms / 1000;
            tv.tv_usec = (cfg_.receive_timeout_ms % 1000) * 1000;

            int ret = ::select(sockfd_ + 1, &rfds, nullptr, nullptr, &tv);
            if (closing_.load()) {
                r.status = RecvStatus::Closed;
                return r;
            }
            if (ret < 0) {
                r.status = RecvStatus::SocketError;
                r.os_error = errno;
                return r;
            }
            if (ret == 0) {
                r.status = RecvStatus::TimedOut;
                return r;
            }
        }

        sockaddr_storage peer{};
        socklen_t peerlen = sizeof(peer);
        ssize_t n = ::recvfrom(sockfd_, buf_.data(), buf_.size(), 0, (SA*)&peer, &peerlen);
        // A shut-down socket reads as an empty datagram.
        if (closing_.load()) {
            r.status = RecvStatus::Closed;
            return r;
        }
        if (n < 0) {
            const int err = errno;
            if (err == EBADF || err == ENOTSOCK) {
                r.status = RecvStatus::Closed;
                return r;
            }
            if (err == EAGAIN || err == EWOULDBLOCK) {
                r.status = RecvStatus::TimedOut;
                return r;
            }
            if (err != EINTR) std::perror("recvfrom");
            r.status = RecvStatus::SocketError;
            r.os_error = err;
            return r;
        }

        return process_datagram(buf_.data(), static_cast<std::size_t>(n), peer_to_string(peer));
    }

    Received SEISreceiver::process_datagram(const uint8_t* data, std::size_t len,
                                            std::optional<std::string> source){
        Received r;
        r.source = std::move(source);

        FrameHeader header;
        if (decode_header(data, len, header, &r.error) != DecodeStatus::Ok) {
            r.status = RecvStatus::Truncated;
            return r;
        }

        r.msg_type = header.msg_type;
        if (header.msg_type != static_cast<uint16_t>(MsgType::Measurement)) {
            // Announce is reserved; nothing else is defined.
            r.status = RecvStatus::Unsupported;
            return r;
        }

        MeasurementBody body;
        DecodeStatus st = decode_measurement(header.body, header.body_size, body, &r.error);
        if (st == DecodeStatus::Truncated) {
            r.status = RecvStatus::Truncated;
            return r;
        }
        if (st == DecodeStatus::TrailingData) {
            r.status = RecvStatus::TrailingData;
            return r;
        }

        Clock::time_point t;
        if (!comp_.compensate(body.rel_time, t)) {
            r.status = RecvStatus::BadTimestamp;
            return r;
        }
        if (!comp_.accept(t)) {
            r.status = RecvStatus::Suppressed;
            return r;
        }

        r.status = RecvStatus::Accepted;
        r.sample.emplace(t, body.x, body.y, body.z, r.source);
        return r;
    }

    MeasurementStream SEISreceiver::measurements(){
        return MeasurementStream(*this);
    }

    Received MeasurementStream::next(){
        while (true) {
            Received r = rx_->receive_one();
            if (r.status == RecvStatus::Suppressed) continue;
            return r;
        }
    }

    MeasurementStream::iterator::iterator(MeasurementStream* s) : stream_(s){
        ++(*this);
    }

    MeasurementStream::iterator& MeasurementStream::iterator::operator++(){
        if (!stream_) return *this;
        current_ = stream_->next();
        if (current_.status == RecvStatus::Closed) {
            stream_ = nullptr;
        }
        return *this;
    }

    const char* to_string(RecvStatus s){
        switch (s) {
            case RecvStatus::Accepted:     return "accepted";
            case RecvStatus::Suppressed:   return "suppressed";
            case RecvStatus::Truncated:    return "truncated";
            case RecvStatus::TrailingData: return "trailing data";
            case RecvStatus::Unsupported:  return "unsupported message type";
            case RecvStatus::BadTimestamp: return "bad timestamp";
            case RecvStatus::TimedOut:     return "timed out";
            case RecvStatus::SocketError:  return "socket error";
            case RecvStatus::Closed:       return "closed";
        }
        return "unknown";
    }
}
