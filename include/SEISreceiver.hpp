#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "SEISconfig.hpp"
#include "SEISsample.hpp"
#include "timeCompensator.hpp"
#include "wireFormat.hpp"

#ifndef SA
#define SA struct sockaddr
#endif

namespace SEIS{

    // Socket could not be created or bound. The receiver is unusable.
    class BindError : public std::runtime_error {
    public:
        BindError(const std::string& what, int err)
            : std::runtime_error(what), code_(err) {}
        int code() const { return code_; }
    private:
        int code_;
    };

    enum class RecvStatus {
        Accepted,
        Suppressed,     // went backwards in time; not an error
        Truncated,
        TrailingData,
        Unsupported,    // announce or unknown message type
        BadTimestamp,   // relative time is NaN/inf or out of clock range
        TimedOut,
        SocketError,
        Closed,
    };

    const char* to_string(RecvStatus s);

    // Outcome of one datagram. Only Accepted carries a sample.
    struct Received {
        RecvStatus status = RecvStatus::Closed;
        std::optional<SEISsample> sample;
        FramingError error;         // Truncated / TrailingData
        uint16_t msg_type = 0;      // Unsupported
        int os_error = 0;           // SocketError
        std::optional<std::string> source;

        bool accepted() const { return status == RecvStatus::Accepted; }
    };

    class MeasurementStream;

    // Owns one UDP socket and turns its datagrams into samples. Not
    // thread-safe; callers sharing a receiver must serialize access. The one
    // exception is close(), which may be called from another thread to wake
    // a blocked receive_one().
    class SEISreceiver {
    public:
        // Binds immediately; throws BindError on failure.
        explicit SEISreceiver(const ReceiverConfig& cfg = ReceiverConfig{});
        ~SEISreceiver();

        SEISreceiver(const SEISreceiver&) = delete;
        SEISreceiver& operator=(const SEISreceiver&) = delete;
        SEISreceiver(SEISreceiver&& other) noexcept;
        SEISreceiver& operator=(SEISreceiver&& other) noexcept;

        // Blocks for one datagram (or the configured timeout).
        Received receive_one();

        // Decode, compensate and filter an already received datagram.
        Received process_datagram(const uint8_t* data, std::size_t len,
                                  std::optional<std::string> source = std::nullopt);

        // Endless sequence of samples, skipping suppressed ones. Ends only
        // once the socket is closed.
        MeasurementStream measurements();

        // Shuts the socket down; a blocked read returns Closed. The
        // descriptor itself is released by the destructor.
        void close();
        bool isOpen() const { return sockfd_ >= 0 && !closing_.load(); }
        uint16_t local_port() const;

        const ReceiverConfig& config() const { return cfg_; }
        timeCompensator& compensator() { return comp_; }
        const timeCompensator& compensator() const { return comp_; }

    private:
        void release();

        int sockfd_ = -1;
        std::atomic<bool> closing_{false};
        ReceiverConfig cfg_;
        timeCompensator comp_;
        std::vector<uint8_t> buf_;
    };

    class MeasurementStream {
    public:
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Received;
            using difference_type = std::ptrdiff_t;
            using pointer = const Received*;
            using reference = const Received&;

            iterator() = default;

            reference operator*() const { return current_; }
            pointer operator->() const { return &current_; }
            iterator& operator++();

            bool operator==(const iterator& o) const { return stream_ == o.stream_; }
            bool operator!=(const iterator& o) const { return stream_ != o.stream_; }

        private:
            friend class MeasurementStream;
            explicit iterator(MeasurementStream* s);

            MeasurementStream* stream_ = nullptr;
            Received current_;
        };

        explicit MeasurementStream(SEISreceiver& rx) : rx_(&rx) {}

        // Next non-suppressed outcome. Per-datagram faults are returned,
        // not thrown; the caller decides whether to keep pulling.
        Received next();

        // Pulls the first element. The stream is single-pass.
        iterator begin() { return iterator(this); }
        iterator end() { return iterator(); }

    private:
        SEISreceiver* rx_;
    };
}
