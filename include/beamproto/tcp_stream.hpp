#ifndef BEAMPROTO_TCP_STREAM_HPP
#define BEAMPROTO_TCP_STREAM_HPP

#include "byte_stream.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace BeamProto {
namespace net {

    using IoContextPtr = std::shared_ptr<boost::asio::io_context>;

    /**
     * @brief ByteStream over a blocking TCP socket.
     */
    class TcpByteStream : public ByteStream {
    public:
        TcpByteStream(IoContextPtr io, boost::asio::ip::tcp::socket socket);
        ~TcpByteStream() override;

        size_t read_some(uint8_t* data, size_t size) override;
        void write_all(const uint8_t* data, size_t size) override;

        // Shuts the socket down so a read blocked in another thread returns.
        // The cross-thread wakeup relies on Linux shutdown(2) semantics, not on Asio guarantees.
        void close() override;

        std::string remote_address() const;

    private:
        IoContextPtr io_;
        boost::asio::ip::tcp::socket socket_;
        std::mutex close_mutex_;
        bool closed_ = false;
    };

    /**
     * @brief Listening endpoint that hands out exactly one connection.
     */
    class TcpListener {
    public:
        /**
         * @throws BeamProto::TransportUnavailable if the port cannot be bound.
         */
        explicit TcpListener(uint16_t port, const std::string& bind_address = "0.0.0.0");
        ~TcpListener();

        TcpListener(const TcpListener&) = delete;
        TcpListener& operator=(const TcpListener&) = delete;

        /**
         * @brief Blocks until one peer connects, then stops listening.
         * @throws BeamProto::TransportUnavailable on failure or after close().
         */
        std::unique_ptr<TcpByteStream> accept_one();

        // Thread-safe; aborts a blocked accept_one().
        void close();

        uint16_t port() const;

    private:
        IoContextPtr io_;
        boost::asio::ip::tcp::acceptor acceptor_;
        std::atomic<bool> closed_{false};
    };

    /**
     * @brief Outgoing connection with a deadline.
     */
    class TcpConnector {
    public:
        TcpConnector();

        TcpConnector(const TcpConnector&) = delete;
        TcpConnector& operator=(const TcpConnector&) = delete;

        /**
         * @brief Connects to address:port, retrying refused attempts until the timeout elapses.
         * @throws BeamProto::TransportUnavailable on timeout, bad address or after cancel().
         */
        std::unique_ptr<TcpByteStream> connect(const std::string& address, uint16_t port,
                                               std::chrono::milliseconds timeout);

        // Thread-safe; aborts a pending connect().
        void cancel();

    private:
        IoContextPtr io_;
        std::atomic<bool> cancelled_{false};
    };

} // namespace net
} // namespace BeamProto

#endif // BEAMPROTO_TCP_STREAM_HPP
