#include "beamproto/tcp_stream.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <thread>

#include "beamproto/errors.hpp"

namespace BeamProto {
namespace net {

using boost::asio::ip::tcp;

namespace {

// Delay between connect attempts while the owner has not started listening yet.
constexpr std::chrono::milliseconds RETRY_INTERVAL{200};

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::connection_aborted || ec == boost::asio::error::shut_down;
}

} // namespace

// --- TcpByteStream ---

TcpByteStream::TcpByteStream(IoContextPtr io, tcp::socket socket) : io_(std::move(io)), socket_(std::move(socket)) {
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
}

TcpByteStream::~TcpByteStream() {
    boost::system::error_code ec;
    socket_.close(ec);
}

size_t TcpByteStream::read_some(uint8_t* data, size_t size) {
    boost::system::error_code ec;
    size_t n = socket_.read_some(boost::asio::buffer(data, size), ec);
    if (ec) {
        if (is_disconnect(ec)) {
            return 0;
        }
        throw IoError("Socket read failed: " + ec.message());
    }
    return n;
}

void TcpByteStream::write_all(const uint8_t* data, size_t size) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(data, size), ec);
    if (ec) {
        throw IoError("Socket write failed: " + ec.message());
    }
}

void TcpByteStream::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    // The descriptor itself is released in the destructor; shutdown wakes blocked calls.
    // Asio does not make a socket object safe for concurrent use, so calling shutdown while
    // another thread sits in read_some relies on the OS: on Linux, shutdown(2) on the shared
    // descriptor makes the blocked recv return. Other platforms may need an async read instead.
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

std::string TcpByteStream::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? std::string() : endpoint.address().to_string();
}

// --- TcpListener ---

TcpListener::TcpListener(uint16_t port, const std::string& bind_address)
    : io_(std::make_shared<boost::asio::io_context>()), acceptor_(*io_) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(bind_address, ec);
    if (ec) {
        throw TransportUnavailable("Invalid bind address '" + bind_address + "'.");
    }
    tcp::endpoint endpoint(address, port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(1, ec);
    if (ec) {
        throw TransportUnavailable("Cannot listen on port " + std::to_string(port) + ": " + ec.message());
    }
}

TcpListener::~TcpListener() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

uint16_t TcpListener::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

std::unique_ptr<TcpByteStream> TcpListener::accept_one() {
    if (closed_) {
        throw TransportUnavailable("Listener closed before accept.");
    }

    tcp::socket socket(*io_);
    boost::system::error_code result = boost::asio::error::would_block;
    acceptor_.async_accept(socket, [&result](const boost::system::error_code& ec) { result = ec; });

    io_->restart();
    io_->run();

    // Exactly one connection per session.
    boost::system::error_code ignored;
    acceptor_.close(ignored);

    if (result) {
        if (closed_) {
            throw TransportUnavailable("Listener closed while waiting for a peer.");
        }
        throw TransportUnavailable("Accept failed: " + result.message());
    }
    return std::make_unique<TcpByteStream>(io_, std::move(socket));
}

void TcpListener::close() {
    closed_ = true;
    boost::asio::post(*io_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

// --- TcpConnector ---

TcpConnector::TcpConnector() : io_(std::make_shared<boost::asio::io_context>()) {}

std::unique_ptr<TcpByteStream> TcpConnector::connect(const std::string& address, uint16_t port,
                                                     std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
        throw TransportUnavailable("Invalid peer address '" + address + "'.");
    }
    tcp::endpoint endpoint(ip, port);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    boost::system::error_code last_error = boost::asio::error::timed_out;

    while (!cancelled_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        tcp::socket socket(*io_);
        boost::system::error_code result = boost::asio::error::would_block;
        socket.async_connect(endpoint, [&result](const boost::system::error_code& e) { result = e; });

        io_->restart();
        io_->run_for(remaining);

        if (result == boost::asio::error::would_block) {
            // Deadline reached or cancel() stopped the loop: abort and drain the pending connect.
            socket.close(ec);
            io_->restart();
            io_->run();
            result = boost::asio::error::timed_out;
        }

        if (!result) {
            return std::make_unique<TcpByteStream>(io_, std::move(socket));
        }

        last_error = result;
        if (result != boost::asio::error::connection_refused) {
            break;
        }
        std::this_thread::sleep_for(std::min(RETRY_INTERVAL, remaining));
    }

    if (cancelled_) {
        throw TransportUnavailable("Connect to " + address + " cancelled.");
    }
    throw TransportUnavailable("Cannot connect to " + address + ":" + std::to_string(port) + ": " +
                               last_error.message());
}

void TcpConnector::cancel() {
    cancelled_ = true;
    boost::asio::post(*io_, [io = io_.get()]() { io->stop(); });
}

} // namespace net
} // namespace BeamProto
