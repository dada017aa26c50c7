#ifndef BEAMPROTO_TEST_SUPPORT_HPP
#define BEAMPROTO_TEST_SUPPORT_HPP

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "beamproto/byte_stream.hpp"
#include "beamproto/discovery.hpp"
#include "beamproto/errors.hpp"
#include "beamproto/history.hpp"

namespace BeamProtoTest {

using BeamProto::byte_vector;

// One direction of an in-memory connection.
struct Pipe {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<uint8_t> data;
    bool closed = false;

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }
};

/**
 * @brief One end of an in-memory, blocking, ordered byte stream.
 */
class PipeEnd : public BeamProto::ByteStream {
public:
    PipeEnd(std::shared_ptr<Pipe> in, std::shared_ptr<Pipe> out) : in_(std::move(in)), out_(std::move(out)) {}
    ~PipeEnd() override { close(); }

    size_t read_some(uint8_t* data, size_t size) override {
        std::unique_lock<std::mutex> lock(in_->mutex);
        in_->cv.wait(lock, [&] { return !in_->data.empty() || in_->closed; });
        if (closed_ || in_->data.empty()) {
            return 0;
        }
        size_t n = std::min(size, in_->data.size());
        std::copy(in_->data.begin(), in_->data.begin() + n, data);
        in_->data.erase(in_->data.begin(), in_->data.begin() + n);
        return n;
    }

    void write_all(const uint8_t* data, size_t size) override {
        {
            std::lock_guard<std::mutex> lock(out_->mutex);
            if (out_->closed) {
                throw BeamProto::IoError("Pipe closed.");
            }
            out_->data.insert(out_->data.end(), data, data + size);
        }
        out_->cv.notify_all();
    }

    void close() override {
        closed_ = true;
        in_->close();
        out_->close();
    }

    bool is_closed() const { return closed_; }

private:
    std::shared_ptr<Pipe> in_;
    std::shared_ptr<Pipe> out_;
    std::atomic<bool> closed_{false};
};

inline std::pair<std::unique_ptr<PipeEnd>, std::unique_ptr<PipeEnd>> make_pipe_pair() {
    auto a_to_b = std::make_shared<Pipe>();
    auto b_to_a = std::make_shared<Pipe>();
    return {std::make_unique<PipeEnd>(b_to_a, a_to_b), std::make_unique<PipeEnd>(a_to_b, b_to_a)};
}

/**
 * @brief Stream backed by a fixed input buffer; writes are captured.
 * max_read limits how many bytes one read_some returns, to exercise partial reads.
 */
class BufferStream : public BeamProto::ByteStream {
public:
    explicit BufferStream(byte_vector input = {}, size_t max_read = SIZE_MAX)
        : input_(std::move(input)), max_read_(max_read) {}

    size_t read_some(uint8_t* data, size_t size) override {
        size_t n = std::min({size, max_read_, input_.size() - offset_});
        std::copy(input_.begin() + offset_, input_.begin() + offset_ + n, data);
        offset_ += n;
        return n;
    }

    void write_all(const uint8_t* data, size_t size) override {
        written.insert(written.end(), data, data + size);
    }

    void close() override { closed = true; }

    byte_vector written;
    bool closed = false;

private:
    byte_vector input_;
    size_t offset_ = 0;
    size_t max_read_;
};

class VectorSource : public BeamProto::ByteSource {
public:
    explicit VectorSource(byte_vector data) : data_(std::move(data)) {}

    size_t read_some(uint8_t* data, size_t size) override {
        size_t n = std::min(size, data_.size() - offset_);
        std::copy(data_.begin() + offset_, data_.begin() + offset_ + n, data);
        offset_ += n;
        return n;
    }

private:
    byte_vector data_;
    size_t offset_ = 0;
};

class VectorSink : public BeamProto::ByteSink {
public:
    void write_all(const uint8_t* data, size_t size) override { data_.insert(data_.end(), data, data + size); }
    void flush() override { ++flushes; }

    const byte_vector& data() const { return data_; }
    int flushes = 0;

private:
    byte_vector data_;
};

class RecordingHistory : public BeamProto::HistorySink {
public:
    void append(const BeamProto::TransferRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    std::vector<BeamProto::TransferRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<BeamProto::TransferRecord> records_;
};

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("beamproto-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const byte_vector& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
}

inline byte_vector read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return byte_vector(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline byte_vector bytes_of(const std::string& text) {
    return byte_vector(text.begin(), text.end());
}

/**
 * @brief Wi-Fi Direct link whose topology is set by the test.
 */
class FakeWifiLink : public BeamProto::WifiDirectLink {
public:
    void start_discovery() override { ++discovery_requests; }
    void connect(const BeamProto::WifiPeer& peer) override { connected_to = peer.address; }
    void create_group() override { set_topology(true, "127.0.0.1"); }

    void set_topology(bool is_group_owner, const std::string& owner_address) {
        BeamProto::WifiConnectionInfo info;
        info.is_group_owner = is_group_owner;
        info.group_owner_address = owner_address;
        connection_info_.publish(info);
    }

    void set_peers(Peers peers) { peers_.publish(std::move(peers)); }

    int discovery_requests = 0;
    std::string connected_to;
};

/**
 * @brief Shared medium between fake Bluetooth links: connect() queues a pipe end
 * that the next accept() picks up.
 */
class FakeBluetoothAir {
public:
    void offer(std::unique_ptr<PipeEnd> server_end, const std::string& service_uuid) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push_back(std::move(server_end));
            last_uuid_ = service_uuid;
        }
        cv_.notify_all();
    }

    std::unique_ptr<PipeEnd> take(const std::atomic<bool>& cancelled) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !pending_.empty() || cancelled; });
        if (cancelled) {
            return nullptr;
        }
        auto end = std::move(pending_.front());
        pending_.pop_front();
        return end;
    }

    void wake() {
        { std::lock_guard<std::mutex> lock(mutex_); }
        cv_.notify_all();
    }

    std::string last_uuid() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_uuid_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<PipeEnd>> pending_;
    std::string last_uuid_;
};

class FakeBluetoothLink : public BeamProto::BluetoothLink {
public:
    explicit FakeBluetoothLink(std::shared_ptr<FakeBluetoothAir> air, bool enabled = true)
        : air_(std::move(air)), enabled_(enabled) {}

    bool is_enabled() const override { return enabled_; }
    void start_discovery() override { ++discovery_requests; }

    std::unique_ptr<BeamProto::ByteStream> connect(const BeamProto::BluetoothDevice& device,
                                                   const std::string& service_uuid) override {
        connected_to = device.address;
        auto ends = make_pipe_pair();
        air_->offer(std::move(ends.second), service_uuid);
        return std::move(ends.first);
    }

    std::unique_ptr<BeamProto::ByteStream> accept(const std::string& service_name,
                                                  const std::string& /*service_uuid*/) override {
        accepted_service = service_name;
        auto end = air_->take(accept_cancelled_);
        if (!end) {
            throw BeamProto::TransportUnavailable("Bluetooth accept cancelled.");
        }
        return end;
    }

    void cancel_accept() override {
        accept_cancelled_ = true;
        air_->wake();
    }

    void set_devices(Devices devices) { devices_.publish(std::move(devices)); }

    int discovery_requests = 0;
    std::string connected_to;
    std::string accepted_service;

private:
    std::shared_ptr<FakeBluetoothAir> air_;
    bool enabled_;
    std::atomic<bool> accept_cancelled_{false};
};

} // namespace BeamProtoTest

#endif // BEAMPROTO_TEST_SUPPORT_HPP
