#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "beamproto/crypto.hpp"
#include "beamproto/errors.hpp"
#include "beamproto/transport_coordinator.hpp"

namespace fs = std::filesystem;

// Both "devices" live in this process and share the loopback interface as their Wi-Fi Direct group.
class LoopbackWifiLink : public BeamProto::WifiDirectLink {
public:
    explicit LoopbackWifiLink(bool is_group_owner) : is_group_owner_(is_group_owner) {}

    void start_discovery() override {
        peers_.publish({{"loopback", "127.0.0.1"}});
    }

    void connect(const BeamProto::WifiPeer& peer) override {
        std::cout << "[" << (is_group_owner_ ? "owner" : "client") << "] joining " << peer.name << std::endl;
        BeamProto::WifiConnectionInfo info;
        info.is_group_owner = is_group_owner_;
        info.group_owner_address = "127.0.0.1";
        connection_info_.publish(info);
    }

    void create_group() override {
        connect({"loopback", "127.0.0.1"});
    }

private:
    bool is_group_owner_;
};

// This example has no Bluetooth radio.
class NoBluetoothLink : public BeamProto::BluetoothLink {
public:
    bool is_enabled() const override { return false; }
    void start_discovery() override {}

    std::unique_ptr<BeamProto::ByteStream> connect(const BeamProto::BluetoothDevice&, const std::string&) override {
        throw BeamProto::TransportUnavailable("No Bluetooth radio.");
    }

    std::unique_ptr<BeamProto::ByteStream> accept(const std::string&, const std::string&) override {
        throw BeamProto::TransportUnavailable("No Bluetooth radio.");
    }

    void cancel_accept() override {}
};

class PrintingHistory : public BeamProto::HistorySink {
public:
    explicit PrintingHistory(std::string who) : who_(std::move(who)) {}

    void append(const BeamProto::TransferRecord& record) override {
        std::cout << "[" << who_ << "] history: " << BeamProto::to_string(record.direction) << " '" << record.name
                  << "' " << record.size << " bytes at " << record.timestamp << std::endl;
    }

private:
    std::string who_;
};

int main(int argc, char* argv[]) {
    if (BeamProto::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }

    fs::path work = fs::temp_directory_path() / "beamproto-loopback";
    fs::create_directories(work);

    // 1. Pick the file to send: the first argument, or a generated one
    fs::path source;
    if (argc > 1) {
        source = argv[1];
    } else {
        source = work / "hello.txt";
        std::ofstream out(source, std::ios::binary | std::ios::trunc);
        out << "hello world";
    }
    if (!fs::is_regular_file(source)) {
        std::cerr << "Not a file: " << source << std::endl;
        return 1;
    }

    // 2. Set up two devices; the receiver owns the group
    BeamProto::CoordinatorConfig config;
    config.session.verbose = true;

    LoopbackWifiLink sender_wifi(false), receiver_wifi(true);
    NoBluetoothLink sender_bt, receiver_bt;
    BeamProto::LocalFileAccess sender_files(work / "sender-inbox");
    BeamProto::LocalFileAccess receiver_files(work / "inbox");
    PrintingHistory sender_history("sender"), receiver_history("receiver");

    BeamProto::TransportCoordinator sender(sender_wifi, sender_bt, sender_files, sender_history, config);
    BeamProto::TransportCoordinator receiver(receiver_wifi, receiver_bt, receiver_files, receiver_history, config);

    sender.start_discovery();
    receiver.create_wifi_group();
    sender.connect_wifi(sender.wifi_peers()->front());

    // 3. The session record travels out of band
    auto token = BeamProto::SessionToken::generate(BeamProto::TransferKind::SINGLE_FILE);
    auto scanned = BeamProto::SessionToken::from_record(token.to_record());
    std::cout << "Session " << token.id << std::endl;

    BeamProto::TransferRequest receive_request;
    receive_request.role = BeamProto::Role::RECEIVER;
    receive_request.token = scanned;
    receive_request.on_channel = [](BeamProto::TransportKind transport, BeamProto::SocketRole role) {
        std::cout << "[receiver] connected over " << BeamProto::to_string(transport) << " as "
                  << BeamProto::to_string(role) << std::endl;
    };
    auto received = std::async(std::launch::async, [&]() { return receiver.transfer(receive_request); });

    BeamProto::TransferRequest send_request;
    send_request.role = BeamProto::Role::SENDER;
    send_request.token = token;
    send_request.files = {source.string()};
    send_request.metadata = BeamProto::TransferMetadata::from_files(
        source.filename().string(), {{source.filename().string(), fs::file_size(source)}});
    send_request.progress = [](uint64_t done, uint64_t total) {
        std::cout << "[sender] " << done << "/" << total << " bytes" << std::endl;
    };

    // 4. Run both sides
    auto sent = sender.transfer(send_request);
    auto outcome = received.get();

    if (!sent.ok() || !outcome.ok()) {
        std::cerr << "Transfer failed: " << BeamProto::to_string(sent.ok() ? outcome.error : sent.error) << std::endl;
        return 1;
    }
    std::cout << "Received into " << (work / "inbox" / source.filename()) << std::endl;
    return 0;
}
