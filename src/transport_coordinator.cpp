#include "beamproto/transport_coordinator.hpp"

#include <iostream>

#include "beamproto/errors.hpp"
#include "beamproto/tcp_stream.hpp"

namespace BeamProto {

const char* to_string(TransportKind kind) {
    return kind == TransportKind::WIFI ? "wifi" : "bluetooth";
}

const char* to_string(SocketRole role) {
    return role == SocketRole::SERVER ? "server" : "client";
}

SocketRole resolve_socket_role(TransportKind transport, Role role, bool is_topology_owner) {
    if (transport == TransportKind::WIFI) {
        return is_topology_owner ? SocketRole::SERVER : SocketRole::CLIENT;
    }
    return role == Role::SENDER ? SocketRole::CLIENT : SocketRole::SERVER;
}

TransportKind transport_kind_for(const SessionToken& token) {
    return token.transport() == TRANSPORT_WIFI ? TransportKind::WIFI : TransportKind::BLUETOOTH;
}

// Installs a cancel hook for one blocking phase and removes it when the phase ends.
class TransportCoordinator::CancelScope {
public:
    CancelScope(TransportCoordinator& owner, std::function<void()> hook) : owner_(owner) {
        owner_.set_cancel_hook(std::move(hook));
    }
    ~CancelScope() { owner_.clear_cancel_hook(); }

    CancelScope(const CancelScope&) = delete;
    CancelScope& operator=(const CancelScope&) = delete;

private:
    TransportCoordinator& owner_;
};

TransportCoordinator::TransportCoordinator(WifiDirectLink& wifi, BluetoothLink& bluetooth, FileAccess& files,
                                           HistorySink& history, CoordinatorConfig config)
    : wifi_(wifi), bluetooth_(bluetooth), files_(files), history_(history), config_(std::move(config)) {}

bool TransportCoordinator::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void TransportCoordinator::start_discovery() {
    wifi_.start_discovery();
    if (bluetooth_.is_enabled()) {
        bluetooth_.start_discovery();
    }
}

void TransportCoordinator::connect_wifi(const WifiPeer& peer) {
    wifi_.connect(peer);
}

void TransportCoordinator::create_wifi_group() {
    wifi_.create_group();
}

LatestValue<WifiDirectLink::Peers>::Snapshot TransportCoordinator::wifi_peers() const {
    return wifi_.peers().get();
}

LatestValue<BluetoothLink::Devices>::Snapshot TransportCoordinator::bluetooth_devices() const {
    return bluetooth_.devices().get();
}

void TransportCoordinator::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            return;
        }
        cancelled_ = true;
    }

    // The hook runs outside mutex_; clear_cancel_hook waits on hook_mutex_, so the
    // object the hook refers to outlives the call.
    std::lock_guard<std::mutex> lock(hook_mutex_);
    if (cancel_hook_) {
        cancel_hook_();
    }
}

void TransportCoordinator::set_cancel_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    cancel_hook_ = std::move(hook);
    if (cancelled_ && cancel_hook_) {
        cancel_hook_();
    }
}

void TransportCoordinator::clear_cancel_hook() {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    cancel_hook_ = nullptr;
}

void TransportCoordinator::throw_if_cancelled() const {
    if (cancelled_) {
        throw TransportUnavailable("Transfer cancelled before the channel was ready.");
    }
}

TransferOutcome TransportCoordinator::transfer(const TransferRequest& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            std::cerr << "[BeamProto] Rejecting session " << request.token.id
                      << ": another transfer is active" << std::endl;
            return TransferOutcome::failure(ErrorCode::SessionAlreadyActive,
                                            "A transfer is already running on this coordinator.");
        }
        active_ = true;
        cancelled_ = false;
    }

    struct ActiveReset {
        TransportCoordinator& self;
        ~ActiveReset() {
            self.clear_cancel_hook();
            std::lock_guard<std::mutex> lock(self.mutex_);
            self.active_ = false;
        }
    } reset{*this};

    TransferOutcome outcome;
    try {
        TransportKind transport;
        SocketRole socket_role;
        std::unique_ptr<ByteStream> stream = open_channel(request, transport, socket_role);
        if (request.on_channel) {
            request.on_channel(transport, socket_role);
        }

        TransportSession session(*stream, request.role, request.token, files_, history_, config_.session);
        CancelScope scope(*this, [&session]() { session.cancel(); });
        outcome = session.run(request.metadata, request.files, request.progress);
    } catch (const Exception& e) {
        outcome = TransferOutcome::failure(cancelled_ ? ErrorCode::Cancelled : e.code(), e.what());
        std::cerr << "[BeamProto] Session " << request.token.id << " could not start: "
                  << to_string(outcome.error) << ": " << outcome.message << std::endl;
    } catch (const std::exception& e) {
        outcome = TransferOutcome::failure(ErrorCode::Unknown, e.what());
        std::cerr << "[BeamProto] Session " << request.token.id << " could not start: " << e.what() << std::endl;
    }
    return outcome;
}

std::unique_ptr<ByteStream> TransportCoordinator::open_channel(const TransferRequest& request,
                                                               TransportKind& transport, SocketRole& socket_role) {
    if (transport_kind_for(request.token) == TransportKind::WIFI) {
        transport = TransportKind::WIFI;
        return open_wifi(request.role, socket_role);
    }

    LatestValue<BluetoothLink::Devices>::Snapshot devices = bluetooth_.devices().get();
    if (devices->empty()) {
        const std::string reason = "no Bluetooth device discovered";
        if (config_.bluetooth_fallback == BluetoothFallback::Fail) {
            throw TransportUnavailable("Cannot use Bluetooth: " + reason + ".");
        }
        std::cerr << "[BeamProto] Session " << request.token.id << ": " << reason
                  << ", falling back to Wi-Fi Direct" << std::endl;
        if (request.on_fallback) {
            request.on_fallback(TransportKind::BLUETOOTH, TransportKind::WIFI, reason);
        }
        transport = TransportKind::WIFI;
        return open_wifi(request.role, socket_role);
    }

    transport = TransportKind::BLUETOOTH;
    return open_bluetooth(devices->front(), request.role, socket_role);
}

std::unique_ptr<ByteStream> TransportCoordinator::open_wifi(Role role, SocketRole& socket_role) {
    LatestValue<WifiDirectLink::ConnectionInfo>& info_cell = wifi_.connection_info();
    LatestValue<WifiDirectLink::ConnectionInfo>::Snapshot info;
    {
        CancelScope scope(*this, [&info_cell]() { info_cell.notify_waiters(); });
        info = info_cell.wait_for(
            [this](const WifiDirectLink::ConnectionInfo& value) { return value.has_value() || cancelled_; },
            config_.topology_timeout);
    }
    throw_if_cancelled();
    if (!info || !info->has_value()) {
        throw TransportUnavailable("Wi-Fi Direct group was not formed in time.");
    }

    const WifiConnectionInfo& topology = **info;
    socket_role = resolve_socket_role(TransportKind::WIFI, role, topology.is_group_owner);

    if (socket_role == SocketRole::SERVER) {
        net::TcpListener listener(config_.wifi_port);
        CancelScope scope(*this, [&listener]() { listener.close(); });
        return listener.accept_one();
    }

    net::TcpConnector connector;
    CancelScope scope(*this, [&connector]() { connector.cancel(); });
    return connector.connect(topology.group_owner_address, config_.wifi_port, config_.connect_timeout);
}

std::unique_ptr<ByteStream> TransportCoordinator::open_bluetooth(const BluetoothDevice& device, Role role,
                                                                 SocketRole& socket_role) {
    if (!bluetooth_.is_enabled()) {
        throw TransportUnavailable("Bluetooth is disabled.");
    }
    socket_role = resolve_socket_role(TransportKind::BLUETOOTH, role, false);

    std::unique_ptr<ByteStream> stream;
    if (socket_role == SocketRole::CLIENT) {
        stream = bluetooth_.connect(device, config_.bluetooth_service_uuid);
    } else {
        CancelScope scope(*this, [this]() { bluetooth_.cancel_accept(); });
        stream = bluetooth_.accept(config_.bluetooth_service_name, config_.bluetooth_service_uuid);
    }
    if (!stream) {
        throw TransportUnavailable("Bluetooth link returned no stream.");
    }
    throw_if_cancelled();
    return stream;
}

} // namespace BeamProto
