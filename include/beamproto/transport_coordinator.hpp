#ifndef BEAMPROTO_TRANSPORT_COORDINATOR_HPP
#define BEAMPROTO_TRANSPORT_COORDINATOR_HPP

#include "config.hpp"
#include "discovery.hpp"
#include "file_access.hpp"
#include "history.hpp"
#include "session_token.hpp"
#include "transport_session.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace BeamProto {

    enum class TransportKind {
        WIFI,
        BLUETOOTH
    };

    // Which side listens and which side connects. Independent of the transfer Role.
    enum class SocketRole {
        SERVER,
        CLIENT
    };

    const char* to_string(TransportKind kind);
    const char* to_string(SocketRole role);

    /**
     * @brief Decides who listens.
     *
     * Wi-Fi: the group owner is SERVER whether it sends or receives.
     * Bluetooth: the sender always connects (CLIENT), the receiver always listens (SERVER);
     * is_topology_owner is ignored.
     */
    SocketRole resolve_socket_role(TransportKind transport, Role role, bool is_topology_owner);

    // "wifi" selects Wi-Fi; any other value selects Bluetooth.
    TransportKind transport_kind_for(const SessionToken& token);

    struct TransferRequest {
        using FallbackCallback = std::function<void(TransportKind from, TransportKind to, const std::string& reason)>;
        using ChannelCallback = std::function<void(TransportKind transport, SocketRole socket_role)>;

        Role role = Role::SENDER;
        SessionToken token;
        // Sender only.
        TransferMetadata metadata;
        std::vector<FileHandle> files;

        ProgressCallback progress;
        // Called before the transfer moves from Bluetooth to Wi-Fi because no device was found.
        FallbackCallback on_fallback;
        // Called once a byte stream is connected.
        ChannelCallback on_channel;
    };

    /**
     * @brief Picks a transport, establishes the byte stream and runs one TransportSession.
     *
     * Only one transfer may run at a time per coordinator.
     */
    class TransportCoordinator {
    public:
        TransportCoordinator(WifiDirectLink& wifi, BluetoothLink& bluetooth, FileAccess& files,
                             HistorySink& history, CoordinatorConfig config = CoordinatorConfig{});

        TransportCoordinator(const TransportCoordinator&) = delete;
        TransportCoordinator& operator=(const TransportCoordinator&) = delete;

        /**
         * @brief Runs one transfer to completion on the calling thread.
         * @return The outcome; SessionAlreadyActive if another transfer is running,
         *         TransportUnavailable if no channel could be established.
         */
        TransferOutcome transfer(const TransferRequest& request);

        /**
         * @brief Aborts the running transfer from any thread by closing its listener,
         * connector or stream. The transfer returns Cancelled.
         */
        void cancel();

        bool is_active() const;

        // Starts discovery on both links.
        void start_discovery();
        void connect_wifi(const WifiPeer& peer);
        void create_wifi_group();

        LatestValue<WifiDirectLink::Peers>::Snapshot wifi_peers() const;
        LatestValue<BluetoothLink::Devices>::Snapshot bluetooth_devices() const;

        const CoordinatorConfig& config() const { return config_; }

    private:
        class CancelScope;

        std::unique_ptr<ByteStream> open_channel(const TransferRequest& request, TransportKind& transport,
                                                 SocketRole& socket_role);
        std::unique_ptr<ByteStream> open_wifi(Role role, SocketRole& socket_role);
        std::unique_ptr<ByteStream> open_bluetooth(const BluetoothDevice& device, Role role,
                                                   SocketRole& socket_role);

        void set_cancel_hook(std::function<void()> hook);
        void clear_cancel_hook();
        void throw_if_cancelled() const;

        WifiDirectLink& wifi_;
        BluetoothLink& bluetooth_;
        FileAccess& files_;
        HistorySink& history_;
        CoordinatorConfig config_;

        mutable std::mutex mutex_;  // guards active_
        bool active_ = false;
        std::atomic<bool> cancelled_{false};

        // Held while the hook is installed, removed or run; never together with mutex_.
        std::mutex hook_mutex_;
        std::function<void()> cancel_hook_;
    };

} // namespace BeamProto

#endif // BEAMPROTO_TRANSPORT_COORDINATOR_HPP
