#ifndef BEAMPROTO_DISCOVERY_HPP
#define BEAMPROTO_DISCOVERY_HPP

#include "byte_stream.hpp"
#include "latest_value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace BeamProto {

    struct WifiPeer {
        std::string name;
        std::string address;  // link-layer device address
    };

    // Topology of an established Wi-Fi Direct group.
    struct WifiConnectionInfo {
        bool is_group_owner = false;
        std::string group_owner_address;  // IP address of the owner
    };

    struct BluetoothDevice {
        std::string name;
        std::string address;
    };

    /**
     * @brief Platform Wi-Fi Direct link. Establishes the group; sockets are opened by the coordinator.
     *
     * Platform glue publishes discovery and connection events into peers() and
     * connection_info() from its own threads.
     */
    class WifiDirectLink {
    public:
        using Peers = std::vector<WifiPeer>;
        using ConnectionInfo = std::optional<WifiConnectionInfo>;

        virtual ~WifiDirectLink() = default;

        virtual void start_discovery() = 0;
        virtual void connect(const WifiPeer& peer) = 0;
        // Makes this device the group owner so others can join without discovery.
        virtual void create_group() = 0;

        LatestValue<Peers>& peers() { return peers_; }
        LatestValue<ConnectionInfo>& connection_info() { return connection_info_; }

    protected:
        LatestValue<Peers> peers_;
        LatestValue<ConnectionInfo> connection_info_;
    };

    /**
     * @brief Platform Bluetooth classic link (RFCOMM-style sockets keyed by a service UUID).
     */
    class BluetoothLink {
    public:
        using Devices = std::vector<BluetoothDevice>;

        virtual ~BluetoothLink() = default;

        virtual bool is_enabled() const = 0;
        virtual void start_discovery() = 0;

        /**
         * @brief Connects to the service on the given device.
         * @throws BeamProto::TransportUnavailable if the connection cannot be made.
         */
        virtual std::unique_ptr<ByteStream> connect(const BluetoothDevice& device,
                                                    const std::string& service_uuid) = 0;

        /**
         * @brief Registers the service and blocks until one peer connects.
         * @throws BeamProto::TransportUnavailable if listening fails or cancel_accept() is called.
         */
        virtual std::unique_ptr<ByteStream> accept(const std::string& service_name,
                                                   const std::string& service_uuid) = 0;

        /**
         * @brief Unblocks a pending accept() from another thread.
         *
         * Called from TransportCoordinator::cancel(). It may query the coordinator
         * (is_active() and the like) but must not call cancel() again.
         */
        virtual void cancel_accept() = 0;

        LatestValue<Devices>& devices() { return devices_; }

    protected:
        LatestValue<Devices> devices_;
    };

} // namespace BeamProto

#endif // BEAMPROTO_DISCOVERY_HPP
