#ifndef BEAMPROTO_CONFIG_HPP
#define BEAMPROTO_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace BeamProto {

    // Session parameter naming the preferred transport, and its values.
    constexpr char TRANSPORT_PARAM[] = "transport";
    constexpr char TRANSPORT_WIFI[] = "wifi";
    constexpr char TRANSPORT_BLUETOOTH[] = "bluetooth";

    constexpr uint16_t DEFAULT_WIFI_PORT = 8988;
    constexpr size_t DEFAULT_CHUNK_SIZE = 8192;
    constexpr char DEFAULT_BLUETOOTH_SERVICE_UUID[] = "fa87c0d0-afac-11de-8a39-0800200c9a66";
    constexpr char DEFAULT_BLUETOOTH_SERVICE_NAME[] = "OpenBeam";

    /**
     * @brief Limits and tuning for one transfer session.
     */
    struct SessionConfig {
        // Payload bytes copied per write; progress is reported after each chunk.
        size_t chunk_size = DEFAULT_CHUNK_SIZE;
        // Upper bound for the sealed handshake frame.
        uint32_t max_handshake_bytes = 64 * 1024;
        // Upper bound for a UTF-8 file name in a file header.
        uint32_t max_name_bytes = 4096;
        // Print a one-line summary to std::cerr when a session completes.
        bool verbose = false;
    };

    /**
     * @brief What to do when Bluetooth is preferred but no device has been discovered.
     */
    enum class BluetoothFallback {
        // Notify the caller, then run the transfer over Wi-Fi.
        WifiWithNotice,
        // Report TransportUnavailable.
        Fail
    };

    struct CoordinatorConfig {
        uint16_t wifi_port = DEFAULT_WIFI_PORT;
        std::chrono::milliseconds connect_timeout{15000};
        // How long to wait for the Wi-Fi link to report its topology.
        std::chrono::milliseconds topology_timeout{60000};
        std::string bluetooth_service_uuid = DEFAULT_BLUETOOTH_SERVICE_UUID;
        std::string bluetooth_service_name = DEFAULT_BLUETOOTH_SERVICE_NAME;
        BluetoothFallback bluetooth_fallback = BluetoothFallback::WifiWithNotice;
        SessionConfig session;
    };

} // namespace BeamProto

#endif // BEAMPROTO_CONFIG_HPP
