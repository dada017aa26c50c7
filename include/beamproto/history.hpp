#ifndef BEAMPROTO_HISTORY_HPP
#define BEAMPROTO_HISTORY_HPP

#include <cstdint>
#include <string>

namespace BeamProto {

    enum class Direction {
        SEND,
        RECEIVE
    };

    // "send" or "receive".
    const char* to_string(Direction direction);

    /**
     * @brief One transfer attempt, handed to the history collaborator.
     *
     * An attempt that fails after the handshake was exchanged is still recorded, with
     * complete set to false. name and size are always the values announced in the handshake.
     */
    struct TransferRecord {
        std::string name;
        uint64_t size = 0;
        int64_t timestamp = 0;  // milliseconds since the Unix epoch
        Direction direction = Direction::SEND;
        bool complete = true;
    };

    /**
     * @brief Append-only sink for transfer records. The protocol layer never reads it back.
     */
    class HistorySink {
    public:
        virtual ~HistorySink() = default;
        virtual void append(const TransferRecord& record) = 0;
    };

} // namespace BeamProto

#endif // BEAMPROTO_HISTORY_HPP
