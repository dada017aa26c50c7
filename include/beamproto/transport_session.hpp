#ifndef BEAMPROTO_TRANSPORT_SESSION_HPP
#define BEAMPROTO_TRANSPORT_SESSION_HPP

#include "byte_stream.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "file_access.hpp"
#include "frame_codec.hpp"
#include "handshake.hpp"
#include "history.hpp"
#include "session_token.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace BeamProto {

    enum class Role {
        SENDER,
        RECEIVER
    };

    const char* to_string(Role role);

    /**
     * @brief The single result of one transfer attempt.
     */
    struct TransferOutcome {
        ErrorCode error = ErrorCode::None;
        std::string message;
        // Set once the handshake was exchanged; the same record is appended to history.
        // On failure it carries complete == false.
        std::optional<TransferRecord> record;
        // Metadata announced by the sender (receiver side, once the handshake was read).
        std::optional<TransferMetadata> metadata;

        bool ok() const { return error == ErrorCode::None; }

        static TransferOutcome failure(ErrorCode code, std::string message);
    };

    /**
     * @brief Runs the handshake and frame exchange over one connected stream.
     *
     * The stream is closed when run returns, whatever the result. Files written before
     * a failure are left in place, and a failure after the handshake still appends an
     * incomplete record to history.
     */
    class TransportSession {
    public:
        TransportSession(ByteStream& stream, Role role, const SessionToken& token, FileAccess& files,
                         HistorySink& history, SessionConfig config = SessionConfig{});

        /**
         * @brief [SENDER] Seals metadata, then streams each handle in order.
         * @param metadata display_name and total_size are announced in the handshake.
         * @param handles Files to send; names and sizes are resolved at transfer time.
         */
        TransferOutcome run_sender(const TransferMetadata& metadata, const std::vector<FileHandle>& handles,
                                   const ProgressCallback& progress = nullptr);

        /**
         * @brief [RECEIVER] Opens the handshake and writes every file into the receive directory.
         */
        TransferOutcome run_receiver(const ProgressCallback& progress = nullptr);

        // Dispatches on the session role; metadata and handles are ignored for a receiver.
        TransferOutcome run(const TransferMetadata& metadata, const std::vector<FileHandle>& handles,
                            const ProgressCallback& progress = nullptr);

        /**
         * @brief Closes the stream from another thread; the running session fails with Cancelled.
         */
        void cancel();

        Role role() const { return role_; }

    private:
        void send_body(const TransferMetadata& metadata, const std::vector<FileHandle>& handles,
                       const ProgressCallback& progress, std::optional<TransferRecord>& record);
        void receive_body(const ProgressCallback& progress, std::optional<TransferMetadata>& announced,
                          std::optional<TransferRecord>& record);
        void append_history(const TransferRecord& record);
        TransferOutcome finish(TransferOutcome outcome);

        ByteStream& stream_;
        Role role_;
        const SessionToken& token_;
        FileAccess& files_;
        HistorySink& history_;
        SessionConfig config_;
        std::atomic<bool> cancelled_{false};
    };

    /**
     * @brief Returns the final path component of a received file name.
     * @throws BeamProto::ProtocolError for empty names, ".", ".." or names with a directory part.
     */
    std::string sanitize_received_name(const std::string& name);

} // namespace BeamProto

#endif // BEAMPROTO_TRANSPORT_SESSION_HPP
