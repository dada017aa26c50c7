#ifndef BEAMPROTO_HANDSHAKE_HPP
#define BEAMPROTO_HANDSHAKE_HPP

#include "keys.hpp"
#include "session_token.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace BeamProto {

    struct FileEntry {
        std::string name;
        uint64_t size = 0;
    };

    /**
     * @brief What the sender announces in the handshake.
     *
     * On the receiving side only display_name, total_size and file_count are known after
     * the handshake; per-file names and sizes arrive later in the file headers.
     */
    struct TransferMetadata {
        std::string display_name;
        uint64_t total_size = 0;
        std::vector<FileEntry> files;
        uint32_t file_count = 0;

        // Builds metadata whose total_size is the sum of the file sizes.
        static TransferMetadata from_files(std::string display_name, std::vector<FileEntry> files);
    };

    class HandshakeCodec {
    public:
        /**
         * @brief Encodes {sessionId, type, name, size, fileCount} as compact JSON.
         */
        static byte_vector encode(const TransferMetadata& metadata, const std::string& session_id,
                                  TransferKind kind);

        /**
         * @brief Decodes a plaintext handshake. Unknown fields are ignored.
         * @throws BeamProto::MalformedHandshake if name, size or fileCount is missing or mistyped.
         */
        static TransferMetadata decode(const byte_vector& plaintext);

        /**
         * @brief Seals the encoded metadata with the session key, bound to the session id.
         */
        static byte_vector create_message(const SessionToken& token, const TransferMetadata& metadata);

        /**
         * @brief Opens and decodes a handshake message.
         * @throws BeamProto::AuthFailure if the message does not authenticate under the token.
         * @throws BeamProto::MalformedHandshake if the plaintext is not a valid handshake.
         */
        static TransferMetadata parse_message(const SessionToken& token, const byte_vector& message);
    };

}  // namespace BeamProto

#endif  // BEAMPROTO_HANDSHAKE_HPP
