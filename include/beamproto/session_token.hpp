#ifndef BEAMPROTO_SESSION_TOKEN_HPP
#define BEAMPROTO_SESSION_TOKEN_HPP

#include "keys.hpp"

#include <map>
#include <string>

namespace BeamProto {

    enum class TransferKind {
        SINGLE_FILE,
        MULTI_FILE
    };

    const char* to_string(TransferKind kind);

    /**
     * @throws BeamProto::InvalidArgument for an unknown name.
     */
    TransferKind transfer_kind_from_string(const std::string& name);

    /**
     * @brief Short-lived descriptor exchanged out of band that seeds one transfer.
     *
     * The id is both the routing identifier and the associated data of the handshake
     * seal, so both ends must hold the identical value. The key is single-use and is
     * never written to storage by this library.
     */
    struct SessionToken {
        std::string id;
        TransferKind kind = TransferKind::SINGLE_FILE;
        SymmetricKey key;
        std::map<std::string, std::string> params;

        /**
         * @brief Creates a token with a random UUID and a fresh key.
         * Adds transport=wifi to the params when no transport is given.
         */
        static SessionToken generate(TransferKind kind, std::map<std::string, std::string> params = {});

        // The preferred transport ("wifi" when the parameter is absent).
        std::string transport() const;

        /**
         * @brief Serializes the token as the compact JSON record carried by the proximity trigger:
         * {"id", "type", "tempKey" (base64url, no padding), "params"}.
         */
        std::string to_record() const;

        /**
         * @brief Reconstructs a token from a record produced by to_record().
         * @throws BeamProto::InvalidToken if the record is malformed.
         */
        static SessionToken from_record(const std::string& record);
    };

} // namespace BeamProto

#endif // BEAMPROTO_SESSION_TOKEN_HPP
