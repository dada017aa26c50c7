#ifndef BEAMPROTO_CRYPTO_HPP
#define BEAMPROTO_CRYPTO_HPP

#include "keys.hpp"
#include <string>

namespace BeamProto {

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates a fresh 256-bit key for one session.
         */
        static SymmetricKey generate_key();

        /**
         * @brief Seals a plaintext with ChaCha20-Poly1305 (IETF).
         * Output layout: [Nonce (12)] + [Ciphertext (N)] + [Tag (16)].
         * @param key The session key.
         * @param plaintext The data to encrypt.
         * @param associated_data Authenticated but not encrypted (the session id).
         * @return The sealed message.
         * @throws BeamProto::InvalidArgument if the key has the wrong size.
         */
        static byte_vector seal(const SymmetricKey& key, const byte_vector& plaintext,
                                const std::string& associated_data);

        /**
         * @brief Opens a message produced by seal().
         * @return The plaintext.
         * @throws BeamProto::AuthFailure if the message is truncated, the key is wrong,
         *         the associated data differs or the message was modified.
         */
        static byte_vector open(const SymmetricKey& key, const byte_vector& sealed,
                                const std::string& associated_data);

        /**
         * @brief URL-safe base64 without padding.
         */
        static std::string base64url_encode(const byte_vector& data);

        /**
         * @throws BeamProto::InvalidArgument on characters outside the alphabet.
         */
        static byte_vector base64url_decode(const std::string& text);

        // Overhead added by seal() on top of the plaintext length.
        static size_t sealed_overhead();
    };

} // namespace BeamProto

#endif // BEAMPROTO_CRYPTO_HPP
