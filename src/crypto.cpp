#include "beamproto/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "beamproto/errors.hpp"

namespace BeamProto {

    static std::atomic<bool> g_sodium_initialized = false;

    SymmetricKey::~SymmetricKey() {
        if (!data.empty()) {
            sodium_memzero(data.data(), data.size());
        }
    }

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    SymmetricKey Crypto::generate_key() {
        static_assert(crypto_aead_chacha20poly1305_ietf_KEYBYTES == SESSION_KEY_BYTES,
                      "session key size must match the AEAD key size");
        SymmetricKey key;
        key.data.resize(crypto_aead_chacha20poly1305_ietf_KEYBYTES);
        crypto_aead_chacha20poly1305_ietf_keygen(key.data.data());
        return key;
    }

    size_t Crypto::sealed_overhead() {
        return crypto_aead_chacha20poly1305_ietf_NPUBBYTES + crypto_aead_chacha20poly1305_ietf_ABYTES;
    }

    byte_vector Crypto::seal(const SymmetricKey& key, const byte_vector& plaintext,
                             const std::string& associated_data) {
        if (key.data.size() != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
            throw InvalidArgument("Invalid key size for encryption.");
        }

        constexpr size_t NONCE_SIZE = crypto_aead_chacha20poly1305_ietf_NPUBBYTES;

        byte_vector sealed(NONCE_SIZE + plaintext.size() + crypto_aead_chacha20poly1305_ietf_ABYTES);
        randombytes_buf(sealed.data(), NONCE_SIZE);

        unsigned long long ciphertext_len;
        crypto_aead_chacha20poly1305_ietf_encrypt(sealed.data() + NONCE_SIZE,
                                                  &ciphertext_len,
                                                  plaintext.data(),
                                                  plaintext.size(),
                                                  reinterpret_cast<const unsigned char*>(associated_data.data()),
                                                  associated_data.size(),
                                                  nullptr,  // nsec is not used
                                                  sealed.data(),
                                                  key.data.data());

        sealed.resize(NONCE_SIZE + ciphertext_len);
        return sealed;
    }

    byte_vector Crypto::open(const SymmetricKey& key, const byte_vector& sealed,
                             const std::string& associated_data) {
        if (key.data.size() != crypto_aead_chacha20poly1305_ietf_KEYBYTES) {
            throw InvalidArgument("Invalid key size for decryption.");
        }

        constexpr size_t NONCE_SIZE = crypto_aead_chacha20poly1305_ietf_NPUBBYTES;

        if (sealed.size() < NONCE_SIZE + crypto_aead_chacha20poly1305_ietf_ABYTES) {
            throw AuthFailure("Handshake authentication failed: message too small to be valid.");
        }

        const unsigned char* ciphertext_with_tag = sealed.data() + NONCE_SIZE;
        size_t ciphertext_with_tag_len = sealed.size() - NONCE_SIZE;

        byte_vector plaintext(ciphertext_with_tag_len - crypto_aead_chacha20poly1305_ietf_ABYTES);
        unsigned long long plaintext_len;

        if (crypto_aead_chacha20poly1305_ietf_decrypt(plaintext.data(),
                                                      &plaintext_len,
                                                      nullptr,  // nsec is not used
                                                      ciphertext_with_tag,
                                                      ciphertext_with_tag_len,
                                                      reinterpret_cast<const unsigned char*>(associated_data.data()),
                                                      associated_data.size(),
                                                      sealed.data(),
                                                      key.data.data()) != 0) {
            throw AuthFailure("Handshake authentication failed: tag, key or session id mismatch.");
        }

        plaintext.resize(plaintext_len);
        return plaintext;
    }

    std::string Crypto::base64url_encode(const byte_vector& data) {
        constexpr int VARIANT = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
        std::string out(sodium_base64_ENCODED_LEN(data.size(), VARIANT), '\0');
        sodium_bin2base64(&out[0], out.size(), data.data(), data.size(), VARIANT);
        out.resize(out.size() - 1);  // drop the terminating NUL
        return out;
    }

    byte_vector Crypto::base64url_decode(const std::string& text) {
        byte_vector out(text.size() * 3 / 4 + 1);
        size_t bin_len = 0;
        const char* end = nullptr;
        if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &bin_len, &end,
                              sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0 ||
            end != text.data() + text.size()) {
            throw InvalidArgument("Invalid base64url input.");
        }
        out.resize(bin_len);
        return out;
    }

}  // namespace BeamProto
