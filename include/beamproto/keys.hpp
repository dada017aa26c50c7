#ifndef BEAMPROTO_KEYS_HPP
#define BEAMPROTO_KEYS_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace BeamProto {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    // Size of the single-use session key (256 bits).
    constexpr std::size_t SESSION_KEY_BYTES = 32;

    // A symmetric key shared out of band. Wiped on destruction.
    struct SymmetricKey {
        byte_vector data;

        SymmetricKey() = default;
        explicit SymmetricKey(byte_vector bytes) : data(std::move(bytes)) {}
        SymmetricKey(const SymmetricKey&) = default;
        SymmetricKey(SymmetricKey&&) = default;
        SymmetricKey& operator=(const SymmetricKey&) = default;
        SymmetricKey& operator=(SymmetricKey&&) = default;
        ~SymmetricKey();

        bool operator==(const SymmetricKey& other) const { return data == other.data; }
        bool operator!=(const SymmetricKey& other) const { return data != other.data; }
    };

} // namespace BeamProto

#endif // BEAMPROTO_KEYS_HPP
