#include <cstdio>
#include <iostream>
#include <string>

#include "beamproto/crypto.hpp"
#include "beamproto/errors.hpp"
#include "beamproto/handshake.hpp"
#include "beamproto/session_token.hpp"

void print_bytes(const std::string& title, const BeamProto::byte_vector& bytes) {
    std::cout << title << " (" << bytes.size() << " bytes): ";
    for (size_t i = 0; i < bytes.size() && i < 24; ++i) {
        printf("%02x", bytes[i]);
    }
    if (bytes.size() > 24) {
        std::cout << "...";
    }
    std::cout << std::endl;
}

int main() {
    // 1. Initialize the crypto library
    if (BeamProto::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }
    std::cout << "Crypto library initialized." << std::endl;

    // 2. The sender creates a session and hands the record to the proximity trigger (NFC tag, QR code...)
    auto token = BeamProto::SessionToken::generate(BeamProto::TransferKind::SINGLE_FILE);
    std::string record = token.to_record();
    std::cout << "Session " << token.id << " over " << token.transport() << std::endl;
    std::cout << "Record: " << record << std::endl;

    // 3. The receiver reads the record back
    BeamProto::SessionToken scanned;
    try {
        scanned = BeamProto::SessionToken::from_record(record);
    } catch (const BeamProto::InvalidToken& e) {
        std::cerr << "Record rejected: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Receiver parsed session " << scanned.id << " (" << BeamProto::to_string(scanned.kind) << ")"
              << std::endl;

    // 4. The sender seals the handshake for this session
    auto metadata = BeamProto::TransferMetadata::from_files("a.txt", {{"a.txt", 11}});
    auto message = BeamProto::HandshakeCodec::create_message(token, metadata);
    print_bytes("[S->R] Sealed handshake", message);

    // 5. The receiver opens it with the scanned token
    auto announced = BeamProto::HandshakeCodec::parse_message(scanned, message);
    std::cout << "[RECEIVER] Incoming '" << announced.display_name << "', " << announced.total_size << " bytes in "
              << announced.file_count << " file(s)" << std::endl;

    // 6. A token from another session cannot open it
    auto stranger = BeamProto::SessionToken::generate(BeamProto::TransferKind::SINGLE_FILE);
    try {
        BeamProto::HandshakeCodec::parse_message(stranger, message);
        std::cerr << "Unexpected: foreign token opened the handshake." << std::endl;
        return 1;
    } catch (const BeamProto::AuthFailure& e) {
        std::cout << "Foreign token rejected: " << e.what() << std::endl;
    }

    return 0;
}
