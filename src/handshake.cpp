#include "beamproto/handshake.hpp"

#include <json/json.h>

#include "beamproto/crypto.hpp"
#include "beamproto/errors.hpp"
#include "json_util.hpp"

namespace BeamProto {

TransferMetadata TransferMetadata::from_files(std::string display_name, std::vector<FileEntry> files) {
    TransferMetadata metadata;
    metadata.display_name = std::move(display_name);
    for (const auto& file : files) {
        metadata.total_size += file.size;
    }
    metadata.file_count = static_cast<uint32_t>(files.size());
    metadata.files = std::move(files);
    return metadata;
}

byte_vector HandshakeCodec::encode(const TransferMetadata& metadata, const std::string& session_id,
                                   TransferKind kind) {
    Json::Value root(Json::objectValue);
    root["sessionId"] = session_id;
    root["type"] = to_string(kind);
    root["name"] = metadata.display_name;
    root["size"] = Json::UInt64(metadata.total_size);
    // Senders usually only fill the file list; honour an explicit count otherwise.
    uint32_t count = metadata.files.empty() ? metadata.file_count : static_cast<uint32_t>(metadata.files.size());
    root["fileCount"] = Json::UInt(count);

    std::string text = detail::write_compact_json(root);
    return byte_vector(text.begin(), text.end());
}

TransferMetadata HandshakeCodec::decode(const byte_vector& plaintext) {
    Json::Value root;
    std::string errors;
    const char* begin = reinterpret_cast<const char*>(plaintext.data());
    if (!detail::parse_json(begin, begin + plaintext.size(), root, errors) || !root.isObject()) {
        throw MalformedHandshake("Handshake is not a JSON object.");
    }

    const Json::Value& name = root["name"];
    if (!name.isString()) {
        throw MalformedHandshake("Handshake field 'name' is missing or not a string.");
    }
    const Json::Value& size = root["size"];
    if (!size.isUInt64()) {
        throw MalformedHandshake("Handshake field 'size' is missing or not a non-negative integer.");
    }
    const Json::Value& file_count = root["fileCount"];
    if (!file_count.isUInt()) {
        throw MalformedHandshake("Handshake field 'fileCount' is missing or not a non-negative integer.");
    }

    TransferMetadata metadata;
    metadata.display_name = name.asString();
    metadata.total_size = size.asUInt64();
    metadata.file_count = file_count.asUInt();
    return metadata;
}

byte_vector HandshakeCodec::create_message(const SessionToken& token, const TransferMetadata& metadata) {
    return Crypto::seal(token.key, encode(metadata, token.id, token.kind), token.id);
}

TransferMetadata HandshakeCodec::parse_message(const SessionToken& token, const byte_vector& message) {
    return decode(Crypto::open(token.key, message, token.id));
}

} // namespace BeamProto
