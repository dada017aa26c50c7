#include "beamproto/session_token.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <json/json.h>

#include "beamproto/config.hpp"
#include "beamproto/crypto.hpp"
#include "beamproto/errors.hpp"
#include "json_util.hpp"

namespace BeamProto {

const char* to_string(TransferKind kind) {
    switch (kind) {
        case TransferKind::SINGLE_FILE:
            return "SINGLE_FILE";
        case TransferKind::MULTI_FILE:
            return "MULTI_FILE";
    }
    return "UNKNOWN";
}

TransferKind transfer_kind_from_string(const std::string& name) {
    if (name == "SINGLE_FILE") return TransferKind::SINGLE_FILE;
    if (name == "MULTI_FILE") return TransferKind::MULTI_FILE;
    throw InvalidArgument("Unknown transfer kind: " + name);
}

SessionToken SessionToken::generate(TransferKind kind, std::map<std::string, std::string> params) {
    SessionToken token;
    token.id = boost::uuids::to_string(boost::uuids::random_generator()());
    token.kind = kind;
    token.key = Crypto::generate_key();
    token.params = std::move(params);
    token.params.emplace(TRANSPORT_PARAM, TRANSPORT_WIFI);  // no-op if a transport is already set
    return token;
}

std::string SessionToken::transport() const {
    auto it = params.find(TRANSPORT_PARAM);
    return it == params.end() ? std::string(TRANSPORT_WIFI) : it->second;
}

std::string SessionToken::to_record() const {
    Json::Value root(Json::objectValue);
    root["id"] = id;
    root["type"] = to_string(kind);
    root["tempKey"] = Crypto::base64url_encode(key.data);

    Json::Value params_obj(Json::objectValue);
    for (const auto& [name, value] : params) {
        params_obj[name] = value;
    }
    root["params"] = params_obj;

    return detail::write_compact_json(root);
}

SessionToken SessionToken::from_record(const std::string& record) {
    Json::Value root;
    std::string errors;
    if (!detail::parse_json(record, root, errors) || !root.isObject()) {
        throw InvalidToken("Session record is not a JSON object: " + errors);
    }

    const Json::Value& id = root["id"];
    const Json::Value& type = root["type"];
    const Json::Value& temp_key = root["tempKey"];
    if (!id.isString() || !type.isString() || !temp_key.isString()) {
        throw InvalidToken("Session record is missing id, type or tempKey.");
    }

    SessionToken token;
    token.id = id.asString();
    if (token.id.empty()) {
        throw InvalidToken("Session record has an empty id.");
    }

    try {
        token.kind = transfer_kind_from_string(type.asString());
        token.key = SymmetricKey(Crypto::base64url_decode(temp_key.asString()));
    } catch (const InvalidArgument& e) {
        throw InvalidToken(std::string("Session record is invalid: ") + e.what());
    }
    if (token.key.data.size() != SESSION_KEY_BYTES) {
        throw InvalidToken("Session record key must be 256 bits.");
    }

    const Json::Value& params = root["params"];
    if (!params.isNull()) {
        if (!params.isObject()) {
            throw InvalidToken("Session record params must be an object.");
        }
        for (const auto& name : params.getMemberNames()) {
            if (!params[name].isString()) {
                throw InvalidToken("Session record param '" + name + "' is not a string.");
            }
            token.params[name] = params[name].asString();
        }
    }
    token.params.emplace(TRANSPORT_PARAM, TRANSPORT_WIFI);

    return token;
}

} // namespace BeamProto
