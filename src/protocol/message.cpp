//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// protocol/message.cpp
//
// Envelope decoding and response encoding
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include "version.hpp"

namespace mcpd_server {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_PARAMS: return "INVALID_PARAMS";
        case ErrorCode::METHOD_NOT_FOUND: return "METHOD_NOT_FOUND";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

//===----------------------------------------------------------------------===//
// Envelope
//===----------------------------------------------------------------------===//
Envelope Envelope::Parse(const std::string& text) {
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        throw ProtocolError("malformed JSON");
    }
    if (!doc.is_object()) {
        throw ProtocolError("envelope must be a JSON object");
    }

    auto tag = doc.find("jsonrpc");
    if (tag != doc.end() && (!tag->is_string() || tag->get<std::string>() != JSONRPC_VERSION)) {
        throw ProtocolError("unsupported jsonrpc version");
    }

    auto id = doc.find("id");
    if (id == doc.end() || !(id->is_string() || id->is_number_integer())) {
        throw ProtocolError("envelope id must be a string or integer");
    }

    auto method = doc.find("method");
    if (method == doc.end() || !method->is_string()) {
        throw ProtocolError("envelope method must be a string");
    }

    Envelope envelope;
    envelope.id = *id;
    envelope.method = method->get<std::string>();

    auto params = doc.find("params");
    if (params != doc.end()) {
        envelope.params = *params;
    }
    return envelope;
}

//===----------------------------------------------------------------------===//
// Response
//===----------------------------------------------------------------------===//
Response Response::Success(nlohmann::json id, nlohmann::json result) {
    Response response;
    response.id_ = std::move(id);
    response.result_ = std::move(result);
    return response;
}

Response Response::Failure(nlohmann::json id, ErrorCode code, std::string message) {
    Response response;
    response.id_ = std::move(id);
    response.error_ = ErrorDescriptor{code, std::move(message)};
    return response;
}

nlohmann::json Response::ToJson() const {
    nlohmann::json doc = {
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id_}
    };

    if (error_) {
        doc["error"] = {
            {"code", static_cast<int32_t>(error_->code)},
            {"message", error_->message}
        };
    } else {
        doc["result"] = result_;
    }
    return doc;
}

//===----------------------------------------------------------------------===//
// CallParams
//===----------------------------------------------------------------------===//
CallParams CallParams::Parse(const nlohmann::json& params) {
    if (!params.is_object()) {
        throw ProtocolError("params must be an object");
    }

    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        throw ProtocolError("params.name must be a string");
    }

    CallParams call;
    call.name = name->get<std::string>();

    auto arguments = params.find("arguments");
    if (arguments != params.end() && !arguments->is_null()) {
        if (!arguments->is_object()) {
            throw ProtocolError("params.arguments must be an object");
        }
        call.arguments = *arguments;
    }
    return call;
}

nlohmann::json BuildIdentityResult(const std::string& server_name,
                                   const std::string& server_version) {
    return {
        {"protocolVersion", MCPD_PROTOCOL_VERSION},
        {"serverInfo", {
            {"name", server_name},
            {"version", server_version}
        }},
        {"capabilities", {
            {"tools", nlohmann::json::object()}
        }}
    };
}

} // namespace mcpd_server
