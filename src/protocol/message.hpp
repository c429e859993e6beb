//===----------------------------------------------------------------------===//
//                         MCPD Server
//
// protocol/message.hpp
//
// JSON-RPC envelope, response and error definitions
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

namespace mcpd_server {

constexpr const char* JSONRPC_VERSION = "2.0";

//===----------------------------------------------------------------------===//
// Error codes
//===----------------------------------------------------------------------===//
enum class ErrorCode : int32_t {
    INVALID_PARAMS = -32600,
    METHOD_NOT_FOUND = -32601,
    INTERNAL_ERROR = -32000
};

const char* ErrorCodeToString(ErrorCode code);

// Thrown for input that cannot be decoded as an envelope
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error(message) {}
};

//===----------------------------------------------------------------------===//
// Method names
//===----------------------------------------------------------------------===//
namespace methods {
constexpr const char* TOOLS_LIST = "tools/list";
constexpr const char* TOOLS_CALL = "tools/call";
} // namespace methods

//===----------------------------------------------------------------------===//
// Envelope (client to server)
//===----------------------------------------------------------------------===//
struct Envelope {
    // String or integer, echoed verbatim
    nlohmann::json id;
    std::string method;
    // Absent params decode as null
    nlohmann::json params;

    // Throws ProtocolError on malformed JSON, a missing or non-string method,
    // a missing or non-scalar id, or a "jsonrpc" tag other than "2.0"
    static Envelope Parse(const std::string& text);

    std::string IdString() const { return id.dump(); }
};

//===----------------------------------------------------------------------===//
// Response (server to client)
//===----------------------------------------------------------------------===//
struct ErrorDescriptor {
    ErrorCode code = ErrorCode::INTERNAL_ERROR;
    std::string message;
};

// Carries exactly one of result or error
class Response {
public:
    static Response Success(nlohmann::json id, nlohmann::json result);
    static Response Failure(nlohmann::json id, ErrorCode code, std::string message);

    const nlohmann::json& Id() const { return id_; }
    bool IsError() const { return error_.has_value(); }
    const nlohmann::json& Result() const { return result_; }
    const ErrorDescriptor& Error() const { return *error_; }

    nlohmann::json ToJson() const;

    // Single line, no trailing newline
    std::string Serialize() const { return ToJson().dump(); }

private:
    Response() = default;

    nlohmann::json id_;
    nlohmann::json result_;
    std::optional<ErrorDescriptor> error_;
};

//===----------------------------------------------------------------------===//
// tools/call parameters
//===----------------------------------------------------------------------===//
struct CallParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();

    // Throws ProtocolError when params is not {"name": string, "arguments"?: object}
    static CallParams Parse(const nlohmann::json& params);
};

// Server identity sent when a session opens
nlohmann::json BuildIdentityResult(const std::string& server_name,
                                   const std::string& server_version);

} // namespace mcpd_server
