// File: include/sr/adapters/obs_ws/obs_protocol.hpp
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "sr/core/status.hpp"

namespace sr {

// obs-websocket 5.x message framing (JSON text frames over the
// "obswebsocket.json" subprotocol). No I/O in here.

// Opcodes
constexpr int kObsOpHello = 0;
constexpr int kObsOpIdentify = 1;
constexpr int kObsOpIdentified = 2;
constexpr int kObsOpEvent = 5;
constexpr int kObsOpRequest = 6;
constexpr int kObsOpRequestResponse = 7;

// requestStatus.code values used here
constexpr int kObsStatusSuccess = 100;
constexpr int kObsStatusOutputRunning = 500;
constexpr int kObsStatusOutputNotRunning = 501;

constexpr int kObsRpcVersion = 1;

struct ObsHello {
  int rpc_version{kObsRpcVersion};
  // Present only when the server requires a password.
  std::optional<std::string> challenge;
  std::optional<std::string> salt;
};

struct ObsResponse {
  std::string request_type;
  std::string request_id;
  bool result{false};
  int code{0};
  std::string comment;
  nlohmann::json data;  // responseData, null when absent
};

// base64(sha256(base64(sha256(password + salt)) + challenge))
Result<std::string> obs_auth_string(const std::string& password, const std::string& salt,
                                    const std::string& challenge);

Result<ObsHello> parse_obs_hello(const std::string& text);

// connection_error when the server wants a password and none is configured.
Result<std::string> make_obs_identify(const ObsHello& hello, const std::string& password);

// Returns the negotiated rpc version.
Result<int> parse_obs_identified(const std::string& text);

std::string make_obs_request(const std::string& request_type, const std::string& request_id);

// A RequestResponse, or nullopt for any other opcode (events, etc.).
Result<std::optional<ObsResponse>> parse_obs_message(const std::string& text);

// responseData.outputActive of a GetRecordStatus response.
Result<bool> obs_output_active(const ObsResponse& r);

}  // namespace sr
