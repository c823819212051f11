// File: src/adapters/obs_ws/obs_protocol.cpp
#include "sr/adapters/obs_ws/obs_protocol.hpp"

#include <array>
#include <utility>
#include <vector>

#include <openssl/evp.h>

namespace sr {
namespace {

using json = nlohmann::json;

Result<std::string> sha256_base64(const std::string& input) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int md_len = 0;
  if (EVP_Digest(input.data(), input.size(), md.data(), &md_len, EVP_sha256(), nullptr) != 1) {
    return Result<std::string>::err(Status::internal("sha256 digest failed"));
  }

  std::vector<unsigned char> out(4 * ((md_len + 2) / 3) + 1);
  const int n = EVP_EncodeBlock(out.data(), md.data(), static_cast<int>(md_len));
  if (n < 0) return Result<std::string>::err(Status::internal("base64 encoding failed"));
  return Result<std::string>::ok(std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n)));
}

// Parses a frame and checks the envelope: {"op": <int>, "d": {...}}.
Result<json> parse_envelope(const std::string& text) {
  json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return Result<json>::err(Status::parse_error("OBS: frame is not JSON"));
  if (!j.is_object() || !j.contains("op") || !j["op"].is_number_integer() || !j.contains("d") ||
      !j["d"].is_object()) {
    return Result<json>::err(Status::parse_error("OBS: frame lacks op/d"));
  }
  return Result<json>::ok(std::move(j));
}

}  // namespace

Result<std::string> obs_auth_string(const std::string& password, const std::string& salt,
                                    const std::string& challenge) {
  auto secret = sha256_base64(password + salt);
  if (!secret.ok()) return secret;
  return sha256_base64(*secret + challenge);
}

Result<ObsHello> parse_obs_hello(const std::string& text) {
  auto env = parse_envelope(text);
  if (!env.ok()) return Result<ObsHello>::err(env.status());
  const json& j = *env;
  if (j["op"].get<int>() != kObsOpHello) {
    return Result<ObsHello>::err(Status::parse_error("OBS: expected Hello, got op " + j["op"].dump()));
  }

  try {
    const json& d = j["d"];
    ObsHello hello;
    hello.rpc_version = d.value("rpcVersion", kObsRpcVersion);
    if (d.contains("authentication")) {
      const json& a = d["authentication"];
      hello.challenge = a.at("challenge").get<std::string>();
      hello.salt = a.at("salt").get<std::string>();
    }
    return Result<ObsHello>::ok(std::move(hello));
  } catch (const json::exception& e) {
    return Result<ObsHello>::err(Status::parse_error(std::string("OBS: bad Hello: ") + e.what()));
  }
}

Result<std::string> make_obs_identify(const ObsHello& hello, const std::string& password) {
  json d = {
      {"rpcVersion", kObsRpcVersion},
      {"eventSubscriptions", 0},  // requests only
  };
  if (hello.challenge && hello.salt) {
    if (password.empty()) {
      return Result<std::string>::err(
          Status::connection_error("OBS requires a password and recorder.password is empty"));
    }
    auto auth = obs_auth_string(password, *hello.salt, *hello.challenge);
    if (!auth.ok()) return auth;
    d["authentication"] = *auth;
  }
  return Result<std::string>::ok(json{{"op", kObsOpIdentify}, {"d", d}}.dump());
}

Result<int> parse_obs_identified(const std::string& text) {
  auto env = parse_envelope(text);
  if (!env.ok()) return Result<int>::err(env.status());
  const json& j = *env;
  if (j["op"].get<int>() != kObsOpIdentified) {
    return Result<int>::err(Status::parse_error("OBS: expected Identified, got op " + j["op"].dump()));
  }
  try {
    return Result<int>::ok(j["d"].value("negotiatedRpcVersion", kObsRpcVersion));
  } catch (const json::exception& e) {
    return Result<int>::err(Status::parse_error(std::string("OBS: bad Identified: ") + e.what()));
  }
}

std::string make_obs_request(const std::string& request_type, const std::string& request_id) {
  return json{
      {"op", kObsOpRequest},
      {"d", {{"requestType", request_type}, {"requestId", request_id}}},
  }.dump();
}

Result<std::optional<ObsResponse>> parse_obs_message(const std::string& text) {
  using R = Result<std::optional<ObsResponse>>;

  auto env = parse_envelope(text);
  if (!env.ok()) return R::err(env.status());
  const json& j = *env;
  if (j["op"].get<int>() != kObsOpRequestResponse) return R::ok(std::nullopt);

  try {
    const json& d = j["d"];
    const json& st = d.at("requestStatus");
    ObsResponse r;
    r.request_type = d.at("requestType").get<std::string>();
    r.request_id = d.at("requestId").get<std::string>();
    r.result = st.at("result").get<bool>();
    r.code = st.at("code").get<int>();
    r.comment = st.value("comment", "");
    if (d.contains("responseData")) r.data = d["responseData"];
    return R::ok(std::move(r));
  } catch (const json::exception& e) {
    return R::err(Status::parse_error(std::string("OBS: bad RequestResponse: ") + e.what()));
  }
}

Result<bool> obs_output_active(const ObsResponse& r) {
  if (!r.data.is_object() || !r.data.contains("outputActive") || !r.data["outputActive"].is_boolean()) {
    return Result<bool>::err(Status::parse_error("OBS: " + r.request_type + " response lacks outputActive"));
  }
  return Result<bool>::ok(r.data["outputActive"].get<bool>());
}

}  // namespace sr
