// File: tests/support/fake_obs_server.hpp
#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "sr/adapters/obs_ws/obs_protocol.hpp"

namespace sr::testing {

// Minimal obs-websocket 5.x server for one client connection, on 127.0.0.1
// with an ephemeral port. Speaks Hello/Identify and the three record requests.
class FakeObsServer {
 public:
  static constexpr const char* kSalt = "lM1GncleQOaCu9lT1yeUZhFYnqhsLLP1G5lAGo3ixaI=";
  static constexpr const char* kChallenge = "+IxH4CnCiqpX1rM9scsNynZzbOe4KhDeYcTNS3PDaeY=";

  explicit FakeObsServer(std::string password = {})
      : password_(std::move(password)),
        acceptor_(ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0}) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this] { serve(); });
  }

  ~FakeObsServer() {
    if (!accepted_.load()) {
      // Unblock accept() when no client ever showed up.
      boost::asio::io_context ioc;
      boost::asio::ip::tcp::socket s(ioc);
      boost::system::error_code ec;
      s.connect({boost::asio::ip::make_address("127.0.0.1"), static_cast<unsigned short>(port_)}, ec);
    }
    if (thread_.joinable()) thread_.join();
  }

  FakeObsServer(const FakeObsServer&) = delete;
  FakeObsServer& operator=(const FakeObsServer&) = delete;

  int port() const { return port_; }

  // Someone else (the OBS user) started a recording.
  void set_recording(bool on) {
    std::lock_guard<std::mutex> lk(mu_);
    recording_ = on;
  }
  bool recording() const {
    std::lock_guard<std::mutex> lk(mu_);
    return recording_;
  }
  // Send an unrelated event frame before every response.
  void set_chatty(bool on) { chatty_ = on; }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lk(mu_);
    return requests_;
  }
  bool identified() const { return identified_.load(); }

 private:
  using json = nlohmann::json;

  void serve() {
    namespace websocket = boost::beast::websocket;
    boost::system::error_code ec;

    boost::asio::ip::tcp::socket sock(ioc_);
    acceptor_.accept(sock, ec);
    accepted_ = true;
    if (ec) return;

    websocket::stream<boost::asio::ip::tcp::socket> ws(std::move(sock));
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
      res.set(boost::beast::http::field::sec_websocket_protocol, "obswebsocket.json");
    }));
    ws.accept(ec);
    if (ec) return;
    ws.text(true);

    json hello = {{"op", kObsOpHello}, {"d", {{"obsWebSocketVersion", "5.0.0"}, {"rpcVersion", 1}}}};
    if (!password_.empty()) hello["d"]["authentication"] = {{"challenge", kChallenge}, {"salt", kSalt}};
    if (!write(ws, hello)) return;

    json identify;
    if (!read(ws, identify)) return;
    if (!password_.empty()) {
      const auto expected = obs_auth_string(password_, kSalt, kChallenge);
      if (!expected.ok() || identify["d"].value("authentication", "") != *expected) {
        ws.close(websocket::close_reason(static_cast<websocket::close_code>(4009), "Authentication failed."), ec);
        return;
      }
    }
    if (!write(ws, {{"op", kObsOpIdentified}, {"d", {{"negotiatedRpcVersion", 1}}}})) return;
    identified_ = true;

    for (;;) {
      json req;
      if (!read(ws, req)) return;  // client went away
      const json& d = req["d"];
      const std::string type = d.value("requestType", "");
      {
        std::lock_guard<std::mutex> lk(mu_);
        requests_.push_back(type);
      }
      if (chatty_ && !write(ws, {{"op", kObsOpEvent}, {"d", {{"eventType", "SceneChanged"}}}})) return;
      if (!write(ws, respond(type, d.value("requestId", "")))) return;
    }
  }

  json respond(const std::string& type, const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    bool ok = true;
    int code = kObsStatusSuccess;
    json data;
    if (type == "GetRecordStatus") {
      data = {{"outputActive", recording_}, {"outputPaused", false}};
    } else if (type == "StartRecord") {
      if (recording_) {
        ok = false;
        code = kObsStatusOutputRunning;
      }
      recording_ = true;
    } else if (type == "StopRecord") {
      if (!recording_) {
        ok = false;
        code = kObsStatusOutputNotRunning;
      }
      recording_ = false;
    } else {
      ok = false;
      code = 204;  // UnknownRequestType
    }

    json d = {{"requestType", type}, {"requestId", id}, {"requestStatus", {{"result", ok}, {"code", code}}}};
    if (!data.is_null()) d["responseData"] = data;
    return {{"op", kObsOpRequestResponse}, {"d", d}};
  }

  template <typename Ws>
  static bool write(Ws& ws, const json& j) {
    boost::system::error_code ec;
    ws.write(boost::asio::buffer(j.dump()), ec);
    return !ec;
  }

  template <typename Ws>
  static bool read(Ws& ws, json& out) {
    boost::beast::flat_buffer buf;
    boost::system::error_code ec;
    ws.read(buf, ec);
    if (ec) return false;
    out = json::parse(boost::beast::buffers_to_string(buf.data()), nullptr, false);
    return !out.is_discarded();
  }

  std::string password_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  int port_{0};

  mutable std::mutex mu_;
  bool recording_{false};
  std::vector<std::string> requests_;
  std::atomic<bool> chatty_{false};
  std::atomic<bool> accepted_{false};
  std::atomic<bool> identified_{false};
  std::thread thread_;
};

}  // namespace sr::testing
