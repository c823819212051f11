// File: src/adapters/obs_ws/obs_ws_recorder_client.cpp
#include "sr/adapters/obs_ws/obs_ws_recorder_client.hpp"

#include <chrono>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>

namespace sr {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

// Frames we are willing to skip while waiting for one response.
constexpr int kMaxInterleavedFrames = 32;

}  // namespace

ObsWsRecorderClient::ObsWsRecorderClient(ObsWsConfig cfg) : cfg_(std::move(cfg)) {}

ObsWsRecorderClient::~ObsWsRecorderClient() { close(); }

template <typename Start>
boost::system::error_code ObsWsRecorderClient::run_io(Start&& start) {
  boost::system::error_code result = boost::asio::error::would_block;
  start([&result](boost::system::error_code ec, auto&&...) { result = ec; });
  ioc_.restart();
  ioc_.run();
  return result;
}

Status ObsWsRecorderClient::link_failed(const std::string& step, const std::string& detail) {
  if (ws_) {
    beast::get_lowest_layer(*ws_).close();
    ws_.reset();
  }
  spdlog::debug("ObsWs: {} with {} failed: {}", step, endpoint(), detail);
  return Status::connection_error("OBS " + endpoint() + ": " + step + " failed: " + detail);
}

Status ObsWsRecorderClient::connect() {
  close();
  const auto timeout = std::chrono::nanoseconds(cfg_.timeout);

  boost::system::error_code ec;
  tcp::resolver resolver(ioc_);
  const auto endpoints = resolver.resolve(cfg_.host, std::to_string(cfg_.port), ec);
  if (ec) return Status::connection_error("OBS: cannot resolve " + endpoint() + ": " + ec.message());

  ws_ = std::make_unique<Socket>(ioc_);
  beast::get_lowest_layer(*ws_).expires_after(timeout);
  ec = run_io([this, &endpoints](auto handler) {
    beast::get_lowest_layer(*ws_).async_connect(endpoints, std::move(handler));
  });
  if (ec) return link_failed("connect", ec.message());

  ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
    req.set(beast::http::field::sec_websocket_protocol, "obswebsocket.json");
  }));
  const std::string host = endpoint();
  beast::get_lowest_layer(*ws_).expires_after(timeout);
  ec = run_io([this, &host](auto handler) { ws_->async_handshake(host, "/", std::move(handler)); });
  if (ec) return link_failed("handshake", ec.message());
  ws_->text(true);

  auto hello_text = read_text();
  if (!hello_text.ok()) return hello_text.status();
  auto hello = parse_obs_hello(*hello_text);
  if (!hello.ok()) return link_failed("hello", hello.status().message());

  auto identify = make_obs_identify(*hello, cfg_.password);
  if (!identify.ok()) return link_failed("identify", identify.status().message());
  SR_RETURN_IF_ERROR(write_text(*identify));

  auto identified_text = read_text();
  if (!identified_text.ok()) return identified_text.status();
  auto rpc = parse_obs_identified(*identified_text);
  if (!rpc.ok()) return link_failed("identify", rpc.status().message());

  spdlog::info("ObsWs: connected to {} (rpc v{}{})", endpoint(), *rpc,
               hello->challenge ? ", authenticated" : "");
  return Status::ok_status();
}

Status ObsWsRecorderClient::write_text(const std::string& text) {
  beast::get_lowest_layer(*ws_).expires_after(std::chrono::nanoseconds(cfg_.timeout));
  const auto ec = run_io([this, &text](auto handler) {
    ws_->async_write(boost::asio::buffer(text), std::move(handler));
  });
  if (ec) return link_failed("write", ec.message());
  return Status::ok_status();
}

Result<std::string> ObsWsRecorderClient::read_text() {
  beast::flat_buffer buffer;
  beast::get_lowest_layer(*ws_).expires_after(std::chrono::nanoseconds(cfg_.timeout));
  const auto ec = run_io([this, &buffer](auto handler) { ws_->async_read(buffer, std::move(handler)); });
  if (ec) {
    std::string detail = ec.message();
    if (ec == websocket::error::closed) {
      const auto& why = ws_->reason();
      detail = "closed by OBS (" + std::to_string(why.code) + " " +
               std::string(why.reason.data(), why.reason.size()) + ")";
    }
    return Result<std::string>::err(link_failed("read", detail));
  }
  return Result<std::string>::ok(beast::buffers_to_string(buffer.data()));
}

Result<ObsResponse> ObsWsRecorderClient::call(const std::string& request_type) {
  if (!ws_) {
    return Result<ObsResponse>::err(Status::connection_error("OBS " + endpoint() + ": not connected"));
  }

  const std::string id = std::to_string(next_request_id_++);
  const Status st = write_text(make_obs_request(request_type, id));
  if (!st.ok()) return Result<ObsResponse>::err(st);

  for (int i = 0; i < kMaxInterleavedFrames; ++i) {
    auto text = read_text();
    if (!text.ok()) return Result<ObsResponse>::err(text.status());
    auto msg = parse_obs_message(*text);
    if (!msg.ok()) return Result<ObsResponse>::err(link_failed(request_type, msg.status().message()));
    if (msg->has_value() && (*msg)->request_id == id) return Result<ObsResponse>::ok(std::move(**msg));
  }
  return Result<ObsResponse>::err(link_failed(request_type, "no response"));
}

Result<bool> ObsWsRecorderClient::is_recording() {
  auto r = call("GetRecordStatus");
  if (!r.ok()) return Result<bool>::err(r.status());
  if (!r->result) {
    return Result<bool>::err(Status::connection_error("OBS: GetRecordStatus failed (" +
                                                      std::to_string(r->code) + "): " + r->comment));
  }
  auto active = obs_output_active(*r);
  if (!active.ok()) return Result<bool>::err(link_failed("GetRecordStatus", active.status().message()));
  return active;
}

Status ObsWsRecorderClient::start_recording() {
  auto active = is_recording();
  if (!active.ok()) return active.status();
  if (*active) return Status::busy("OBS is already recording");

  auto r = call("StartRecord");
  if (!r.ok()) return r.status();
  if (!r->result) {
    if (r->code == kObsStatusOutputRunning) return Status::busy("OBS is already recording: " + r->comment);
    return Status::connection_error("OBS: StartRecord failed (" + std::to_string(r->code) + "): " + r->comment);
  }
  spdlog::info("ObsWs: recording started");
  return Status::ok_status();
}

Status ObsWsRecorderClient::stop_recording() {
  auto r = call("StopRecord");
  if (!r.ok()) return r.status();
  if (!r->result) {
    if (r->code == kObsStatusOutputNotRunning) {
      spdlog::info("ObsWs: StopRecord while not recording");
      return Status::ok_status();
    }
    return Status::connection_error("OBS: StopRecord failed (" + std::to_string(r->code) + "): " + r->comment);
  }
  spdlog::info("ObsWs: recording stopped");
  return Status::ok_status();
}

void ObsWsRecorderClient::close() {
  if (!ws_) return;

  beast::get_lowest_layer(*ws_).expires_after(std::chrono::nanoseconds(cfg_.timeout));
  const auto ec = run_io([this](auto handler) {
    ws_->async_close(websocket::close_code::normal, std::move(handler));
  });
  if (ec) spdlog::debug("ObsWs: close handshake with {} failed: {}", endpoint(), ec.message());

  beast::get_lowest_layer(*ws_).close();
  ws_.reset();
  spdlog::debug("ObsWs: disconnected from {}", endpoint());
}

}  // namespace sr
