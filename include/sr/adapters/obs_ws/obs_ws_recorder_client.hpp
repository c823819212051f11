// File: include/sr/adapters/obs_ws/obs_ws_recorder_client.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "sr/adapters/obs_ws/obs_protocol.hpp"
#include "sr/core/recording/recorder_client.hpp"
#include "sr/core/types.hpp"

namespace sr {

struct ObsWsConfig {
  std::string host{"localhost"};
  int port{4455};
  std::string password;  // empty when OBS has authentication off

  // Bound on every network step (connect, handshake, each request).
  DurationNs timeout{ms_to_ns(3000)};
};

// RecorderClient for OBS Studio over obs-websocket 5.x.
//
// Blocking calls with a per-step timeout. Any transport or protocol failure
// drops the link and returns connection_error; the next connect() reopens it.
// start_recording() checks GetRecordStatus first and returns busy if OBS is
// already recording.
class ObsWsRecorderClient final : public RecorderClient {
 public:
  explicit ObsWsRecorderClient(ObsWsConfig cfg);
  ~ObsWsRecorderClient() override;

  ObsWsRecorderClient(const ObsWsRecorderClient&) = delete;
  ObsWsRecorderClient& operator=(const ObsWsRecorderClient&) = delete;

  Status connect() override;
  Status start_recording() override;
  Status stop_recording() override;
  Result<bool> is_recording() override;
  void close() override;

  std::string name() const override { return "obs(" + endpoint() + ")"; }

  [[nodiscard]] bool connected() const { return ws_ != nullptr; }

 private:
  using Socket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  std::string endpoint() const { return cfg_.host + ":" + std::to_string(cfg_.port); }

  // Starts one async operation and runs the io_context until it completes.
  template <typename Start>
  boost::system::error_code run_io(Start&& start);

  Status write_text(const std::string& text);
  Result<std::string> read_text();
  Result<ObsResponse> call(const std::string& request_type);

  // Drops the link and describes the failure as connection_error.
  Status link_failed(const std::string& step, const std::string& detail);

  ObsWsConfig cfg_;
  boost::asio::io_context ioc_;
  std::unique_ptr<Socket> ws_;
  std::uint64_t next_request_id_{1};
};

}  // namespace sr
