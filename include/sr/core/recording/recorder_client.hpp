// File: include/sr/core/recording/recorder_client.hpp
#pragma once

#include <string>

#include "sr/core/status.hpp"

namespace sr {

// Control surface of the remote recorder.
//
// Error codes:
//  - connection_error: recorder unreachable (any call)
//  - busy: start_recording() while the recorder is already recording for a
//    reason outside this process
//
// Used only from the consumer loop.
class RecorderClient {
 public:
  virtual ~RecorderClient() = default;

  virtual Status connect() = 0;
  virtual Status start_recording() = 0;
  virtual Status stop_recording() = 0;
  virtual Result<bool> is_recording() = 0;

  // Releases the connection. Safe to call more than once.
  virtual void close() = 0;

  virtual std::string name() const = 0;
};

}  // namespace sr
