// File: include/sr/core/io/signal_source.hpp
#pragma once

#include <string>

#include "sr/core/status.hpp"

namespace sr {

// Raw signal behind a SensorPort. Vision sources return a motion-intensity
// metric (changed-pixel area); audio sources return a level in [0, 1].
//
// Called only from the owning SensorPort's thread.
class ISignalSource {
 public:
  virtual ~ISignalSource() = default;

  // Optional. A failed open() is retried by the SensorPort on its next tick.
  virtual Status open() { return Status::ok_status(); }

  // Returns:
  //  - OK with the current value
  //  - unavailable(...) when no sample can be taken right now (retried next tick)
  //  - other error codes on failure (also retried; never fatal)
  virtual Result<float> sample() = 0;

  virtual void close() {}

  virtual std::string name() const = 0;
};

}  // namespace sr
