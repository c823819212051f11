// File: include/sr/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "sr/core/config.hpp"

namespace sr {

// Hash the full runtime config (sensors, trigger, recorder, output...).
// Goal: if the run's behaviour can change, this hash should change.
std::string compute_config_hash(const Config& cfg);

}  // namespace sr
