#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Frames, admin payloads and history snapshots all use nlohmann json.
 */
using json = nlohmann::json;
