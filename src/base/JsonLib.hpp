#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Frame payloads and the session file are plain JSON documents.
 */
using json = nlohmann::json;
