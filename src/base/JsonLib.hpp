#ifndef __SCANLINK_JSON_LIB__
#define __SCANLINK_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for the wire codec.
 */
using json = nlohmann::json;

#endif  // __SCANLINK_JSON_LIB__
