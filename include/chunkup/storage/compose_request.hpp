#pragma once

#include "chunkup/storage/types.hpp"

#include <string>

namespace chunkup::storage {

/**
 * @brief JSON request body for a compose call
 *
 * Shape follows the GCS JSON API:
 * {"kind":"storage#composeRequest",
 *  "destination":{"name":"<dest>"},
 *  "sourceObjects":[{"name":"..","generation":N, ...}]}
 *
 * A zero generation is omitted instead of being sent as a precondition.
 */
std::string to_json_body(const ComposeRequest& request);

} // namespace chunkup::storage
