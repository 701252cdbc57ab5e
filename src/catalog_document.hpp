#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace product_sync {

/// Rewrite the JSON text @p original (// and /* */ comments allowed) so that
/// it parses to @p updated.
///
/// Only changed values, removed members and added members are touched.
/// Comments, blank lines and indentation everywhere else come through
/// byte-for-byte.  Added members are laid out like their last sibling.
/// An object whose members are all replaced is re-rendered as a whole.
/// @throws std::invalid_argument if @p updated is not an object.
/// @throws std::runtime_error if @p original is not a JSON object document.
std::string patchJsonText(const std::string& original,
                          const nlohmann::ordered_json& updated);

} // namespace product_sync
