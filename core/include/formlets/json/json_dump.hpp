// formlets/json/json_dump.hpp - JSON views of value trees and render dicts
//
// Used by the command line renderer (--json) and handy when inspecting a
// form in tests. Values are dumped structurally: functions are never forced.
//
#pragma once

#include <any>
#include <nlohmann/json.hpp>

#include "formlets/render/render_dict.hpp"
#include "formlets/value/value.hpp"

namespace formlets
{

/**
 * Serialize a value tree.
 *
 * Plain: {"kind":"plain","origin":...,"payload":...}
 * Function: {"kind":"function","name":...,"arity":...,"args":[...],"reifies":[...]}
 * Error: {"kind":"error","origin":...,"reason":...,"original":{...}}
 */
[[nodiscard]] nlohmann::json to_json(const Value & value);

/// {"empty":bool,"values":{name:raw},"errors":{origin:[reason,...]}}
[[nodiscard]] nlohmann::json to_json(const RenderDict & dict);

/**
 * JSON for a payload of a known type (bool, integers, double, std::string,
 * nlohmann::json). Other payloads become {"type": <type name>}.
 */
[[nodiscard]] nlohmann::json payload_to_json(const std::any & payload);

}  // namespace formlets
