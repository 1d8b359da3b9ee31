// formlets/json/json_dump.cpp - JSON serialization implementation
//
#include "formlets/json/json_dump.hpp"

#include <cstdint>
#include <string>

#include "formlets/value/value_visitor.hpp"

namespace formlets
{
namespace
{

using nlohmann::json;

json j_origin(const Origin & origin)
{
  if (!origin) return nullptr;
  return *origin;
}

class JsonDumper : public ValueVisitor<JsonDumper, json>
{
public:
  json visit_plain(const PlainValue * v)
  {
    return json{
      {"kind", "plain"}, {"origin", j_origin(v->origin())}, {"payload", payload_to_json(v->payload())}};
  }

  json visit_function(const FunctionValue * v)
  {
    json args = json::array();
    for (const auto & arg : v->args()) {
      args.push_back(visit(arg.get()));
    }
    json reifies = json::array();
    for (const auto & filter : v->filters()) {
      reifies.push_back(filter.kind_name);
    }
    return json{
      {"kind", "function"},
      {"name", v->name()},
      {"origin", j_origin(v->origin())},
      {"arity", v->arity()},
      {"args", args},
      {"reifies", reifies}};
  }

  json visit_error(const ErrorValue * v)
  {
    return json{
      {"kind", "error"},
      {"origin", j_origin(v->origin())},
      {"reason", v->reason()},
      {"original", visit(v->original_value().get())}};
  }
};

}  // namespace

json payload_to_json(const std::any & payload)
{
  if (!payload.has_value()) return nullptr;
  if (const auto * b = std::any_cast<bool>(&payload)) return *b;
  if (const auto * i = std::any_cast<int64_t>(&payload)) return *i;
  if (const auto * i = std::any_cast<int>(&payload)) return *i;
  if (const auto * u = std::any_cast<uint64_t>(&payload)) return *u;
  if (const auto * d = std::any_cast<double>(&payload)) return *d;
  if (const auto * s = std::any_cast<std::string>(&payload)) return *s;
  if (const auto * j = std::any_cast<json>(&payload)) return *j;
  return json{{"type", payload.type().name()}};
}

json to_json(const Value & value)
{
  JsonDumper dumper;
  return dumper.visit(&value);
}

json to_json(const RenderDict & dict)
{
  json values = json::object();
  for (const auto & [name, raw] : dict.values()) {
    values[name] = raw;
  }
  json errors = json::object();
  for (const auto & [origin, reasons] : dict.all_errors()) {
    errors[origin] = reasons;
  }
  return json{{"empty", dict.is_empty()}, {"values", values}, {"errors", errors}};
}

}  // namespace formlets
