#include "cosmos/core/config.h"

#include <stdexcept>
#include <utility>

#include "cosmos/util/log.h"

namespace cosmos {
namespace {

void read_number(const json::Value& o, const char* key, double& out) {
  const json::Value* v = o.find(key);
  if (!v) return;
  if (!v->is_number()) {
    log::warn(std::string("config: '") + key + "' is not a number; keeping default");
    return;
  }
  out = v->number_value();
}

void read_int(const json::Value& o, const char* key, int& out) {
  double d = static_cast<double>(out);
  read_number(o, key, d);
  out = static_cast<int>(d);
}

PositioningConfig positioning_from_json(const json::Value& o) {
  PositioningConfig c;
  if (!o.is_object()) {
    log::warn("config: 'positioning' is not an object; keeping defaults");
    return c;
  }
  read_number(o, "min_radius", c.min_radius);
  read_number(o, "max_radius", c.max_radius);
  read_int(o, "angle_slots", c.angle_slots);
  read_int(o, "seed_multiplier", c.seed_multiplier);
  read_number(o, "min_angle_separation_deg", c.min_angle_separation_deg);
  read_number(o, "min_distance_separation", c.min_distance_separation);
  read_number(o, "ring_step", c.ring_step);
  read_int(o, "ring_expansion_steps", c.ring_expansion_steps);
  read_number(o, "outward_extension_min_target", c.outward_extension_min_target);
  read_number(o, "outward_extension_limit", c.outward_extension_limit);
  read_number(o, "relocation_min_error", c.relocation_min_error);
  read_int(o, "relocation_max_candidates", c.relocation_max_candidates);
  read_number(o, "fallback_margin", c.fallback_margin);
  read_number(o, "improvement_threshold", c.improvement_threshold);

  if (c.max_radius < c.min_radius) {
    log::warn("config: max_radius < min_radius; swapping");
    std::swap(c.min_radius, c.max_radius);
  }
  if (c.angle_slots < 1) c.angle_slots = 1;
  if (c.ring_step <= 0.0) c.ring_step = PositioningConfig{}.ring_step;
  return c;
}

} // namespace

ManagerConfig manager_config_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("manager config must be a JSON object");

  ManagerConfig cfg;
  if (const json::Value* floor = v.find("min_added_company_id")) {
    if (floor->is_number()) {
      cfg.min_added_company_id = static_cast<Id>(floor->int_value());
    } else {
      log::warn("config: 'min_added_company_id' is not a number; keeping default");
    }
  }
  if (const json::Value* key = v.find("cache_key")) {
    if (key->is_string() && !key->string_value().empty()) {
      cfg.cache_key = key->string_value();
    } else {
      log::warn("config: 'cache_key' must be a non-empty string; keeping default");
    }
  }
  if (const json::Value* place = v.find("place_missing_on_load")) {
    if (place->is_bool()) {
      cfg.place_missing_on_load = place->bool_value();
    } else {
      log::warn("config: 'place_missing_on_load' is not a boolean; keeping default");
    }
  }
  if (const json::Value* pos = v.find("positioning")) cfg.positioning = positioning_from_json(*pos);
  return cfg;
}

ManagerConfig load_manager_config_from_json(const std::string& json_text) {
  return manager_config_from_json(json::parse(json_text));
}

json::Value manager_config_to_json(const ManagerConfig& cfg) {
  const PositioningConfig& p = cfg.positioning;
  json::Object pos;
  pos["min_radius"] = p.min_radius;
  pos["max_radius"] = p.max_radius;
  pos["angle_slots"] = static_cast<double>(p.angle_slots);
  pos["seed_multiplier"] = static_cast<double>(p.seed_multiplier);
  pos["min_angle_separation_deg"] = p.min_angle_separation_deg;
  pos["min_distance_separation"] = p.min_distance_separation;
  pos["ring_step"] = p.ring_step;
  pos["ring_expansion_steps"] = static_cast<double>(p.ring_expansion_steps);
  pos["outward_extension_min_target"] = p.outward_extension_min_target;
  pos["outward_extension_limit"] = p.outward_extension_limit;
  pos["relocation_min_error"] = p.relocation_min_error;
  pos["relocation_max_candidates"] = static_cast<double>(p.relocation_max_candidates);
  pos["fallback_margin"] = p.fallback_margin;
  pos["improvement_threshold"] = p.improvement_threshold;

  json::Object root;
  root["min_added_company_id"] = static_cast<double>(cfg.min_added_company_id);
  root["cache_key"] = cfg.cache_key;
  root["place_missing_on_load"] = cfg.place_missing_on_load;
  root["positioning"] = pos;
  return root;
}

} // namespace cosmos
