#include "cosmos/core/serialization.h"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>

namespace cosmos {
namespace {

using json::Array;
using json::Object;
using json::Value;

constexpr int kCurrentSnapshotVersion = 2;

// Returns the first key present; snapshots from the web client used camelCase.
const Value* find_any(const Value& o, std::initializer_list<const char*> keys) {
  for (const char* k : keys) {
    if (const Value* v = o.find(k)) return v;
  }
  return nullptr;
}

std::string string_field(const Value& o, std::initializer_list<const char*> keys) {
  const Value* v = find_any(o, keys);
  return v ? v->string_value() : std::string();
}

Array id_array(const std::vector<Id>& ids) {
  Array a;
  a.reserve(ids.size());
  for (Id id : ids) a.push_back(static_cast<double>(id));
  return a;
}

std::vector<Id> ids_from_json(const Value* v) {
  std::vector<Id> out;
  if (!v || !v->is_array()) return out;
  for (const auto& e : v->array()) {
    if (e.is_number()) out.push_back(static_cast<Id>(e.int_value()));
  }
  return out;
}

Array string_array(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.push_back(s);
  return a;
}

std::vector<std::string> strings_from_json(const Value* v) {
  std::vector<std::string> out;
  if (!v || !v->is_array()) return out;
  for (const auto& e : v->array()) {
    if (e.is_string()) out.push_back(e.string_value());
  }
  return out;
}

Value placement_to_json(const Placement& p) {
  Object o;
  o["angle"] = p.angle;
  o["distance"] = p.distance;
  return o;
}

std::optional<Placement> placement_from_json(const Value* v) {
  if (!v || !v->is_object()) return std::nullopt;
  const Value* a = v->find("angle");
  const Value* d = v->find("distance");
  if (!a || !d || !a->is_number() || !d->is_number()) return std::nullopt;
  return Placement{a->number_value(), d->number_value()};
}

std::vector<Company> companies_from_json(const Value* v) {
  std::vector<Company> out;
  if (!v) return out;
  for (const auto& cv : v->array()) out.push_back(company_from_json(cv));
  return out;
}

Array companies_to_json(const std::vector<Company>& companies) {
  Array a;
  a.reserve(companies.size());
  for (const auto& c : companies) a.push_back(company_to_json(c));
  return a;
}

} // namespace

SavePayload make_save_payload(const ExplorationState& state) {
  SavePayload p;
  p.user_id = state.id;
  p.profile = state.profile;
  p.companies.reserve(state.base_companies.size() + state.added_companies.size());
  p.companies.insert(p.companies.end(), state.base_companies.begin(), state.base_companies.end());
  p.companies.insert(p.companies.end(), state.added_companies.begin(), state.added_companies.end());
  p.preferences.watchlist_company_ids = state.watchlist_company_ids;
  p.preferences.removed_company_ids = state.removed_company_ids;
  p.preferences.view_mode = state.view_mode;
  return p;
}

Value company_to_json(const Company& c) {
  Object o;
  o["id"] = static_cast<double>(c.id);
  o["name"] = c.name;
  o["match_score"] = c.match_score;
  if (c.explore_position) o["explore_position"] = placement_to_json(*c.explore_position);
  if (c.watchlist_position) o["watchlist_position"] = placement_to_json(*c.watchlist_position);

  o["logo"] = c.logo;
  o["career_url"] = c.career_url;
  o["industry"] = c.industry;
  o["stage"] = c.stage;
  o["location"] = c.location;
  o["employees"] = c.employees;
  o["remote"] = c.remote;
  o["open_roles"] = static_cast<double>(c.open_roles);
  o["connections"] = id_array(c.connections);

  // Object keys must be strings; connection ids are written in decimal.
  Object types;
  for (const auto& [id, kind] : c.connection_types) types[std::to_string(id)] = kind;
  o["connection_types"] = types;

  o["match_reasons"] = string_array(c.match_reasons);
  o["color"] = c.color;

  Object links;
  if (!c.external_links.website.empty()) links["website"] = c.external_links.website;
  if (!c.external_links.linkedin.empty()) links["linkedin"] = c.external_links.linkedin;
  if (!c.external_links.glassdoor.empty()) links["glassdoor"] = c.external_links.glassdoor;
  if (!c.external_links.crunchbase.empty()) links["crunchbase"] = c.external_links.crunchbase;
  if (!links.empty()) o["external_links"] = links;
  return o;
}

Company company_from_json(const Value& v) {
  if (!v.is_object()) throw std::runtime_error("company entry is not an object");

  Company c;
  c.id = static_cast<Id>(v.at("id").int_value());
  c.name = string_field(v, {"name"});
  if (const Value* s = find_any(v, {"match_score", "matchScore"})) c.match_score = s->number_value();

  c.explore_position = placement_from_json(find_any(v, {"explore_position", "explorePosition"}));
  c.watchlist_position = placement_from_json(find_any(v, {"watchlist_position", "watchlistPosition"}));

  c.logo = string_field(v, {"logo"});
  c.career_url = string_field(v, {"career_url", "careerUrl"});
  c.industry = string_field(v, {"industry"});
  c.stage = string_field(v, {"stage"});
  c.location = string_field(v, {"location"});
  c.employees = string_field(v, {"employees"});
  c.remote = string_field(v, {"remote"});
  if (const Value* r = find_any(v, {"open_roles", "openRoles"})) c.open_roles = static_cast<int>(r->int_value());
  c.connections = ids_from_json(v.find("connections"));

  if (const Value* t = find_any(v, {"connection_types", "connectionTypes"}); t && t->is_object()) {
    for (const auto& [k, kind] : t->object()) {
      try {
        c.connection_types[static_cast<Id>(std::stoll(k))] = kind.string_value();
      } catch (const std::exception&) {
        throw std::runtime_error("company " + std::to_string(c.id) + ": bad connection id '" + k + "'");
      }
    }
  }

  c.match_reasons = strings_from_json(find_any(v, {"match_reasons", "matchReasons"}));
  c.color = string_field(v, {"color"});

  if (const Value* l = find_any(v, {"external_links", "externalLinks"}); l && l->is_object()) {
    c.external_links.website = string_field(*l, {"website"});
    c.external_links.linkedin = string_field(*l, {"linkedin"});
    c.external_links.glassdoor = string_field(*l, {"glassdoor"});
    c.external_links.crunchbase = string_field(*l, {"crunchbase"});
  }
  return c;
}

Value profile_to_json(const UserProfile& p) {
  Object o;
  o["id"] = p.id;
  o["name"] = p.name;
  o["must_haves"] = string_array(p.must_haves);
  o["want_to_have"] = string_array(p.want_to_have);
  o["experience"] = string_array(p.experience);
  o["target_role"] = p.target_role;
  o["target_companies"] = p.target_companies;
  return o;
}

UserProfile profile_from_json(const Value& v) {
  UserProfile p;
  if (!v.is_object()) return p;
  p.id = string_field(v, {"id"});
  p.name = string_field(v, {"name"});
  p.must_haves = strings_from_json(find_any(v, {"must_haves", "mustHaves"}));
  p.want_to_have = strings_from_json(find_any(v, {"want_to_have", "wantToHave"}));
  p.experience = strings_from_json(v.find("experience"));
  p.target_role = string_field(v, {"target_role", "targetRole"});
  p.target_companies = string_field(v, {"target_companies", "targetCompanies"});
  return p;
}

Value preferences_to_json(const SavePreferences& p) {
  Object o;
  o["watchlist_company_ids"] = id_array(p.watchlist_company_ids);
  o["removed_company_ids"] = id_array(p.removed_company_ids);
  o["view_mode"] = std::string(view_mode_to_string(p.view_mode));
  return o;
}

Value serialize_state_to_json_value(const ExplorationState& s) {
  Object root;
  root["snapshot_version"] = static_cast<double>(kCurrentSnapshotVersion);
  root["id"] = s.id;
  root["name"] = s.name;
  root["profile"] = profile_to_json(s.profile);
  root["base_companies"] = companies_to_json(s.base_companies);
  root["added_companies"] = companies_to_json(s.added_companies);
  root["removed_company_ids"] = id_array(s.removed_company_ids);
  root["watchlist_company_ids"] = id_array(s.watchlist_company_ids);
  root["view_mode"] = std::string(view_mode_to_string(s.view_mode));
  if (s.last_selected_company_id) {
    root["last_selected_company_id"] = static_cast<double>(*s.last_selected_company_id);
  }
  root["next_company_id"] = static_cast<double>(s.next_company_id);
  return root;
}

std::string serialize_state_to_json(const ExplorationState& state, int indent) {
  return json::stringify(serialize_state_to_json_value(state), indent);
}

ExplorationState deserialize_state_from_json_value(const Value& root) {
  if (!root.is_object()) throw std::runtime_error("exploration snapshot is not a JSON object");

  ExplorationState s;
  s.id = string_field(root, {"id"});
  s.name = string_field(root, {"name"});
  if (const Value* p = find_any(root, {"profile", "cmf"})) s.profile = profile_from_json(*p);

  const Value* base = find_any(root, {"base_companies", "baseCompanies"});
  if (!base) throw std::runtime_error("exploration snapshot missing key: base_companies");
  s.base_companies = companies_from_json(base);
  s.added_companies = companies_from_json(find_any(root, {"added_companies", "addedCompanies"}));

  s.removed_company_ids = ids_from_json(find_any(root, {"removed_company_ids", "removedCompanyIds"}));
  s.watchlist_company_ids = ids_from_json(find_any(root, {"watchlist_company_ids", "watchlistCompanyIds"}));

  s.view_mode = ViewMode::Explore;
  if (const Value* vm = find_any(root, {"view_mode", "viewMode"})) {
    ViewMode parsed = ViewMode::Explore;
    if (parse_view_mode(vm->string_value(), parsed)) s.view_mode = parsed;
  }

  if (const Value* sel = find_any(root, {"last_selected_company_id", "lastSelectedCompanyId"});
      sel && sel->is_number()) {
    s.last_selected_company_id = static_cast<Id>(sel->int_value());
  }

  // Snapshots without a high-water mark get one derived from the ids present.
  s.next_company_id = max_company_id(s) + 1;
  if (const Value* next = root.find("next_company_id"); next && next->is_number()) {
    s.next_company_id = std::max(s.next_company_id, static_cast<Id>(next->int_value()));
  }
  return s;
}

ExplorationState deserialize_state_from_json(const std::string& json_text) {
  return deserialize_state_from_json_value(json::parse(json_text));
}

std::string serialize_save_payload_to_json(const SavePayload& payload, int indent) {
  Object root;
  root["user_id"] = payload.user_id;
  root["user_profile"] = profile_to_json(payload.profile);
  root["companies"] = companies_to_json(payload.companies);
  root["preferences"] = preferences_to_json(payload.preferences);
  return json::stringify(root, indent);
}

} // namespace cosmos
