#include <iostream>
#include <stdexcept>
#include <string>

#include "cosmos/core/serialization.h"
#include "cosmos/util/json.h"

#define COSMOS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_serialization() {
  using namespace cosmos;

  ExplorationState s;
  s.id = "9d49907c-a057-4f3b-9cfc-a6e2769b44cd";
  s.name = "Dana";
  s.profile.name = "Dana";
  s.profile.must_haves = {"remote", "equity"};
  s.profile.experience = {"8 years backend"};
  s.profile.target_companies = "Series B fintech";

  Company a;
  a.id = 4;
  a.name = "Stripe";
  a.match_score = 91.5;
  a.explore_position = Placement{12.5, 77.00000000000001};
  a.watchlist_position = Placement{300.0, 81.0};
  a.logo = "https://logo.example/stripe.png";
  a.career_url = "https://stripe.com/jobs";
  a.industry = "Payments";
  a.stage = "Late";
  a.location = "SF";
  a.employees = "5000+";
  a.remote = "Hybrid";
  a.open_roles = 14;
  a.connections = {5, 6};
  a.connection_types = {{5, "competitor"}, {6, "partner"}};
  a.match_reasons = {"payments", "scale"};
  a.color = "#00ff88";
  a.external_links.website = "https://stripe.com";
  a.external_links.crunchbase = "https://crunchbase.example/stripe";
  s.base_companies.push_back(a);

  Company b;
  b.id = 1001;
  b.name = "Tiny";
  b.match_score = 40.0;
  s.added_companies.push_back(b);

  s.removed_company_ids = {1001};
  s.watchlist_company_ids = {4};
  s.view_mode = ViewMode::Watchlist;
  s.last_selected_company_id = 4;
  s.next_company_id = 1500;

  // Full round trip.
  {
    const auto loaded = deserialize_state_from_json(serialize_state_to_json(s));
    COSMOS_ASSERT(loaded.id == s.id);
    COSMOS_ASSERT(loaded.name == s.name);
    COSMOS_ASSERT(loaded.profile == s.profile);
    COSMOS_ASSERT(loaded.base_companies == s.base_companies);
    COSMOS_ASSERT(loaded.added_companies == s.added_companies);
    COSMOS_ASSERT(loaded.removed_company_ids == s.removed_company_ids);
    COSMOS_ASSERT(loaded.watchlist_company_ids == s.watchlist_company_ids);
    COSMOS_ASSERT(loaded.view_mode == ViewMode::Watchlist);
    COSMOS_ASSERT(loaded.last_selected_company_id == s.last_selected_company_id);
    COSMOS_ASSERT(loaded.next_company_id == 1500);

    // Compact form carries the same data.
    const auto compact = deserialize_state_from_json(serialize_state_to_json(s, 0));
    COSMOS_ASSERT(compact.base_companies == s.base_companies);
  }

  // Snapshots from the web client use camelCase keys and may lack the
  // high-water mark.
  {
    const std::string text = R"({
      "id": "9d49907c-a057-4f3b-9cfc-a6e2769b44cd",
      "name": "Dana",
      "cmf": {"name": "Dana", "mustHaves": ["remote"], "targetRole": "EM"},
      "baseCompanies": [
        {"id": 3, "name": "A", "matchScore": 80, "openRoles": 2,
         "explorePosition": {"angle": 21, "distance": 100},
         "connectionTypes": {"4": "partner"}, "externalLinks": {"linkedin": "x"}}
      ],
      "addedCompanies": [{"id": 1002, "name": "B", "matchScore": 10}],
      "removedCompanyIds": [],
      "watchlistCompanyIds": [1002],
      "viewMode": "watchlist",
      "lastSelectedCompanyId": 3
    })";
    const auto loaded = deserialize_state_from_json(text);
    COSMOS_ASSERT(loaded.profile.must_haves.size() == 1);
    COSMOS_ASSERT(loaded.profile.target_role == "EM");
    COSMOS_ASSERT(loaded.base_companies.size() == 1);
    COSMOS_ASSERT(loaded.base_companies[0].match_score == 80.0);
    COSMOS_ASSERT(loaded.base_companies[0].open_roles == 2);
    COSMOS_ASSERT(loaded.base_companies[0].explore_position == (Placement{21.0, 100.0}));
    COSMOS_ASSERT(!loaded.base_companies[0].watchlist_position);
    COSMOS_ASSERT(loaded.base_companies[0].connection_types.at(4) == "partner");
    COSMOS_ASSERT(loaded.base_companies[0].external_links.linkedin == "x");
    COSMOS_ASSERT(loaded.watchlist_company_ids.size() == 1);
    COSMOS_ASSERT(loaded.view_mode == ViewMode::Watchlist);
    COSMOS_ASSERT(loaded.last_selected_company_id == 3);
    COSMOS_ASSERT(loaded.next_company_id == 1003);
  }

  // Unknown view modes fall back to explore; missing base companies is fatal.
  {
    const auto loaded = deserialize_state_from_json(R"({"base_companies": [], "view_mode": "grid"})");
    COSMOS_ASSERT(loaded.view_mode == ViewMode::Explore);
    COSMOS_ASSERT(loaded.next_company_id == 1);

    bool threw = false;
    try {
      (void)deserialize_state_from_json(R"({"id": "x"})");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    COSMOS_ASSERT(threw);

    threw = false;
    try {
      (void)deserialize_state_from_json(R"({"base_companies": [{"name": "no id"}]})");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    COSMOS_ASSERT(threw);
  }

  // The remote payload carries every record, tombstoned ones included.
  {
    const SavePayload p = make_save_payload(s);
    COSMOS_ASSERT(p.user_id == s.id);
    COSMOS_ASSERT(p.companies.size() == 2);
    COSMOS_ASSERT(p.preferences.removed_company_ids == s.removed_company_ids);

    const auto v = json::parse(serialize_save_payload_to_json(p));
    COSMOS_ASSERT(v.at("user_id").string_value() == s.id);
    COSMOS_ASSERT(v.at("companies").array().size() == 2);
    COSMOS_ASSERT(v.at("preferences").at("view_mode").string_value() == "watchlist");
    COSMOS_ASSERT(v.at("user_profile").at("target_companies").string_value() == "Series B fintech");
  }

  return 0;
}
