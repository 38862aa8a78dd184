#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cosmos {

using Id = std::int64_t;
constexpr Id kInvalidId = 0;

enum class ViewMode : std::uint8_t { Explore = 0, Watchlist = 1 };

// A point on the exploration surface in polar form.
//
// angle is in degrees [0, 360); distance is the radius from the center.
// Smaller distances mean better matches.
struct Placement {
  double angle{0.0};
  double distance{0.0};

  bool operator==(const Placement& rhs) const { return angle == rhs.angle && distance == rhs.distance; }
  bool operator!=(const Placement& rhs) const { return !(*this == rhs); }
};

struct ExternalLinks {
  std::string website;
  std::string linkedin;
  std::string glassdoor;
  std::string crunchbase;

  bool operator==(const ExternalLinks&) const = default;
};

struct Company {
  Id id{kInvalidId};
  std::string name;

  // 0..100. Drives the target ring distance.
  double match_score{0.0};

  // Independent per-view placements. Moving a company between views never
  // touches the placement it had in the view it left.
  std::optional<Placement> explore_position;
  std::optional<Placement> watchlist_position;

  // Descriptive fields. The core carries them around but never interprets them
  // beyond open_roles (watchlist stats).
  std::string logo;
  std::string career_url;
  std::string industry;
  std::string stage;
  std::string location;
  std::string employees;
  std::string remote;
  int open_roles{0};
  std::vector<Id> connections;
  std::unordered_map<Id, std::string> connection_types;
  std::vector<std::string> match_reasons;
  std::string color;
  ExternalLinks external_links;

  bool operator==(const Company&) const = default;
};

// The user's "candidate market fit" profile. Opaque to the core; it travels
// with every remote save.
struct UserProfile {
  std::string id;
  std::string name;
  std::vector<std::string> must_haves;
  std::vector<std::string> want_to_have;
  std::vector<std::string> experience;
  std::string target_role;
  std::string target_companies;

  bool operator==(const UserProfile&) const = default;
};

struct WatchlistStats {
  int total_companies{0};
  int excellent_matches{0};
  int total_open_roles{0};
};

struct ExplorationStats {
  int total{0};
  int base{0};
  int added{0};
  int removed{0};
  int watchlisted{0};
  ViewMode view_mode{ViewMode::Explore};
};

// Score at or above which a watchlisted company counts as an excellent match.
constexpr double kExcellentMatchScore = 90.0;

inline const std::optional<Placement>& placement_in(const Company& c, ViewMode view) {
  return view == ViewMode::Watchlist ? c.watchlist_position : c.explore_position;
}

inline std::optional<Placement>& placement_in(Company& c, ViewMode view) {
  return view == ViewMode::Watchlist ? c.watchlist_position : c.explore_position;
}

const char* view_mode_to_string(ViewMode v);

// Accepts "explore" / "watchlist" (case-insensitive). Returns false otherwise.
bool parse_view_mode(const std::string& raw, ViewMode& out);

} // namespace cosmos
