#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "cosmos/core/positioning.h"

#define COSMOS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using cosmos::Company;
using cosmos::Id;
using cosmos::Placement;
using cosmos::ViewMode;

// Score whose ideal ring is `distance` under the default radii.
double score_for_ring(double distance) { return 100.0 - (distance - 60.0) / 2.0; }

Company placed(Id id, double score, double angle, double distance) {
  Company c;
  c.id = id;
  c.name = "c" + std::to_string(id);
  c.match_score = score;
  c.explore_position = Placement{angle, distance};
  return c;
}

Company unplaced(Id id, double score) {
  Company c;
  c.id = id;
  c.name = "new" + std::to_string(id);
  c.match_score = score;
  return c;
}

// 24 occupants, one on every 15 degree slot of the ring.
void saturate_ring(std::vector<Company>& out, Id& next_id, double distance) {
  for (int i = 0; i < 24; ++i) {
    out.push_back(placed(next_id++, score_for_ring(distance), 15.0 * i, distance));
  }
}

bool any_conflict(const std::vector<Company>& companies) {
  for (std::size_t i = 0; i < companies.size(); ++i) {
    for (std::size_t j = i + 1; j < companies.size(); ++j) {
      const auto& a = companies[i].explore_position;
      const auto& b = companies[j].explore_position;
      if (a && b && cosmos::placements_conflict(*a, *b)) return true;
    }
  }
  return false;
}

void apply(std::vector<Company>& occupants, const cosmos::PositioningSolution& sol) {
  for (const auto& r : sol.relocated) {
    bool found = false;
    for (auto& o : occupants) {
      if (o.id == r.company.id) {
        o = r.company;
        found = true;
      }
    }
    if (!found) occupants.push_back(r.company);
  }
}

} // namespace

int test_positioning() {
  using namespace cosmos;

  // Score to ring mapping is monotonic and clamped.
  {
    COSMOS_ASSERT(score_to_distance(100.0) == 60.0);
    COSMOS_ASSERT(score_to_distance(0.0) == 260.0);
    COSMOS_ASSERT(score_to_distance(50.0) == 160.0);
    COSMOS_ASSERT(score_to_distance(150.0) == 60.0);
    COSMOS_ASSERT(score_to_distance(-5.0) == 260.0);
    COSMOS_ASSERT(score_to_distance(90.0) < score_to_distance(80.0));
  }

  // Angles wrap and the conflict rule needs both separations to be small.
  {
    COSMOS_ASSERT(normalize_angle(-15.0) == 345.0);
    COSMOS_ASSERT(normalize_angle(720.0) == 0.0);
    COSMOS_ASSERT(angular_separation(355.0, 5.0) == 10.0);
    COSMOS_ASSERT(placements_conflict({355.0, 100.0}, {5.0, 110.0}));
    COSMOS_ASSERT(!placements_conflict({355.0, 100.0}, {5.0, 120.0}));
    COSMOS_ASSERT(!placements_conflict({0.0, 100.0}, {15.0, 100.0}));
  }

  // Candidate angles start at the id-derived seed.
  {
    const auto angles = candidate_angles(1001);
    COSMOS_ASSERT(angles.size() == 24);
    COSMOS_ASSERT(angles[0] == 167.0);
    COSMOS_ASSERT(angles[1] == 182.0);
    COSMOS_ASSERT(candidate_angles(1001) == angles);

    // Ids at the top of the range reduce before multiplying.
    const Id huge = std::numeric_limits<Id>::max();
    COSMOS_ASSERT(candidate_angles(huge)[0] == 49.0);
    PositioningConfig wide;
    wide.seed_multiplier = std::numeric_limits<int>::max();
    COSMOS_ASSERT(candidate_angles(huge, wide)[0] == 169.0);
  }

  // Two companies on the same ring: the second gets another angle directly.
  {
    std::vector<Company> occupants;
    const auto first = find_positioning_solution(unplaced(1001, 50.0), occupants, ViewMode::Explore);
    COSMOS_ASSERT(first.stage == PlacementStage::Direct);
    COSMOS_ASSERT(first.placement.angle == 167.0);
    COSMOS_ASSERT(first.placement.distance == 160.0);
    apply(occupants, first);

    const auto second = find_positioning_solution(unplaced(1002, 50.0), occupants, ViewMode::Explore);
    COSMOS_ASSERT(second.stage == PlacementStage::Direct);
    COSMOS_ASSERT(second.placement.distance == 160.0);
    COSMOS_ASSERT(second.placement.angle == 189.0);
    COSMOS_ASSERT(second.relocated.size() == 1);
    COSMOS_ASSERT(second.new_company.explore_position == second.placement);
    COSMOS_ASSERT(!second.new_company.watchlist_position);
  }

  // Saturated target ring: the next company moves to the adjacent ring.
  {
    std::vector<Company> occupants;
    Id next = 1;
    saturate_ring(occupants, next, 160.0);
    const auto sol = find_positioning_solution(unplaced(100, 50.0), occupants, ViewMode::Explore);
    COSMOS_ASSERT(sol.stage == PlacementStage::NearTarget);
    COSMOS_ASSERT(sol.placement.distance == 180.0);
    COSMOS_ASSERT(sol.relocated.size() == 1);
    COSMOS_ASSERT(!conflicts_with_any(sol.placement, occupants, ViewMode::Explore));
  }

  // Far rings keep stepping outward past the regular window.
  {
    std::vector<Company> occupants;
    Id next = 1;
    for (double d : {200.0, 220.0, 180.0, 240.0, 160.0, 260.0, 140.0}) saturate_ring(occupants, next, d);
    const auto sol = find_positioning_solution(unplaced(500, score_for_ring(200.0)), occupants, ViewMode::Explore);
    COSMOS_ASSERT(sol.stage == PlacementStage::NearTarget);
    COSMOS_ASSERT(sol.placement.distance == 280.0);
  }

  // Near rings do not, and with nobody misplaced the fallback takes over.
  {
    std::vector<Company> occupants;
    Id next = 1;
    for (double d : {160.0, 180.0, 140.0, 200.0, 120.0, 220.0, 100.0}) saturate_ring(occupants, next, d);
    const auto sol = find_positioning_solution(unplaced(500, 50.0), occupants, ViewMode::Explore);
    COSMOS_ASSERT(sol.stage == PlacementStage::Fallback);
    COSMOS_ASSERT(sol.placement.distance == 260.0);
    COSMOS_ASSERT(sol.placement.angle == 45.0);
    COSMOS_ASSERT(!conflicts_with_any(sol.placement, occupants, ViewMode::Explore));
  }

  // Smart relocation evicts a badly placed occupant to its own ideal ring.
  {
    PositioningConfig cfg;
    cfg.ring_expansion_steps = 0;

    std::vector<Company> occupants;
    Id next = 101;
    saturate_ring(occupants, next, 160.0);
    // #106 sits at 75 degrees on the 160 ring but belongs on the 80 ring.
    occupants[5].match_score = 90.0;

    // Id 15 scans multiples of 15 degrees, so only the freed slot fits.
    const auto sol = find_positioning_solution(unplaced(15, 50.0), occupants, ViewMode::Explore, cfg);
    COSMOS_ASSERT(sol.stage == PlacementStage::SmartRelocation);
    COSMOS_ASSERT(sol.placement.angle == 75.0);
    COSMOS_ASSERT(sol.placement.distance == 160.0);
    COSMOS_ASSERT(sol.relocated.size() == 2);
    COSMOS_ASSERT(sol.relocated[0].company.id == 15);
    COSMOS_ASSERT(sol.relocated[1].company.id == 106);
    COSMOS_ASSERT(sol.relocated[1].previous == (Placement{75.0, 160.0}));
    COSMOS_ASSERT(sol.relocated[1].company.explore_position->distance == score_to_distance(90.0));
    COSMOS_ASSERT(sol.stable.size() == 23);
    COSMOS_ASSERT(is_solution_beneficial(sol, cfg));

    std::vector<Company> after = occupants;
    apply(after, sol);
    COSMOS_ASSERT(after.size() == 25);
    COSMOS_ASSERT(!any_conflict(after));

    const auto resolved = resolve_placement(unplaced(15, 50.0), occupants, ViewMode::Explore, cfg);
    COSMOS_ASSERT(resolved.stage == PlacementStage::SmartRelocation);

    // Demand more improvement than the eviction offers: the fallback wins
    // and nobody else moves.
    cfg.improvement_threshold = 100.0;
    COSMOS_ASSERT(!is_solution_beneficial(sol, cfg));
    const auto fb = resolve_placement(unplaced(15, 50.0), occupants, ViewMode::Explore, cfg);
    COSMOS_ASSERT(fb.stage == PlacementStage::Fallback);
    COSMOS_ASSERT(fb.relocated.size() == 1);
    COSMOS_ASSERT(fb.placement.distance == 200.0);
    COSMOS_ASSERT(!conflicts_with_any(fb.placement, occupants, ViewMode::Explore, cfg));
  }

  // Views are independent: a watchlist placement ignores explore occupants.
  {
    std::vector<Company> occupants;
    occupants.push_back(placed(1, 50.0, 167.0, 160.0));
    const auto sol = find_positioning_solution(unplaced(1001, 50.0), occupants, ViewMode::Watchlist);
    COSMOS_ASSERT(sol.stage == PlacementStage::Direct);
    COSMOS_ASSERT(sol.placement.angle == 167.0);
    COSMOS_ASSERT(sol.new_company.watchlist_position == sol.placement);
    COSMOS_ASSERT(!sol.new_company.explore_position);
  }

  // Hundreds of companies all terminate and never collide.
  {
    std::vector<Company> occupants;
    for (Id id = 1; id <= 400; ++id) {
      const double score = static_cast<double>((id * 37) % 101);
      const auto sol = resolve_placement(unplaced(id, score), occupants, ViewMode::Explore);
      apply(occupants, sol);
    }
    COSMOS_ASSERT(occupants.size() == 400);
    COSMOS_ASSERT(!any_conflict(occupants));
  }

  // Same score for everyone: the densest case.
  {
    std::vector<Company> occupants;
    for (Id id = 1; id <= 300; ++id) ::apply(occupants, resolve_placement(unplaced(id, 75.0), occupants, ViewMode::Explore));
    COSMOS_ASSERT(occupants.size() == 300);
    COSMOS_ASSERT(!any_conflict(occupants));
  }

  return 0;
}
