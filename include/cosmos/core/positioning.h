#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cosmos/core/entities.h"

namespace cosmos {

// Tunables for the radial placement pipeline.
//
// Distances are in surface pixels, angles in degrees.
struct PositioningConfig {
  // Ring radius for a perfect (100) and a zero score.
  double min_radius{60.0};
  double max_radius{260.0};

  // Stage 1 scans this many equally spaced angles, rotated by a seed
  // derived from the company id: (id * seed_multiplier) mod 360.
  int angle_slots{24};
  int seed_multiplier{7};

  // Two points conflict only when BOTH separations are below these.
  double min_angle_separation_deg{15.0};
  double min_distance_separation{20.0};

  // Stage 2 tries target +/- k * ring_step for k = 1..ring_expansion_steps.
  double ring_step{20.0};
  int ring_expansion_steps{3};

  // If the target ring is at least this far out, stage 2 keeps stepping
  // outward (only) until the offset exceeds outward_extension_limit.
  double outward_extension_min_target{180.0};
  double outward_extension_limit{200.0};

  // Stage 3: occupants whose placement is further than this from their own
  // ideal ring are eviction candidates; at most relocation_max_candidates
  // of them are considered, worst first.
  double relocation_min_error{30.0};
  int relocation_max_candidates{2};

  // Stage 4 clearance beyond the outermost occupant. Raised to
  // min_distance_separation if configured lower.
  double fallback_margin{40.0};

  // A multi-company relocation must reduce the summed positioning error of
  // the evicted companies by more than this to be applied.
  double improvement_threshold{20.0};
};

enum class PlacementStage { Direct, NearTarget, SmartRelocation, Fallback };

const char* placement_stage_to_string(PlacementStage s);

// A company moved by a positioning solution, with the placement it had in the
// destination view before the move (nullopt for a newly placed company).
struct RelocatedCompany {
  Company company;
  std::optional<Placement> previous;
};

struct PositioningSolution {
  PlacementStage stage{PlacementStage::Direct};
  ViewMode view{ViewMode::Explore};

  // The placed company, with its placement for the destination view set.
  Company new_company;
  Placement placement;

  // Every company whose destination-view placement changes: the placed
  // company first, then any evicted companies.
  std::vector<RelocatedCompany> relocated;

  // Occupants left untouched.
  std::vector<Company> stable;

  std::string reason;
};

// Monotonic score -> ring radius mapping. Higher score => smaller radius.
double score_to_distance(double match_score, const PositioningConfig& cfg = {});

// Wraps into [0, 360).
double normalize_angle(double deg);

// Shortest wrap-around separation in [0, 180].
double angular_separation(double a_deg, double b_deg);

bool placements_conflict(const Placement& a, const Placement& b, const PositioningConfig& cfg = {});

// True if p conflicts with the destination-view placement of any occupant
// other than `self_id`. Occupants without a placement in `view` are ignored.
bool conflicts_with_any(const Placement& p, const std::vector<Company>& occupants, ViewMode view,
                        const PositioningConfig& cfg = {}, Id self_id = kInvalidId);

// Stage 1 scan order for a company id.
std::vector<double> candidate_angles(Id company_id, const PositioningConfig& cfg = {});

// Stage 1: first conflict-free angle at exactly `distance`.
std::optional<Placement> try_direct_placement(const Company& company, double distance,
                                              const std::vector<Company>& occupants, ViewMode view,
                                              const PositioningConfig& cfg = {});

// Stage 2: stage 1 on rings near `target_distance`.
std::optional<Placement> try_near_target_placement(const Company& company, double target_distance,
                                                   const std::vector<Company>& occupants, ViewMode view,
                                                   const PositioningConfig& cfg = {});

// Stage 3: evict one badly placed occupant to make room.
std::optional<PositioningSolution> try_smart_relocation(const Company& company, double target_distance,
                                                        const std::vector<Company>& occupants, ViewMode view,
                                                        const PositioningConfig& cfg = {});

// Stage 4: always succeeds and never conflicts.
Placement fallback_placement(const Company& company, double target_distance,
                             const std::vector<Company>& occupants, ViewMode view,
                             const PositioningConfig& cfg = {});

// Runs stages 1-4 in order and returns the first success.
//
// `occupants` are the companies currently visible in `view`; an occupant with
// the same id as `company` is ignored.
PositioningSolution find_positioning_solution(const Company& company, const std::vector<Company>& occupants,
                                              ViewMode view, const PositioningConfig& cfg = {});

// Single-company solutions are always beneficial. A relocation is beneficial
// when the evicted companies' summed |distance - ideal| drops by more than
// cfg.improvement_threshold.
bool is_solution_beneficial(const PositioningSolution& solution, const PositioningConfig& cfg = {});

// find_positioning_solution(), but a relocation that is not beneficial is
// replaced by the stage 4 placement, which moves nobody else.
PositioningSolution resolve_placement(const Company& company, const std::vector<Company>& occupants,
                                      ViewMode view, const PositioningConfig& cfg = {});

} // namespace cosmos
