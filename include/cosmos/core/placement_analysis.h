#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cosmos/core/entities.h"
#include "cosmos/core/positioning.h"

namespace cosmos {

struct PlacementAnalysisOptions {
  // A company further than this from its ideal ring should be re-placed.
  double reposition_threshold{25.0};

  // Cartesian separation under which two markers visibly overlap.
  double min_visual_distance{50.0};

  // Pairs closer than this in angle are reported even without a conflict.
  double close_angle_deg{10.0};
};

struct CompanyPlacementAnalysis {
  Id company_id{kInvalidId};
  std::string name;
  double target_distance{0.0};
  std::optional<Placement> current;
  // |target - current distance|; an unplaced company counts as distance 0.
  double error{0.0};
  bool should_reposition{false};
};

struct PlacementPairReport {
  Id first{kInvalidId};
  Id second{kInvalidId};
  double angle_difference{0.0};
  double distance_difference{0.0};
  double visual_distance{0.0};

  // Dual-tolerance rule used by the positioning engine.
  bool conflict{false};
  bool visual_overlap{false};
};

struct PlacementAnalysisSummary {
  int total_companies{0};
  int poorly_positioned{0};
  int conflicts{0};
  int visual_overlaps{0};
  double average_error{0.0};
};

struct PlacementAnalysisReport {
  std::vector<CompanyPlacementAnalysis> companies;
  std::vector<PlacementPairReport> pairs;
  PlacementAnalysisSummary summary;
};

// Audits the placements the companies hold in `view`.
PlacementAnalysisReport analyze_placements(const std::vector<Company>& companies, ViewMode view,
                                           const PositioningConfig& cfg = {},
                                           const PlacementAnalysisOptions& opt = {});

// Human-readable multi-line report (used by the CLI).
std::string format_placement_report(const PlacementAnalysisReport& report);

} // namespace cosmos
