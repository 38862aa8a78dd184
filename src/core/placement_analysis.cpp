#include "cosmos/core/placement_analysis.h"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "cosmos/core/vec2.h"

namespace cosmos {

PlacementAnalysisReport analyze_placements(const std::vector<Company>& companies, ViewMode view,
                                           const PositioningConfig& cfg, const PlacementAnalysisOptions& opt) {
  PlacementAnalysisReport out;
  out.companies.reserve(companies.size());

  double error_sum = 0.0;
  for (const auto& c : companies) {
    CompanyPlacementAnalysis a;
    a.company_id = c.id;
    a.name = c.name;
    a.target_distance = score_to_distance(c.match_score, cfg);
    a.current = placement_in(c, view);
    const double current_distance = a.current ? a.current->distance : 0.0;
    a.error = std::fabs(a.target_distance - current_distance);
    a.should_reposition = a.error > opt.reposition_threshold;

    error_sum += a.error;
    if (a.should_reposition) ++out.summary.poorly_positioned;
    out.companies.push_back(std::move(a));
  }

  for (std::size_t i = 0; i < companies.size(); ++i) {
    const auto& pi = placement_in(companies[i], view);
    if (!pi) continue;
    for (std::size_t j = i + 1; j < companies.size(); ++j) {
      const auto& pj = placement_in(companies[j], view);
      if (!pj) continue;

      PlacementPairReport r;
      r.first = companies[i].id;
      r.second = companies[j].id;
      r.angle_difference = angular_separation(pi->angle, pj->angle);
      r.distance_difference = std::fabs(pi->distance - pj->distance);
      const Vec2 a = Vec2::from_polar_deg(pi->angle, pi->distance);
      const Vec2 b = Vec2::from_polar_deg(pj->angle, pj->distance);
      r.visual_distance = (a - b).length();
      r.conflict = placements_conflict(*pi, *pj, cfg);
      r.visual_overlap = r.visual_distance < opt.min_visual_distance;

      if (!r.conflict && !r.visual_overlap && r.angle_difference >= opt.close_angle_deg) continue;
      if (r.conflict) ++out.summary.conflicts;
      if (r.visual_overlap) ++out.summary.visual_overlaps;
      out.pairs.push_back(r);
    }
  }

  out.summary.total_companies = static_cast<int>(companies.size());
  if (!companies.empty()) out.summary.average_error = error_sum / static_cast<double>(companies.size());
  return out;
}

std::string format_placement_report(const PlacementAnalysisReport& report) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1);
  const auto& s = report.summary;
  ss << "Companies: " << s.total_companies << "  poorly positioned: " << s.poorly_positioned
     << "  conflicts: " << s.conflicts << "  overlaps: " << s.visual_overlaps << "  avg error: " << s.average_error
     << "\n";

  for (const auto& a : report.companies) {
    if (!a.should_reposition) continue;
    ss << "  reposition #" << a.company_id << " " << a.name << ": target " << a.target_distance << ", current ";
    if (a.current) {
      ss << a.current->distance;
    } else {
      ss << "(none)";
    }
    ss << " (error " << a.error << ")\n";
  }
  for (const auto& p : report.pairs) {
    ss << "  #" << p.first << " / #" << p.second << ": " << p.angle_difference << " deg, " << p.distance_difference
       << " px apart (visual " << p.visual_distance << ")";
    if (p.conflict) ss << " CONFLICT";
    if (p.visual_overlap) ss << " OVERLAP";
    ss << "\n";
  }
  return ss.str();
}

} // namespace cosmos
