#include "cosmos/core/positioning.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <sstream>

#include "cosmos/util/log.h"

namespace cosmos {
namespace {

std::string fmt(double v) {
  std::ostringstream ss;
  ss << v;
  return ss.str();
}

double effective_fallback_margin(const PositioningConfig& cfg) {
  return std::max(cfg.fallback_margin, cfg.min_distance_separation);
}

Company with_placement(const Company& c, ViewMode view, const Placement& p) {
  Company out = c;
  placement_in(out, view) = p;
  return out;
}

std::vector<Company> without_id(const std::vector<Company>& companies, Id id) {
  std::vector<Company> out;
  out.reserve(companies.size());
  for (const auto& c : companies) {
    if (c.id != id) out.push_back(c);
  }
  return out;
}

PositioningSolution single_company_solution(PlacementStage stage, const Company& company, const Placement& p,
                                            const std::vector<Company>& occupants, ViewMode view,
                                            std::string reason) {
  PositioningSolution sol;
  sol.stage = stage;
  sol.view = view;
  sol.new_company = with_placement(company, view, p);
  sol.placement = p;
  sol.relocated.push_back(RelocatedCompany{sol.new_company, placement_in(company, view)});
  sol.stable = occupants;
  sol.reason = std::move(reason);
  return sol;
}

struct EvictionCandidate {
  const Company* company{nullptr};
  double current_distance{0.0};
  double ideal_distance{0.0};
  double error{0.0};
};

} // namespace

const char* placement_stage_to_string(PlacementStage s) {
  switch (s) {
    case PlacementStage::Direct: return "direct";
    case PlacementStage::NearTarget: return "near_target";
    case PlacementStage::SmartRelocation: return "smart_relocation";
    case PlacementStage::Fallback: return "fallback";
  }
  return "direct";
}

double score_to_distance(double match_score, const PositioningConfig& cfg) {
  const double s = std::clamp(std::isfinite(match_score) ? match_score : 0.0, 0.0, 100.0);
  return cfg.min_radius + (100.0 - s) / 100.0 * (cfg.max_radius - cfg.min_radius);
}

double normalize_angle(double deg) {
  if (!std::isfinite(deg)) return 0.0;
  double a = std::fmod(deg, 360.0);
  if (a < 0.0) a += 360.0;
  if (a >= 360.0) a = 0.0;
  return a;
}

double angular_separation(double a_deg, double b_deg) {
  const double d = std::fabs(normalize_angle(a_deg) - normalize_angle(b_deg));
  return std::min(d, 360.0 - d);
}

bool placements_conflict(const Placement& a, const Placement& b, const PositioningConfig& cfg) {
  return angular_separation(a.angle, b.angle) < cfg.min_angle_separation_deg &&
         std::fabs(a.distance - b.distance) < cfg.min_distance_separation;
}

bool conflicts_with_any(const Placement& p, const std::vector<Company>& occupants, ViewMode view,
                        const PositioningConfig& cfg, Id self_id) {
  for (const auto& other : occupants) {
    if (self_id != kInvalidId && other.id == self_id) continue;
    const auto& op = placement_in(other, view);
    if (op && placements_conflict(p, *op, cfg)) return true;
  }
  return false;
}

std::vector<double> candidate_angles(Id company_id, const PositioningConfig& cfg) {
  const int slots = std::max(1, cfg.angle_slots);
  const double step = 360.0 / static_cast<double>(slots);
  // Reduce both factors first so the product cannot overflow.
  const long long id_mod = (static_cast<long long>(company_id % 360) + 360) % 360;
  const long long mul_mod = (static_cast<long long>(cfg.seed_multiplier % 360) + 360) % 360;
  const long long seed = (id_mod * mul_mod) % 360;

  std::vector<double> out;
  out.reserve(static_cast<std::size_t>(slots));
  for (int i = 0; i < slots; ++i) {
    out.push_back(normalize_angle(static_cast<double>(seed) + step * static_cast<double>(i)));
  }
  return out;
}

std::optional<Placement> try_direct_placement(const Company& company, double distance,
                                              const std::vector<Company>& occupants, ViewMode view,
                                              const PositioningConfig& cfg) {
  for (const double angle : candidate_angles(company.id, cfg)) {
    const Placement p{angle, distance};
    if (!conflicts_with_any(p, occupants, view, cfg, company.id)) return p;
  }
  return std::nullopt;
}

std::optional<Placement> try_near_target_placement(const Company& company, double target_distance,
                                                   const std::vector<Company>& occupants, ViewMode view,
                                                   const PositioningConfig& cfg) {
  for (int k = 1; k <= cfg.ring_expansion_steps; ++k) {
    const double offset = cfg.ring_step * static_cast<double>(k);
    for (const double d : {target_distance + offset, target_distance - offset}) {
      if (d < cfg.min_radius) continue;
      if (auto p = try_direct_placement(company, d, occupants, view, cfg)) return p;
    }
  }

  if (target_distance < cfg.outward_extension_min_target || cfg.ring_step <= 0.0) return std::nullopt;

  for (int k = cfg.ring_expansion_steps + 1;; ++k) {
    const double offset = cfg.ring_step * static_cast<double>(k);
    if (offset > cfg.outward_extension_limit) break;
    if (auto p = try_direct_placement(company, target_distance + offset, occupants, view, cfg)) return p;
  }
  return std::nullopt;
}

std::optional<PositioningSolution> try_smart_relocation(const Company& company, double target_distance,
                                                        const std::vector<Company>& occupants, ViewMode view,
                                                        const PositioningConfig& cfg) {
  std::vector<EvictionCandidate> candidates;
  for (const auto& other : occupants) {
    if (other.id == company.id) continue;
    const auto& op = placement_in(other, view);
    if (!op) continue;
    EvictionCandidate c;
    c.company = &other;
    c.current_distance = op->distance;
    c.ideal_distance = score_to_distance(other.match_score, cfg);
    c.error = std::fabs(c.current_distance - c.ideal_distance);
    if (c.error > cfg.relocation_min_error) candidates.push_back(c);
  }
  if (candidates.empty()) return std::nullopt;

  std::sort(candidates.begin(), candidates.end(), [](const EvictionCandidate& a, const EvictionCandidate& b) {
    if (a.error != b.error) return a.error > b.error;
    return a.company->id < b.company->id;
  });
  if (static_cast<int>(candidates.size()) > cfg.relocation_max_candidates) {
    candidates.resize(static_cast<std::size_t>(std::max(0, cfg.relocation_max_candidates)));
  }

  for (const auto& cand : candidates) {
    std::vector<Company> remaining = without_id(occupants, cand.company->id);
    remaining = without_id(remaining, company.id);

    const auto new_p = try_direct_placement(company, target_distance, remaining, view, cfg);
    if (!new_p) continue;

    std::vector<Company> with_new = remaining;
    with_new.push_back(with_placement(company, view, *new_p));
    const auto moved_p = try_direct_placement(*cand.company, cand.ideal_distance, with_new, view, cfg);
    if (!moved_p) continue;

    PositioningSolution sol;
    sol.stage = PlacementStage::SmartRelocation;
    sol.view = view;
    sol.new_company = with_placement(company, view, *new_p);
    sol.placement = *new_p;
    sol.relocated.push_back(RelocatedCompany{sol.new_company, placement_in(company, view)});
    sol.relocated.push_back(
        RelocatedCompany{with_placement(*cand.company, view, *moved_p), placement_in(*cand.company, view)});
    sol.stable = std::move(remaining);
    sol.reason = "relocated " + cand.company->name + " from " + fmt(cand.current_distance) + " to " +
                 fmt(cand.ideal_distance) + " (error " + fmt(cand.error) + ")";
    return sol;
  }
  return std::nullopt;
}

Placement fallback_placement(const Company& company, double target_distance,
                             const std::vector<Company>& occupants, ViewMode view,
                             const PositioningConfig& cfg) {
  std::array<int, 4> crowding{0, 0, 0, 0};
  double outermost = 0.0;
  for (const auto& other : occupants) {
    if (other.id == company.id) continue;
    const auto& op = placement_in(other, view);
    if (!op) continue;
    const int sector = std::clamp(static_cast<int>(normalize_angle(op->angle) / 90.0), 0, 3);
    ++crowding[static_cast<std::size_t>(sector)];
    outermost = std::max(outermost, op->distance);
  }

  // Ties go to the lowest sector start.
  int best = 0;
  for (int s = 1; s < 4; ++s) {
    if (crowding[static_cast<std::size_t>(s)] < crowding[static_cast<std::size_t>(best)]) best = s;
  }

  Placement p;
  p.angle = static_cast<double>(best) * 90.0 + 45.0;
  p.distance = std::max(target_distance, outermost) + effective_fallback_margin(cfg);
  return p;
}

PositioningSolution find_positioning_solution(const Company& company, const std::vector<Company>& occupants,
                                              ViewMode view, const PositioningConfig& cfg) {
  const std::vector<Company> others = without_id(occupants, company.id);
  const double target = score_to_distance(company.match_score, cfg);

  if (auto p = try_direct_placement(company, target, others, view, cfg)) {
    log::debug("positioning: direct placement for " + company.name + " at " + fmt(p->angle) + " deg");
    return single_company_solution(PlacementStage::Direct, company, *p, others, view, "direct placement");
  }

  if (auto p = try_near_target_placement(company, target, others, view, cfg)) {
    log::debug("positioning: near-target placement for " + company.name + " at distance " + fmt(p->distance) +
               " (target " + fmt(target) + ")");
    return single_company_solution(PlacementStage::NearTarget, company, *p, others, view,
                                   "ring adjusted to " + fmt(p->distance));
  }

  if (auto sol = try_smart_relocation(company, target, others, view, cfg)) {
    log::debug("positioning: " + sol->reason + " to make room for " + company.name);
    return *sol;
  }

  const Placement p = fallback_placement(company, target, others, view, cfg);
  log::debug("positioning: fallback placement for " + company.name + " at distance " + fmt(p.distance));
  return single_company_solution(PlacementStage::Fallback, company, p, others, view,
                                 "fallback at " + fmt(p.distance));
}

bool is_solution_beneficial(const PositioningSolution& solution, const PositioningConfig& cfg) {
  if (solution.relocated.size() <= 1) return true;

  double improvement = 0.0;
  for (const auto& r : solution.relocated) {
    if (r.company.id == solution.new_company.id) continue;
    const double ideal = score_to_distance(r.company.match_score, cfg);
    const auto& now = placement_in(r.company, solution.view);
    const double before = r.previous ? std::fabs(r.previous->distance - ideal) : 0.0;
    const double after = now ? std::fabs(now->distance - ideal) : before;
    improvement += before - after;
  }
  return improvement > cfg.improvement_threshold;
}

PositioningSolution resolve_placement(const Company& company, const std::vector<Company>& occupants,
                                      ViewMode view, const PositioningConfig& cfg) {
  PositioningSolution sol = find_positioning_solution(company, occupants, view, cfg);
  if (is_solution_beneficial(sol, cfg)) return sol;

  const std::vector<Company> others = without_id(occupants, company.id);
  const double target = score_to_distance(company.match_score, cfg);
  const Placement p = fallback_placement(company, target, others, view, cfg);
  log::debug("positioning: relocation for " + company.name + " not beneficial, using fallback");
  return single_company_solution(PlacementStage::Fallback, company, p, others, view,
                                 "fallback at " + fmt(p.distance) + " (relocation not beneficial)");
}

} // namespace cosmos
