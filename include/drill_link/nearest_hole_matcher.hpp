// === Nearest Hole Matcher ====================================================
//
// Stateless nearest-neighbour search over a hole set. Holes without surveyed
// coordinates are never candidates. The distance gate is applied by callers
// (see `within_gate`) so a rejected match can still be logged with its
// distance.

#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

#include "drill_link/types.hpp"

namespace drill_link {

/** @brief Result of a nearest-hole search. */
struct NearestHoleMatch final {
    std::optional<Hole> hole{};                                  /**< Closest hole, if any had coordinates. */
    double distance_m{std::numeric_limits<double>::infinity()};  /**< Great-circle distance to it. */
};

/** @brief Knobs for ranking several candidates. */
struct RankingOptions final {
    std::optional<double> max_distance_m{};  /**< Drop candidates farther than this. */
    bool use_3d{true};                       /**< Include elevation when both sides report it. */
    std::optional<std::size_t> limit{};      /**< Keep at most this many candidates. */
};

/** @brief Hole paired with its distance from a fix. */
struct RankedHole final {
    Hole hole{};
    double distance_m{};
};

class NearestHoleMatcher final {
  public:
    static constexpr double k_default_max_distance_m{10.0};

    /**
     * @brief Closest hole to @p fix by great-circle distance.
     *
     * Exact ties keep the hole that appears first in @p holes.
     */
    [[nodiscard]] static NearestHoleMatch find_nearest(const HoleList& holes, const PositionFix& fix);

    /** @brief Candidates sorted by ascending distance; ties keep input order. */
    [[nodiscard]] static std::vector<RankedHole> rank_by_distance(const HoleList& holes,
                                                                  const PositionFix& fix,
                                                                  const RankingOptions& options = {});

    /** @brief True when a hole was found no farther than @p max_distance_m. */
    [[nodiscard]] static bool within_gate(const NearestHoleMatch& match, double max_distance_m) noexcept;
};

}  // namespace drill_link
