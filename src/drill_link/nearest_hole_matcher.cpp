#include "drill_link/nearest_hole_matcher.hpp"

#include <algorithm>

#include "drill_link/geo_math.hpp"

namespace drill_link {

NearestHoleMatch NearestHoleMatcher::find_nearest(const HoleList& holes, const PositionFix& fix) {
    NearestHoleMatch match{};
    const Hole* nearest_hole = nullptr;
    for (const Hole& hole : holes) {
        if (!hole.has_coordinates()) {
            continue;
        }
        const double distance_m = great_circle_distance_m(
            fix.latitude_deg, fix.longitude_deg, *hole.latitude_deg, *hole.longitude_deg
        );
        if (distance_m < match.distance_m) {
            match.distance_m = distance_m;
            nearest_hole = &hole;
        }
    }
    if (nearest_hole != nullptr) {
        match.hole = *nearest_hole;
    }
    return match;
}

std::vector<RankedHole> NearestHoleMatcher::rank_by_distance(const HoleList& holes,
                                                             const PositionFix& fix,
                                                             const RankingOptions& options) {
    std::vector<RankedHole> ranked_holes;
    ranked_holes.reserve(holes.size());
    for (const Hole& hole : holes) {
        if (!hole.has_coordinates()) {
            continue;
        }
        const double distance_m = options.use_3d
            ? distance_3d_m(fix.latitude_deg, fix.longitude_deg, fix.elevation_m,
                            *hole.latitude_deg, *hole.longitude_deg, hole.elevation_m)
            : great_circle_distance_m(fix.latitude_deg, fix.longitude_deg, *hole.latitude_deg, *hole.longitude_deg);
        if (options.max_distance_m.has_value() && distance_m > *options.max_distance_m) {
            continue;
        }
        ranked_holes.push_back(RankedHole{hole, distance_m});
    }

    std::stable_sort(ranked_holes.begin(), ranked_holes.end(), [](const RankedHole& lhs, const RankedHole& rhs) {
        return lhs.distance_m < rhs.distance_m;
    });
    if (options.limit.has_value() && ranked_holes.size() > *options.limit) {
        ranked_holes.resize(*options.limit);
    }
    return ranked_holes;
}

bool NearestHoleMatcher::within_gate(const NearestHoleMatch& match, double max_distance_m) noexcept {
    return match.hole.has_value() && match.distance_m <= max_distance_m;
}

}  // namespace drill_link
