// === Hole Directory ==========================================================
//
// Time-bounded cache of a project's hole set. A refresh replaces the snapshot
// wholesale; failed refreshes leave the last good snapshot (and its timestamp)
// untouched so matching continues during remote outages and the next call
// retries. The remote call is made without holding the cache lock, so two
// callers racing an expiry may both fetch; the result is applied idempotently.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "drill_link/drilling_api.hpp"
#include "drill_link/logging.hpp"
#include "drill_link/types.hpp"

namespace drill_link {

/** @brief Source of "now" for cache age checks; injectable for tests. */
using ClockFunction = std::function<TimePoint()>;

/** @brief TTL-cached view of the remote hole listing for one project. */
class HoleDirectory final {
  public:
    static constexpr Duration k_default_ttl{300.0};

    HoleDirectory(DrillingApiPtr api,
                  std::string project_id,
                  Duration ttl = k_default_ttl,
                  ClockFunction clock = [] { return SteadyClock::now(); });

    [[nodiscard]] const std::string& project_id() const noexcept;
    [[nodiscard]] Duration ttl() const noexcept;

    /**
     * @brief Current hole set, refreshing from the API when absent or stale.
     *
     * Returns the previous snapshot (empty if there never was one) when the
     * refresh fails.
     */
    [[nodiscard]] HoleList get_holes();
    /** @brief Drop the snapshot so the next get_holes() refetches. */
    void invalidate();

    /** @brief True once a fetch has succeeded and the cache was not invalidated since. */
    [[nodiscard]] bool has_snapshot() const;
    /** @brief Age of the current snapshot, std::nullopt when there is none. */
    [[nodiscard]] std::optional<Duration> cache_age() const;

  private:
    DrillingApiPtr api_;
    std::string str_project_id_;
    Duration ttl_;
    ClockFunction clock_;
    mutable std::mutex cache_mutex_;
    HoleList list_holes_;
    std::optional<TimePoint> optional_fetched_at_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drill_link
