// === Drilling API ============================================================
//
// Abstract seam over the remote project/hole service. The correlation service,
// hole directory, and coalescing queue only talk to this interface; the HTTP
// adapter lives in `http_drilling_api.hpp`, tests substitute fakes.
//
// Implementations must not throw for remote failures (timeouts, refused
// connections, non-2xx statuses, malformed bodies). They log the cause and
// report it as std::nullopt / false.

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "drill_link/types.hpp"

namespace drill_link {

/** @brief Body of a drilling-speed submission. */
struct DrillingSpeedReport final {
    double speed{};                          /**< Drilling speed (m/s). */
    double depth{};                          /**< Current depth (m). */
    WallTimePoint timestamp{WallClock::now()}; /**< Measurement time, sent as UTC. */
    std::optional<std::string> sensor_id{};  /**< Optional originating sensor tag. */
};

/** @brief Remote hole directory and telemetry sink. */
class DrillingApi {
  public:
    virtual ~DrillingApi() = default;

    /** @brief GET /projects/{project}/holes. */
    [[nodiscard]] virtual std::optional<HoleList> list_holes(const std::string& project_id) = 0;
    /** @brief GET /projects/{project}/holes/{hole}. */
    [[nodiscard]] virtual std::optional<Hole> get_hole(const std::string& project_id, const std::string& hole_id) = 0;
    /** @brief POST /projects/{project}/holes/{hole}/drilling-speed; true on `{"success": true}`. */
    [[nodiscard]] virtual bool post_drilling_speed(const std::string& project_id,
                                                   const std::string& hole_id,
                                                   const DrillingSpeedReport& report) = 0;
    /** @brief Probe whether the service answers at all. */
    [[nodiscard]] virtual bool test_connection() = 0;
};

using DrillingApiPtr = std::shared_ptr<DrillingApi>;

}  // namespace drill_link
