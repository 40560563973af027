// === HTTP Drilling API =======================================================
//
// cpp-httplib adapter for `DrillingApi`. The configured base URL already
// includes the API prefix (e.g. "https://example.org/api"); endpoint paths are
// appended to it. A fresh client is opened per request so the adapter can be
// shared between the transport callback thread and the delivery worker.

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "drill_link/drilling_api.hpp"
#include "drill_link/logging.hpp"
#include "drill_link/types.hpp"

namespace drill_link {

/** @brief Connection settings for the remote hole service. */
struct HttpApiSettings final {
    std::string base_url{};   /**< Scheme, host, optional port and path prefix. */
    Duration timeout{10.0};   /**< Connect/read/write timeout per request. */
};

/** @brief Blocking HTTP implementation of DrillingApi. */
class HttpDrillingApi final : public DrillingApi {
  public:
    explicit HttpDrillingApi(HttpApiSettings settings);

    [[nodiscard]] const HttpApiSettings& settings() const noexcept;

    [[nodiscard]] std::optional<HoleList> list_holes(const std::string& project_id) override;
    [[nodiscard]] std::optional<Hole> get_hole(const std::string& project_id, const std::string& hole_id) override;
    [[nodiscard]] bool post_drilling_speed(const std::string& project_id,
                                           const std::string& hole_id,
                                           const DrillingSpeedReport& report) override;
    [[nodiscard]] bool test_connection() override;

  private:
    /** @brief Issue a request; returns the body of a 2xx response, std::nullopt otherwise. */
    std::optional<std::string> send_request(const std::string& method,
                                            const std::string& endpoint,
                                            const std::optional<std::string>& json_body);

    HttpApiSettings settings_;
    std::string str_origin_;       /**< "scheme://host[:port]". */
    std::string str_path_prefix_;  /**< Path component of the base URL without trailing '/'. */
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drill_link
