#include "drill_link/http_drilling_api.hpp"

#include <ctime>
#include <stdexcept>

#include <httplib.h>

#include "drill_link/api_codec.hpp"

namespace drill_link {

namespace {

constexpr std::string_view k_scheme_separator{"://"};
constexpr int k_status_ok{200};
constexpr int k_status_forbidden{403};
constexpr int k_status_not_found{404};

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

void apply_timeouts(httplib::Client& client, Duration timeout) {
    const auto whole_seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto remainder_us = std::chrono::duration_cast<std::chrono::microseconds>(timeout - whole_seconds);
    const auto seconds = static_cast<time_t>(whole_seconds.count());
    const auto microseconds = static_cast<time_t>(remainder_us.count());
    client.set_connection_timeout(seconds, microseconds);
    client.set_read_timeout(seconds, microseconds);
    client.set_write_timeout(seconds, microseconds);
}

}  // namespace

HttpDrillingApi::HttpDrillingApi(HttpApiSettings settings)
    : settings_(std::move(settings)),
      logger_(get_logger()) {
    if (settings_.timeout.count() <= 0.0) {
        throw std::invalid_argument("HttpDrillingApi timeout must be positive");
    }
    const std::size_t scheme_end = settings_.base_url.find(k_scheme_separator);
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("HttpDrillingApi base URL must include a scheme: " + settings_.base_url);
    }
    const std::size_t path_start = settings_.base_url.find('/', scheme_end + k_scheme_separator.size());
    str_origin_ = settings_.base_url.substr(0, path_start);
    if (path_start != std::string::npos) {
        str_path_prefix_ = settings_.base_url.substr(path_start);
    }
    while (!str_path_prefix_.empty() && str_path_prefix_.back() == '/') {
        str_path_prefix_.pop_back();
    }
    logger_->info("Remote hole service at {}{}", str_origin_, str_path_prefix_);
}

const HttpApiSettings& HttpDrillingApi::settings() const noexcept {
    return settings_;
}

std::optional<HoleList> HttpDrillingApi::list_holes(const std::string& project_id) {
    const std::optional<std::string> body = send_request("GET", "/projects/" + project_id + "/holes", std::nullopt);
    if (!body.has_value()) {
        return std::nullopt;
    }
    std::optional<HoleList> holes = decode_hole_list_response(*body);
    if (!holes.has_value()) {
        logger_->warn("Hole listing for project {} was malformed or unsuccessful", project_id);
    }
    return holes;
}

std::optional<Hole> HttpDrillingApi::get_hole(const std::string& project_id, const std::string& hole_id) {
    const std::optional<std::string> body = send_request(
        "GET", "/projects/" + project_id + "/holes/" + hole_id, std::nullopt
    );
    if (!body.has_value()) {
        return std::nullopt;
    }
    std::optional<Hole> hole = decode_hole_response(*body);
    if (!hole.has_value()) {
        logger_->warn("Hole {} detail for project {} was malformed or unsuccessful", hole_id, project_id);
    }
    return hole;
}

bool HttpDrillingApi::post_drilling_speed(const std::string& project_id,
                                          const std::string& hole_id,
                                          const DrillingSpeedReport& report) {
    const std::optional<std::string> body = send_request(
        "POST",
        "/projects/" + project_id + "/holes/" + hole_id + "/drilling-speed",
        encode_drilling_speed_report(report)
    );
    if (!body.has_value()) {
        return false;
    }
    if (!decode_success_flag(*body)) {
        logger_->warn("drilling-speed for hole {} rejected: {}", hole_id, *body);
        return false;
    }
    return true;
}

bool HttpDrillingApi::test_connection() {
    httplib::Client client(str_origin_);
    apply_timeouts(client, settings_.timeout);
    const std::string path = str_path_prefix_.empty() ? std::string{"/"} : str_path_prefix_;
    const httplib::Result result = client.Get(path);
    if (!result) {
        logger_->warn("Remote hole service unreachable: {}", httplib::to_string(result.error()));
        return false;
    }
    // Any of these proves the server is alive even if the bare prefix has no route.
    const int status = result->status;
    const bool reachable = status == k_status_ok || status == k_status_forbidden || status == k_status_not_found;
    logger_->info("Remote hole service probe returned HTTP {}", status);
    return reachable;
}

std::optional<std::string> HttpDrillingApi::send_request(const std::string& method,
                                                         const std::string& endpoint,
                                                         const std::optional<std::string>& json_body) {
    const std::string path = str_path_prefix_ + endpoint;
    try {
        httplib::Client client(str_origin_);
        apply_timeouts(client, settings_.timeout);
        client.set_default_headers({{"Accept", "application/json"}});

        httplib::Result result = method == "POST"
            ? client.Post(path, json_body.value_or(std::string{"{}"}), "application/json")
            : client.Get(path);
        if (!result) {
            logger_->warn("API {} {} failed: {}", method, path, httplib::to_string(result.error()));
            return std::nullopt;
        }
        if (!is_success_status(result->status)) {
            logger_->warn("API {} {} returned HTTP {}: {}", method, path, result->status, result->body);
            return std::nullopt;
        }
        return result->body;
    } catch (const std::exception& exc) {
        logger_->error("API {} {} raised: {}", method, path, exc.what());
        return std::nullopt;
    }
}

}  // namespace drill_link
