#include "drill_link/hole_directory.hpp"

#include <stdexcept>

namespace drill_link {

HoleDirectory::HoleDirectory(DrillingApiPtr api, std::string project_id, Duration ttl, ClockFunction clock)
    : api_(std::move(api)),
      str_project_id_(std::move(project_id)),
      ttl_(ttl),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (api_ == nullptr) {
        throw std::invalid_argument("HoleDirectory requires an API client");
    }
    if (str_project_id_.empty()) {
        throw std::invalid_argument("HoleDirectory requires a project id");
    }
    if (ttl_.count() <= 0.0) {
        throw std::invalid_argument("HoleDirectory TTL must be positive");
    }
    if (!clock_) {
        throw std::invalid_argument("HoleDirectory requires a clock");
    }
}

const std::string& HoleDirectory::project_id() const noexcept {
    return str_project_id_;
}

Duration HoleDirectory::ttl() const noexcept {
    return ttl_;
}

HoleList HoleDirectory::get_holes() {
    {
        std::scoped_lock lock(cache_mutex_);
        if (optional_fetched_at_.has_value() && Duration{clock_() - *optional_fetched_at_} < ttl_) {
            return list_holes_;
        }
    }

    std::optional<HoleList> fetched_holes;
    try {
        fetched_holes = api_->list_holes(str_project_id_);
    } catch (const std::exception& exc) {
        logger_->error("Hole listing for project {} raised: {}", str_project_id_, exc.what());
    }

    std::scoped_lock lock(cache_mutex_);
    if (!fetched_holes.has_value()) {
        logger_->warn("Unable to refresh holes for project {}; serving {} cached holes",
                      str_project_id_,
                      list_holes_.size());
        return list_holes_;
    }

    list_holes_ = std::move(*fetched_holes);
    optional_fetched_at_ = clock_();
    logger_->info("Loaded {} holes for project {}", list_holes_.size(), str_project_id_);
    return list_holes_;
}

void HoleDirectory::invalidate() {
    std::scoped_lock lock(cache_mutex_);
    list_holes_.clear();
    optional_fetched_at_.reset();
    logger_->debug("Hole cache for project {} invalidated", str_project_id_);
}

bool HoleDirectory::has_snapshot() const {
    std::scoped_lock lock(cache_mutex_);
    return optional_fetched_at_.has_value();
}

std::optional<Duration> HoleDirectory::cache_age() const {
    std::scoped_lock lock(cache_mutex_);
    if (!optional_fetched_at_.has_value()) {
        return std::nullopt;
    }
    return Duration{clock_() - *optional_fetched_at_};
}

}  // namespace drill_link
