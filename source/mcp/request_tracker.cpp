#include "mcp/request_tracker.hpp"

#include <algorithm>

namespace request_tracker {

static bool is_trackable(const json &request_id) {
    return request_id.is_string() || request_id.is_number();
}

bool RequestTracker::track(const json &request_id) {
    if (!is_trackable(request_id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(pending_ids_.begin(), pending_ids_.end(), request_id) == pending_ids_.end()) {
        pending_ids_.push_back(request_id);
    }
    return true;
}

bool RequestTracker::consume(const json &request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto position = std::find(pending_ids_.begin(), pending_ids_.end(), request_id);
    if (position == pending_ids_.end()) {
        return false;
    }
    pending_ids_.erase(position);
    return true;
}

bool RequestTracker::is_tracked(const json &request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(pending_ids_.begin(), pending_ids_.end(), request_id) != pending_ids_.end();
}

size_t RequestTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_ids_.size();
}

void RequestTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ids_.clear();
}

} // namespace request_tracker
