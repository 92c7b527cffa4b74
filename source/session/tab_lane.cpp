#include "session/tab_lane.hpp"

namespace session {

uint64_t TabLane::draw_ticket() {
    std::lock_guard<std::mutex> lock(lane_mutex_);
    return next_ticket_++;
}

void TabLane::wait_turn(uint64_t ticket) {
    std::unique_lock<std::mutex> lock(lane_mutex_);
    lane_condition_.wait(lock, [this, ticket] { return now_serving_ == ticket; });
}

void TabLane::finish_turn(uint64_t ticket) {
    std::lock_guard<std::mutex> lock(lane_mutex_);
    if (now_serving_ == ticket) {
        ++now_serving_;
        lane_condition_.notify_all();
    }
}

} // namespace session
