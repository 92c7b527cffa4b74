#ifndef NLBD_TAB_LANE_HPP
#define NLBD_TAB_LANE_HPP

// FIFO ticket lane. Every action on a tab draws a ticket when the tab is
// resolved; turns are served strictly in ticket order, one at a time.

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace session {

class TabLane {
public:
    TabLane() = default;
    TabLane(const TabLane &) = delete;
    TabLane &operator=(const TabLane &) = delete;

    // Tickets are drawn under the registry mutex so ticket order matches
    // resolution order.
    uint64_t draw_ticket();

    // Block until ticket is the one being served.
    void wait_turn(uint64_t ticket);

    // End the turn of ticket (the one being served) and admit the next.
    void finish_turn(uint64_t ticket);

private:
    std::mutex lane_mutex_;
    std::condition_variable lane_condition_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;
};

} // namespace session

#endif // NLBD_TAB_LANE_HPP
