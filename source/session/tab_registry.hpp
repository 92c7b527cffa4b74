#ifndef NLBD_TAB_REGISTRY_HPP
#define NLBD_TAB_REGISTRY_HPP

// Session/tab registry: the ordered set of open tabs and the active pointer.
//
// Structural changes (open/close/switch) and snapshots are serialized by one
// registry mutex, and the active pointer is repaired inside the same critical
// section that removes a tab. Page work happens outside that mutex, inside the
// tab's lane (see TabLease), so different tabs proceed in parallel.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "browser/browser_driver_abi.hpp"
#include "protocol/error_kind.hpp"
#include "session/tab_lane.hpp"

namespace session {

struct Tab {
    int id = 0;
    std::shared_ptr<browser_driver::PageHandle> page;
    std::string title; // guarded by the registry mutex
    std::string url;   // guarded by the registry mutex
    std::chrono::system_clock::time_point created_at;
    std::atomic<bool> closed{false};
    TabLane lane;
};

// Immutable view of one tab, unaffected by later registry changes.
struct TabSnapshot {
    int index = 0; // 1-based position
    int id = 0;
    std::string title;
    std::string url;
    bool is_active = false;
};

struct RegistryResult {
    bool success = false;
    nlbd::ErrorKind error_kind = nlbd::ErrorKind::None;
    std::string error_detail;
    int tab_id = 0;
    std::string warning; // set when the operation succeeded but page cleanup failed
};

// One turn in a tab's lane. Move-only; the turn ends when the lease is
// released or destroyed.
class TabLease {
public:
    TabLease() = default;
    TabLease(std::shared_ptr<Tab> tab, uint64_t ticket);
    ~TabLease();

    TabLease(TabLease &&other) noexcept;
    TabLease &operator=(TabLease &&other) noexcept;
    TabLease(const TabLease &) = delete;
    TabLease &operator=(const TabLease &) = delete;

    // Wait for this lease's turn. False if the tab was closed meanwhile.
    bool wait_turn();

    bool valid() const { return tab_ != nullptr; }
    int tab_id() const { return tab_ ? tab_->id : 0; }
    browser_driver::PageHandle &page() { return *tab_->page; }

    // End the turn now (waits for it first if it never started).
    void release();

private:
    std::shared_ptr<Tab> tab_;
    uint64_t ticket_ = 0;
    bool turn_started_ = false;
};

struct AcquireResult {
    bool success = false;
    nlbd::ErrorKind error_kind = nlbd::ErrorKind::None;
    std::string error_detail;
    TabLease lease;
};

class TabRegistry {
public:
    explicit TabRegistry(browser_driver::BrowserDriver &driver);
    ~TabRegistry();

    TabRegistry(const TabRegistry &) = delete;
    TabRegistry &operator=(const TabRegistry &) = delete;

    // Create a page (about:blank when url is empty), append it and make it active.
    RegistryResult open_tab(const std::string &url = "");

    // Make the tab at 1-based position active. Active is unchanged on failure.
    RegistryResult switch_tab(int position);

    // Close the tab with this id, or the active tab. Waits for in-flight
    // actions on that tab first. If the closed tab was active, the preceding
    // tab becomes active, else the new first tab, else none.
    RegistryResult close_tab(std::optional<int> tab_id = std::nullopt);

    // close_tab() for a 1-based position.
    RegistryResult close_tab_at(int position);

    std::vector<TabSnapshot> list_tabs() const;
    std::optional<TabSnapshot> active_tab() const;

    // Resolve the explicit position (or the active tab) and draw a ticket in
    // its lane. The caller waits for its turn through the lease.
    AcquireResult acquire(std::optional<int> position = std::nullopt);

    // Same, for the tab with this id whatever its position or the active pointer.
    AcquireResult acquire_id(int tab_id);

    // Refresh cached page metadata. Unknown ids are ignored.
    void update_location(int tab_id, const std::string &title, const std::string &url);

    // Close every tab (daemon shutdown). Page close failures are logged.
    void close_all();

    size_t size() const;

private:
    RegistryResult close_resolved(std::shared_ptr<Tab> tab, uint64_t ticket);
    TabSnapshot snapshot_locked(size_t index) const;

    browser_driver::BrowserDriver &driver_;
    mutable std::mutex registry_mutex_;
    std::vector<std::shared_ptr<Tab>> tabs_;
    int active_tab_id_ = 0; // 0: no active tab
    int next_tab_id_ = 1;
};

} // namespace session

#endif // NLBD_TAB_REGISTRY_HPP
