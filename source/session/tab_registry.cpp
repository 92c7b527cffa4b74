#include "session/tab_registry.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <utility>

namespace session {

// --- TabLease ---

TabLease::TabLease(std::shared_ptr<Tab> tab, uint64_t ticket)
    : tab_(std::move(tab)), ticket_(ticket) {}

TabLease::~TabLease() {
    release();
}

TabLease::TabLease(TabLease &&other) noexcept
    : tab_(std::move(other.tab_)), ticket_(other.ticket_), turn_started_(other.turn_started_) {
    other.tab_.reset();
    other.turn_started_ = false;
}

TabLease &TabLease::operator=(TabLease &&other) noexcept {
    if (this != &other) {
        release();
        tab_ = std::move(other.tab_);
        ticket_ = other.ticket_;
        turn_started_ = other.turn_started_;
        other.tab_.reset();
        other.turn_started_ = false;
    }
    return *this;
}

bool TabLease::wait_turn() {
    if (!tab_) {
        return false;
    }
    if (!turn_started_) {
        tab_->lane.wait_turn(ticket_);
        turn_started_ = true;
    }
    return !tab_->closed.load();
}

void TabLease::release() {
    if (!tab_) {
        return;
    }
    // Later tickets are only admitted once this one has had its turn.
    if (!turn_started_) {
        tab_->lane.wait_turn(ticket_);
    }
    tab_->lane.finish_turn(ticket_);
    tab_.reset();
    turn_started_ = false;
}

// --- TabRegistry ---

static std::string tab_not_found(const std::string &what, size_t tab_count) {
    return "tab not found: " + what + " (" + std::to_string(tab_count) +
           (tab_count == 1 ? " tab open)" : " tabs open)");
}

TabRegistry::TabRegistry(browser_driver::BrowserDriver &driver) : driver_(driver) {}

TabRegistry::~TabRegistry() {
    close_all();
}

TabSnapshot TabRegistry::snapshot_locked(size_t index) const {
    const Tab &tab = *tabs_[index];
    TabSnapshot snapshot;
    snapshot.index = static_cast<int>(index) + 1;
    snapshot.id = tab.id;
    snapshot.title = tab.title;
    snapshot.url = tab.url;
    snapshot.is_active = tab.id == active_tab_id_;
    return snapshot;
}

RegistryResult TabRegistry::open_tab(const std::string &url) {
    RegistryResult result;

    // Page creation talks to the browser; keep it outside the registry mutex.
    browser_driver::OpenPageResult page_result = driver_.open_page(url);
    if (!page_result.success || !page_result.page) {
        result.error_kind = page_result.timed_out ? nlbd::ErrorKind::Timeout : nlbd::ErrorKind::Driver;
        result.error_detail = "could not open tab: " + page_result.error_detail;
        return result;
    }

    auto tab = std::make_shared<Tab>();
    tab->page = std::shared_ptr<browser_driver::PageHandle>(std::move(page_result.page));
    tab->url = url.empty() ? "about:blank" : url;
    tab->created_at = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(registry_mutex_);
    tab->id = next_tab_id_++;
    tabs_.push_back(tab);
    active_tab_id_ = tab->id;

    debug_log::log("open_tab: id=" + std::to_string(tab->id) + " page=" + tab->page->page_id());
    result.success = true;
    result.tab_id = tab->id;
    return result;
}

RegistryResult TabRegistry::switch_tab(int position) {
    RegistryResult result;
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (position < 1 || position > static_cast<int>(tabs_.size())) {
        result.error_kind = nlbd::ErrorKind::Registry;
        result.error_detail = tab_not_found(std::to_string(position), tabs_.size());
        return result;
    }

    active_tab_id_ = tabs_[static_cast<size_t>(position - 1)]->id;
    result.success = true;
    result.tab_id = active_tab_id_;
    return result;
}

RegistryResult TabRegistry::close_tab(std::optional<int> tab_id) {
    std::shared_ptr<Tab> tab;
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        int wanted_id = tab_id ? *tab_id : active_tab_id_;
        if (!tab_id && active_tab_id_ == 0) {
            RegistryResult result;
            result.error_kind = nlbd::ErrorKind::Registry;
            result.error_detail = "no active tab";
            return result;
        }
        auto found = std::find_if(tabs_.begin(), tabs_.end(),
                                  [wanted_id](const std::shared_ptr<Tab> &candidate) {
                                      return candidate->id == wanted_id;
                                  });
        if (found == tabs_.end()) {
            RegistryResult result;
            result.error_kind = nlbd::ErrorKind::Registry;
            result.error_detail = tab_not_found("id " + std::to_string(wanted_id), tabs_.size());
            return result;
        }
        tab = *found;
        ticket = tab->lane.draw_ticket();
    }
    return close_resolved(std::move(tab), ticket);
}

RegistryResult TabRegistry::close_tab_at(int position) {
    std::shared_ptr<Tab> tab;
    uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (position < 1 || position > static_cast<int>(tabs_.size())) {
            RegistryResult result;
            result.error_kind = nlbd::ErrorKind::Registry;
            result.error_detail = tab_not_found(std::to_string(position), tabs_.size());
            return result;
        }
        tab = tabs_[static_cast<size_t>(position - 1)];
        ticket = tab->lane.draw_ticket();
    }
    return close_resolved(std::move(tab), ticket);
}

RegistryResult TabRegistry::close_resolved(std::shared_ptr<Tab> tab, uint64_t ticket) {
    RegistryResult result;
    const int closing_id = tab->id;

    // Actions already queued on this tab run first.
    TabLease lease(tab, ticket);
    if (!lease.wait_turn()) {
        result.error_kind = nlbd::ErrorKind::Registry;
        result.error_detail = "tab not found: id " + std::to_string(closing_id) + " (already closed)";
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto found = std::find(tabs_.begin(), tabs_.end(), tab);
        if (found == tabs_.end()) {
            result.error_kind = nlbd::ErrorKind::Registry;
            result.error_detail = tab_not_found("id " + std::to_string(closing_id), tabs_.size());
            return result;
        }
        size_t removed_index = static_cast<size_t>(found - tabs_.begin());
        tabs_.erase(found);
        tab->closed = true;

        if (active_tab_id_ == closing_id) {
            if (tabs_.empty()) {
                active_tab_id_ = 0;
            } else if (removed_index > 0) {
                active_tab_id_ = tabs_[removed_index - 1]->id;
            } else {
                active_tab_id_ = tabs_.front()->id;
            }
        }
    }

    browser_driver::DriverResult close_result = tab->page->close();
    if (!close_result.success) {
        result.warning = "page close failed: " + close_result.error_detail;
        debug_log::warn("close_tab: id=" + std::to_string(closing_id) + " " + result.warning);
    }

    debug_log::log("close_tab: id=" + std::to_string(closing_id));
    result.success = true;
    result.tab_id = closing_id;
    return result;
}

std::vector<TabSnapshot> TabRegistry::list_tabs() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<TabSnapshot> snapshots;
    snapshots.reserve(tabs_.size());
    for (size_t index = 0; index < tabs_.size(); ++index) {
        snapshots.push_back(snapshot_locked(index));
    }
    return snapshots;
}

std::optional<TabSnapshot> TabRegistry::active_tab() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (size_t index = 0; index < tabs_.size(); ++index) {
        if (tabs_[index]->id == active_tab_id_) {
            return snapshot_locked(index);
        }
    }
    return std::nullopt;
}

AcquireResult TabRegistry::acquire(std::optional<int> position) {
    AcquireResult result;
    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::shared_ptr<Tab> tab;
    if (position) {
        if (*position < 1 || *position > static_cast<int>(tabs_.size())) {
            result.error_kind = nlbd::ErrorKind::Registry;
            result.error_detail = tab_not_found(std::to_string(*position), tabs_.size());
            return result;
        }
        tab = tabs_[static_cast<size_t>(*position - 1)];
    } else {
        for (const auto &candidate : tabs_) {
            if (candidate->id == active_tab_id_) {
                tab = candidate;
                break;
            }
        }
        if (!tab) {
            result.error_kind = nlbd::ErrorKind::Registry;
            result.error_detail = "no active tab";
            return result;
        }
    }

    uint64_t ticket = tab->lane.draw_ticket();
    result.lease = TabLease(tab, ticket);
    result.success = true;
    return result;
}

AcquireResult TabRegistry::acquire_id(int tab_id) {
    AcquireResult result;
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto found = std::find_if(tabs_.begin(), tabs_.end(),
                              [tab_id](const std::shared_ptr<Tab> &candidate) {
                                  return candidate->id == tab_id;
                              });
    if (found == tabs_.end()) {
        result.error_kind = nlbd::ErrorKind::Registry;
        result.error_detail = tab_not_found("id " + std::to_string(tab_id), tabs_.size());
        return result;
    }

    uint64_t ticket = (*found)->lane.draw_ticket();
    result.lease = TabLease(*found, ticket);
    result.success = true;
    return result;
}

void TabRegistry::update_location(int tab_id, const std::string &title, const std::string &url) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto &tab : tabs_) {
        if (tab->id == tab_id) {
            tab->title = title;
            tab->url = url;
            return;
        }
    }
}

void TabRegistry::close_all() {
    std::vector<std::pair<std::shared_ptr<Tab>, uint64_t>> closing;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto &tab : tabs_) {
            closing.emplace_back(tab, tab->lane.draw_ticket());
            tab->closed = true;
        }
        tabs_.clear();
        active_tab_id_ = 0;
    }

    for (auto &entry : closing) {
        TabLease lease(entry.first, entry.second);
        lease.wait_turn();
        if (!driver_.is_open()) {
            continue;
        }
        browser_driver::DriverResult close_result = entry.first->page->close();
        if (!close_result.success) {
            debug_log::warn("close_all: tab " + std::to_string(entry.first->id) +
                            " did not close: " + close_result.error_detail);
        }
    }
    if (!closing.empty()) {
        debug_log::log("close_all: closed " + std::to_string(closing.size()) + " tab(s).");
    }
}

size_t TabRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return tabs_.size();
}

} // namespace session
