#include "infrastructure/monitoring/StatusCache.hpp"

#include <mutex>

namespace vikabh::infra {

std::optional<core::StatusEntry> StatusCache::get(int64_t deviceId) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(deviceId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StatusCache::set(core::StatusEntry entry) {
    const int64_t id = entry.deviceId();
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(id, std::move(entry));
}

std::vector<core::StatusEntry> StatusCache::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<core::StatusEntry> entries;
    entries.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        entries.push_back(entry);
    }
    return entries;
}

size_t StatusCache::retain(const std::set<int64_t>& deviceIds) {
    std::unique_lock lock(mutex_);
    return std::erase_if(entries_, [&deviceIds](const auto& item) {
        return !deviceIds.contains(item.first);
    });
}

core::StatusSummary StatusCache::summary() const {
    std::shared_lock lock(mutex_);
    core::StatusSummary summary;
    for (const auto& [id, entry] : entries_) {
        switch (entry.result.outcome) {
        case core::ProbeOutcome::Online:
            ++summary.online;
            break;
        case core::ProbeOutcome::Offline:
            ++summary.offline;
            break;
        case core::ProbeOutcome::Error:
            ++summary.error;
            break;
        }
        if (!entry.persisted) {
            ++summary.stale;
        }
        if (!summary.lastUpdate || entry.result.timestamp > *summary.lastUpdate) {
            summary.lastUpdate = entry.result.timestamp;
        }
    }
    return summary;
}

size_t StatusCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void StatusCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

} // namespace vikabh::infra
