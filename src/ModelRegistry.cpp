#include "ModelRegistry.h"

#include <algorithm>
#include <mutex>
#include <utility>

bool ModelRegistry::publish(const RunContext& context, InsightSnapshot snapshot) {
    auto ptr = std::make_shared<const InsightSnapshot>(std::move(snapshot));
    std::unique_lock<std::shared_mutex> lock(mutex);
    SnapshotPtr& slot = snapshots[context.tenant];
    if (slot && slot->version >= ptr->version) return false;
    slot = std::move(ptr);
    return true;
}

ModelRegistry::SnapshotPtr ModelRegistry::publishIfAbsent(const RunContext& context, InsightSnapshot snapshot) {
    auto ptr = std::make_shared<const InsightSnapshot>(std::move(snapshot));
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto inserted = snapshots.emplace(context.tenant, std::move(ptr));
    return inserted.first->second;
}

ModelRegistry::SnapshotPtr ModelRegistry::current(const RunContext& context) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = snapshots.find(context.tenant);
    return it == snapshots.end() ? nullptr : it->second;
}

bool ModelRegistry::has(const RunContext& context) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return snapshots.find(context.tenant) != snapshots.end();
}

void ModelRegistry::clear(const RunContext& context) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    snapshots.erase(context.tenant);
}

std::vector<std::string> ModelRegistry::tenants() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    std::vector<std::string> out;
    out.reserve(snapshots.size());
    for (const auto& entry : snapshots) out.push_back(entry.first);
    std::sort(out.begin(), out.end());
    return out;
}
