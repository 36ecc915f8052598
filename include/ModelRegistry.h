#pragma once

#include "InsightTypes.h"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Holds the committed result snapshot of each tenant. Readers receive an
 * immutable shared snapshot, so a publish never tears a reader's view.
 */
class ModelRegistry {
public:
    using SnapshotPtr = std::shared_ptr<const InsightSnapshot>;

    // Replaces the tenant's snapshot only with a newer version; returns whether it did.
    bool publish(const RunContext& context, InsightSnapshot snapshot);
    // Keeps an already published snapshot; returns whichever is current.
    SnapshotPtr publishIfAbsent(const RunContext& context, InsightSnapshot snapshot);
    SnapshotPtr current(const RunContext& context) const;
    bool has(const RunContext& context) const;
    void clear(const RunContext& context);
    std::vector<std::string> tenants() const;

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, SnapshotPtr> snapshots;
};
