#pragma once
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "exec/exchange_gateway.hpp"

namespace exec {

struct ReconcileReport {
    std::vector<core::PositionKey> dropped;   // local only
    std::vector<core::PositionKey> added;     // remote only
    std::vector<core::PositionKey> refreshed; // both

    bool changed() const { return !dropped.empty() || !added.empty(); }
};

// Local cache of open positions. The exchange is authoritative.
class PositionLedger {
public:
    // Afterwards the local key set equals the remote key set (size > 0 entries only)
    ReconcileReport reconcile(const std::vector<Position>& remote);

    void upsert(const Position& p);
    bool erase(const core::PositionKey& key);
    bool has(const core::PositionKey& key) const;
    std::optional<Position> get(const core::PositionKey& key) const;
    std::vector<Position> snapshot() const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mu_;
    std::unordered_map<core::PositionKey, Position> map_;
};

} // namespace exec
