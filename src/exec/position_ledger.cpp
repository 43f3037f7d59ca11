#include "exec/position_ledger.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace exec {

ReconcileReport PositionLedger::reconcile(const std::vector<Position>& remote){
    std::unordered_map<core::PositionKey, const Position*> live;
    for (auto& p : remote) if (p.size>0.0) live[p.key()] = &p;

    ReconcileReport rep;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = map_.begin(); it!=map_.end();){
        if (!live.count(it->first)){
            rep.dropped.push_back(it->first);
            it = map_.erase(it);
        } else ++it;
    }
    for (auto& [key, p] : live){
        auto it = map_.find(key);
        if (it==map_.end()){
            map_.emplace(key, *p);
            rep.added.push_back(key);
            continue;
        }
        it->second.size = p->size;
        it->second.entry_price = p->entry_price;
        it->second.unrealized_pnl = p->unrealized_pnl;
        if (p->take_profit) it->second.take_profit = p->take_profit;
        if (p->stop_loss) it->second.stop_loss = p->stop_loss;
        rep.refreshed.push_back(key);
    }
    if (rep.changed())
        spdlog::info("ledger reconciled: {} dropped, {} added, {} open", rep.dropped.size(), rep.added.size(), map_.size());
    return rep;
}

void PositionLedger::upsert(const Position& p){
    std::lock_guard<std::mutex> lk(mu_);
    map_[p.key()] = p;
}

bool PositionLedger::erase(const core::PositionKey& key){
    std::lock_guard<std::mutex> lk(mu_);
    return map_.erase(key) > 0;
}

bool PositionLedger::has(const core::PositionKey& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return map_.count(key) > 0;
}

std::optional<Position> PositionLedger::get(const core::PositionKey& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = map_.find(key);
    if (it==map_.end()) return std::nullopt;
    return it->second;
}

std::vector<Position> PositionLedger::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Position> v;
    v.reserve(map_.size());
    for (auto& kv : map_) v.push_back(kv.second);
    std::sort(v.begin(), v.end(), [](const Position& a, const Position& b){ return a.key() < b.key(); });
    return v;
}

size_t PositionLedger::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

void PositionLedger::clear(){
    std::lock_guard<std::mutex> lk(mu_);
    map_.clear();
}

} // namespace exec
