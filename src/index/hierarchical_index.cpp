/** \file hierarchical_index.cpp
 *  \brief Simplified HNSW over FlatIndex slots.
 */

#include "promptvec/index/hierarchical_index.hpp"
#include "promptvec/core/debug.hpp"
#include "promptvec/kernels/distance.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <queue>
#include <random>
#include <utility>

namespace promptvec::index {

/** \brief Node in the graph, stored by slot. */
struct GraphNode {
    bool present{false};
    std::uint32_t level{0};
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per level 0..level
};

/** \brief Internal implementation of the hierarchical index. */
class HierarchicalIndex::Impl {
public:
    explicit Impl(HierarchicalIndexParams params)
        : params_(params), rng_(params.seed) {}

    HierarchicalIndexParams params_;
    std::mt19937 rng_;
    std::uint32_t entry_point_{kInvalidSlot};

    /** \brief Graph nodes by slot. */
    std::vector<GraphNode> nodes_;
    /** \brief Per level, the slots that joined it. */
    std::vector<std::vector<std::uint32_t>> level_members_;

    /** \brief Geometric level draw. */
    auto select_level() -> std::uint32_t;

    /** \brief Cosine distance between a query and a slot. */
    static auto distance(const FlatIndex& flat, std::span<const float> q, std::uint32_t slot) -> float {
        return kernels::cosine_distance(q, flat.vector(slot));
    }

    auto usable(const FlatIndex& flat, std::uint32_t slot) const noexcept -> bool {
        return slot < nodes_.size() && nodes_[slot].present && flat.is_live(slot);
    }

    /** \brief M nearest members of a level by exhaustive scan, closest first. */
    auto nearest_on_level(const FlatIndex& flat, std::uint32_t slot, std::uint32_t level) const
        -> std::vector<std::pair<float, std::uint32_t>>;

    /** \brief Offer new_slot as a neighbor of existing at level. */
    auto add_backlink(const FlatIndex& flat, std::uint32_t existing, std::uint32_t new_slot,
                      float new_dist, std::uint32_t level) -> void;

    /** \brief Best-first beam over one level. */
    auto search_layer(const FlatIndex& flat, std::span<const float> query,
                      std::uint32_t entry, std::uint32_t ef, std::uint32_t level) const
        -> std::vector<std::pair<float, std::uint32_t>>;

    /** \brief Highest-level present node, lowest slot on ties. */
    auto pick_entry_point(const FlatIndex* flat) const -> std::uint32_t;

    auto erase_from_levels(std::uint32_t slot) -> void;
    auto trim_levels() -> void;
};

auto HierarchicalIndex::Impl::select_level() -> std::uint32_t {
    std::bernoulli_distribution promote(params_.level_probability);
    std::uint32_t level = 0;
    while (level < params_.max_level && promote(rng_)) {
        ++level;
    }
    return level;
}

auto HierarchicalIndex::Impl::nearest_on_level(const FlatIndex& flat, std::uint32_t slot,
                                               std::uint32_t level) const
    -> std::vector<std::pair<float, std::uint32_t>> {
    std::vector<std::pair<float, std::uint32_t>> candidates;
    if (level >= level_members_.size()) return candidates;

    const auto query = flat.vector(slot);
    candidates.reserve(level_members_[level].size());
    for (std::uint32_t member : level_members_[level]) {
        if (member == slot || !usable(flat, member)) continue;
        candidates.emplace_back(distance(flat, query, member), member);
    }

    const std::size_t keep = std::min<std::size_t>(params_.M, candidates.size());
    // Pairs order by (distance, slot), so ties resolve deterministically.
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(keep),
                      candidates.end());
    candidates.resize(keep);
    return candidates;
}

auto HierarchicalIndex::Impl::add_backlink(const FlatIndex& flat, std::uint32_t existing,
                                           std::uint32_t new_slot, float new_dist,
                                           std::uint32_t level) -> void {
    auto& node = nodes_[existing];
    if (level > node.level) return;
    auto& links = node.neighbors[level];
    if (std::find(links.begin(), links.end(), new_slot) != links.end()) return;

    if (links.size() < params_.M) {
        links.push_back(new_slot);
        return;
    }

    // Full: replace the weakest link if the newcomer is closer.
    const auto base = flat.vector(existing);
    std::size_t worst_pos = 0;
    float worst_dist = -1.0f;
    for (std::size_t i = 0; i < links.size(); ++i) {
        const std::uint32_t n = links[i];
        const float d = usable(flat, n) ? distance(flat, base, n)
                                        : std::numeric_limits<float>::infinity();
        if (d > worst_dist) {
            worst_dist = d;
            worst_pos = i;
        }
    }
    if (new_dist < worst_dist) {
        links[worst_pos] = new_slot;
    }
}

auto HierarchicalIndex::Impl::search_layer(const FlatIndex& flat, std::span<const float> query,
                                           std::uint32_t entry, std::uint32_t ef,
                                           std::uint32_t level) const
    -> std::vector<std::pair<float, std::uint32_t>> {
    std::vector<std::uint8_t> visited(nodes_.size(), 0);

    std::priority_queue<std::pair<float, std::uint32_t>> candidates;  // max-heap on -dist
    std::priority_queue<std::pair<float, std::uint32_t>> nearest;     // max-heap on dist

    const float entry_dist = distance(flat, query, entry);
    candidates.emplace(-entry_dist, entry);
    nearest.emplace(entry_dist, entry);
    visited[entry] = 1;

    while (!candidates.empty()) {
        const auto [neg_dist, current] = candidates.top();
        const float current_dist = -neg_dist;
        candidates.pop();

        if (nearest.size() >= ef && current_dist > nearest.top().first) {
            break;
        }

        const auto& node = nodes_[current];
        if (level > node.level) continue;

        for (std::uint32_t neighbor : node.neighbors[level]) {
            if (neighbor >= visited.size() || visited[neighbor]) continue;
            visited[neighbor] = 1;
            if (!usable(flat, neighbor)) continue;

            const float dist = distance(flat, query, neighbor);
            if (nearest.size() < ef || dist < nearest.top().first) {
                candidates.emplace(-dist, neighbor);
                nearest.emplace(dist, neighbor);
                if (nearest.size() > ef) {
                    nearest.pop();
                }
            }
        }
    }

    std::vector<std::pair<float, std::uint32_t>> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    // Deterministic ordering on ties (distance, then slot)
    std::sort(result.begin(), result.end());
    return result;
}

auto HierarchicalIndex::Impl::pick_entry_point(const FlatIndex* flat) const -> std::uint32_t {
    std::uint32_t best = kInvalidSlot;
    for (std::uint32_t s = 0; s < nodes_.size(); ++s) {
        if (!nodes_[s].present) continue;
        if (flat && !flat->is_live(s)) continue;
        if (best == kInvalidSlot || nodes_[s].level > nodes_[best].level) best = s;
    }
    return best;
}

auto HierarchicalIndex::Impl::erase_from_levels(std::uint32_t slot) -> void {
    const auto& node = nodes_[slot];
    for (std::uint32_t l = 0; l <= node.level && l < level_members_.size(); ++l) {
        auto& members = level_members_[l];
        members.erase(std::remove(members.begin(), members.end(), slot), members.end());
    }
}

auto HierarchicalIndex::Impl::trim_levels() -> void {
    while (!level_members_.empty() && level_members_.back().empty()) {
        level_members_.pop_back();
    }
}

HierarchicalIndex::HierarchicalIndex(HierarchicalIndexParams params)
    : impl_(std::make_unique<Impl>(params)) {}

HierarchicalIndex::~HierarchicalIndex() = default;
HierarchicalIndex::HierarchicalIndex(HierarchicalIndex&&) noexcept = default;
HierarchicalIndex& HierarchicalIndex::operator=(HierarchicalIndex&&) noexcept = default;

auto HierarchicalIndex::insert(const FlatIndex& flat, std::uint32_t slot)
    -> std::expected<void, core::error> {
    if (!flat.is_live(slot)) {
        return std::unexpected(core::error{
            core::error_code::precondition_failed,
            "Cannot index a slot that is not live",
            "hierarchical_index.insert"
        });
    }

    auto& impl = *impl_;
    std::uint32_t level = 0;
    if (slot < impl.nodes_.size() && impl.nodes_[slot].present) {
        // Upsert of an existing document: relink with the new vector at the level it already
        // holds. No level is drawn, so the RNG stream and the entry point stay put.
        level = impl.nodes_[slot].level;
        impl.erase_from_levels(slot);
        impl.nodes_[slot].present = false;
    } else {
        if (impl.nodes_.size() <= slot) {
            impl.nodes_.resize(static_cast<std::size_t>(slot) + 1);
        }
        level = impl.select_level();
    }
    if (impl.level_members_.size() <= level) {
        impl.level_members_.resize(static_cast<std::size_t>(level) + 1);
    }

    // Neighbors are picked before the node joins its levels so it never links to itself.
    std::vector<std::vector<std::pair<float, std::uint32_t>>> chosen(level + 1);
    for (std::uint32_t l = 0; l <= level; ++l) {
        chosen[l] = impl.nearest_on_level(flat, slot, l);
    }

    auto& node = impl.nodes_[slot];
    node.present = true;
    node.level = level;
    node.neighbors.assign(static_cast<std::size_t>(level) + 1, {});
    for (std::uint32_t l = 0; l <= level; ++l) {
        auto& links = node.neighbors[l];
        links.reserve(chosen[l].size());
        for (const auto& [dist, neighbor] : chosen[l]) {
            links.push_back(neighbor);
            impl.add_backlink(flat, neighbor, slot, dist, l);
        }
        impl.level_members_[l].push_back(slot);
    }

    if (impl.entry_point_ == kInvalidSlot || !impl.usable(flat, impl.entry_point_)) {
        impl.entry_point_ = slot;
    }
    return {};
}

auto HierarchicalIndex::remove(std::uint32_t slot) -> void {
    auto& impl = *impl_;
    if (slot >= impl.nodes_.size() || !impl.nodes_[slot].present) return;

    impl.erase_from_levels(slot);
    auto& node = impl.nodes_[slot];
    node.present = false;
    node.neighbors.clear();
    node.level = 0;
    impl.trim_levels();

    if (impl.entry_point_ == slot) {
        impl.entry_point_ = impl.pick_entry_point(nullptr);
    }
}

auto HierarchicalIndex::search(const FlatIndex& flat, std::span<const float> query,
                               std::uint32_t limit, float threshold) const
    -> std::expected<std::vector<ScoredSlot>, core::error> {
    const auto& impl = *impl_;
    if (impl.entry_point_ == kInvalidSlot || !impl.usable(flat, impl.entry_point_)) {
        return std::unexpected(core::error{
            core::error_code::not_initialized,
            "Hierarchical index has no entry point",
            "hierarchical_index.search"
        });
    }

    // Greedy descent through the upper levels.
    std::uint32_t current = impl.entry_point_;
    float current_dist = Impl::distance(flat, query, current);
    for (std::uint32_t l = impl.nodes_[current].level; l > 0; --l) {
        bool changed = true;
        while (changed) {
            changed = false;
            const auto& node = impl.nodes_[current];
            if (l > node.level) break;
            for (std::uint32_t neighbor : node.neighbors[l]) {
                if (!impl.usable(flat, neighbor)) continue;
                const float d = Impl::distance(flat, query, neighbor);
                if (d < current_dist) {
                    current_dist = d;
                    current = neighbor;
                    changed = true;
                }
            }
        }
    }

    const std::uint32_t ef = std::max(impl.params_.ef_search, limit);
    const auto found = impl.search_layer(flat, query, current, ef, 0);

    std::vector<ScoredSlot> hits;
    hits.reserve(found.size());
    for (const auto& [dist, slot] : found) {
        const float sim = kernels::cosine_similarity(query, flat.vector(slot));
        if (sim >= threshold) hits.push_back({slot, sim});
    }
    std::stable_sort(hits.begin(), hits.end(), [](const ScoredSlot& a, const ScoredSlot& b) {
        return a.similarity > b.similarity;
    });

    if (core::debug_enabled()) {
        std::cerr << "[promptvec][index] search visited beam=" << found.size()
                  << " hits=" << hits.size() << std::endl;
    }
    return hits;
}

auto HierarchicalIndex::rebuild(const FlatIndex& flat) -> std::expected<void, core::error> {
    clear();
    const auto slots = flat.live_slots();
    if (core::debug_enabled()) {
        std::cerr << "[promptvec][index] rebuilding over " << slots.size() << " nodes" << std::endl;
    }
    for (std::uint32_t slot : slots) {
        if (auto r = insert(flat, slot); !r) {
            return std::unexpected(r.error());
        }
    }
    // Re-pick: the first reinserted node anchors descent.
    impl_->entry_point_ = slots.empty() ? kInvalidSlot : slots.front();
    return {};
}

auto HierarchicalIndex::garbage_collect(const FlatIndex& flat) -> std::size_t {
    auto& impl = *impl_;
    std::size_t removed = 0;

    for (std::uint32_t s = 0; s < impl.nodes_.size(); ++s) {
        auto& node = impl.nodes_[s];
        if (node.present && !flat.is_live(s)) {
            // Document vanished without an explicit unlink.
            remove(s);
            continue;
        }
        for (auto& links : node.neighbors) {
            const auto before = links.size();
            links.erase(std::remove_if(links.begin(), links.end(),
                                       [&](std::uint32_t n) { return !impl.usable(flat, n); }),
                        links.end());
            removed += before - links.size();
        }
    }
    impl.trim_levels();
    if (impl.entry_point_ != kInvalidSlot && !impl.usable(flat, impl.entry_point_)) {
        impl.entry_point_ = impl.pick_entry_point(&flat);
    }
    return removed;
}

auto HierarchicalIndex::remap(const std::vector<std::uint32_t>& old_to_new) -> void {
    auto& impl = *impl_;
    auto map = [&](std::uint32_t s) {
        return s < old_to_new.size() ? old_to_new[s] : kInvalidSlot;
    };

    std::vector<GraphNode> next;
    for (std::uint32_t s = 0; s < impl.nodes_.size(); ++s) {
        const std::uint32_t to = map(s);
        if (to == kInvalidSlot || !impl.nodes_[s].present) continue;
        if (next.size() <= to) next.resize(static_cast<std::size_t>(to) + 1);
        GraphNode& dst = next[to];
        dst = std::move(impl.nodes_[s]);
        for (auto& links : dst.neighbors) {
            std::vector<std::uint32_t> mapped;
            mapped.reserve(links.size());
            for (std::uint32_t n : links) {
                if (const std::uint32_t m = map(n); m != kInvalidSlot) mapped.push_back(m);
            }
            links = std::move(mapped);
        }
    }
    impl.nodes_ = std::move(next);

    for (auto& members : impl.level_members_) {
        std::vector<std::uint32_t> mapped;
        mapped.reserve(members.size());
        for (std::uint32_t m : members) {
            if (const std::uint32_t t = map(m); t != kInvalidSlot) mapped.push_back(t);
        }
        members = std::move(mapped);
    }
    impl.trim_levels();

    impl.entry_point_ = map(impl.entry_point_);
    if (impl.entry_point_ == kInvalidSlot) {
        impl.entry_point_ = impl.pick_entry_point(nullptr);
    }
}

auto HierarchicalIndex::clear() noexcept -> void {
    impl_->nodes_.clear();
    impl_->level_members_.clear();
    impl_->entry_point_ = kInvalidSlot;
}

auto HierarchicalIndex::entry_point() const noexcept -> std::optional<std::uint32_t> {
    if (impl_->entry_point_ == kInvalidSlot) return std::nullopt;
    return impl_->entry_point_;
}

auto HierarchicalIndex::contains(std::uint32_t slot) const noexcept -> bool {
    return slot < impl_->nodes_.size() && impl_->nodes_[slot].present;
}

auto HierarchicalIndex::node_level(std::uint32_t slot) const noexcept -> std::optional<std::uint32_t> {
    if (!contains(slot)) return std::nullopt;
    return impl_->nodes_[slot].level;
}

auto HierarchicalIndex::neighbors(std::uint32_t slot, std::uint32_t level) const
    -> std::vector<std::uint32_t> {
    if (!contains(slot) || level > impl_->nodes_[slot].level) return {};
    return impl_->nodes_[slot].neighbors[level];
}

auto HierarchicalIndex::is_referenced(std::uint32_t slot) const noexcept -> bool {
    for (const auto& node : impl_->nodes_) {
        for (const auto& links : node.neighbors) {
            if (std::find(links.begin(), links.end(), slot) != links.end()) return true;
        }
    }
    for (const auto& members : impl_->level_members_) {
        if (std::find(members.begin(), members.end(), slot) != members.end()) return true;
    }
    return false;
}

auto HierarchicalIndex::max_level() const noexcept -> std::optional<std::uint32_t> {
    if (impl_->level_members_.empty()) return std::nullopt;
    return static_cast<std::uint32_t>(impl_->level_members_.size() - 1);
}

auto HierarchicalIndex::size() const noexcept -> std::size_t {
    return impl_->level_members_.empty() ? 0 : impl_->level_members_.front().size();
}

auto HierarchicalIndex::get_stats() const -> HierarchicalIndexStats {
    HierarchicalIndexStats stats;
    const auto& impl = *impl_;
    stats.n_nodes = size();
    stats.n_levels = impl.level_members_.size();
    stats.level_counts.reserve(impl.level_members_.size());
    for (const auto& members : impl.level_members_) {
        stats.level_counts.push_back(members.size());
    }
    std::size_t base_edges = 0;
    for (const auto& node : impl.nodes_) {
        for (std::size_t l = 0; l < node.neighbors.size(); ++l) {
            stats.n_edges += node.neighbors[l].size();
            if (l == 0) base_edges += node.neighbors[l].size();
        }
    }
    stats.memory_bytes = stats.n_edges * sizeof(std::uint32_t) +
                         impl.nodes_.size() * sizeof(GraphNode);
    stats.avg_degree = stats.n_nodes > 0
        ? static_cast<float>(base_edges) / static_cast<float>(stats.n_nodes)
        : 0.0f;
    return stats;
}

auto HierarchicalIndex::params() const noexcept -> const HierarchicalIndexParams& {
    return impl_->params_;
}

} // namespace promptvec::index
