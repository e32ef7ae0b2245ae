#pragma once

/** \file hierarchical_index.hpp
 *  \brief Multi-level proximity graph over FlatIndex slots for sub-linear candidate retrieval.
 *
 * Simplified HNSW:
 * - Each node draws a level from a geometric distribution (promotion probability
 *   level_probability, capped at max_level) and joins levels 0..level.
 * - At every level it joins, its M neighbors are chosen by an exhaustive scan of
 *   that level's members against the FlatIndex (not greedy per-level search).
 *   Chosen neighbors get a backlink when they have room or the new node beats
 *   their weakest link, which keeps later inserts reachable from the entry point.
 * - Search descends greedily from the entry point's top level to level 1 and runs
 *   a best-first beam at level 0, scoring every visited node exactly.
 *
 * The entry point is the first node ever inserted; it is reassigned when that node
 * is removed and re-picked on rebuild(). No recall bound is guaranteed.
 *
 * Thread-safety: NOT thread-safe; use external synchronization (a reader/writer
 * lock around both this index and the FlatIndex it reads).
 * Memory: O(M * N * expected_levels) adjacency entries.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "promptvec/config.hpp"
#include "promptvec/error.hpp"
#include "promptvec/index/flat_index.hpp"

namespace promptvec::index {

/** \brief Index statistics. */
struct HierarchicalIndexStats {
    std::size_t n_nodes{0};                 /**< Nodes currently in the graph */
    std::size_t n_edges{0};                 /**< Adjacency entries over all levels */
    std::size_t n_levels{0};                /**< Populated levels */
    std::size_t memory_bytes{0};            /**< Adjacency storage estimate */
    float avg_degree{0.0f};                 /**< Level-0 edges per node */
    std::vector<std::size_t> level_counts;  /**< Nodes per level */
};

class HierarchicalIndex {
public:
    explicit HierarchicalIndex(HierarchicalIndexParams params = {});
    ~HierarchicalIndex();
    HierarchicalIndex(HierarchicalIndex&&) noexcept;
    HierarchicalIndex& operator=(HierarchicalIndex&&) noexcept;
    HierarchicalIndex(const HierarchicalIndex&) = delete;
    HierarchicalIndex& operator=(const HierarchicalIndex&) = delete;

    /** \brief Link a live FlatIndex slot into the graph (re-links if already present).
     *
     * Preconditions: flat.is_live(slot)
     * Complexity: O(level * N * dim) exhaustive neighbor selection
     */
    auto insert(const FlatIndex& flat, std::uint32_t slot) -> std::expected<void, core::error>;

    /** \brief Unlink a node. Inbound references from other nodes linger until garbage_collect(). */
    auto remove(std::uint32_t slot) -> void;

    /** \brief Approximate top candidates with similarity >= threshold, best first.
     *
     * \param limit Caller's result limit; the level-0 beam is max(ef_search, limit) wide
     * \return Hits sorted by descending similarity (ties by ascending slot)
     * Errors: not_initialized when the graph has no entry point
     */
    auto search(const FlatIndex& flat, std::span<const float> query,
                std::uint32_t limit, float threshold) const
        -> std::expected<std::vector<ScoredSlot>, core::error>;

    /** \brief Clear every level and reinsert all live slots in slot order. O(N^2). */
    auto rebuild(const FlatIndex& flat) -> std::expected<void, core::error>;

    /** \brief Drop adjacency references to nodes that are gone. \return references removed */
    auto garbage_collect(const FlatIndex& flat) -> std::size_t;

    /** \brief Apply a FlatIndex::compact() table. */
    auto remap(const std::vector<std::uint32_t>& old_to_new) -> void;

    auto clear() noexcept -> void;

    [[nodiscard]] auto entry_point() const noexcept -> std::optional<std::uint32_t>;
    [[nodiscard]] auto contains(std::uint32_t slot) const noexcept -> bool;
    [[nodiscard]] auto node_level(std::uint32_t slot) const noexcept -> std::optional<std::uint32_t>;
    [[nodiscard]] auto neighbors(std::uint32_t slot, std::uint32_t level) const -> std::vector<std::uint32_t>;
    /** \brief True when any adjacency list mentions slot (diagnostics). */
    [[nodiscard]] auto is_referenced(std::uint32_t slot) const noexcept -> bool;
    [[nodiscard]] auto max_level() const noexcept -> std::optional<std::uint32_t>;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto get_stats() const -> HierarchicalIndexStats;
    [[nodiscard]] auto params() const noexcept -> const HierarchicalIndexParams&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace promptvec::index
