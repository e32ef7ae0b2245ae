#pragma once

/** \file flat_index.hpp
 *  \brief Exact id -> vector arena; ground truth for all similarity math.
 *
 * Documents live in dense integer slots with a string id lookup table. Removal
 * tombstones a slot; slots are never reused until compact() renumbers the arena.
 * Every other slot-keyed structure (quantized codes, metadata bitmaps, adjacency)
 * must be remapped with the table compact() returns.
 *
 * Thread-safety: NOT thread-safe; callers serialize writers against readers.
 */

#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "promptvec/error.hpp"

namespace promptvec::index {

/** \brief Marker for "no slot" in remap tables and adjacency. */
inline constexpr std::uint32_t kInvalidSlot = std::numeric_limits<std::uint32_t>::max();

/** \brief One exact-scan hit. */
struct ScoredSlot {
    std::uint32_t slot{kInvalidSlot};
    float similarity{0.0f};
};

class FlatIndex {
public:
    explicit FlatIndex(std::size_t dim);

    /** \brief Insert or overwrite the vector stored under id.
     *
     * \return Slot holding the vector (unchanged for an existing id)
     * Errors: invalid_argument when vec.size() != dimension()
     * Complexity: O(dim) amortized
     */
    auto upsert(std::string_view id, std::span<const float> vec)
        -> std::expected<std::uint32_t, core::error>;

    /** \brief Tombstone the slot behind id. Errors: not_found. */
    auto remove(std::string_view id) -> std::expected<std::uint32_t, core::error>;

    [[nodiscard]] auto find(std::string_view id) const -> std::optional<std::uint32_t>;
    [[nodiscard]] auto vector(std::uint32_t slot) const -> std::span<const float>;
    [[nodiscard]] auto id(std::uint32_t slot) const -> const std::string&;
    [[nodiscard]] auto is_live(std::uint32_t slot) const noexcept -> bool;

    /** \brief Live slots in ascending (insertion) order. */
    [[nodiscard]] auto live_slots() const -> std::vector<std::uint32_t>;

    /** \brief Exhaustive cosine scan keeping hits with similarity >= threshold.
     *
     * Results are in slot order; callers sort.
     */
    [[nodiscard]] auto scan(std::span<const float> query, float threshold) const
        -> std::vector<ScoredSlot>;

    /** \brief Min and max over every live component; nullopt when empty. */
    [[nodiscard]] auto component_range() const -> std::optional<std::pair<float, float>>;

    /** \brief Drop tombstones and renumber live slots densely, preserving order.
     *
     * \return old slot -> new slot (kInvalidSlot for removed slots)
     */
    auto compact() -> std::vector<std::uint32_t>;

    auto clear() noexcept -> void;

    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dim_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return id_to_slot_.size(); }
    [[nodiscard]] auto slot_count() const noexcept -> std::size_t { return ids_.size(); }
    [[nodiscard]] auto tombstone_count() const noexcept -> std::size_t { return ids_.size() - id_to_slot_.size(); }
    [[nodiscard]] auto memory_bytes() const noexcept -> std::size_t;

private:
    std::size_t dim_;
    std::vector<float> data_;                 // slot_count x dim, row-major
    std::vector<std::string> ids_;
    std::vector<std::uint8_t> live_;
    std::unordered_map<std::string, std::uint32_t> id_to_slot_;
};

} // namespace promptvec::index
