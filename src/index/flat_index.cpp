/** \file flat_index.cpp
 *  \brief Dense slot arena for exact vectors.
 */

#include "promptvec/index/flat_index.hpp"
#include "promptvec/kernels/distance.hpp"

#include <algorithm>
#include <limits>

namespace promptvec::index {

FlatIndex::FlatIndex(std::size_t dim) : dim_(dim) {}

auto FlatIndex::upsert(std::string_view id, std::span<const float> vec)
    -> std::expected<std::uint32_t, core::error> {
    if (vec.size() != dim_) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "Vector dimension mismatch: expected " + std::to_string(dim_) +
                ", got " + std::to_string(vec.size()),
            "flat_index.upsert"
        });
    }

    std::string key(id);
    if (auto it = id_to_slot_.find(key); it != id_to_slot_.end()) {
        std::copy(vec.begin(), vec.end(), data_.begin() + static_cast<std::ptrdiff_t>(it->second * dim_));
        return it->second;
    }

    const auto slot = static_cast<std::uint32_t>(ids_.size());
    data_.insert(data_.end(), vec.begin(), vec.end());
    ids_.push_back(key);
    live_.push_back(1);
    id_to_slot_.emplace(std::move(key), slot);
    return slot;
}

auto FlatIndex::remove(std::string_view id) -> std::expected<std::uint32_t, core::error> {
    auto it = id_to_slot_.find(std::string(id));
    if (it == id_to_slot_.end()) {
        return std::unexpected(core::error{
            core::error_code::not_found,
            "Document not found: " + std::string(id),
            "flat_index.remove"
        });
    }
    const std::uint32_t slot = it->second;
    live_[slot] = 0;
    id_to_slot_.erase(it);
    return slot;
}

auto FlatIndex::find(std::string_view id) const -> std::optional<std::uint32_t> {
    auto it = id_to_slot_.find(std::string(id));
    if (it == id_to_slot_.end()) return std::nullopt;
    return it->second;
}

auto FlatIndex::vector(std::uint32_t slot) const -> std::span<const float> {
    return std::span<const float>(data_.data() + static_cast<std::size_t>(slot) * dim_, dim_);
}

auto FlatIndex::id(std::uint32_t slot) const -> const std::string& {
    return ids_[slot];
}

auto FlatIndex::is_live(std::uint32_t slot) const noexcept -> bool {
    return slot < live_.size() && live_[slot] != 0;
}

auto FlatIndex::live_slots() const -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> out;
    out.reserve(id_to_slot_.size());
    for (std::uint32_t s = 0; s < live_.size(); ++s) {
        if (live_[s]) out.push_back(s);
    }
    return out;
}

auto FlatIndex::scan(std::span<const float> query, float threshold) const
    -> std::vector<ScoredSlot> {
    const std::size_t n = ids_.size();
    std::vector<float> sims(n, -std::numeric_limits<float>::infinity());

    #pragma omp parallel for schedule(static)
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const auto s = static_cast<std::uint32_t>(i);
        if (live_[s]) sims[s] = kernels::cosine_similarity(query, vector(s));
    }

    std::vector<ScoredSlot> hits;
    for (std::uint32_t s = 0; s < n; ++s) {
        if (live_[s] && sims[s] >= threshold) hits.push_back({s, sims[s]});
    }
    return hits;
}

auto FlatIndex::component_range() const -> std::optional<std::pair<float, float>> {
    if (id_to_slot_.empty()) return std::nullopt;
    float lo = std::numeric_limits<float>::max();
    float hi = std::numeric_limits<float>::lowest();
    for (std::uint32_t s = 0; s < live_.size(); ++s) {
        if (!live_[s]) continue;
        for (float v : vector(s)) {
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }
    return std::make_pair(lo, hi);
}

auto FlatIndex::compact() -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> remap(ids_.size(), kInvalidSlot);
    std::uint32_t next = 0;
    for (std::uint32_t s = 0; s < ids_.size(); ++s) {
        if (!live_[s]) continue;
        remap[s] = next;
        if (next != s) {
            std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(s * dim_), dim_,
                        data_.begin() + static_cast<std::ptrdiff_t>(next * dim_));
            ids_[next] = std::move(ids_[s]);
        }
        live_[next] = 1;
        id_to_slot_[ids_[next]] = next;
        ++next;
    }
    data_.resize(static_cast<std::size_t>(next) * dim_);
    ids_.resize(next);
    live_.resize(next);
    return remap;
}

auto FlatIndex::clear() noexcept -> void {
    data_.clear();
    ids_.clear();
    live_.clear();
    id_to_slot_.clear();
}

auto FlatIndex::memory_bytes() const noexcept -> std::size_t {
    return id_to_slot_.size() * dim_ * sizeof(float);
}

} // namespace promptvec::index
