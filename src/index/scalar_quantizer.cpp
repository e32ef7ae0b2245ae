/** \file scalar_quantizer.cpp
 *  \brief Global min/max 8-bit quantizer.
 */

#include "promptvec/index/scalar_quantizer.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace promptvec::index {

ScalarQuantizer::ScalarQuantizer(std::size_t dim) : dim_(dim) {}

auto ScalarQuantizer::recalibrate(const FlatIndex& flat) -> bool {
    const auto range = flat.component_range();
    if (!range) return false;

    const auto [lo, hi] = *range;
    const float span = hi - lo;
    // A degenerate range maps every component to code 0.
    params_ = QuantizationParams{span > 0.0f ? span / 255.0f : 1.0f, lo};

    for (std::uint32_t s = 0; s < codes_.size(); ++s) {
        if (codes_[s].empty()) continue;
        if (!flat.is_live(s)) continue;
        encode_into(flat.vector(s), codes_[s]);
    }
    return true;
}

auto ScalarQuantizer::encode_into(std::span<const float> vec, std::vector<std::uint8_t>& out) const
    -> void {
    out.resize(dim_);
    const auto& p = *params_;
    for (std::size_t i = 0; i < dim_; ++i) {
        const float q = std::round((vec[i] - p.offset) / p.scale);
        out[i] = static_cast<std::uint8_t>(std::clamp(q, 0.0f, 255.0f));
    }
}

auto ScalarQuantizer::quantize(std::span<const float> vec) const
    -> std::expected<std::vector<std::uint8_t>, core::error> {
    if (!params_) {
        return std::unexpected(core::error{
            core::error_code::not_initialized,
            "Quantizer has not been calibrated",
            "quantizer"
        });
    }
    if (vec.size() != dim_) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "Vector dimension mismatch: expected " + std::to_string(dim_) +
                ", got " + std::to_string(vec.size()),
            "quantizer"
        });
    }
    std::vector<std::uint8_t> out;
    encode_into(vec, out);
    return out;
}

auto ScalarQuantizer::dequantize(std::span<const std::uint8_t> codes) const
    -> std::expected<std::vector<float>, core::error> {
    if (!params_) {
        return std::unexpected(core::error{
            core::error_code::not_initialized,
            "Quantizer has not been calibrated",
            "quantizer"
        });
    }
    std::vector<float> out(codes.size());
    for (std::size_t i = 0; i < codes.size(); ++i) {
        out[i] = params_->offset + static_cast<float>(codes[i]) * params_->scale;
    }
    return out;
}

auto ScalarQuantizer::encode_slot(const FlatIndex& flat, std::uint32_t slot)
    -> std::expected<void, core::error> {
    if (!flat.is_live(slot)) {
        return std::unexpected(core::error{
            core::error_code::not_found,
            "Slot is not live",
            "quantizer.encode"
        });
    }
    if (!params_ && !recalibrate(flat)) {
        return std::unexpected(core::error{
            core::error_code::not_initialized,
            "Cannot calibrate quantizer on an empty corpus",
            "quantizer.encode"
        });
    }
    if (codes_.size() <= slot) codes_.resize(static_cast<std::size_t>(slot) + 1);
    if (codes_[slot].empty()) ++encoded_;
    encode_into(flat.vector(slot), codes_[slot]);
    return {};
}

auto ScalarQuantizer::erase(std::uint32_t slot) noexcept -> void {
    if (slot < codes_.size() && !codes_[slot].empty()) {
        codes_[slot].clear();
        codes_[slot].shrink_to_fit();
        --encoded_;
    }
}

auto ScalarQuantizer::codes(std::uint32_t slot) const -> std::optional<std::span<const std::uint8_t>> {
    if (slot >= codes_.size() || codes_[slot].empty()) return std::nullopt;
    return std::span<const std::uint8_t>(codes_[slot]);
}

auto ScalarQuantizer::remap(const std::vector<std::uint32_t>& old_to_new) -> void {
    std::vector<std::vector<std::uint8_t>> next;
    encoded_ = 0;
    for (std::uint32_t s = 0; s < codes_.size() && s < old_to_new.size(); ++s) {
        const std::uint32_t to = old_to_new[s];
        if (to == kInvalidSlot || codes_[s].empty()) continue;
        if (next.size() <= to) next.resize(static_cast<std::size_t>(to) + 1);
        next[to] = std::move(codes_[s]);
        ++encoded_;
    }
    codes_ = std::move(next);
}

auto ScalarQuantizer::garbage_collect(const FlatIndex& flat) -> std::size_t {
    std::size_t dropped = 0;
    for (std::uint32_t s = 0; s < codes_.size(); ++s) {
        if (!codes_[s].empty() && !flat.is_live(s)) {
            erase(s);
            ++dropped;
        }
    }
    return dropped;
}

auto ScalarQuantizer::clear() noexcept -> void {
    codes_.clear();
    params_.reset();
    encoded_ = 0;
}

} // namespace promptvec::index
