#pragma once

/** \file scalar_quantizer.hpp
 *  \brief 8-bit affine scalar quantization with corpus-global parameters.
 *
 * code[i] = clamp(round((v[i] - offset) / scale), 0, 255), with offset = global min
 * and scale = (max - min) / 255 over every live component. Parameters are computed
 * on first use and afterwards only by an explicit recalibrate(); inserts between
 * recalibrations are encoded with the stale parameters.
 *
 * Codes are bookkeeping (memory accounting, reduced-fidelity reconstruction);
 * full-precision vectors stay authoritative for similarity.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "promptvec/error.hpp"
#include "promptvec/index/flat_index.hpp"

namespace promptvec::index {

/** \brief Affine transform parameters. */
struct QuantizationParams {
    float scale{1.0f};
    float offset{0.0f};
};

class ScalarQuantizer {
public:
    explicit ScalarQuantizer(std::size_t dim);

    /** \brief Recompute (scale, offset) from the live corpus and re-encode stored codes.
     *
     * \return false when the corpus is empty (parameters unchanged)
     * Complexity: O(N * dim)
     */
    auto recalibrate(const FlatIndex& flat) -> bool;

    /** \brief Encode with current parameters. Errors: not_initialized, invalid_argument. */
    [[nodiscard]] auto quantize(std::span<const float> vec) const
        -> std::expected<std::vector<std::uint8_t>, core::error>;

    /** \brief Approximate reconstruction offset + code * scale. */
    [[nodiscard]] auto dequantize(std::span<const std::uint8_t> codes) const
        -> std::expected<std::vector<float>, core::error>;

    /** \brief Encode the vector in slot and keep the codes; calibrates first if needed. */
    auto encode_slot(const FlatIndex& flat, std::uint32_t slot) -> std::expected<void, core::error>;

    auto erase(std::uint32_t slot) noexcept -> void;

    [[nodiscard]] auto codes(std::uint32_t slot) const -> std::optional<std::span<const std::uint8_t>>;

    /** \brief Apply a FlatIndex::compact() table. */
    auto remap(const std::vector<std::uint32_t>& old_to_new) -> void;

    /** \brief Drop codes whose slot is no longer live. \return number dropped */
    auto garbage_collect(const FlatIndex& flat) -> std::size_t;

    auto clear() noexcept -> void;

    [[nodiscard]] auto params() const noexcept -> std::optional<QuantizationParams> { return params_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return encoded_; }
    [[nodiscard]] auto memory_bytes() const noexcept -> std::size_t { return encoded_ * dim_; }

private:
    auto encode_into(std::span<const float> vec, std::vector<std::uint8_t>& out) const -> void;

    std::size_t dim_;
    std::optional<QuantizationParams> params_;
    std::vector<std::vector<std::uint8_t>> codes_;   // by slot; empty = absent
    std::size_t encoded_{0};
};

} // namespace promptvec::index
