#pragma once

/** \file recommendation_engine.hpp
 *  \brief Preference vectors from weighted, time-decayed interaction history.
 *
 * Each interaction contributes base_weight(type) * exp(-days_since / decay_days)
 * * custom_weight of its document's vector. The weighted mean is normalized and
 * used as a low-threshold search query; documents touched within the recent
 * window are excluded from the recommendations.
 */

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "promptvec/config.hpp"
#include "promptvec/document.hpp"
#include "promptvec/error.hpp"
#include "promptvec/index/flat_index.hpp"
#include "promptvec/search/search_engine.hpp"

namespace promptvec::analysis {

enum class InteractionType : std::uint8_t {
    View,
    Like,
    Use,
    Share,
};

auto to_string(InteractionType type) noexcept -> std::string_view;
auto parse_interaction_type(std::string_view text) -> std::expected<InteractionType, core::error>;

/** \brief view 0.1, like 0.3, use 0.5, share 0.8. */
auto base_weight(InteractionType type) noexcept -> double;

struct Interaction {
    std::string document_id;
    InteractionType type{InteractionType::View};
    Timestamp timestamp{};
    std::optional<double> weight;        /**< Custom multiplier, 1 when absent */
};

class RecommendationEngine {
public:
    explicit RecommendationEngine(const DatabaseConfig& cfg);

    /** \brief Normalized weighted mean of the interacted documents' vectors.
     *
     * Interactions with unknown documents are skipped.
     * \return nullopt when nothing contributes a positive weight
     */
    [[nodiscard]] auto preference_vector(const index::FlatIndex& flat,
                                         const std::vector<Interaction>& history,
                                         Timestamp now) const
        -> std::optional<std::vector<float>>;

    /** \brief Documents interacted with inside the recent window. */
    [[nodiscard]] auto recent_documents(const std::vector<Interaction>& history, Timestamp now) const
        -> std::set<std::string>;

    /** \brief Query used to retrieve recommendation candidates. */
    [[nodiscard]] auto make_query(std::vector<float> preference, std::uint32_t limit,
                                  std::size_t excluded) const -> search::SearchQuery;

    /** \brief Drop excluded documents, truncate to limit and re-rank from 1. */
    [[nodiscard]] static auto finalize(std::vector<search::SearchResult> results,
                                       const std::set<std::string>& excluded,
                                       std::uint32_t limit) -> std::vector<search::SearchResult>;

private:
    float threshold_;
    std::chrono::hours recent_window_;
    double decay_days_;
};

} // namespace promptvec::analysis
