#include "promptvec/analysis/recommendation_engine.hpp"
#include "promptvec/kernels/distance.hpp"

#include <cmath>

namespace promptvec::analysis {

auto to_string(InteractionType type) noexcept -> std::string_view {
    switch (type) {
        case InteractionType::View: return "view";
        case InteractionType::Like: return "like";
        case InteractionType::Use: return "use";
        case InteractionType::Share: return "share";
    }
    return "unknown";
}

auto parse_interaction_type(std::string_view text) -> std::expected<InteractionType, core::error> {
    if (text == "view") return InteractionType::View;
    if (text == "like") return InteractionType::Like;
    if (text == "use") return InteractionType::Use;
    if (text == "share") return InteractionType::Share;
    return std::unexpected(core::error{
        core::error_code::invalid_argument,
        "Unknown interaction type: " + std::string(text),
        "recommend"
    });
}

auto base_weight(InteractionType type) noexcept -> double {
    switch (type) {
        case InteractionType::View: return 0.1;
        case InteractionType::Like: return 0.3;
        case InteractionType::Use: return 0.5;
        case InteractionType::Share: return 0.8;
    }
    return 0.0;
}

RecommendationEngine::RecommendationEngine(const DatabaseConfig& cfg)
    : threshold_(cfg.recommendation_threshold)
    , recent_window_(cfg.recent_interaction_window)
    , decay_days_(cfg.recency_decay_days) {}

auto RecommendationEngine::preference_vector(const index::FlatIndex& flat,
                                             const std::vector<Interaction>& history,
                                             Timestamp now) const
    -> std::optional<std::vector<float>> {
    const std::size_t dim = flat.dimension();
    std::vector<double> acc(dim, 0.0);
    double total_weight = 0.0;

    for (const auto& interaction : history) {
        const auto slot = flat.find(interaction.document_id);
        if (!slot) continue;

        const double days = std::chrono::duration<double, std::ratio<86400>>(now - interaction.timestamp).count();
        const double w = base_weight(interaction.type) * std::exp(-days / decay_days_) *
                         interaction.weight.value_or(1.0);
        const auto v = flat.vector(*slot);
        for (std::size_t d = 0; d < dim; ++d) acc[d] += v[d] * w;
        total_weight += w;
    }

    if (total_weight <= 0.0) return std::nullopt;

    std::vector<float> pref(dim);
    for (std::size_t d = 0; d < dim; ++d) pref[d] = static_cast<float>(acc[d] / total_weight);
    kernels::normalize_in_place(pref);
    return pref;
}

auto RecommendationEngine::recent_documents(const std::vector<Interaction>& history, Timestamp now) const
    -> std::set<std::string> {
    std::set<std::string> out;
    for (const auto& interaction : history) {
        if (now - interaction.timestamp < recent_window_) out.insert(interaction.document_id);
    }
    return out;
}

auto RecommendationEngine::make_query(std::vector<float> preference, std::uint32_t limit,
                                      std::size_t excluded) const -> search::SearchQuery {
    search::SearchQuery query;
    query.vector = std::move(preference);
    query.limit = limit + static_cast<std::uint32_t>(excluded);
    query.threshold = threshold_;
    return query;
}

auto RecommendationEngine::finalize(std::vector<search::SearchResult> results,
                                    const std::set<std::string>& excluded,
                                    std::uint32_t limit) -> std::vector<search::SearchResult> {
    std::erase_if(results, [&](const search::SearchResult& r) {
        return excluded.contains(r.document.id);
    });
    if (results.size() > limit) results.resize(limit);
    for (std::size_t i = 0; i < results.size(); ++i) {
        results[i].rank = static_cast<std::uint32_t>(i + 1);
    }
    return results;
}

} // namespace promptvec::analysis
