#include "promptvec/analysis/drift_analyzer.hpp"
#include "promptvec/kernels/distance.hpp"

#include <algorithm>
#include <span>

namespace promptvec::analysis {

namespace {

using Group = std::vector<std::span<const float>>;

auto drift_between(const Group& recent, const Group& older, std::size_t dim) -> double {
    const auto a = kernels::centroid(recent, dim);
    const auto b = kernels::centroid(older, dim);
    return 1.0 - static_cast<double>(kernels::cosine_similarity(a, b));
}

} // anonymous namespace

DriftAnalyzer::DriftAnalyzer(const DatabaseConfig& cfg)
    : recent_window_(cfg.drift_recent_window)
    , older_window_(cfg.drift_older_window)
    , growth_min_(cfg.trending_growth_min)
    , overall_alert_(cfg.overall_drift_alert)
    , domain_alert_(cfg.domain_drift_alert) {}

auto DriftAnalyzer::analyze(const store::DocumentStore& store, Timestamp now) const -> DriftReport {
    const auto& flat = store.flat();
    const std::size_t dim = flat.dimension();
    const Timestamp recent_after = now - recent_window_;
    const Timestamp older_before = now - older_window_;

    Group recent, older;
    std::map<std::string, Group> recent_by_domain, older_by_domain;
    std::map<std::string, std::size_t> recent_tags, older_tags;

    for (auto slot : flat.live_slots()) {
        const auto& doc = store.document(slot);
        const auto created = doc.metadata.created;
        if (created > recent_after) {
            recent.push_back(flat.vector(slot));
            recent_by_domain[doc.metadata.domain].push_back(flat.vector(slot));
            for (const auto& tag : doc.metadata.tags) recent_tags[tag]++;
        } else if (created < older_before) {
            older.push_back(flat.vector(slot));
            older_by_domain[doc.metadata.domain].push_back(flat.vector(slot));
            for (const auto& tag : doc.metadata.tags) older_tags[tag]++;
        }
    }

    DriftReport report;
    report.recent_count = recent.size();
    report.older_count = older.size();
    report.sufficient_data = !recent.empty() && !older.empty();
    if (report.sufficient_data) {
        report.overall_drift = drift_between(recent, older, dim);
    }

    for (const auto& [domain, group] : recent_by_domain) {
        auto it = older_by_domain.find(domain);
        if (it == older_by_domain.end()) continue;
        report.domain_drifts[domain] = drift_between(group, it->second, dim);
    }

    for (const auto& [tag, count] : recent_tags) {
        const auto it = older_tags.find(tag);
        const double old_count = it == older_tags.end() ? 0.0 : static_cast<double>(it->second);
        const double r = static_cast<double>(count);
        const double growth = old_count > 0.0 ? (r - old_count) / old_count : r;
        if (growth > growth_min_) {
            report.trending_topics.push_back(TrendingTopic{tag, growth, count});
        }
    }
    std::stable_sort(report.trending_topics.begin(), report.trending_topics.end(),
                     [](const TrendingTopic& a, const TrendingTopic& b) {
                         return a.growth_rate > b.growth_rate;
                     });

    if (report.overall_drift > overall_alert_) {
        report.recommendations.emplace_back(
            "Significant semantic drift detected - consider retraining models");
    }
    for (const auto& [domain, drift] : report.domain_drifts) {
        if (drift > domain_alert_) {
            report.recommendations.push_back("High drift in " + domain + " domain - review recent additions");
        }
    }
    if (!report.trending_topics.empty()) {
        std::string topics;
        for (std::size_t i = 0; i < report.trending_topics.size() && i < 3; ++i) {
            if (i > 0) topics += ", ";
            topics += report.trending_topics[i].topic;
        }
        report.recommendations.push_back("Trending topics detected: " + topics);
    }
    return report;
}

} // namespace promptvec::analysis
