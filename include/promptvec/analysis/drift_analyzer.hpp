#pragma once

/** \file drift_analyzer.hpp
 *  \brief Centroid drift between recent and older documents, globally and per domain.
 *
 * Recent documents were created strictly less than drift_recent_window ago, older
 * ones strictly more than drift_older_window ago; documents in between count for
 * neither. Drift is 1 - cosine(recent centroid, older centroid).
 */

#include <map>
#include <string>
#include <vector>

#include "promptvec/config.hpp"
#include "promptvec/document.hpp"
#include "promptvec/store/document_store.hpp"

namespace promptvec::analysis {

struct TrendingTopic {
    std::string topic;
    double growth_rate{0.0};            /**< (recent - older) / older, or recent when older is 0 */
    std::size_t document_count{0};      /**< Recent documents carrying the tag */
};

struct DriftReport {
    double overall_drift{0.0};          /**< 0 when either window is empty */
    std::map<std::string, double> domain_drifts;   /**< Domains populated in both windows */
    std::vector<TrendingTopic> trending_topics;    /**< Descending growth */
    std::vector<std::string> recommendations;
    std::size_t recent_count{0};
    std::size_t older_count{0};
    bool sufficient_data{false};        /**< Both windows populated */
};

class DriftAnalyzer {
public:
    explicit DriftAnalyzer(const DatabaseConfig& cfg);

    [[nodiscard]] auto analyze(const store::DocumentStore& store, Timestamp now) const -> DriftReport;

private:
    std::chrono::hours recent_window_;
    std::chrono::hours older_window_;
    double growth_min_;
    double overall_alert_;
    double domain_alert_;
};

} // namespace promptvec::analysis
