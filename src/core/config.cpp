/** \file config.cpp
 *  \brief DatabaseConfig validation and PROMPTVEC_* environment overrides.
 */

#include "promptvec/config.hpp"
#include "promptvec/core/platform_utils.hpp"

#include <cctype>
#include <cmath>
#include <exception>
#include <limits>
#include <string>
#include <utility>

namespace promptvec {

namespace {

inline auto config_error(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{
        core::error_code::config_invalid,
        std::move(message),
        "config"
    });
}

// Accepts plain decimal digits that fit T; anything else leaves out unchanged.
template <typename T>
void override_unsigned(const char* key, T& out) noexcept {
    auto v = core::getenv_nonempty(key);
    if (!v) return;
    // stoull would accept a sign and silently wrap "-5".
    if (!std::isdigit(static_cast<unsigned char>(v->front()))) return;
    try {
        std::size_t used = 0;
        const unsigned long long x = std::stoull(*v, &used);
        if (used != v->size()) return;
        if (x > static_cast<unsigned long long>(std::numeric_limits<T>::max())) return;
        out = static_cast<T>(x);
    } catch (const std::exception&) { /* beyond unsigned long long */ }
}

} // anonymous namespace

auto DatabaseConfig::validate() const -> std::expected<void, core::error> {
    if (dimension == 0) {
        return config_error("dimension must be > 0");
    }
    if (index.M == 0) {
        return config_error("M must be > 0");
    }
    if (!(index.level_probability > 0.0f) || index.level_probability >= 1.0f) {
        return config_error("level_probability must be in (0, 1)");
    }
    if (default_limit == 0) {
        return config_error("default_limit must be > 0");
    }
    if (!std::isfinite(default_threshold) || default_threshold < -1.0f || default_threshold > 1.0f) {
        return config_error("default_threshold must be within [-1, 1]");
    }
    if (batch_chunk_size == 0) {
        return config_error("batch_chunk_size must be > 0");
    }
    if (kmeans_max_iter == 0) {
        return config_error("kmeans_max_iter must be > 0");
    }
    if (!(recency_decay_days > 0.0)) {
        return config_error("recency_decay_days must be > 0");
    }
    if (drift_older_window < drift_recent_window) {
        return config_error("drift_older_window must not be shorter than drift_recent_window");
    }
    if (analytics_queue_capacity == 0 || perf_window == 0) {
        return config_error("analytics_queue_capacity and perf_window must be > 0");
    }
    return {};
}

auto apply_env_overrides(DatabaseConfig& cfg) noexcept -> void {
    override_unsigned("PROMPTVEC_DIMENSION", cfg.dimension);
    override_unsigned("PROMPTVEC_HNSW_M", cfg.index.M);
    override_unsigned("PROMPTVEC_EF_SEARCH", cfg.index.ef_search);
    override_unsigned("PROMPTVEC_SEED", cfg.index.seed);

    std::uint64_t ttl_sec = 0;
    if (core::getenv_nonempty("PROMPTVEC_SEARCH_CACHE_TTL_SEC")) {
        ttl_sec = static_cast<std::uint64_t>(cfg.search_cache_ttl.count());
        override_unsigned("PROMPTVEC_SEARCH_CACHE_TTL_SEC", ttl_sec);
        cfg.search_cache_ttl = std::chrono::seconds(ttl_sec);
    }
    if (core::getenv_nonempty("PROMPTVEC_CLUSTER_CACHE_TTL_SEC")) {
        ttl_sec = static_cast<std::uint64_t>(cfg.cluster_cache_ttl.count());
        override_unsigned("PROMPTVEC_CLUSTER_CACHE_TTL_SEC", ttl_sec);
        cfg.cluster_cache_ttl = std::chrono::seconds(ttl_sec);
    }
}

} // namespace promptvec
