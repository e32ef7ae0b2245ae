#pragma once

/** \file embedding_provider.hpp
 *  \brief Text -> vector conversion used for text queries.
 */

#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

#include "promptvec/error.hpp"

namespace promptvec::embedding {

/** \brief Consumed embedding interface; implementations may call out to a model. */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;
    virtual auto embed(std::string_view text) -> std::expected<std::vector<float>, core::error> = 0;
};

/** \brief Deterministic bag-of-words hashing embedder.
 *
 * Lower-cases the text, splits on whitespace, hashes every word into one of dim
 * buckets and adds 1/(position+1) to it, then L2-normalizes. Useful as a default
 * and in tests; carries no semantics beyond shared words.
 */
class HashingEmbedder final : public EmbeddingProvider {
public:
    explicit HashingEmbedder(std::size_t dim) : dim_(dim) {}
    auto embed(std::string_view text) -> std::expected<std::vector<float>, core::error> override;

private:
    std::size_t dim_;
};

} // namespace promptvec::embedding
