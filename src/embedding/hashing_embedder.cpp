#include "promptvec/embedding/embedding_provider.hpp"
#include "promptvec/kernels/distance.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace promptvec::embedding {

namespace {

// 31-multiplier string hash wrapped to signed 32 bits.
auto word_hash(const std::string& word) noexcept -> std::int32_t {
    std::uint32_t h = 0;
    for (unsigned char c : word) {
        h = h * 31u + c;
    }
    return static_cast<std::int32_t>(h);
}

} // anonymous namespace

auto HashingEmbedder::embed(std::string_view text) -> std::expected<std::vector<float>, core::error> {
    if (dim_ == 0) {
        return std::unexpected(core::error{
            core::error_code::precondition_failed,
            "Embedding dimension must be > 0",
            "embedding.hashing"
        });
    }

    std::vector<float> vec(dim_, 0.0f);
    std::size_t position = 0;
    std::string word;
    auto flush_word = [&] {
        if (word.empty()) return;
        const std::int64_t h = word_hash(word);
        const auto bucket = static_cast<std::size_t>(std::llabs(h)) % dim_;
        vec[bucket] += 1.0f / static_cast<float>(position + 1);
        ++position;
        word.clear();
    };

    for (unsigned char c : text) {
        if (std::isspace(c)) {
            flush_word();
        } else {
            word.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    flush_word();

    kernels::normalize_in_place(vec);
    return vec;
}

} // namespace promptvec::embedding
