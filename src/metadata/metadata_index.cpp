/** \file metadata_index.cpp
 *  \brief Bitmap-backed categorical filtering.
 */

#include "promptvec/metadata/metadata_index.hpp"

namespace promptvec::metadata {

namespace {

template <typename Map, typename Key>
void drop_from(Map& index, const Key& key, std::uint32_t slot) {
    auto it = index.find(key);
    if (it == index.end()) return;
    it->second.remove(slot);
    if (it->second.isEmpty()) index.erase(it);
}

} // anonymous namespace

auto MetadataIndex::add(std::uint32_t slot, const DocumentMetadata& meta) -> void {
    all_.add(slot);
    by_domain_[meta.domain].add(slot);
    by_type_[meta.type].add(slot);
    for (const auto& tag : meta.tags) {
        by_tag_[tag].add(slot);
    }
}

auto MetadataIndex::remove(std::uint32_t slot, const DocumentMetadata& meta) -> void {
    all_.remove(slot);
    drop_from(by_domain_, meta.domain, slot);
    drop_from(by_type_, meta.type, slot);
    for (const auto& tag : meta.tags) {
        drop_from(by_tag_, tag, slot);
    }
}

auto MetadataIndex::union_of(const std::map<std::string, roaring::Roaring>& index,
                             const std::vector<std::string>& keys) -> roaring::Roaring {
    roaring::Roaring out;
    for (const auto& k : keys) {
        if (auto it = index.find(k); it != index.end()) out |= it->second;
    }
    return out;
}

auto MetadataIndex::evaluate(const SearchFilters& filters) const -> roaring::Roaring {
    roaring::Roaring result = all_;
    if (!filters.domains.empty()) {
        result &= union_of(by_domain_, filters.domains);
    }
    if (!filters.types.empty()) {
        roaring::Roaring types;
        for (DocumentType t : filters.types) {
            if (auto it = by_type_.find(t); it != by_type_.end()) types |= it->second;
        }
        result &= types;
    }
    if (!filters.tags.empty()) {
        result &= union_of(by_tag_, filters.tags);
    }
    return result;
}

auto MetadataIndex::select(const std::string* domain, const DocumentType* type) const
    -> roaring::Roaring {
    roaring::Roaring result = all_;
    if (domain) {
        auto it = by_domain_.find(*domain);
        if (it == by_domain_.end()) return roaring::Roaring{};
        result &= it->second;
    }
    if (type) {
        auto it = by_type_.find(*type);
        if (it == by_type_.end()) return roaring::Roaring{};
        result &= it->second;
    }
    return result;
}

auto MetadataIndex::domains() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(by_domain_.size());
    for (const auto& [domain, _] : by_domain_) out.push_back(domain);
    return out;
}

auto MetadataIndex::memory_bytes() const -> std::size_t {
    std::size_t total = all_.getSizeInBytes();
    for (const auto& [_, bm] : by_domain_) total += bm.getSizeInBytes();
    for (const auto& [_, bm] : by_type_) total += bm.getSizeInBytes();
    for (const auto& [_, bm] : by_tag_) total += bm.getSizeInBytes();
    return total;
}

auto MetadataIndex::clear() -> void {
    all_ = roaring::Roaring{};
    by_domain_.clear();
    by_type_.clear();
    by_tag_.clear();
}

} // namespace promptvec::metadata
