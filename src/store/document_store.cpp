/** \file document_store.cpp
 *  \brief Document upsert/delete fan-out and maintenance passes.
 */

#include "promptvec/store/document_store.hpp"
#include "promptvec/core/debug.hpp"
#include "promptvec/kernels/distance.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace promptvec::store {

DocumentStore::DocumentStore(const DatabaseConfig& cfg)
    : list_default_limit_(cfg.list_default_limit)
    , flat_(cfg.dimension)
    , graph_(cfg.index)
    , quantizer_(cfg.dimension) {}

auto DocumentStore::prepare(VectorDocument doc) const -> std::expected<VectorDocument, core::error> {
    if (doc.id.empty()) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "Document id must not be empty",
            "store.add"
        });
    }
    if (doc.vector.size() != flat_.dimension()) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "Vector dimension mismatch: expected " + std::to_string(flat_.dimension()) +
                ", got " + std::to_string(doc.vector.size()),
            "store.add"
        });
    }
    kernels::normalize_in_place(doc.vector);
    return doc;
}

auto DocumentStore::upsert(VectorDocument doc) -> std::expected<std::uint32_t, core::error> {
    auto prepared = prepare(std::move(doc));
    if (!prepared) return std::unexpected(prepared.error());
    return upsert_prepared(std::move(*prepared));
}

auto DocumentStore::upsert_prepared(VectorDocument doc) -> std::expected<std::uint32_t, core::error> {
    // An unchanged vector keeps its graph links and codes.
    const auto existing = flat_.find(doc.id);
    const bool same_vector = existing && std::ranges::equal(flat_.vector(*existing), doc.vector);

    auto slot = flat_.upsert(doc.id, doc.vector);
    if (!slot) return std::unexpected(slot.error());

    if (*slot < docs_.size()) {
        // Replacing: unindex the old metadata first.
        meta_.remove(*slot, docs_[*slot].metadata);
    } else {
        docs_.resize(static_cast<std::size_t>(*slot) + 1);
    }

    if (!same_vector) {
        if (auto r = graph_.insert(flat_, *slot); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = quantizer_.encode_slot(flat_, *slot); !r) {
            return std::unexpected(r.error());
        }
    }
    meta_.add(*slot, doc.metadata);
    docs_[*slot] = std::move(doc);

    if (core::debug_enabled()) {
        std::cerr << "[promptvec][store] upsert id=" << docs_[*slot].id << " slot=" << *slot
                  << " n=" << flat_.size() << std::endl;
    }
    return *slot;
}

auto DocumentStore::update(VectorDocument doc) -> std::expected<std::uint32_t, core::error> {
    if (!flat_.find(doc.id)) {
        return std::unexpected(core::error{
            core::error_code::not_found,
            "Document not found: " + doc.id,
            "store.update"
        });
    }
    return upsert(std::move(doc));
}

auto DocumentStore::remove(std::string_view id) -> std::expected<VectorDocument, core::error> {
    auto slot = flat_.remove(id);
    if (!slot) {
        return std::unexpected(core::error{
            core::error_code::not_found,
            "Document not found: " + std::string(id),
            "store.delete"
        });
    }
    VectorDocument removed = std::move(docs_[*slot]);
    docs_[*slot] = VectorDocument{};
    meta_.remove(*slot, removed.metadata);
    graph_.remove(*slot);
    quantizer_.erase(*slot);
    return removed;
}

auto DocumentStore::get(std::string_view id) const -> const VectorDocument* {
    auto slot = flat_.find(id);
    if (!slot) return nullptr;
    return &docs_[*slot];
}

auto DocumentStore::list(const ListOptions& options) const -> std::vector<VectorDocument> {
    // A missing or zero limit means the default page size.
    const std::uint32_t limit = options.limit.value_or(0) > 0 ? *options.limit : list_default_limit_;
    const std::string* domain = options.domain ? &*options.domain : nullptr;
    const DocumentType* type = options.type ? &*options.type : nullptr;
    const roaring::Roaring selected = meta_.select(domain, type);

    std::vector<VectorDocument> out;
    std::uint64_t position = 0;
    for (auto it = selected.begin(); it != selected.end() && out.size() < limit; ++it, ++position) {
        if (position < options.offset) continue;
        out.push_back(docs_[*it]);
    }
    return out;
}

auto DocumentStore::recalibrate() -> bool {
    return quantizer_.recalibrate(flat_);
}

auto DocumentStore::rebuild_index() -> std::expected<void, core::error> {
    return graph_.rebuild(flat_);
}

auto DocumentStore::garbage_collect() -> CollectionReport {
    CollectionReport report;
    report.adjacency_refs_removed = graph_.garbage_collect(flat_);
    report.codes_dropped = quantizer_.garbage_collect(flat_);
    report.slots_reclaimed = flat_.tombstone_count();
    if (report.slots_reclaimed == 0) {
        return report;
    }

    const auto old_to_new = flat_.compact();
    graph_.remap(old_to_new);
    quantizer_.remap(old_to_new);

    std::vector<VectorDocument> compacted(flat_.slot_count());
    for (std::size_t old_slot = 0; old_slot < old_to_new.size(); ++old_slot) {
        const auto new_slot = old_to_new[old_slot];
        if (new_slot == index::kInvalidSlot) continue;
        compacted[new_slot] = std::move(docs_[old_slot]);
    }
    docs_ = std::move(compacted);

    meta_.clear();
    for (std::uint32_t slot = 0; slot < docs_.size(); ++slot) {
        meta_.add(slot, docs_[slot].metadata);
    }

    if (core::debug_enabled()) {
        std::cerr << "[promptvec][store][gc] reclaimed=" << report.slots_reclaimed
                  << " refs=" << report.adjacency_refs_removed
                  << " codes=" << report.codes_dropped << std::endl;
    }
    return report;
}

auto DocumentStore::clear() -> void {
    flat_.clear();
    graph_.clear();
    quantizer_.clear();
    meta_.clear();
    docs_.clear();
}

auto DocumentStore::metadata_bytes() const -> std::size_t {
    std::size_t bytes = meta_.memory_bytes();
    for (std::uint32_t slot = 0; slot < docs_.size(); ++slot) {
        if (!flat_.is_live(slot)) continue;
        const auto& doc = docs_[slot];
        bytes += sizeof(VectorDocument) + doc.id.size() + doc.content.size() + doc.metadata.domain.size();
        for (const auto& tag : doc.metadata.tags) bytes += tag.size();
        bytes += doc.metadata.extra.size() * 64;
    }
    return bytes;
}

} // namespace promptvec::store
