#include "promptvec/filter.hpp"

namespace promptvec::filter_eval {

auto matches_ranges(const SearchFilters& f, const DocumentMetadata& meta) -> bool {
  if (f.effectiveness_min && meta.effectiveness.value_or(0.0) < *f.effectiveness_min) return false;
  if (f.created_after && meta.created < *f.created_after) return false;
  if (f.created_before && meta.created > *f.created_before) return false;
  return true;
}

} // namespace promptvec::filter_eval
