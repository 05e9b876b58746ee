#include "redline/engine/validation_results.h"

#include <stdexcept>

namespace redline::engine {

void ValidationResults::add_document(const domain::Document& document) {
  if (index_.find(&document) != index_.end()) {
    return;
  }
  index_.emplace(&document, entries_.size());
  entries_.emplace_back(&document, std::vector<validator::ValidationError>{});
}

void ValidationResults::append(const domain::Document& document,
                               validator::ValidationError error) {
  add_document(document);
  entries_[index_.at(&document)].second.push_back(std::move(error));
}

bool ValidationResults::contains(const domain::Document& document) const {
  return index_.find(&document) != index_.end();
}

const std::vector<validator::ValidationError>& ValidationResults::at(
    const domain::Document& document) const {
  auto it = index_.find(&document);
  if (it == index_.end()) {
    throw std::out_of_range("document has no validation results");
  }
  return entries_[it->second].second;
}

std::size_t ValidationResults::total_errors() const noexcept {
  std::size_t total = 0;
  for (const auto& entry : entries_) {
    total += entry.second.size();
  }
  return total;
}

}  // namespace redline::engine
