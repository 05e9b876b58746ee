#pragma once

#include "redline/domain/document.h"
#include "redline/validator/validation_error.h"

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace redline::engine {

// ValidationResults maps each document of a collection to its findings.
// Entries keep collection order; every document of the validated collection
// has an entry, possibly empty. Keys are document identities (addresses).
class ValidationResults {
 public:
  using Entry = std::pair<const domain::Document*, std::vector<validator::ValidationError>>;

  // Adds an empty entry for document; no-op if it already has one.
  void add_document(const domain::Document& document);

  // Appends error to the document's findings; creates the entry if needed.
  void append(const domain::Document& document, validator::ValidationError error);

  [[nodiscard]] bool contains(const domain::Document& document) const;

  // Throws std::out_of_range for documents that were not validated.
  [[nodiscard]] const std::vector<validator::ValidationError>& at(
      const domain::Document& document) const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] std::size_t total_errors() const noexcept;

  [[nodiscard]] auto begin() const noexcept { return entries_.cbegin(); }
  [[nodiscard]] auto end() const noexcept { return entries_.cend(); }

 private:
  std::vector<Entry> entries_;
  std::unordered_map<const domain::Document*, std::size_t> index_;
};

}  // namespace redline::engine
