#pragma once

#include "redline/validator/validator.h"

namespace redline::validator {

// DocumentLength: total characters of all sentences in a document must not
// exceed max_len (default 10000). Counts code points of paragraph, header and
// list sentences.
class DocumentLengthValidator final : public DocumentValidator {
 public:
  DocumentLengthValidator() = default;

  [[nodiscard]] std::vector<ValidationError> Validate(const domain::Document& document) override;

  [[nodiscard]] int max_length() const noexcept { return max_length_; }

 protected:
  void init() override;

 private:
  int max_length_{10000};
};

}  // namespace redline::validator
