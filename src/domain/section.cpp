#include "redline/domain/section.h"

namespace redline::domain {

std::string Section::header_text() const {
  std::string text;
  for (const auto& sentence : header_contents) {
    text += sentence.content();
  }
  return text;
}

std::size_t Section::sentence_count() const {
  std::size_t count = 0;
  for_each_sentence_container(*this, [&count](const std::vector<Sentence>& sentences) {
    count += sentences.size();
  });
  return count;
}

}  // namespace redline::domain
