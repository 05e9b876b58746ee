#pragma once

#include "redline/domain/sentence.h"

#include <string>
#include <vector>

namespace redline::domain {

struct Paragraph {
  std::vector<Sentence> sentences;
};

// ListElement is one bullet of a list; level starts at 1 for top-level items.
struct ListElement {
  int level{1};
  std::vector<Sentence> sentences;
};

struct ListBlock {
  std::vector<ListElement> list_elements;
};

// Section is a header plus the body that follows it up to the next header.
// level 0 denotes the implicit section of text that has no heading.
//
// Sentence containers are always visited in the order:
// paragraphs, header_contents, list_blocks (see for_each_sentence_container).
struct Section {
  int level{0};
  std::vector<Sentence> header_contents;
  std::vector<Paragraph> paragraphs;
  std::vector<ListBlock> list_blocks;

  // Concatenated header text, sentences joined without separators.
  [[nodiscard]] std::string header_text() const;

  [[nodiscard]] std::size_t sentence_count() const;
};

// for_each_sentence_container calls fn with every sentence list of a section in
// traversal order: each paragraph's sentences, the header's sentences, then each
// list block's each element's sentences.
template <typename SectionT, typename Fn>
void for_each_sentence_container(SectionT& section, Fn&& fn) {
  for (auto& paragraph : section.paragraphs) {
    fn(paragraph.sentences);
  }
  fn(section.header_contents);
  for (auto& list_block : section.list_blocks) {
    for (auto& list_element : list_block.list_elements) {
      fn(list_element.sentences);
    }
  }
}

}  // namespace redline::domain
