#include "redline/domain/document.h"

#include <utility>

namespace redline::domain {

DocumentBuilder& DocumentBuilder::set_file_name(std::string file_name) {
  document_.file_name = std::move(file_name);
  return *this;
}

DocumentBuilder& DocumentBuilder::add_section(int level, std::vector<Sentence> header_contents) {
  Section section;
  section.level = level;
  section.header_contents = std::move(header_contents);
  document_.sections.push_back(std::move(section));
  return *this;
}

DocumentBuilder& DocumentBuilder::add_paragraph() {
  current_section().paragraphs.emplace_back();
  return *this;
}

DocumentBuilder& DocumentBuilder::add_sentence(Sentence sentence) {
  auto& section = current_section();
  if (section.paragraphs.empty()) {
    section.paragraphs.emplace_back();
  }
  section.paragraphs.back().sentences.push_back(std::move(sentence));
  return *this;
}

DocumentBuilder& DocumentBuilder::add_list_block() {
  current_section().list_blocks.emplace_back();
  return *this;
}

DocumentBuilder& DocumentBuilder::add_list_element(int level, std::vector<Sentence> sentences) {
  auto& section = current_section();
  if (section.list_blocks.empty()) {
    section.list_blocks.emplace_back();
  }
  section.list_blocks.back().list_elements.push_back(ListElement{level, std::move(sentences)});
  return *this;
}

Document DocumentBuilder::build() {
  Document built = std::move(document_);
  document_ = Document{};
  return built;
}

Section& DocumentBuilder::current_section() {
  if (document_.sections.empty()) {
    document_.sections.emplace_back();
  }
  return document_.sections.back();
}

DocumentCollection::DocumentCollection(std::vector<Document> documents)
    : documents_(std::move(documents)) {}

DocumentCollection::Builder& DocumentCollection::Builder::add_document(Document document) {
  documents_.push_back(std::move(document));
  return *this;
}

DocumentCollection DocumentCollection::Builder::build() {
  DocumentCollection collection(std::move(documents_));
  documents_.clear();
  return collection;
}

}  // namespace redline::domain
