#pragma once

#include "redline/domain/section.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace redline::domain {

// Document is one parsed input. Its address identifies it in
// engine::ValidationResults, so a Document must not be copied or moved out of
// its DocumentCollection while results referring to it are in use.
struct Document {
  std::optional<std::string> file_name;
  std::vector<Section> sections;
};

// DocumentBuilder appends structure in source order.
// Sentences and list elements go into the most recently added container;
// missing containers (section, paragraph, list block) are created on demand.
class DocumentBuilder {
 public:
  DocumentBuilder& set_file_name(std::string file_name);

  DocumentBuilder& add_section(int level, std::vector<Sentence> header_contents = {});
  DocumentBuilder& add_paragraph();
  DocumentBuilder& add_sentence(Sentence sentence);
  DocumentBuilder& add_list_block();
  DocumentBuilder& add_list_element(int level, std::vector<Sentence> sentences);

  [[nodiscard]] Document build();

 private:
  Section& current_section();

  Document document_;
};

// DocumentCollection is the ordered batch handed to the engine.
class DocumentCollection {
 public:
  class Builder {
   public:
    Builder& add_document(Document document);
    [[nodiscard]] DocumentCollection build();

   private:
    std::vector<Document> documents_;
  };

  DocumentCollection() = default;

  [[nodiscard]] std::size_t size() const noexcept { return documents_.size(); }
  [[nodiscard]] bool empty() const noexcept { return documents_.empty(); }

  [[nodiscard]] Document& operator[](std::size_t index) { return documents_[index]; }
  [[nodiscard]] const Document& operator[](std::size_t index) const { return documents_[index]; }

  [[nodiscard]] auto begin() noexcept { return documents_.begin(); }
  [[nodiscard]] auto end() noexcept { return documents_.end(); }
  [[nodiscard]] auto begin() const noexcept { return documents_.begin(); }
  [[nodiscard]] auto end() const noexcept { return documents_.end(); }

 private:
  explicit DocumentCollection(std::vector<Document> documents);

  std::vector<Document> documents_;
};

}  // namespace redline::domain
