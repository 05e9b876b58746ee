#include "redline/core/normalization.h"
#include "redline/parser/document_parser.h"
#include "redline/parser/sentence_splitter.h"

#include <optional>
#include <string_view>

namespace redline::parser {

namespace {

constexpr int kMaxHeadingLevel = 6;
constexpr std::size_t kIndentPerListLevel = 2;

struct Marker {
  int level{0};
  std::size_t width{0};  // bytes covered by indentation + marker + space
};

// "## Title" -> level 2. The marker must be followed by a space or end the line.
std::optional<Marker> heading_marker(std::string_view text) {
  std::size_t hashes = 0;
  while (hashes < text.size() && text[hashes] == '#') {
    ++hashes;
  }
  if (hashes == 0 || hashes > kMaxHeadingLevel) {
    return std::nullopt;
  }
  if (hashes < text.size() && text[hashes] != ' ' && text[hashes] != '\t') {
    return std::nullopt;
  }
  return Marker{static_cast<int>(hashes), hashes};
}

// "  - item" -> level 2.
std::optional<Marker> list_marker(std::string_view text) {
  std::size_t indent = 0;
  while (indent < text.size() && text[indent] == ' ') {
    ++indent;
  }
  if (indent + 1 >= text.size()) {
    return std::nullopt;
  }
  const char bullet = text[indent];
  if ((bullet != '-' && bullet != '*' && bullet != '+') || text[indent + 1] != ' ') {
    return std::nullopt;
  }
  return Marker{static_cast<int>(indent / kIndentPerListLevel) + 1, indent + 2};
}

// Blanks out the marker so sentence offsets still point into the source line.
SourceLine strip_marker(const SourceLine& line, std::size_t width) {
  SourceLine stripped = line;
  for (std::size_t i = 0; i < width && i < stripped.text.size(); ++i) {
    stripped.text[i] = ' ';
  }
  return stripped;
}

bool is_code_fence(std::string_view text) {
  return core::trim(text).rfind("```", 0) == 0;
}

}  // namespace

domain::Document MarkdownParser::parse(const std::string& source, const SentenceBoundary& boundary,
                                       const tokenization::ITokenizer& tokenizer) const {
  domain::DocumentBuilder builder;

  std::vector<SourceLine> paragraph;
  bool in_list = false;
  bool in_code = false;

  auto flush_paragraph = [&]() {
    if (paragraph.empty()) {
      return;
    }
    builder.add_paragraph();
    for (auto& sentence : split_sentences(paragraph, boundary, tokenizer)) {
      builder.add_sentence(std::move(sentence));
    }
    paragraph.clear();
  };

  for (const auto& line : split_lines(source)) {
    if (is_code_fence(line.text)) {
      flush_paragraph();
      in_list = false;
      in_code = !in_code;
      continue;
    }
    if (in_code) {
      continue;
    }

    if (core::trim(line.text).empty()) {
      flush_paragraph();
      in_list = false;
      continue;
    }

    if (auto heading = heading_marker(line.text)) {
      flush_paragraph();
      in_list = false;
      builder.add_section(heading->level,
                          split_sentences({strip_marker(line, heading->width)}, boundary, tokenizer));
      continue;
    }

    if (auto item = list_marker(line.text)) {
      flush_paragraph();
      if (!in_list) {
        builder.add_list_block();
        in_list = true;
      }
      builder.add_list_element(item->level,
                               split_sentences({strip_marker(line, item->width)}, boundary, tokenizer));
      continue;
    }

    in_list = false;
    paragraph.push_back(line);
  }
  flush_paragraph();

  return builder.build();
}

}  // namespace redline::parser
