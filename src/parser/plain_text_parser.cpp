#include "redline/core/normalization.h"
#include "redline/parser/document_parser.h"
#include "redline/parser/sentence_splitter.h"

namespace redline::parser {

domain::Document PlainTextParser::parse(const std::string& source,
                                        const SentenceBoundary& boundary,
                                        const tokenization::ITokenizer& tokenizer) const {
  domain::DocumentBuilder builder;
  builder.add_section(0);

  std::vector<SourceLine> block;
  auto flush_block = [&]() {
    if (block.empty()) {
      return;
    }
    builder.add_paragraph();
    for (auto& sentence : split_sentences(block, boundary, tokenizer)) {
      builder.add_sentence(std::move(sentence));
    }
    block.clear();
  };

  for (auto& line : split_lines(source)) {
    if (core::trim(line.text).empty()) {
      flush_block();
    } else {
      block.push_back(std::move(line));
    }
  }
  flush_block();

  return builder.build();
}

}  // namespace redline::parser
