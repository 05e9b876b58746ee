#include "redline/parser/document_parser.h"

#include "redline/core/errors.h"

namespace redline::parser {

domain::DocumentCollection parse_all(const IDocumentParser& parser,
                                     const std::vector<SourceDocument>& sources,
                                     const SentenceBoundary& boundary,
                                     const tokenization::ITokenizer& tokenizer) {
  domain::DocumentCollection::Builder builder;
  for (const auto& source : sources) {
    auto document = parser.parse(source.content, boundary, tokenizer);
    document.file_name = source.file_name;
    builder.add_document(std::move(document));
  }
  return builder.build();
}

std::unique_ptr<IDocumentParser> make_parser(const std::string& name) {
  if (name == "plain") {
    return std::make_unique<PlainTextParser>();
  }
  if (name == "markdown") {
    return std::make_unique<MarkdownParser>();
  }
  throw core::ConfigurationError("Unknown parser: " + name + " (valid: plain, markdown)");
}

}  // namespace redline::parser
