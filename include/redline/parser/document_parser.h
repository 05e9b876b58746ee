#pragma once

#include "redline/domain/document.h"
#include "redline/parser/sentence_boundary.h"
#include "redline/tokenization/tokenizer.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redline::parser {

/// Builds a document tree from source text
class IDocumentParser {
 public:
  virtual ~IDocumentParser() = default;

  /// Parse one source
  /// @param source Full text of the input
  /// @param boundary Sentence terminators for the configured language
  /// @param tokenizer Fills the tokens of every sentence
  [[nodiscard]] virtual domain::Document parse(const std::string& source,
                                               const SentenceBoundary& boundary,
                                               const tokenization::ITokenizer& tokenizer) const = 0;

  /// Parser identifier as accepted by make_parser ("plain", "markdown")
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Plain text: one section without header, blank lines separate paragraphs
class PlainTextParser final : public IDocumentParser {
 public:
  [[nodiscard]] domain::Document parse(const std::string& source, const SentenceBoundary& boundary,
                                       const tokenization::ITokenizer& tokenizer) const override;
  [[nodiscard]] std::string_view name() const noexcept override { return "plain"; }
};

/// Markdown subset: ATX headings open sections, "-", "*", "+" bullets form
/// list blocks (two spaces of indentation per nesting level), the rest forms
/// paragraphs separated by blank lines
class MarkdownParser final : public IDocumentParser {
 public:
  [[nodiscard]] domain::Document parse(const std::string& source, const SentenceBoundary& boundary,
                                       const tokenization::ITokenizer& tokenizer) const override;
  [[nodiscard]] std::string_view name() const noexcept override { return "markdown"; }
};

/// One input of a batch parse
struct SourceDocument {
  std::string content;
  std::optional<std::string> file_name;
};

/// Parse every source in order into one collection
[[nodiscard]] domain::DocumentCollection parse_all(const IDocumentParser& parser,
                                                   const std::vector<SourceDocument>& sources,
                                                   const SentenceBoundary& boundary,
                                                   const tokenization::ITokenizer& tokenizer);

/// Parser for "plain" or "markdown"; throws core::ConfigurationError otherwise
[[nodiscard]] std::unique_ptr<IDocumentParser> make_parser(const std::string& name);

}  // namespace redline::parser
