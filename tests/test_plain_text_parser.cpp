#include "redline/config/symbol_table.h"
#include "redline/core/errors.h"
#include "redline/parser/document_parser.h"
#include "redline/parser/sentence_splitter.h"
#include "redline/tokenization/whitespace_tokenizer.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace redline;

TEST_CASE("split_lines numbers lines from one", "[parser][lines]") {
  const auto lines = parser::split_lines("first\r\nsecond\rthird\n\nfifth");

  REQUIRE(lines.size() == 5);
  CHECK(lines[0].text == "first");
  CHECK(lines[1].text == "second");
  CHECK(lines[2].text == "third");
  CHECK(lines[3].text.empty());
  CHECK(lines[4].text == "fifth");
  CHECK(lines[4].number == 5);
}

TEST_CASE("PlainTextParser builds paragraphs of sentences", "[parser][plain]") {
  const parser::PlainTextParser plain;
  const parser::SentenceBoundary boundary(config::SymbolTable("en"));
  const tokenization::WhitespaceTokenizer tokenizer;

  const auto document =
      plain.parse("This is a pen. That is\na dog.\n\nSecond paragraph!\n", boundary, tokenizer);

  REQUIRE(document.sections.size() == 1);
  const auto& section = document.sections[0];
  CHECK(section.level == 0);
  CHECK(section.header_contents.empty());
  REQUIRE(section.paragraphs.size() == 2);

  const auto& first = section.paragraphs[0].sentences;
  REQUIRE(first.size() == 2);
  CHECK(first[0].content() == "This is a pen.");
  CHECK(first[0].line_number() == 1);
  CHECK(first[0].is_first_sentence());
  CHECK(first[0].tokens().size() == 4);

  // A sentence continued on the next line keeps its starting position.
  CHECK(first[1].content() == "That is a dog.");
  CHECK(first[1].line_number() == 1);
  CHECK(first[1].start_position_offset() == 15);
  CHECK_FALSE(first[1].is_first_sentence());

  const auto& second = section.paragraphs[1].sentences;
  REQUIRE(second.size() == 1);
  CHECK(second[0].content() == "Second paragraph!");
  CHECK(second[0].line_number() == 4);
  CHECK(second[0].is_first_sentence());
}

TEST_CASE("PlainTextParser keeps unterminated trailing text", "[parser][plain]") {
  const parser::PlainTextParser plain;
  const parser::SentenceBoundary boundary(config::SymbolTable("en"));
  const tokenization::WhitespaceTokenizer tokenizer;

  const auto document = plain.parse("Done. And then", boundary, tokenizer);

  const auto& sentences = document.sections[0].paragraphs[0].sentences;
  REQUIRE(sentences.size() == 2);
  CHECK(sentences[1].content() == "And then");
}

TEST_CASE("PlainTextParser joins Japanese lines without spaces", "[parser][plain]") {
  const parser::PlainTextParser plain;
  const parser::SentenceBoundary boundary(config::SymbolTable("ja"));
  const tokenization::WhitespaceTokenizer tokenizer;

  const auto document = plain.parse("これはペンです。それは\n犬です。", boundary, tokenizer);

  const auto& sentences = document.sections[0].paragraphs[0].sentences;
  REQUIRE(sentences.size() == 2);
  CHECK(sentences[0].content() == "これはペンです。");
  CHECK(sentences[1].content() == "それは犬です。");
}

TEST_CASE("parse_all keeps source order and file names", "[parser]") {
  const parser::SentenceBoundary boundary(config::SymbolTable("en"));
  const tokenization::WhitespaceTokenizer tokenizer;
  const auto plain = parser::make_parser("plain");

  const std::vector<parser::SourceDocument> sources = {
      {"One.", std::string("a.txt")},
      {"Two.", std::nullopt},
  };
  const auto collection = parser::parse_all(*plain, sources, boundary, tokenizer);

  REQUIRE(collection.size() == 2);
  CHECK(collection[0].file_name == "a.txt");
  CHECK_FALSE(collection[1].file_name.has_value());
  CHECK(collection[1].sections[0].paragraphs[0].sentences[0].content() == "Two.");
}

TEST_CASE("make_parser knows plain and markdown", "[parser]") {
  CHECK(parser::make_parser("plain")->name() == "plain");
  CHECK(parser::make_parser("markdown")->name() == "markdown");
  REQUIRE_THROWS_AS(parser::make_parser("asciidoc"), core::ConfigurationError);
}
