#include "redline/parser/sentence_splitter.h"

#include "redline/core/normalization.h"

#include <string_view>

namespace redline::parser {

namespace {

bool is_ascii(const char ch) { return static_cast<unsigned char>(ch) < 0x80U; }

std::size_t skip_spaces(std::string_view text, std::size_t pos) {
  while (pos < text.size() && core::is_ascii_space(text[pos])) {
    ++pos;
  }
  return pos;
}

// Accumulates the text of the sentence currently being read.
class PendingSentence {
 public:
  [[nodiscard]] bool empty() const noexcept { return text_.empty(); }

  void append(std::string_view piece, int line, int offset) {
    const std::string trimmed = core::trim(piece);
    if (trimmed.empty()) {
      return;
    }
    if (text_.empty()) {
      line_ = line;
      offset_ = offset;
    } else if (is_ascii(text_.back()) && is_ascii(trimmed.front())) {
      text_.push_back(' ');
    }
    text_ += trimmed;
  }

  void flush(std::vector<domain::Sentence>& out, const tokenization::ITokenizer& tokenizer) {
    if (text_.empty()) {
      return;
    }
    domain::Sentence sentence(std::move(text_), line_, offset_, out.empty());
    sentence.set_tokens(tokenizer.tokenize(sentence.content()));
    out.push_back(std::move(sentence));
    text_.clear();
  }

 private:
  std::string text_;
  int line_{0};
  int offset_{0};
};

}  // namespace

std::vector<domain::Sentence> split_sentences(const std::vector<SourceLine>& lines,
                                              const SentenceBoundary& boundary,
                                              const tokenization::ITokenizer& tokenizer) {
  std::vector<domain::Sentence> sentences;
  PendingSentence pending;

  for (const auto& line : lines) {
    const std::string_view text = line.text;
    std::size_t pos = skip_spaces(text, 0);

    while (pos < text.size()) {
      const std::size_t end = boundary.find_end(text, pos);
      if (end == std::string_view::npos) {
        pending.append(text.substr(pos), line.number, static_cast<int>(pos));
        break;
      }
      pending.append(text.substr(pos, end - pos), line.number, static_cast<int>(pos));
      pending.flush(sentences, tokenizer);
      pos = skip_spaces(text, end);
    }
  }

  pending.flush(sentences, tokenizer);
  return sentences;
}

std::vector<SourceLine> split_lines(const std::string& source) {
  std::vector<SourceLine> lines;
  std::string current;
  int number = 1;

  for (std::size_t i = 0; i < source.size(); ++i) {
    const char ch = source[i];
    if (ch == '\r' || ch == '\n') {
      if (ch == '\r' && i + 1 < source.size() && source[i + 1] == '\n') {
        ++i;
      }
      lines.push_back(SourceLine{std::move(current), number++});
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) {
    lines.push_back(SourceLine{std::move(current), number});
  }

  return lines;
}

}  // namespace redline::parser
