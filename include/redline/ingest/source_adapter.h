#pragma once

#include "redline/core/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace redline::ingest {

/// Error type for extraction failures
struct ExtractionError {
  std::string message;
};

/// Result of text extraction
using ExtractionResult = core::Result<std::string, ExtractionError>;

/// Turns the raw bytes of an input file into text a document parser accepts
class ISourceAdapter {
 public:
  virtual ~ISourceAdapter() = default;

  /// Extract text from raw bytes
  [[nodiscard]] virtual ExtractionResult extract(const std::vector<uint8_t>& data) const = 0;

  /// Extraction method identifier (e.g., "text-pass-through-v1")
  [[nodiscard]] virtual std::string extraction_method() const = 0;
};

/// UTF-8 text pass-through (plain text and markdown)
class TextSourceAdapter : public ISourceAdapter {
 public:
  [[nodiscard]] ExtractionResult extract(const std::vector<uint8_t>& data) const override;
  [[nodiscard]] std::string extraction_method() const override { return "text-pass-through-v1"; }
};

/// Office Open XML word processing documents
class DocxSourceAdapter : public ISourceAdapter {
 public:
  [[nodiscard]] ExtractionResult extract(const std::vector<uint8_t>& data) const override;
  [[nodiscard]] std::string extraction_method() const override { return "docx-extract-v1"; }
};

/// DOCX adapter for ".docx" paths (case-insensitive), text adapter otherwise
[[nodiscard]] std::unique_ptr<ISourceAdapter> adapter_for_path(const std::string& path);

/// Read a whole file as bytes
[[nodiscard]] core::Result<std::vector<uint8_t>, ExtractionError> read_file_bytes(
    const std::string& path);

/// Read a file and run it through the adapter matching its path
[[nodiscard]] ExtractionResult extract_file(const std::string& path);

}  // namespace redline::ingest
