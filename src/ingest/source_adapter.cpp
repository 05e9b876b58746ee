#include "redline/ingest/source_adapter.h"

#include "redline/core/normalization.h"

#include <fstream>
#include <iterator>
#include <pugixml.hpp>
#include <sstream>
#include <zip.h>

namespace redline::ingest {

namespace {

constexpr const char* kDocumentPart = "word/document.xml";

// Owns an open libzip archive.
class ZipArchive {
 public:
  explicit ZipArchive(zip_t* archive) : archive_(archive) {}
  ~ZipArchive() {
    if (archive_ != nullptr) {
      zip_discard(archive_);
    }
  }

  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;

  [[nodiscard]] zip_t* get() const noexcept { return archive_; }

 private:
  zip_t* archive_;
};

core::Result<std::vector<char>, ExtractionError> read_entry(zip_t* archive, const char* name) {
  using EntryResult = core::Result<std::vector<char>, ExtractionError>;

  zip_stat_t st;
  zip_stat_init(&st);
  if (zip_stat(archive, name, 0, &st) != 0 || (st.valid & ZIP_STAT_SIZE) == 0) {
    return EntryResult::err(ExtractionError{std::string("Failed to find ") + name + " in DOCX"});
  }

  zip_file_t* file = zip_fopen(archive, name, 0);
  if (file == nullptr) {
    return EntryResult::err(ExtractionError{std::string("Failed to open ") + name});
  }

  std::vector<char> buffer(static_cast<std::size_t>(st.size));
  const zip_int64_t bytes_read = zip_fread(file, buffer.data(), st.size);
  zip_fclose(file);

  if (bytes_read != static_cast<zip_int64_t>(st.size)) {
    return EntryResult::err(ExtractionError{std::string("Failed to read ") + name + " completely"});
  }
  return EntryResult::ok(std::move(buffer));
}

}  // namespace

ExtractionResult TextSourceAdapter::extract(const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return ExtractionResult::err(ExtractionError{"Empty input data"});
  }
  return ExtractionResult::ok(std::string(data.begin(), data.end()));
}

ExtractionResult DocxSourceAdapter::extract(const std::vector<uint8_t>& data) const {
  if (data.empty()) {
    return ExtractionResult::err(ExtractionError{"Empty input data"});
  }

  zip_error_t error;
  zip_error_init(&error);
  zip_source_t* src = zip_source_buffer_create(data.data(), data.size(), 0, &error);
  if (src == nullptr) {
    zip_error_fini(&error);
    return ExtractionResult::err(ExtractionError{"Failed to create ZIP source from DOCX data"});
  }

  zip_t* raw_archive = zip_open_from_source(src, ZIP_RDONLY, &error);
  zip_error_fini(&error);
  if (raw_archive == nullptr) {
    zip_source_free(src);
    return ExtractionResult::err(ExtractionError{"Failed to open DOCX as ZIP archive"});
  }
  const ZipArchive archive(raw_archive);

  auto xml_data = read_entry(archive.get(), kDocumentPart);
  if (!xml_data.has_value()) {
    return ExtractionResult::err(xml_data.error());
  }

  pugi::xml_document doc;
  const pugi::xml_parse_result parsed =
      doc.load_buffer(xml_data.value().data(), xml_data.value().size());
  if (!parsed) {
    return ExtractionResult::err(
        ExtractionError{std::string("Failed to parse word/document.xml: ") + parsed.description()});
  }

  // One <w:p> per paragraph; runs (<w:t>) inside it are concatenated.
  std::ostringstream text;
  bool first = true;
  for (const auto& paragraph : doc.select_nodes("//w:p")) {
    std::string line;
    for (const auto& run : paragraph.node().select_nodes(".//w:t")) {
      line += run.node().child_value();
    }
    if (core::trim(line).empty()) {
      continue;
    }
    if (!first) {
      text << "\n\n";
    }
    text << line;
    first = false;
  }

  if (first) {
    return ExtractionResult::err(ExtractionError{"No text content found in DOCX"});
  }
  text << "\n";
  return ExtractionResult::ok(text.str());
}

std::unique_ptr<ISourceAdapter> adapter_for_path(const std::string& path) {
  const std::string lowered = core::normalize_ascii_lower(path);
  if (lowered.ends_with(".docx")) {
    return std::make_unique<DocxSourceAdapter>();
  }
  return std::make_unique<TextSourceAdapter>();
}

core::Result<std::vector<uint8_t>, ExtractionError> read_file_bytes(const std::string& path) {
  using BytesResult = core::Result<std::vector<uint8_t>, ExtractionError>;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return BytesResult::err(ExtractionError{"Cannot open file: " + path});
  }
  std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return BytesResult::err(ExtractionError{"Failed to read file: " + path});
  }
  return BytesResult::ok(std::move(bytes));
}

ExtractionResult extract_file(const std::string& path) {
  auto bytes = read_file_bytes(path);
  if (!bytes.has_value()) {
    return ExtractionResult::err(bytes.error());
  }
  return adapter_for_path(path)->extract(bytes.value());
}

}  // namespace redline::ingest
