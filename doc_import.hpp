// doc_import.hpp
#ifndef DOC_IMPORT_HPP
#define DOC_IMPORT_HPP

#include "doc_aspect.hpp"
#include "doc_deps.hpp"
#include "doc_service.hpp"

#include <filesystem>
#include <optional>
#include <string>

/// A language overlay file found next to a structural document.
struct OverlaySource {
  std::string language;
  DocTree content;
  std::string path;
};

/// One structural document read from a corpus, with its overlays.
struct SourceRecord {
  std::string slug;
  std::string domain;
  DocumentKind kind;
  DocTree content;
  std::optional<std::string> template_slug;
  DocSortedSet<std::string> refs; // template slug + referenced code slugs
  DocVector<OverlaySource> overlays;
  std::string path;
};

struct DomainSource {
  std::string name;
  std::string default_language;
  DocVector<SourceRecord> records;
};

/// Reads a corpus laid out as
///
///   <root>/<domain>/domain.json                           {"default_language": "en"}
///   <root>/<domain>/{schema,template,code}/<slug>.json    structural documents
///   <root>/<domain>/lang/<lang>/{template,code}/<slug>.json  overlays
///
/// The file stem is the slug. Files that cannot be parsed are logged and
/// skipped; they never abort the load.
class SourceTreeLoader {
public:
  explicit SourceTreeLoader(std::filesystem::path root, ParseMode mode = ParseMode::Permissive)
      : root_(std::move(root)), mode_(mode) {}

  /// Every domain directory under the root that has a domain.json, by name.
  DocVector<DomainSource> load() const;

  /// Throws DocumentParseError when the domain directory or its domain.json is unusable.
  DomainSource load_domain(const std::string &name) const;

private:
  std::filesystem::path root_;
  ParseMode mode_;

  std::optional<SourceRecord> read_record(const std::filesystem::path &file, const std::string &domain,
                                          DocumentKind kind) const;
  void attach_overlays(const std::filesystem::path &domain_dir, DomainSource &domain) const;
};

struct ImportOptions {
  bool strict = true;                         // a dependency cycle aborts the batch
  ParseMode parse_mode = ParseMode::Permissive;
  bool smash = true;                          // smash the base when all overlays caught up
};

struct ImportFailure {
  std::string slug;
  std::optional<std::string> language;
  std::string error;
};

struct ImportReport {
  DocVector<std::string> imported; // structural documents written or already up to date
  DocVector<std::string> smashed;
  CircularDependencyError::Remaining skipped;
  DocVector<ImportFailure> failed;

  bool ok() const { return skipped.empty() && failed.empty(); }
};

/// Feeds a loaded domain through DocumentService in dependency order, one
/// document at a time. A failing document is reported and its siblings go on.
class BatchImporter {
public:
  BatchImporter(DocumentService &service, DocumentStore &store) : service_(service), store_(store) {}

  /// Throws CircularDependencyError in strict mode when the batch has a cycle;
  /// nothing has been written at that point.
  ImportReport run(const DomainSource &domain, const ImportOptions &options = ImportOptions());

private:
  DocumentService &service_;
  DocumentStore &store_;

  void import_overlays(const SourceRecord &record, const std::string &default_language, ImportReport &report);
};

#endif // DOC_IMPORT_HPP
