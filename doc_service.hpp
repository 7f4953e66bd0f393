// doc_service.hpp
#ifndef DOC_SERVICE_HPP
#define DOC_SERVICE_HPP

#include "doc_aspect.hpp"
#include "doc_document.hpp"
#include "doc_refs.hpp"
#include "doc_versions.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/// Incoming document data for update_or_insert.
struct DocumentModel {
  std::string slug;
  std::string domain;
  DocumentKind kind = DocumentKind::SCHEMA;
  std::optional<std::string> language;      // concrete kinds only
  std::optional<std::string> template_slug; // base_code -> schema
  DocTree content;
};

struct CommitResult {
  Document document;
  uint64_t version;
  bool changed; // false when the write was a no-op
};

/// Read model: a structural document merged with one language overlay.
struct MergedDocument {
  std::string slug;
  std::string domain;
  DocumentKind kind;
  std::string requested_language;
  std::string served_language;
  uint64_t version;          // base version the content was merged against
  uint64_t template_version; // base version the overlay was last submitted against
  bool outdated;             // template_version < current base version
  DocTree content;
};

/// The document write pipeline: merge, compare, version, commit, notify.
///
/// Each write (read, merge, compare, version, put) runs inside one
/// DocumentStore::atomically call. Commit handlers run after the commit; an
/// exception thrown by a handler is logged and does not reach the caller. A
/// handler may remove itself or other handlers while it runs.
///
/// ⚠️  Not thread-safe. Writes are expected to arrive one at a time.
class DocumentService {
public:
  using CommitHandler = std::function<void(const Document &, uint64_t version)>;

  DocumentService(DocumentStore &store, DependentsIndex &dependents, std::string fallback_default_language = "en");

  /// Inserts a new document or updates the existing one with the same slug
  /// (and language, for concrete kinds). Throws NotFoundError when the model
  /// references a document that does not exist, DocumentParseError for
  /// malformed aspects, StoreCommitError when the store fails.
  CommitResult update_or_insert(const DocumentModel &model, ParseMode mode = ParseMode::Permissive);

  /// Submits the `language` overlay of the structural document `slug`.
  ///
  /// The overlay must merge strictly with the latest base. On MergeError the
  /// failing aspects are logged one by one and the error is rethrown; nothing
  /// is committed. On success the overlay pins the base's current version.
  CommitResult submit_language(const std::string &slug, const std::string &language, const DocTree &overlay);

  /// Content of a historical version. Without language the structural document.
  DocTree get_version(const std::string &slug, const std::optional<std::string> &language, uint64_t version) const;

  /// Base merged with the overlay of `language`, falling back to the domain's
  /// default language. When an outdated overlay no longer merges with the
  /// latest base, it is merged with the base version it was submitted against.
  MergedDocument merged_document(const std::string &slug, const std::string &language) const;

  bool can_smash(const std::string &slug, const std::optional<std::string> &language = std::nullopt) const;

  /// Folds the latest version into the previous one. Throws VersionError when
  /// a dependent still pins an older version.
  uint64_t smash_version(const std::string &slug, const std::optional<std::string> &language = std::nullopt);

  /// Registers a handler called after every commit; returns its id.
  uint64_t on_document_committed(CommitHandler handler);
  bool remove_commit_handler(uint64_t id);

  const ReferenceResolver &resolver() const { return resolver_; }
  const VersionStore &versions() const { return versions_; }

private:
  DocumentStore &store_;
  ReferenceResolver resolver_;
  VersionStore versions_;

  DocSortedMap<uint64_t, CommitHandler> handlers_;
  uint64_t next_handler_id_;

  Document load(const std::string &slug, const std::optional<std::string> &language) const;
  // Bodies of the two write operations, run inside one store transaction
  CommitResult write_structural(const DocumentModel &model, ParseMode mode);
  CommitResult write_language(const std::string &slug, const std::string &language, const DocTree &overlay);
  void notify(const Document &doc);
};

/// Random (v4) uuid in its canonical text form.
std::string generate_uuid();

#endif // DOC_SERVICE_HPP
