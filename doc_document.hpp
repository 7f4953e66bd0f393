// doc_document.hpp
#ifndef DOC_DOCUMENT_HPP
#define DOC_DOCUMENT_HPP

#include "doc_diff.hpp"
#include "doc_tree.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/// Structural kinds are language neutral; concrete kinds are per language
/// overlays of a base_template / base_code.
enum class DocumentKind { SCHEMA, BASE_TEMPLATE, BASE_CODE, TEMPLATE, CODE };

const char *kind_name(DocumentKind kind);
std::optional<DocumentKind> kind_from_name(const std::string &name);

inline bool is_structural(DocumentKind kind) {
  return kind == DocumentKind::SCHEMA || kind == DocumentKind::BASE_TEMPLATE || kind == DocumentKind::BASE_CODE;
}

/// The concrete kind of the overlays of a base document. Throws DocumentParseError
/// for a schema, which cannot carry languages.
DocumentKind concrete_kind_of(DocumentKind base_kind);

/// Outgoing reference of a structural document, found in its aspects.
struct Reference {
  enum Type { CODE, TAG };

  std::string aspect_path; // e.g. `.colors` or `.observations.kind`
  std::string dest_slug;
  Type ref_type;
  std::string tag; // group name when ref_type == TAG

  static const char *type_name(Type type) { return type == TAG ? "tag" : "code"; }

  bool operator==(const Reference &other) const {
    return aspect_path == other.aspect_path && dest_slug == other.dest_slug && ref_type == other.ref_type &&
           tag == other.tag;
  }
};

/// A persisted document: either a structural document (no language) or a
/// concrete per-language overlay of one.
///
/// Invariant: reverse_deltas.size() == version - 1. reverse_deltas[i] turns
/// version i+2 into version i+1.
struct Document {
  std::string uuid;
  std::string slug;
  std::string domain;
  DocumentKind kind = DocumentKind::SCHEMA;
  std::optional<std::string> language;
  uint64_t version = 1;
  DocTree content;
  DocVector<DocPatch> reverse_deltas;

  // base_code -> its schema; concrete -> its base document
  std::optional<std::string> template_slug;
  // concrete only: version of the base it was last merged against
  uint64_t template_version = 0;

  DocVector<Reference> references;

  bool is_structural() const { return ::is_structural(kind); }

  /// `slug` or `slug[language]`, for messages.
  std::string descriptor() const { return language ? slug + "[" + *language + "]" : slug; }
};

/// Something pinning a version of a document: an overlay of a structural
/// document or an instance of a concrete one.
struct Dependent {
  std::string id;
  uint64_t pinned_version;
};

/// Persistence collaborator. Implementations are responsible for atomicity of
/// every single write; `atomically` groups several writes into one unit.
class DocumentStore {
public:
  virtual ~DocumentStore() = default;

  virtual std::optional<Document> get_structural(const std::string &slug) const = 0;
  virtual std::optional<Document> get_concrete(const std::string &slug, const std::string &language) const = 0;
  virtual std::optional<Document> get_by_uuid(const std::string &uuid) const = 0;

  /// All language overlays of a structural document.
  virtual DocVector<Document> concretes_of(const std::string &slug) const = 0;

  /// Inserts or replaces the document (matched by uuid) including its delta log.
  virtual void put(const Document &doc) = 0;
  virtual void remove(const std::string &uuid) = 0;

  virtual std::optional<std::string> default_language(const std::string &domain) const = 0;
  virtual void set_default_language(const std::string &domain, const std::string &language) = 0;

  /// Runs `fn` so that all writes it performs commit together or not at all.
  /// Exceptions thrown by `fn` propagate after the rollback.
  virtual void atomically(const std::function<void()> &fn) = 0;
};

/// Answers who pins which version of a document.
///
/// For a structural document the dependents are its overlays (pinned at their
/// template_version). For a concrete document they are the instances recorded
/// through `pin`.
class DependentsIndex {
public:
  virtual ~DependentsIndex() = default;

  virtual DocVector<Dependent> dependents(const Document &doc) const = 0;

  bool has_dependent(const Document &doc, uint64_t version) const {
    for (const auto &dependent : dependents(doc)) {
      if (dependent.pinned_version == version) {
        return true;
      }
    }
    return false;
  }

  /// Moves every dependent pinned at `from` to `to`.
  virtual void repin(const Document &doc, uint64_t from, uint64_t to) = 0;

  /// Records that instance `dependent_id` uses `version` of the concrete
  /// document (slug, language). Replaces an earlier pin of the same instance.
  virtual void pin(const std::string &dependent_id, const std::string &slug, const std::string &language,
                   uint64_t version) = 0;
  virtual void unpin(const std::string &dependent_id) = 0;
};

#endif // DOC_DOCUMENT_HPP
