// doc_refs.hpp
#ifndef DOC_REFS_HPP
#define DOC_REFS_HPP

#include "doc_document.hpp"

#include <optional>
#include <string>

/// A reference to a document: by uuid, by slug (the structural document) or
/// by slug and language (a concrete overlay).
struct DocumentRef {
  std::optional<std::string> uuid;
  std::optional<std::string> slug;
  std::optional<std::string> language;

  static DocumentRef by_uuid(std::string uuid) { return DocumentRef{std::move(uuid), std::nullopt, std::nullopt}; }
  static DocumentRef by_slug(std::string slug) { return DocumentRef{std::nullopt, std::move(slug), std::nullopt}; }
  static DocumentRef by_slug(std::string slug, std::string language) {
    return DocumentRef{std::nullopt, std::move(slug), std::move(language)};
  }

  std::string to_string() const;
};

struct ResolvedDocument {
  Document document;
  std::optional<std::string> requested_language;
  std::optional<std::string> served_language;

  bool used_fallback() const { return requested_language != served_language; }
};

/// Looks documents up in a DocumentStore, falling back to the domain's default
/// language when the requested language has no overlay.
class ReferenceResolver {
public:
  /// @param fallback_default_language used for domains without a configured default
  explicit ReferenceResolver(const DocumentStore &store, std::string fallback_default_language = "en")
      : store_(store), fallback_default_language_(std::move(fallback_default_language)) {}

  /// Throws NotFoundError. A language lookup that fails twice reports both
  /// languages tried, requested first.
  ResolvedDocument resolve(const DocumentRef &ref) const;

  std::string default_language(const std::string &domain) const;

private:
  const DocumentStore &store_;
  std::string fallback_default_language_;
};

#endif // DOC_REFS_HPP
