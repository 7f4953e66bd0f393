// doc_refs.cpp
#include "doc_refs.hpp"
#include "doc_errors.hpp"
#include "doc_log.hpp"

std::string DocumentRef::to_string() const {
  if (uuid) {
    return "uuid:" + *uuid;
  }
  if (slug && language) {
    return *slug + "[" + *language + "]";
  }
  if (slug) {
    return *slug;
  }
  return "<empty reference>";
}

std::string ReferenceResolver::default_language(const std::string &domain) const {
  return store_.default_language(domain).value_or(fallback_default_language_);
}

ResolvedDocument ReferenceResolver::resolve(const DocumentRef &ref) const {
  if (ref.uuid) {
    auto doc = store_.get_by_uuid(*ref.uuid);
    if (!doc) {
      throw NotFoundError(ref.to_string());
    }
    auto language = doc->language;
    return ResolvedDocument{std::move(*doc), language, language};
  }

  if (!ref.slug) {
    throw NotFoundError(ref.to_string());
  }

  if (!ref.language) {
    auto base = store_.get_structural(*ref.slug);
    if (!base) {
      throw NotFoundError(*ref.slug);
    }
    return ResolvedDocument{std::move(*base), std::nullopt, std::nullopt};
  }

  const std::string &requested = *ref.language;
  if (auto doc = store_.get_concrete(*ref.slug, requested)) {
    return ResolvedDocument{std::move(*doc), requested, requested};
  }

  auto base = store_.get_structural(*ref.slug);
  if (!base) {
    throw NotFoundError(*ref.slug, {requested});
  }
  std::string fallback = default_language(base->domain);
  if (fallback == requested) {
    throw NotFoundError(*ref.slug, {requested});
  }
  if (auto doc = store_.get_concrete(*ref.slug, fallback)) {
    DOCTREE_LOG_DEBUG(*ref.slug + ": no '" + requested + "' overlay, serving '" + fallback + "'");
    return ResolvedDocument{std::move(*doc), requested, fallback};
  }
  throw NotFoundError(*ref.slug, {requested, fallback});
}
