// doc_service.cpp
#include "doc_service.hpp"
#include "doc_errors.hpp"
#include "doc_log.hpp"
#include "doc_merge.hpp"

#include <uuid/uuid.h>

std::string generate_uuid() {
  uuid_t uuid;
  uuid_generate(uuid);

  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);

  return std::string(uuid_str);
}

namespace {

/// Drops the top-level bookkeeping fields, which live on Document itself.
DocTree strip_bookkeeping(const DocTree &content) {
  if (!content.is_object()) {
    throw DocumentParseError(std::string("Document content must be an object, got ") +
                             DocTree::type_name(content.type()));
  }
  DocTree result = content;
  for (const auto &field : ChangeDetector::default_ignore_fields()) {
    result.as_object().erase(field);
  }
  return result;
}

} // namespace

DocumentService::DocumentService(DocumentStore &store, DependentsIndex &dependents,
                                 std::string fallback_default_language)
    : store_(store), resolver_(store, std::move(fallback_default_language)), versions_(dependents),
      next_handler_id_(1) {}

CommitResult DocumentService::update_or_insert(const DocumentModel &model, ParseMode mode) {
  CommitResult result{Document(), 0, false};
  store_.atomically([&]() { result = write_structural(model, mode); });
  if (result.changed) {
    notify(result.document);
  }
  return result;
}

CommitResult DocumentService::submit_language(const std::string &slug, const std::string &language,
                                              const DocTree &overlay) {
  CommitResult result{Document(), 0, false};
  store_.atomically([&]() { result = write_language(slug, language, overlay); });
  if (result.changed) {
    notify(result.document);
  }
  return result;
}

CommitResult DocumentService::write_structural(const DocumentModel &model, ParseMode mode) {
  if (!is_structural(model.kind)) {
    if (!model.language) {
      throw DocumentParseError(std::string("A ") + kind_name(model.kind) + " document needs a language: " +
                               model.slug);
    }
    return write_language(model.slug, *model.language, model.content);
  }
  if (model.language) {
    throw DocumentParseError(std::string("A ") + kind_name(model.kind) + " document has no language: " + model.slug);
  }

  DocTree content = strip_bookkeeping(model.content);
  DocVector<Reference> references = extract_references(parse_aspects(content, mode));

  // Everything referenced must already exist
  if (model.template_slug) {
    resolver_.resolve(DocumentRef::by_slug(*model.template_slug));
  }
  for (const auto &ref : references) {
    if (ref.dest_slug != model.slug) {
      resolver_.resolve(DocumentRef::by_slug(ref.dest_slug));
    }
  }

  if (auto existing = store_.get_structural(model.slug)) {
    Document doc = std::move(*existing);
    if (doc.kind != model.kind) {
      throw DocumentParseError("Cannot change " + doc.slug + " from " + kind_name(doc.kind) + " to " +
                               kind_name(model.kind));
    }
    bool content_changed = !ChangeDetector::compare(doc.content, content).is_equal;
    if (!content_changed && doc.references == references && doc.template_slug == model.template_slug) {
      DOCTREE_LOG_DEBUG(doc.descriptor() + " unchanged");
      uint64_t version = doc.version;
      return CommitResult{std::move(doc), version, false};
    }
    if (content_changed) {
      versions_.update_version(doc, content);
    }
    doc.references = std::move(references);
    doc.template_slug = model.template_slug;
    store_.put(doc);
    DOCTREE_LOG_INFO("updated " + doc.descriptor() + " to version " + std::to_string(doc.version));
    uint64_t version = doc.version;
    return CommitResult{std::move(doc), version, true};
  }

  Document doc;
  doc.uuid = generate_uuid();
  doc.slug = model.slug;
  doc.domain = model.domain;
  doc.kind = model.kind;
  doc.version = 1;
  doc.content = std::move(content);
  doc.template_slug = model.template_slug;
  doc.references = std::move(references);
  store_.put(doc);
  DOCTREE_LOG_INFO("inserted " + doc.descriptor());
  return CommitResult{std::move(doc), 1, true};
}

CommitResult DocumentService::write_language(const std::string &slug, const std::string &language,
                                             const DocTree &overlay) {
  auto base = store_.get_structural(slug);
  if (!base) {
    throw NotFoundError(slug);
  }
  DocumentKind kind = concrete_kind_of(base->kind);
  DocTree content = strip_bookkeeping(overlay);

  try {
    MergeEngine::merge(base->content, content, true);
  } catch (const MergeError &e) {
    DOCTREE_LOG_ERROR("cannot merge language data with latest base version of " + slug + "[" + language +
                      "]: " + e.what());
    auto breakdown = MergeEngine::merge_aspects_one_by_one(base->content, content, true);
    std::string failures = MergeEngine::describe_failures(breakdown);
    if (!failures.empty()) {
      DOCTREE_LOG_ERROR(failures);
    }
    throw;
  }

  if (auto existing = store_.get_concrete(slug, language)) {
    Document doc = std::move(*existing);
    bool content_changed = !ChangeDetector::compare(doc.content, content).is_equal;
    if (!content_changed && doc.template_version == base->version) {
      DOCTREE_LOG_DEBUG(doc.descriptor() + " unchanged");
      uint64_t version = doc.version;
      return CommitResult{std::move(doc), version, false};
    }
    if (content_changed) {
      versions_.update_version(doc, content);
    }
    doc.template_version = base->version;
    store_.put(doc);
    DOCTREE_LOG_INFO("updated " + doc.descriptor() + " to version " + std::to_string(doc.version) +
                     " (base version " + std::to_string(doc.template_version) + ")");
    uint64_t version = doc.version;
    return CommitResult{std::move(doc), version, true};
  }

  Document doc;
  doc.uuid = generate_uuid();
  doc.slug = slug;
  doc.domain = base->domain;
  doc.kind = kind;
  doc.language = language;
  doc.version = 1;
  doc.content = std::move(content);
  doc.template_slug = slug;
  doc.template_version = base->version;
  store_.put(doc);
  DOCTREE_LOG_INFO("inserted " + doc.descriptor() + " (base version " + std::to_string(doc.template_version) + ")");
  return CommitResult{std::move(doc), 1, true};
}

DocTree DocumentService::get_version(const std::string &slug, const std::optional<std::string> &language,
                                     uint64_t version) const {
  return versions_.get_version(load(slug, language), version);
}

MergedDocument DocumentService::merged_document(const std::string &slug, const std::string &language) const {
  ResolvedDocument overlay = resolver_.resolve(DocumentRef::by_slug(slug, language));
  Document base = load(slug, std::nullopt);

  MergedDocument merged{slug,
                        base.domain,
                        overlay.document.kind,
                        language,
                        overlay.served_language.value_or(language),
                        base.version,
                        overlay.document.template_version,
                        overlay.document.template_version < base.version,
                        DocTree()};
  try {
    merged.content = MergeEngine::merge(base.content, overlay.document.content, true);
  } catch (const MergeError &e) {
    if (!merged.outdated) {
      throw;
    }
    DOCTREE_LOG_WARN(overlay.document.descriptor() + " does not fit version " + std::to_string(base.version) +
                     " of its base (" + e.what() + "), merging with version " +
                     std::to_string(merged.template_version));
    merged.content = MergeEngine::merge(versions_.get_version(base, merged.template_version),
                                        overlay.document.content, true);
    merged.version = merged.template_version;
  }
  return merged;
}

bool DocumentService::can_smash(const std::string &slug, const std::optional<std::string> &language) const {
  return versions_.can_smash(load(slug, language));
}

uint64_t DocumentService::smash_version(const std::string &slug, const std::optional<std::string> &language) {
  Document doc;
  store_.atomically([&]() {
    doc = load(slug, language);
    versions_.smash_version(doc);
    store_.put(doc);
  });
  notify(doc);
  return doc.version;
}

uint64_t DocumentService::on_document_committed(CommitHandler handler) {
  uint64_t id = next_handler_id_++;
  handlers_.emplace(id, std::move(handler));
  return id;
}

bool DocumentService::remove_commit_handler(uint64_t id) { return handlers_.erase(id) > 0; }

Document DocumentService::load(const std::string &slug, const std::optional<std::string> &language) const {
  auto doc = language ? store_.get_concrete(slug, *language) : store_.get_structural(slug);
  if (!doc) {
    throw NotFoundError(language ? DocumentRef::by_slug(slug, *language).to_string() : slug);
  }
  return std::move(*doc);
}

void DocumentService::notify(const Document &doc) {
  // Handlers may add or remove handlers, so dispatch over a copy
  auto handlers = handlers_;
  for (const auto &[id, handler] : handlers) {
    if (handlers_.find(id) == handlers_.end()) {
      continue; // removed by an earlier handler
    }
    try {
      handler(doc, doc.version);
    } catch (const std::exception &e) {
      // Log error but don't throw, the document is already committed
      DOCTREE_LOG_ERROR("commit handler " + std::to_string(id) + " failed for " + doc.descriptor() + ": " +
                        e.what());
    } catch (...) {
      DOCTREE_LOG_ERROR("commit handler " + std::to_string(id) + " failed for " + doc.descriptor() +
                        ": unknown exception");
    }
  }
}
