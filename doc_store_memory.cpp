// doc_store_memory.cpp
#include "doc_store_memory.hpp"
#include "doc_errors.hpp"

std::optional<Document> MemoryDocumentStore::get_structural(const std::string &slug) const {
  for (const auto &[uuid, doc] : state_.documents) {
    if (doc.slug == slug && !doc.language) {
      return doc;
    }
  }
  return std::nullopt;
}

std::optional<Document> MemoryDocumentStore::get_concrete(const std::string &slug, const std::string &language) const {
  for (const auto &[uuid, doc] : state_.documents) {
    if (doc.slug == slug && doc.language == language) {
      return doc;
    }
  }
  return std::nullopt;
}

std::optional<Document> MemoryDocumentStore::get_by_uuid(const std::string &uuid) const {
  auto it = state_.documents.find(uuid);
  if (it == state_.documents.end()) {
    return std::nullopt;
  }
  return it->second;
}

DocVector<Document> MemoryDocumentStore::concretes_of(const std::string &slug) const {
  DocVector<Document> result;
  for (const auto &[uuid, doc] : state_.documents) {
    if (doc.slug == slug && doc.language) {
      result.push_back(doc);
    }
  }
  return result;
}

void MemoryDocumentStore::put(const Document &doc) {
  if (doc.uuid.empty()) {
    throw StoreCommitError("Cannot store a document without uuid: " + doc.descriptor());
  }
  if (doc.reverse_deltas.size() + 1 != doc.version) {
    throw StoreCommitError("Delta log of " + doc.descriptor() + " does not match version " +
                           std::to_string(doc.version));
  }
  // (slug, language) is unique
  for (const auto &[uuid, other] : state_.documents) {
    if (uuid != doc.uuid && other.slug == doc.slug && other.language == doc.language) {
      throw StoreCommitError("Document already exists: " + doc.descriptor());
    }
  }
  state_.documents[doc.uuid] = doc;
}

void MemoryDocumentStore::remove(const std::string &uuid) { state_.documents.erase(uuid); }

std::optional<std::string> MemoryDocumentStore::default_language(const std::string &domain) const {
  auto it = state_.domains.find(domain);
  if (it == state_.domains.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryDocumentStore::set_default_language(const std::string &domain, const std::string &language) {
  state_.domains[domain] = language;
}

void MemoryDocumentStore::atomically(const std::function<void()> &fn) {
  if (in_transaction_) {
    fn();
    return;
  }
  State snapshot = state_;
  in_transaction_ = true;
  try {
    fn();
  } catch (...) {
    state_ = std::move(snapshot);
    in_transaction_ = false;
    throw;
  }
  in_transaction_ = false;
}

DocVector<Dependent> MemoryDocumentStore::dependents(const Document &doc) const {
  DocVector<Dependent> result;
  if (doc.is_structural()) {
    for (const auto &concrete : concretes_of(doc.slug)) {
      result.push_back(Dependent{concrete.uuid, concrete.template_version});
    }
    return result;
  }
  for (const auto &[id, pin] : state_.pins) {
    if (pin.slug == doc.slug && doc.language && pin.language == *doc.language) {
      result.push_back(Dependent{id, pin.version});
    }
  }
  return result;
}

void MemoryDocumentStore::repin(const Document &doc, uint64_t from, uint64_t to) {
  if (doc.is_structural()) {
    for (auto &[uuid, other] : state_.documents) {
      if (other.slug == doc.slug && other.language && other.template_version == from) {
        other.template_version = to;
      }
    }
    return;
  }
  for (auto &[id, pin] : state_.pins) {
    if (pin.slug == doc.slug && doc.language && pin.language == *doc.language && pin.version == from) {
      pin.version = to;
    }
  }
}

void MemoryDocumentStore::pin(const std::string &dependent_id, const std::string &slug, const std::string &language,
                              uint64_t version) {
  state_.pins[dependent_id] = Pin{slug, language, version};
}

void MemoryDocumentStore::unpin(const std::string &dependent_id) { state_.pins.erase(dependent_id); }
