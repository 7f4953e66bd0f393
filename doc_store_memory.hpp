// doc_store_memory.hpp
#ifndef DOC_STORE_MEMORY_HPP
#define DOC_STORE_MEMORY_HPP

#include "doc_document.hpp"

/// In-process DocumentStore and DependentsIndex.
///
/// `atomically` snapshots the state and restores it when the callback throws,
/// so it behaves like a transaction for a single-threaded caller.
///
/// ⚠️  Not thread-safe.
class MemoryDocumentStore : public DocumentStore, public DependentsIndex {
public:
  MemoryDocumentStore() = default;

  std::optional<Document> get_structural(const std::string &slug) const override;
  std::optional<Document> get_concrete(const std::string &slug, const std::string &language) const override;
  std::optional<Document> get_by_uuid(const std::string &uuid) const override;
  DocVector<Document> concretes_of(const std::string &slug) const override;
  void put(const Document &doc) override;
  void remove(const std::string &uuid) override;
  std::optional<std::string> default_language(const std::string &domain) const override;
  void set_default_language(const std::string &domain, const std::string &language) override;
  void atomically(const std::function<void()> &fn) override;

  DocVector<Dependent> dependents(const Document &doc) const override;
  void repin(const Document &doc, uint64_t from, uint64_t to) override;
  void pin(const std::string &dependent_id, const std::string &slug, const std::string &language,
           uint64_t version) override;
  void unpin(const std::string &dependent_id) override;

  size_t document_count() const { return state_.documents.size(); }

private:
  struct Pin {
    std::string slug;
    std::string language;
    uint64_t version;
  };

  struct State {
    DocSortedMap<std::string, Document> documents; // uuid -> document
    DocSortedMap<std::string, std::string> domains; // domain -> default language
    DocSortedMap<std::string, Pin> pins;            // instance id -> pin
  };

  State state_;
  bool in_transaction_ = false;
};

#endif // DOC_STORE_MEMORY_HPP
