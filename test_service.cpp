// test_service.cpp
#include "doc_errors.hpp"
#include "doc_service.hpp"
#include "doc_store_memory.hpp"
#include <functional>
#include <iostream>
#include <cstdlib>

// Test helper macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) \
  do { \
    std::cout << "Running test: " << #name << "..."; \
    test_##name(); \
    std::cout << " PASSED" << std::endl; \
  } while (0)

#define ASSERT_EQ(a, b) \
  do { \
    if ((a) != (b)) { \
      std::cerr << "Assertion failed: " << #a << " == " << #b \
                << " (got " << (a) << " and " << (b) << ")" << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_TRUE(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "Assertion failed: " << #cond << std::endl; \
      std::exit(1); \
    } \
  } while (0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

static DocTree json(const char *text) { return DocTree::from_json(text); }

static DocumentModel structural(const std::string &slug, DocumentKind kind, const char *content,
                                std::optional<std::string> template_slug = std::nullopt) {
  DocumentModel model;
  model.slug = slug;
  model.domain = "birds";
  model.kind = kind;
  model.template_slug = std::move(template_slug);
  model.content = json(content);
  return model;
}

static const char *ONE_ASPECT = "{\"title\":\"Bird observation\",\"aspects\":["
                                "{\"name\":\"colors\",\"type\":\"multiselect\",\"items\":\"colors\"}]}";
static const char *TWO_ASPECTS = "{\"title\":\"Bird observation\",\"aspects\":["
                                 "{\"name\":\"colors\",\"type\":\"multiselect\",\"items\":\"colors\"},"
                                 "{\"name\":\"count\",\"type\":\"int\"}]}";

// code schema, colors code and the bird_obs template
static void seed(DocumentService &service) {
  service.update_or_insert(structural("code_schema", DocumentKind::SCHEMA, "{\"aspects\":[]}"));
  service.update_or_insert(
      structural("colors", DocumentKind::BASE_CODE, "{\"items\":[\"red\",\"blue\"]}", std::string("code_schema")));
  service.update_or_insert(structural("bird_obs", DocumentKind::BASE_TEMPLATE, ONE_ASPECT));
}

TEST(insert_and_noop_update) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);
  ASSERT_EQ(store.document_count(), 3u);

  Document bird = *store.get_structural("bird_obs");
  ASSERT_EQ(bird.uuid.size(), 36u);
  ASSERT_EQ(bird.version, 1u);
  ASSERT_EQ(bird.references.size(), 1u);
  ASSERT_EQ(bird.references[0].dest_slug, "colors");

  // bookkeeping fields are not content
  CommitResult again = service.update_or_insert(
      structural("bird_obs", DocumentKind::BASE_TEMPLATE,
                 "{\"uuid\":\"other\",\"version\":7,\"title\":\"Bird observation\",\"aspects\":["
                 "{\"name\":\"colors\",\"type\":\"multiselect\",\"items\":\"colors\"}]}"));
  ASSERT_FALSE(again.changed);
  ASSERT_EQ(again.version, 1u);
  ASSERT_EQ(again.document.uuid, bird.uuid);
  ASSERT_TRUE(store.get_structural("bird_obs")->content.find("uuid") == nullptr);
}

TEST(structural_update_adds_version) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);

  CommitResult result = service.update_or_insert(structural("bird_obs", DocumentKind::BASE_TEMPLATE, TWO_ASPECTS));
  ASSERT_TRUE(result.changed);
  ASSERT_EQ(result.version, 2u);
  ASSERT_EQ(service.get_version("bird_obs", std::nullopt, 1), json(ONE_ASPECT));
  ASSERT_EQ(service.get_version("bird_obs", std::nullopt, 2), json(TWO_ASPECTS));

  bool exception_thrown = false;
  try {
    service.get_version("bird_obs", std::nullopt, 3);
  } catch (const VersionError &e) {
    exception_thrown = (e.max() == 2);
  }
  ASSERT_EQ(exception_thrown, true);
}

TEST(missing_reference_rejected) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);

  bool exception_thrown = false;
  try {
    service.update_or_insert(structural("nest", DocumentKind::BASE_TEMPLATE,
                                        "{\"aspects\":[{\"name\":\"place\",\"type\":\"select\",\"items\":\"habitats\"}]}"));
  } catch (const NotFoundError &e) {
    exception_thrown = (e.reference() == "habitats");
  }
  ASSERT_EQ(exception_thrown, true);
  ASSERT_FALSE(store.get_structural("nest").has_value());

  exception_thrown = false;
  try {
    service.update_or_insert(structural("sizes", DocumentKind::BASE_CODE, "{\"items\":[]}", std::string("nope")));
  } catch (const NotFoundError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);
}

TEST(kind_cannot_change) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);

  bool exception_thrown = false;
  try {
    service.update_or_insert(structural("colors", DocumentKind::BASE_TEMPLATE, "{\"items\":[\"red\"]}"));
  } catch (const DocumentParseError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);
}

TEST(submit_language) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);

  CommitResult en = service.submit_language("bird_obs", "en", json("{\"aspects\":[{\"label\":\"Colors\"}]}"));
  ASSERT_TRUE(en.changed);
  ASSERT_TRUE(en.document.kind == DocumentKind::TEMPLATE);
  ASSERT_EQ(en.document.template_version, 1u);
  ASSERT_EQ(en.document.template_slug.value_or(""), "bird_obs");

  // the same overlay again is a no-op
  ASSERT_FALSE(service.submit_language("bird_obs", "en", json("{\"aspects\":[{\"label\":\"Colors\"}]}")).changed);

  // a concrete model goes the same way
  DocumentModel model;
  model.slug = "colors";
  model.domain = "birds";
  model.kind = DocumentKind::CODE;
  model.language = "en";
  model.content = json("{\"items\":[\"Red\",\"Blue\"]}");
  ASSERT_TRUE(service.update_or_insert(model).document.kind == DocumentKind::CODE);

  model.language.reset();
  bool exception_thrown = false;
  try {
    service.update_or_insert(model);
  } catch (const DocumentParseError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);
}

TEST(mismatched_overlay_commits_nothing) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);
  int commits = 0;
  service.on_document_committed([&](const Document &, uint64_t) { ++commits; });

  bool exception_thrown = false;
  try {
    service.submit_language("bird_obs", "de", json("{\"aspects\":[{\"label\":\"Farben\"},{\"label\":\"Anzahl\"}]}"));
  } catch (const MergeError &e) {
    exception_thrown = true;
    ASSERT_EQ(e.kind(), MergeError::STRUCTURAL_MISMATCH);
    ASSERT_EQ(e.path(), "aspects.1");
  }
  ASSERT_EQ(exception_thrown, true);
  ASSERT_FALSE(store.get_concrete("bird_obs", "de").has_value());
  ASSERT_EQ(commits, 0);
}

TEST(schema_has_no_languages) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);

  bool exception_thrown = false;
  try {
    service.submit_language("code_schema", "en", json("{\"aspects\":[]}"));
  } catch (const DocumentParseError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);

  exception_thrown = false;
  try {
    service.submit_language("unknown", "en", json("{}"));
  } catch (const NotFoundError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);
}

TEST(merged_document_of_outdated_overlay) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);
  service.submit_language("bird_obs", "en", json("{\"aspects\":[{\"label\":\"Colors\"}]}"));

  MergedDocument current = service.merged_document("bird_obs", "en");
  ASSERT_FALSE(current.outdated);
  ASSERT_EQ(current.content.find("aspects")->as_list()[0].find("label")->as_text(), "Colors");

  service.update_or_insert(structural("bird_obs", DocumentKind::BASE_TEMPLATE, TWO_ASPECTS));

  // the overlay only covers one aspect: served against the version it was made for
  MergedDocument outdated = service.merged_document("bird_obs", "fr");
  ASSERT_TRUE(outdated.outdated);
  ASSERT_EQ(outdated.requested_language, "fr");
  ASSERT_EQ(outdated.served_language, "en");
  ASSERT_EQ(outdated.version, 1u);
  ASSERT_EQ(outdated.template_version, 1u);
  ASSERT_EQ(outdated.content.find("aspects")->size(), 1u);
}

TEST(commit_handlers) {
  MemoryDocumentStore store;
  DocumentService service(store, store);

  DocVector<std::string> seen;
  uint64_t recorder = service.on_document_committed(
      [&](const Document &doc, uint64_t version) { seen.push_back(doc.slug + "@" + std::to_string(version)); });
  uint64_t failing = service.on_document_committed(
      [](const Document &, uint64_t) { throw std::runtime_error("listener is broken"); });
  ASSERT_TRUE(recorder != failing);

  // a failing handler neither blocks the commit nor the other handlers
  seed(service);
  ASSERT_EQ(seen.size(), 3u);
  ASSERT_EQ(seen[2], "bird_obs@1");
  ASSERT_TRUE(store.get_structural("bird_obs").has_value());

  // no-op writes do not notify
  service.update_or_insert(structural("bird_obs", DocumentKind::BASE_TEMPLATE, ONE_ASPECT));
  ASSERT_EQ(seen.size(), 3u);

  ASSERT_TRUE(service.remove_commit_handler(recorder));
  ASSERT_FALSE(service.remove_commit_handler(recorder));
  service.update_or_insert(structural("bird_obs", DocumentKind::BASE_TEMPLATE, TWO_ASPECTS));
  ASSERT_EQ(seen.size(), 3u);
}

TEST(handler_may_remove_handlers) {
  MemoryDocumentStore store;
  DocumentService service(store, store);

  int once_calls = 0;
  int later_calls = 0;
  uint64_t once = 0;
  uint64_t later = 0;
  once = service.on_document_committed([&](const Document &, uint64_t) {
    ++once_calls;
    service.remove_commit_handler(once);
  });
  // removes the handler registered after it before that one runs
  service.on_document_committed([&](const Document &, uint64_t) { service.remove_commit_handler(later); });
  later = service.on_document_committed([&](const Document &, uint64_t) { ++later_calls; });

  seed(service);
  ASSERT_EQ(once_calls, 1);
  ASSERT_EQ(later_calls, 0);
  ASSERT_FALSE(service.remove_commit_handler(once));
  ASSERT_FALSE(service.remove_commit_handler(later));
}

TEST(handler_throwing_non_exception_is_contained) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  int calls = 0;
  service.on_document_committed([](const Document &, uint64_t) { throw 42; });
  service.on_document_committed([&](const Document &, uint64_t) { ++calls; });

  seed(service);
  ASSERT_EQ(calls, 3);
  ASSERT_EQ(store.document_count(), 3u);
}

// Counts store reads made outside a transaction
class TransactionTrackingStore : public MemoryDocumentStore {
public:
  mutable int reads_outside = 0;

  std::optional<Document> get_structural(const std::string &slug) const override {
    note_read();
    return MemoryDocumentStore::get_structural(slug);
  }
  std::optional<Document> get_concrete(const std::string &slug, const std::string &language) const override {
    note_read();
    return MemoryDocumentStore::get_concrete(slug, language);
  }
  std::optional<Document> get_by_uuid(const std::string &uuid) const override {
    note_read();
    return MemoryDocumentStore::get_by_uuid(uuid);
  }
  DocVector<Document> concretes_of(const std::string &slug) const override {
    note_read();
    return MemoryDocumentStore::concretes_of(slug);
  }
  DocVector<Dependent> dependents(const Document &doc) const override {
    note_read();
    return MemoryDocumentStore::dependents(doc);
  }
  void atomically(const std::function<void()> &fn) override {
    ++depth_;
    try {
      MemoryDocumentStore::atomically(fn);
    } catch (...) {
      --depth_;
      throw;
    }
    --depth_;
  }

private:
  int depth_ = 0;

  void note_read() const {
    if (depth_ == 0) {
      ++reads_outside;
    }
  }
};

TEST(writes_read_inside_one_transaction) {
  TransactionTrackingStore store;
  DocumentService service(store, store);
  seed(service);
  service.update_or_insert(structural("bird_obs", DocumentKind::BASE_TEMPLATE, TWO_ASPECTS));
  service.submit_language("bird_obs", "en", json("{\"aspects\":[{\"label\":\"Colors\"},{\"label\":\"Count\"}]}"));
  service.submit_language("bird_obs", "en", json("{\"aspects\":[{\"label\":\"Colours\"},{\"label\":\"Count\"}]}"));
  ASSERT_EQ(store.get_concrete("bird_obs", "en")->version, 2u);

  // the reads above were the test's own
  ASSERT_EQ(store.reads_outside, 1);
}

TEST(smash_after_overlays_caught_up) {
  MemoryDocumentStore store;
  DocumentService service(store, store);
  seed(service);
  service.submit_language("bird_obs", "en", json("{\"aspects\":[{\"label\":\"Colors\"}]}"));
  service.update_or_insert(structural("bird_obs", DocumentKind::BASE_TEMPLATE, TWO_ASPECTS));

  // en still pins version 1
  ASSERT_FALSE(service.can_smash("bird_obs"));
  bool exception_thrown = false;
  try {
    service.smash_version("bird_obs");
  } catch (const VersionError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);
  ASSERT_EQ(store.get_structural("bird_obs")->version, 2u);

  service.submit_language("bird_obs", "en", json("{\"aspects\":[{\"label\":\"Colors\"},{\"label\":\"Count\"}]}"));
  ASSERT_EQ(store.get_concrete("bird_obs", "en")->template_version, 2u);
  ASSERT_TRUE(service.can_smash("bird_obs"));

  ASSERT_EQ(service.smash_version("bird_obs"), 1u);
  ASSERT_EQ(store.get_structural("bird_obs")->content, json(TWO_ASPECTS));
  ASSERT_EQ(store.get_concrete("bird_obs", "en")->template_version, 1u);
  ASSERT_FALSE(service.merged_document("bird_obs", "en").outdated);
}

TEST(generated_uuids_differ) {
  std::string a = generate_uuid();
  std::string b = generate_uuid();
  ASSERT_EQ(a.size(), 36u);
  ASSERT_TRUE(a != b);
  ASSERT_EQ(a[8], '-');
}

int main() {
  std::cout << "Running DocumentService tests..." << std::endl << std::endl;

  RUN_TEST(insert_and_noop_update);
  RUN_TEST(structural_update_adds_version);
  RUN_TEST(missing_reference_rejected);
  RUN_TEST(kind_cannot_change);
  RUN_TEST(submit_language);
  RUN_TEST(mismatched_overlay_commits_nothing);
  RUN_TEST(schema_has_no_languages);
  RUN_TEST(merged_document_of_outdated_overlay);
  RUN_TEST(commit_handlers);
  RUN_TEST(handler_may_remove_handlers);
  RUN_TEST(handler_throwing_non_exception_is_contained);
  RUN_TEST(writes_read_inside_one_transaction);
  RUN_TEST(smash_after_overlays_caught_up);
  RUN_TEST(generated_uuids_differ);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
