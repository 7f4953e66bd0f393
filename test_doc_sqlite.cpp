// test_doc_sqlite.cpp
#include "doc_errors.hpp"
#include "doc_service.hpp"
#include "doc_sqlite.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

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

// Test fixture helper
class TestDB {
public:
  TestDB(const std::string &name) : path_("test_" + name + ".db") { clean(); }

  ~TestDB() { clean(); }

  const char *path() const { return path_.c_str(); }

private:
  std::string path_;

  void clean() {
    for (const char *suffix : {"", "-wal", "-shm"}) {
      if (fs::exists(path_ + suffix)) {
        fs::remove(path_ + suffix);
      }
    }
  }
};

// Helper to count rows in a table
int count_rows(sqlite3 *db, const std::string &table) {
  std::string query = "SELECT COUNT(*) FROM " + table;
  sqlite3_stmt *stmt;
  sqlite3_prepare_v2(db, query.c_str(), -1, &stmt, nullptr);
  sqlite3_step(stmt);
  int count = sqlite3_column_int(stmt, 0);
  sqlite3_finalize(stmt);
  return count;
}

static DocTree json(const char *text) { return DocTree::from_json(text); }

static Document make_doc(const std::string &uuid, const std::string &slug, DocumentKind kind, const char *content,
                         std::optional<std::string> language = std::nullopt) {
  Document doc;
  doc.uuid = uuid;
  doc.slug = slug;
  doc.domain = "birds";
  doc.kind = kind;
  doc.language = std::move(language);
  doc.content = json(content);
  if (doc.language) {
    doc.template_slug = slug;
    doc.template_version = 1;
  }
  return doc;
}

static DocumentModel base_template(const char *content) {
  DocumentModel model;
  model.slug = "bird_obs";
  model.domain = "birds";
  model.kind = DocumentKind::BASE_TEMPLATE;
  model.content = json(content);
  return model;
}

static const char *V1 = "{\"aspects\":[{\"name\":\"species\",\"type\":\"str\"}]}";
static const char *V2 = "{\"aspects\":[{\"name\":\"species\",\"type\":\"str\"},{\"name\":\"count\",\"type\":\"int\"}]}";
static const char *V3 = "{\"aspects\":[{\"name\":\"species\",\"type\":\"str\",\"label\":\"Kind\"},"
                        "{\"name\":\"count\",\"type\":\"int\"}]}";

TEST(tables_created) {
  TestDB test_db("tables_created");
  SQLiteDocumentStore store(test_db.path());

  sqlite3_stmt *stmt;
  const char *check_sql = "SELECT COUNT(*) FROM sqlite_master WHERE type='table' "
                          "AND name IN ('_doctree_documents', '_doctree_deltas', '_doctree_pins', '_doctree_domains')";
  sqlite3_prepare_v2(store.get_db(), check_sql, -1, &stmt, nullptr);
  sqlite3_step(stmt);
  int table_count = sqlite3_column_int(stmt, 0);
  sqlite3_finalize(stmt);
  ASSERT_EQ(table_count, 4);
}

TEST(history_survives_reopen) {
  TestDB test_db("history_survives_reopen");
  std::string uuid;
  {
    SQLiteDocumentStore store(test_db.path());
    DocumentService service(store, store);
    uuid = service.update_or_insert(base_template(V1)).document.uuid;
    service.update_or_insert(base_template(V2));
    service.update_or_insert(base_template(V3));
    ASSERT_EQ(count_rows(store.get_db(), "_doctree_deltas"), 2);
  }

  SQLiteDocumentStore store(test_db.path());
  DocumentService service(store, store);
  auto doc = store.get_by_uuid(uuid);
  ASSERT_TRUE(doc.has_value());
  ASSERT_EQ(doc->version, 3u);
  ASSERT_EQ(doc->reverse_deltas.size(), 2u);
  ASSERT_EQ(service.get_version("bird_obs", std::nullopt, 1), json(V1));
  ASSERT_EQ(service.get_version("bird_obs", std::nullopt, 2), json(V2));
  ASSERT_EQ(service.get_version("bird_obs", std::nullopt, 3), json(V3));
}

TEST(references_stored) {
  TestDB test_db("references_stored");
  SQLiteDocumentStore store(test_db.path());

  Document doc = make_doc("u1", "bird_obs", DocumentKind::BASE_TEMPLATE, "{}");
  doc.references.push_back(Reference{".habitat", "habitats", Reference::TAG, "env"});
  doc.references.push_back(Reference{".colors", "colors", Reference::CODE, ""});
  store.put(doc);

  auto loaded = store.get_structural("bird_obs");
  ASSERT_TRUE(loaded.has_value());
  ASSERT_TRUE(loaded->references == doc.references);
  ASSERT_TRUE(loaded->kind == DocumentKind::BASE_TEMPLATE);
  ASSERT_FALSE(loaded->language.has_value());
}

TEST(smash_shortens_delta_log) {
  TestDB test_db("smash_shortens_delta_log");
  SQLiteDocumentStore store(test_db.path());
  DocumentService service(store, store);
  service.update_or_insert(base_template(V1));
  service.update_or_insert(base_template(V2));
  service.update_or_insert(base_template(V3));
  ASSERT_EQ(count_rows(store.get_db(), "_doctree_deltas"), 2);

  ASSERT_EQ(service.smash_version("bird_obs"), 2u);
  ASSERT_EQ(count_rows(store.get_db(), "_doctree_deltas"), 1);
  ASSERT_EQ(service.get_version("bird_obs", std::nullopt, 1), json(V1));
  ASSERT_EQ(service.get_version("bird_obs", std::nullopt, 2), json(V3));
}

TEST(failed_write_rolls_back) {
  TestDB test_db("failed_write_rolls_back");
  SQLiteDocumentStore store(test_db.path());
  store.put(make_doc("u1", "colors", DocumentKind::BASE_CODE, "{\"items\":[]}"));

  // a second structural document with the same slug
  bool exception_thrown = false;
  try {
    store.put(make_doc("u2", "colors", DocumentKind::BASE_CODE, "{\"items\":[\"red\"]}"));
  } catch (const StoreCommitError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);
  ASSERT_FALSE(store.get_by_uuid("u2").has_value());

  // an exception inside atomically undoes every write of the group
  exception_thrown = false;
  try {
    store.atomically([&]() {
      store.put(make_doc("u3", "habitats", DocumentKind::BASE_CODE, "{}"));
      store.set_default_language("birds", "de");
      throw std::runtime_error("abort");
    });
  } catch (const std::runtime_error &e) {
    exception_thrown = (std::string(e.what()) == "abort");
  }
  ASSERT_EQ(exception_thrown, true);
  ASSERT_FALSE(store.get_by_uuid("u3").has_value());
  ASSERT_FALSE(store.default_language("birds").has_value());
  ASSERT_EQ(count_rows(store.get_db(), "_doctree_documents"), 1);

  // the store is usable afterwards
  store.set_default_language("birds", "en");
  ASSERT_EQ(store.default_language("birds").value_or(""), "en");
}

TEST(inconsistent_log_rejected) {
  TestDB test_db("inconsistent_log_rejected");
  SQLiteDocumentStore store(test_db.path());
  Document doc = make_doc("u1", "colors", DocumentKind::BASE_CODE, "{}");
  doc.version = 2;
  bool exception_thrown = false;
  try {
    store.put(doc);
  } catch (const StoreCommitError &) {
    exception_thrown = true;
  }
  ASSERT_EQ(exception_thrown, true);
  ASSERT_EQ(count_rows(store.get_db(), "_doctree_documents"), 0);
}

TEST(dependents_and_pins) {
  TestDB test_db("dependents_and_pins");
  SQLiteDocumentStore store(test_db.path());

  Document base = make_doc("b", "colors", DocumentKind::BASE_CODE, "{\"items\":[\"r\"]}");
  store.put(base);
  Document en = make_doc("en", "colors", DocumentKind::CODE, "{\"items\":[\"Red\"]}", "en");
  Document de = make_doc("de", "colors", DocumentKind::CODE, "{\"items\":[\"Rot\"]}", "de");
  de.template_version = 2;
  store.put(en);
  store.put(de);

  auto overlays = store.dependents(base);
  ASSERT_EQ(overlays.size(), 2u);
  ASSERT_EQ(overlays[0].id, "de");
  ASSERT_EQ(overlays[0].pinned_version, 2u);
  ASSERT_EQ(overlays[1].pinned_version, 1u);
  ASSERT_EQ(store.concretes_of("colors").size(), 2u);

  store.repin(base, 2, 1);
  ASSERT_EQ(store.get_concrete("colors", "de")->template_version, 1u);

  store.pin("entry-1", "colors", "en", 1);
  store.pin("entry-2", "colors", "en", 1);
  store.pin("entry-3", "colors", "de", 1);
  ASSERT_EQ(store.dependents(en).size(), 2u);
  ASSERT_TRUE(store.has_dependent(en, 1));

  store.repin(en, 1, 2);
  ASSERT_FALSE(store.has_dependent(en, 1));
  ASSERT_TRUE(store.has_dependent(de, 1));

  // a later pin replaces the earlier one
  store.pin("entry-1", "colors", "de", 1);
  ASSERT_EQ(store.dependents(en).size(), 1u);
  store.unpin("entry-2");
  ASSERT_TRUE(store.dependents(en).empty());
}

TEST(remove_drops_delta_log) {
  TestDB test_db("remove_drops_delta_log");
  SQLiteDocumentStore store(test_db.path());
  DocumentService service(store, store);
  std::string uuid = service.update_or_insert(base_template(V1)).document.uuid;
  service.update_or_insert(base_template(V2));
  ASSERT_EQ(count_rows(store.get_db(), "_doctree_deltas"), 1);

  store.remove(uuid);
  ASSERT_FALSE(store.get_structural("bird_obs").has_value());
  ASSERT_EQ(count_rows(store.get_db(), "_doctree_deltas"), 0);
}

int main() {
  std::cout << "Running SQLiteDocumentStore tests..." << std::endl << std::endl;

  RUN_TEST(tables_created);
  RUN_TEST(history_survives_reopen);
  RUN_TEST(references_stored);
  RUN_TEST(smash_shortens_delta_log);
  RUN_TEST(failed_write_rolls_back);
  RUN_TEST(inconsistent_log_rejected);
  RUN_TEST(dependents_and_pins);
  RUN_TEST(remove_drops_delta_log);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
