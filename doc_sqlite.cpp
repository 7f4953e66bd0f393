// doc_sqlite.cpp
#include "doc_sqlite.hpp"
#include "doc_errors.hpp"
#include "doc_log.hpp"

#include <nlohmann/json.hpp>

namespace {

const std::string DOCUMENT_COLUMNS =
    "uuid, slug, domain, kind, language, version, content, template_slug, template_version, refs";

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char *>(text) : std::string();
}

std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, int col) {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, col);
}

void bind_text(sqlite3_stmt *stmt, int idx, const std::string &value) {
  sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt *stmt, int idx, const std::optional<std::string> &value) {
  if (value) {
    bind_text(stmt, idx, *value);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

std::string references_to_json(const DocVector<Reference> &refs) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &ref : refs) {
    list.push_back({{"aspect_path", ref.aspect_path},
                    {"dest_slug", ref.dest_slug},
                    {"ref_type", Reference::type_name(ref.ref_type)},
                    {"tag", ref.tag}});
  }
  return list.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

DocVector<Reference> references_from_json(const std::string &text) {
  DocVector<Reference> refs;
  try {
    for (const auto &entry : nlohmann::json::parse(text)) {
      Reference ref;
      ref.aspect_path = entry.value("aspect_path", "");
      ref.dest_slug = entry.value("dest_slug", "");
      ref.ref_type = entry.value("ref_type", "code") == "tag" ? Reference::TAG : Reference::CODE;
      ref.tag = entry.value("tag", "");
      refs.push_back(std::move(ref));
    }
  } catch (const nlohmann::json::exception &e) {
    throw StoreCommitError(std::string("Corrupt reference list: ") + e.what());
  }
  return refs;
}

} // namespace

SQLiteDocumentStore::SQLiteDocumentStore(const char *path) : db_(nullptr), in_transaction_(false) {
  int rc = sqlite3_open_v2(path, &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
    sqlite3_close(db_);
    throw StoreCommitError(error);
  }

  try {
    exec_or_throw("PRAGMA foreign_keys = ON");
    exec_or_throw("PRAGMA journal_mode=WAL");
    create_tables();
  } catch (const StoreCommitError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SQLiteDocumentStore::~SQLiteDocumentStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SQLiteDocumentStore::create_tables() {
  exec_or_throw("CREATE TABLE IF NOT EXISTS _doctree_documents ("
                "uuid TEXT PRIMARY KEY NOT NULL, "
                "slug TEXT NOT NULL, "
                "domain TEXT NOT NULL, "
                "kind TEXT NOT NULL, "
                "language TEXT, "
                "version INTEGER NOT NULL, "
                "content TEXT NOT NULL, "
                "template_slug TEXT, "
                "template_version INTEGER NOT NULL DEFAULT 0, "
                "refs TEXT NOT NULL DEFAULT '[]')");

  // (slug, language) identifies a document; structural documents have no language
  exec_or_throw("CREATE UNIQUE INDEX IF NOT EXISTS _doctree_documents_slug_idx "
                "ON _doctree_documents(slug, IFNULL(language, ''))");

  exec_or_throw("CREATE TABLE IF NOT EXISTS _doctree_deltas ("
                "uuid TEXT NOT NULL REFERENCES _doctree_documents(uuid) ON DELETE CASCADE, "
                "version_index INTEGER NOT NULL, "
                "patch TEXT NOT NULL, "
                "PRIMARY KEY (uuid, version_index))");

  exec_or_throw("CREATE TABLE IF NOT EXISTS _doctree_pins ("
                "dependent_id TEXT PRIMARY KEY NOT NULL, "
                "slug TEXT NOT NULL, "
                "language TEXT NOT NULL, "
                "version INTEGER NOT NULL)");

  exec_or_throw("CREATE INDEX IF NOT EXISTS _doctree_pins_target_idx ON _doctree_pins(slug, language)");

  exec_or_throw("CREATE TABLE IF NOT EXISTS _doctree_domains ("
                "domain TEXT PRIMARY KEY NOT NULL, "
                "default_language TEXT NOT NULL)");
}

sqlite3_stmt *SQLiteDocumentStore::prepare(const char *sql) const {
  sqlite3_stmt *stmt;
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw StoreCommitError("Failed to prepare statement: " + get_error());
  }
  return stmt;
}

void SQLiteDocumentStore::step_done(const Statement &stmt, const char *what) const {
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    throw StoreCommitError(std::string("Failed to ") + what + ": " + get_error());
  }
}

Document SQLiteDocumentStore::read_document(sqlite3_stmt *stmt) const {
  Document doc;
  doc.uuid = column_text(stmt, 0);
  doc.slug = column_text(stmt, 1);
  doc.domain = column_text(stmt, 2);
  std::string kind = column_text(stmt, 3);
  auto parsed_kind = kind_from_name(kind);
  if (!parsed_kind) {
    throw DocumentParseError("Unknown document kind in store: " + kind);
  }
  doc.kind = *parsed_kind;
  doc.language = column_optional_text(stmt, 4);
  doc.version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
  doc.content = DocTree::from_json(column_text(stmt, 6));
  doc.template_slug = column_optional_text(stmt, 7);
  doc.template_version = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
  doc.references = references_from_json(column_text(stmt, 9));

  Statement deltas(prepare("SELECT patch FROM _doctree_deltas WHERE uuid = ? ORDER BY version_index"));
  bind_text(deltas.get(), 1, doc.uuid);
  int rc;
  while ((rc = sqlite3_step(deltas.get())) == SQLITE_ROW) {
    doc.reverse_deltas.push_back(DocPatch::from_string(column_text(deltas.get(), 0)));
  }
  if (rc != SQLITE_DONE) {
    throw StoreCommitError("Failed to read delta log: " + get_error());
  }
  return doc;
}

std::optional<Document> SQLiteDocumentStore::query_one(const char *sql, const DocVector<std::string> &params) const {
  auto docs = query_all(sql, params);
  if (docs.empty()) {
    return std::nullopt;
  }
  return std::move(docs.front());
}

DocVector<Document> SQLiteDocumentStore::query_all(const char *sql, const DocVector<std::string> &params) const {
  Statement stmt(prepare(sql));
  for (size_t i = 0; i < params.size(); ++i) {
    bind_text(stmt.get(), static_cast<int>(i + 1), params[i]);
  }
  DocVector<Document> docs;
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    docs.push_back(read_document(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    throw StoreCommitError("Failed to query documents: " + get_error());
  }
  return docs;
}

std::optional<Document> SQLiteDocumentStore::get_structural(const std::string &slug) const {
  std::string sql = "SELECT " + DOCUMENT_COLUMNS + " FROM _doctree_documents WHERE slug = ? AND language IS NULL";
  return query_one(sql.c_str(), {slug});
}

std::optional<Document> SQLiteDocumentStore::get_concrete(const std::string &slug, const std::string &language) const {
  std::string sql = "SELECT " + DOCUMENT_COLUMNS + " FROM _doctree_documents WHERE slug = ? AND language = ?";
  return query_one(sql.c_str(), {slug, language});
}

std::optional<Document> SQLiteDocumentStore::get_by_uuid(const std::string &uuid) const {
  std::string sql = "SELECT " + DOCUMENT_COLUMNS + " FROM _doctree_documents WHERE uuid = ?";
  return query_one(sql.c_str(), {uuid});
}

DocVector<Document> SQLiteDocumentStore::concretes_of(const std::string &slug) const {
  std::string sql = "SELECT " + DOCUMENT_COLUMNS +
                    " FROM _doctree_documents WHERE slug = ? AND language IS NOT NULL ORDER BY language";
  return query_all(sql.c_str(), {slug});
}

void SQLiteDocumentStore::write_document(const Document &doc) {
  if (doc.uuid.empty()) {
    throw StoreCommitError("Cannot store a document without uuid: " + doc.descriptor());
  }
  if (doc.reverse_deltas.size() + 1 != doc.version) {
    throw StoreCommitError("Delta log of " + doc.descriptor() + " does not match version " +
                           std::to_string(doc.version));
  }

  {
    Statement stmt(prepare("INSERT INTO _doctree_documents "
                           "(uuid, slug, domain, kind, language, version, content, template_slug, template_version, refs) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                           "ON CONFLICT(uuid) DO UPDATE SET "
                           "slug = excluded.slug, domain = excluded.domain, kind = excluded.kind, "
                           "language = excluded.language, version = excluded.version, content = excluded.content, "
                           "template_slug = excluded.template_slug, template_version = excluded.template_version, "
                           "refs = excluded.refs"));
    bind_text(stmt.get(), 1, doc.uuid);
    bind_text(stmt.get(), 2, doc.slug);
    bind_text(stmt.get(), 3, doc.domain);
    bind_text(stmt.get(), 4, kind_name(doc.kind));
    bind_optional_text(stmt.get(), 5, doc.language);
    sqlite3_bind_int64(stmt.get(), 6, static_cast<sqlite3_int64>(doc.version));
    bind_text(stmt.get(), 7, doc.content.to_json());
    bind_optional_text(stmt.get(), 8, doc.template_slug);
    sqlite3_bind_int64(stmt.get(), 9, static_cast<sqlite3_int64>(doc.template_version));
    bind_text(stmt.get(), 10, references_to_json(doc.references));
    step_done(stmt, "write document");
  }

  // Existing log entries, to touch only the rows that changed
  DocVector<std::string> stored;
  {
    Statement stmt(prepare("SELECT patch FROM _doctree_deltas WHERE uuid = ? ORDER BY version_index"));
    bind_text(stmt.get(), 1, doc.uuid);
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
      stored.push_back(column_text(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
      throw StoreCommitError("Failed to read delta log: " + get_error());
    }
  }

  if (stored.size() > doc.reverse_deltas.size()) {
    Statement stmt(prepare("DELETE FROM _doctree_deltas WHERE uuid = ? AND version_index >= ?"));
    bind_text(stmt.get(), 1, doc.uuid);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(doc.reverse_deltas.size()));
    step_done(stmt, "truncate delta log");
  }

  for (size_t i = 0; i < doc.reverse_deltas.size(); ++i) {
    std::string patch = doc.reverse_deltas[i].to_string();
    if (i < stored.size() && stored[i] == patch) {
      continue;
    }
    Statement stmt(prepare("INSERT OR REPLACE INTO _doctree_deltas (uuid, version_index, patch) VALUES (?, ?, ?)"));
    bind_text(stmt.get(), 1, doc.uuid);
    sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(i));
    bind_text(stmt.get(), 3, patch);
    step_done(stmt, "write delta");
  }
}

void SQLiteDocumentStore::put(const Document &doc) {
  atomically([&]() { write_document(doc); });
}

void SQLiteDocumentStore::remove(const std::string &uuid) {
  atomically([&]() {
    Statement deltas(prepare("DELETE FROM _doctree_deltas WHERE uuid = ?"));
    bind_text(deltas.get(), 1, uuid);
    step_done(deltas, "delete delta log");
    Statement stmt(prepare("DELETE FROM _doctree_documents WHERE uuid = ?"));
    bind_text(stmt.get(), 1, uuid);
    step_done(stmt, "delete document");
  });
}

std::optional<std::string> SQLiteDocumentStore::default_language(const std::string &domain) const {
  Statement stmt(prepare("SELECT default_language FROM _doctree_domains WHERE domain = ?"));
  bind_text(stmt.get(), 1, domain);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return column_text(stmt.get(), 0);
  }
  if (rc != SQLITE_DONE) {
    throw StoreCommitError("Failed to query domain: " + get_error());
  }
  return std::nullopt;
}

void SQLiteDocumentStore::set_default_language(const std::string &domain, const std::string &language) {
  atomically([&]() {
    Statement stmt(prepare("INSERT OR REPLACE INTO _doctree_domains (domain, default_language) VALUES (?, ?)"));
    bind_text(stmt.get(), 1, domain);
    bind_text(stmt.get(), 2, language);
    step_done(stmt, "write domain");
  });
}

void SQLiteDocumentStore::atomically(const std::function<void()> &fn) {
  if (in_transaction_) {
    fn();
    return;
  }

  exec_or_throw("BEGIN IMMEDIATE");
  in_transaction_ = true;
  try {
    fn();
  } catch (...) {
    in_transaction_ = false;
    rollback();
    throw;
  }
  in_transaction_ = false;

  char *err_msg = nullptr;
  if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &err_msg) != SQLITE_OK) {
    std::string error = "Commit failed: " + std::string(err_msg ? err_msg : get_error().c_str());
    sqlite3_free(err_msg);
    if (!sqlite3_get_autocommit(db_)) {
      rollback();
    }
    throw StoreCommitError(error);
  }
}

void SQLiteDocumentStore::rollback() {
  char *err_msg = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err_msg) != SQLITE_OK) {
    // Log error but don't throw from the cleanup path
    DOCTREE_LOG_ERROR("rollback failed: " + std::string(err_msg ? err_msg : get_error().c_str()));
    sqlite3_free(err_msg);
  }
}

DocVector<Dependent> SQLiteDocumentStore::dependents(const Document &doc) const {
  DocVector<Dependent> result;
  Statement stmt(doc.is_structural()
                     ? prepare("SELECT uuid, template_version FROM _doctree_documents "
                               "WHERE slug = ? AND language IS NOT NULL ORDER BY language")
                     : prepare("SELECT dependent_id, version FROM _doctree_pins "
                               "WHERE slug = ? AND language = ? ORDER BY dependent_id"));
  bind_text(stmt.get(), 1, doc.slug);
  if (!doc.is_structural()) {
    bind_optional_text(stmt.get(), 2, doc.language);
  }
  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    result.push_back(Dependent{column_text(stmt.get(), 0), static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1))});
  }
  if (rc != SQLITE_DONE) {
    throw StoreCommitError("Failed to query dependents: " + get_error());
  }
  return result;
}

void SQLiteDocumentStore::repin(const Document &doc, uint64_t from, uint64_t to) {
  atomically([&]() {
    Statement stmt(doc.is_structural()
                       ? prepare("UPDATE _doctree_documents SET template_version = ? "
                                 "WHERE slug = ? AND language IS NOT NULL AND template_version = ?")
                       : prepare("UPDATE _doctree_pins SET version = ? "
                                 "WHERE slug = ? AND version = ? AND language = ?"));
    sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(to));
    bind_text(stmt.get(), 2, doc.slug);
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(from));
    if (!doc.is_structural()) {
      bind_optional_text(stmt.get(), 4, doc.language);
    }
    step_done(stmt, "repin dependents");
  });
}

void SQLiteDocumentStore::pin(const std::string &dependent_id, const std::string &slug, const std::string &language,
                              uint64_t version) {
  atomically([&]() {
    Statement stmt(prepare("INSERT OR REPLACE INTO _doctree_pins (dependent_id, slug, language, version) "
                           "VALUES (?, ?, ?, ?)"));
    bind_text(stmt.get(), 1, dependent_id);
    bind_text(stmt.get(), 2, slug);
    bind_text(stmt.get(), 3, language);
    sqlite3_bind_int64(stmt.get(), 4, static_cast<sqlite3_int64>(version));
    step_done(stmt, "write pin");
  });
}

void SQLiteDocumentStore::unpin(const std::string &dependent_id) {
  atomically([&]() {
    Statement stmt(prepare("DELETE FROM _doctree_pins WHERE dependent_id = ?"));
    bind_text(stmt.get(), 1, dependent_id);
    step_done(stmt, "delete pin");
  });
}

void SQLiteDocumentStore::exec_or_throw(const char *sql) {
  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = "SQL execution failed: ";
    if (err_msg) {
      error += err_msg;
      sqlite3_free(err_msg);
    }
    throw StoreCommitError(error);
  }
}

std::string SQLiteDocumentStore::get_error() const { return sqlite3_errmsg(db_); }
