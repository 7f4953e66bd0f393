// doc_sqlite.hpp
#ifndef DOC_SQLITE_HPP
#define DOC_SQLITE_HPP

#include "doc_document.hpp"

#include <sqlite3.h>

#include <string>

/// SQLite-backed DocumentStore and DependentsIndex.
///
/// Tables (created on open if missing):
/// - `_doctree_documents` one row per structural or concrete document
/// - `_doctree_deltas` the reverse-delta log, one row per (uuid, version_index)
/// - `_doctree_pins` instance pins on concrete documents
/// - `_doctree_domains` default language per domain
///
/// Every write runs inside `BEGIN IMMEDIATE ... COMMIT`; `atomically` widens
/// that transaction to a group of writes. Any SQLite failure rolls back and
/// surfaces as StoreCommitError.
///
/// ⚠️  This class is NOT thread-safe. Use one instance per thread.
class SQLiteDocumentStore : public DocumentStore, public DependentsIndex {
public:
  /// Opens (or creates) the database at `path`. Throws StoreCommitError.
  explicit SQLiteDocumentStore(const char *path);
  ~SQLiteDocumentStore() override;

  SQLiteDocumentStore(const SQLiteDocumentStore &) = delete;
  SQLiteDocumentStore &operator=(const SQLiteDocumentStore &) = delete;

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

  /// Gets the underlying sqlite3* handle
  sqlite3 *get_db() { return db_; }

private:
  /// RAII wrapper for sqlite3_stmt*
  class Statement {
  public:
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}
    ~Statement() {
      if (stmt_)
        sqlite3_finalize(stmt_);
    }
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    Statement(Statement &&other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }
    sqlite3_stmt *get() const { return stmt_; }

  private:
    sqlite3_stmt *stmt_;
  };

  sqlite3 *db_;
  bool in_transaction_;

  void create_tables();

  sqlite3_stmt *prepare(const char *sql) const;

  /// Steps a statement that returns no rows
  void step_done(const Statement &stmt, const char *what) const;

  /// Reads the current row of a `SELECT * FROM _doctree_documents` plus its delta log
  Document read_document(sqlite3_stmt *stmt) const;
  std::optional<Document> query_one(const char *sql, const DocVector<std::string> &params) const;
  DocVector<Document> query_all(const char *sql, const DocVector<std::string> &params) const;

  void write_document(const Document &doc);

  /// Rolls back the open transaction, logging instead of throwing on failure
  void rollback();

  /// Helper to execute SQL and check for errors
  void exec_or_throw(const char *sql);

  /// Helper to get error message
  std::string get_error() const;
};

#endif // DOC_SQLITE_HPP
