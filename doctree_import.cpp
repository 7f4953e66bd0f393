// doctree_import.cpp
//
// Imports a document corpus into a SQLite database.
//
//   doctree_import <database> <corpus-root> [--domain NAME] [--lenient] [--strict-parse] [--no-smash]
#include "doc_import.hpp"
#include "doc_errors.hpp"
#include "doc_sqlite.hpp"

#include <cstring>
#include <iostream>

static void print_usage(const char *prog) {
  std::cerr << "Usage: " << prog << " <database> <corpus-root> [options]" << std::endl
            << "  --domain NAME    import only this domain" << std::endl
            << "  --lenient        skip documents with circular dependencies instead of aborting" << std::endl
            << "  --strict-parse   reject unknown keys in aspects" << std::endl
            << "  --no-smash       keep every version created by the import" << std::endl;
}

int main(int argc, char **argv) {
  if (argc < 3) {
    print_usage(argv[0]);
    return 2;
  }

  const char *db_path = argv[1];
  std::string root = argv[2];
  std::optional<std::string> only_domain;
  ImportOptions options;

  for (int i = 3; i < argc; ++i) {
    if (std::strcmp(argv[i], "--domain") == 0 && i + 1 < argc) {
      only_domain = argv[++i];
    } else if (std::strcmp(argv[i], "--lenient") == 0) {
      options.strict = false;
    } else if (std::strcmp(argv[i], "--strict-parse") == 0) {
      options.parse_mode = ParseMode::Strict;
    } else if (std::strcmp(argv[i], "--no-smash") == 0) {
      options.smash = false;
    } else {
      print_usage(argv[0]);
      return 2;
    }
  }

  try {
    SQLiteDocumentStore store(db_path);
    DocumentService service(store, store);
    BatchImporter importer(service, store);
    SourceTreeLoader loader(root, options.parse_mode);

    DocVector<DomainSource> domains;
    if (only_domain) {
      domains.push_back(loader.load_domain(*only_domain));
    } else {
      domains = loader.load();
    }

    bool all_ok = true;
    for (const auto &domain : domains) {
      ImportReport report = importer.run(domain, options);
      std::cout << domain.name << ": " << report.imported.size() << " imported, " << report.smashed.size()
                << " smashed, " << report.skipped.size() << " skipped, " << report.failed.size() << " failed"
                << std::endl;
      if (!report.skipped.empty()) {
        std::cout << "  circular: " << CircularDependencyError::describe(report.skipped) << std::endl;
      }
      for (const auto &failure : report.failed) {
        std::cout << "  " << failure.slug << (failure.language ? "[" + *failure.language + "]" : "") << ": "
                  << failure.error << std::endl;
      }
      all_ok = all_ok && report.ok();
    }
    return all_ok ? 0 : 1;
  } catch (const DocTreeException &e) {
    std::cerr << "doctree_import: " << e.what() << std::endl;
    return 1;
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "doctree_import: " << e.what() << std::endl;
    return 1;
  }
}
