// doc_import.cpp
#include "doc_import.hpp"
#include "doc_errors.hpp"
#include "doc_log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct KindDir {
  const char *dir;
  DocumentKind kind;
};

const KindDir STRUCTURAL_DIRS[] = {
    {"schema", DocumentKind::SCHEMA},
    {"template", DocumentKind::BASE_TEMPLATE},
    {"code", DocumentKind::BASE_CODE},
};

const KindDir OVERLAY_DIRS[] = {
    {"template", DocumentKind::BASE_TEMPLATE},
    {"code", DocumentKind::BASE_CODE},
};

DocTree read_json_file(const fs::path &file) {
  std::ifstream in(file);
  if (!in) {
    throw DocumentParseError("Cannot open " + file.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    return DocTree::from_json(buffer.str());
  } catch (const DocumentParseError &e) {
    throw DocumentParseError(file.string() + ": " + e.what());
  }
}

/// `*.json` files of a directory, sorted by name. Empty when the directory is missing.
DocVector<fs::path> json_files(const fs::path &dir) {
  DocVector<fs::path> files;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return files;
  }
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

DocVector<fs::path> subdirectories(const fs::path &dir) {
  DocVector<fs::path> dirs;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return dirs;
  }
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.is_directory()) {
      dirs.push_back(entry.path());
    }
  }
  std::sort(dirs.begin(), dirs.end());
  return dirs;
}

std::optional<std::string> template_slug_of(const DocTree &content) {
  const DocTree *tmpl = content.find("template");
  if (tmpl == nullptr || tmpl->is_null()) {
    return std::nullopt;
  }
  if (tmpl->is_text()) {
    return tmpl->as_text();
  }
  if (auto slug = tmpl->text_at("slug")) {
    return slug;
  }
  throw DocumentParseError("'template' must be a slug or an object with a slug");
}

} // namespace

// SourceTreeLoader implementation

DocVector<DomainSource> SourceTreeLoader::load() const {
  DocVector<DomainSource> domains;
  for (const auto &dir : subdirectories(root_)) {
    if (!fs::exists(dir / "domain.json")) {
      DOCTREE_LOG_DEBUG("skipping " + dir.string() + ": no domain.json");
      continue;
    }
    domains.push_back(load_domain(dir.filename().string()));
  }
  return domains;
}

DomainSource SourceTreeLoader::load_domain(const std::string &name) const {
  fs::path domain_dir = root_ / name;
  if (!fs::is_directory(domain_dir)) {
    throw DocumentParseError("Domain directory not found: " + domain_dir.string());
  }

  DomainSource domain;
  domain.name = name;
  DocTree meta = read_json_file(domain_dir / "domain.json");
  auto default_language = meta.text_at("default_language");
  if (!default_language || default_language->empty()) {
    throw DocumentParseError(name + "/domain.json has no default_language");
  }
  domain.default_language = *default_language;

  for (const auto &kind_dir : STRUCTURAL_DIRS) {
    for (const auto &file : json_files(domain_dir / kind_dir.dir)) {
      if (auto record = read_record(file, name, kind_dir.kind)) {
        domain.records.push_back(std::move(*record));
      }
    }
  }

  attach_overlays(domain_dir, domain);
  DOCTREE_LOG_INFO(name + ": loaded " + std::to_string(domain.records.size()) + " documents");
  return domain;
}

std::optional<SourceRecord> SourceTreeLoader::read_record(const fs::path &file, const std::string &domain,
                                                          DocumentKind kind) const {
  try {
    SourceRecord record;
    record.slug = file.stem().string();
    record.domain = domain;
    record.kind = kind;
    record.path = file.string();
    record.content = read_json_file(file);
    if (!record.content.is_object()) {
      throw DocumentParseError(record.path + ": document must be an object");
    }

    auto declared = record.content.text_at("slug");
    if (declared && *declared != record.slug) {
      DOCTREE_LOG_WARN(record.path + ": slug '" + *declared + "' does not match the file name, using '" +
                       record.slug + "'");
    }
    record.content["slug"] = record.slug;

    record.template_slug = template_slug_of(record.content);
    if (record.template_slug) {
      record.refs.insert(*record.template_slug);
    }
    // an aspect may refer to its own document
    for (const auto &ref : extract_references(parse_aspects(record.content, mode_))) {
      if (ref.dest_slug != record.slug) {
        record.refs.insert(ref.dest_slug);
      }
    }
    return record;
  } catch (const DocumentParseError &e) {
    DOCTREE_LOG_WARN(std::string("skipping file: ") + e.what());
    return std::nullopt;
  }
}

void SourceTreeLoader::attach_overlays(const fs::path &domain_dir, DomainSource &domain) const {
  for (const auto &lang_dir : subdirectories(domain_dir / "lang")) {
    std::string language = lang_dir.filename().string();
    for (const auto &kind_dir : OVERLAY_DIRS) {
      for (const auto &file : json_files(lang_dir / kind_dir.dir)) {
        std::string slug = file.stem().string();
        auto record = std::find_if(domain.records.begin(), domain.records.end(),
                                   [&](const SourceRecord &r) { return r.slug == slug && r.kind == kind_dir.kind; });
        if (record == domain.records.end()) {
          DOCTREE_LOG_WARN(file.string() + ": no " + kind_name(kind_dir.kind) + " '" + slug + "' for this overlay");
          continue;
        }
        try {
          record->overlays.push_back(OverlaySource{language, read_json_file(file), file.string()});
        } catch (const DocumentParseError &e) {
          DOCTREE_LOG_WARN(std::string("skipping file: ") + e.what());
        }
      }
    }
  }
}

// BatchImporter implementation

ImportReport BatchImporter::run(const DomainSource &domain, const ImportOptions &options) {
  ImportReport report;

  DocVector<DependencyNode> nodes;
  DocMap<std::string, const SourceRecord *> by_slug;
  for (const auto &record : domain.records) {
    nodes.push_back(DependencyNode{record.slug, record.refs});
    by_slug.emplace(record.slug, &record);
  }

  DocVector<std::string> order;
  if (options.strict) {
    order = DependencyResolver::resolve_order(nodes);
  } else {
    LenientOrder lenient = DependencyResolver::resolve_order_lenient(nodes);
    order = std::move(lenient.order);
    report.skipped = std::move(lenient.skipped);
  }
  DOCTREE_LOG_INFO(domain.name + ": importing " + std::to_string(order.size()) + " documents");

  store_.set_default_language(domain.name, domain.default_language);

  for (const auto &slug : order) {
    const SourceRecord &record = *by_slug.at(slug);
    try {
      service_.update_or_insert(
          DocumentModel{record.slug, domain.name, record.kind, std::nullopt, record.template_slug, record.content},
          options.parse_mode);
    } catch (const DocTreeException &e) {
      DOCTREE_LOG_ERROR("failed to import " + slug + ": " + e.what());
      report.failed.push_back(ImportFailure{slug, std::nullopt, e.what()});
      continue;
    }
    report.imported.push_back(slug);

    import_overlays(record, domain.default_language, report);

    if (!options.smash) {
      continue;
    }
    try {
      if (service_.can_smash(slug)) {
        service_.smash_version(slug);
        report.smashed.push_back(slug);
      }
    } catch (const DocTreeException &e) {
      DOCTREE_LOG_ERROR("failed to smash " + slug + ": " + e.what());
      report.failed.push_back(ImportFailure{slug, std::nullopt, e.what()});
    }
  }
  return report;
}

void BatchImporter::import_overlays(const SourceRecord &record, const std::string &default_language,
                                    ImportReport &report) {
  if (record.overlays.empty()) {
    return;
  }

  // default language first, the rest in their loaded order
  DocVector<const OverlaySource *> ordered;
  for (const auto &overlay : record.overlays) {
    if (overlay.language == default_language) {
      ordered.insert(ordered.begin(), &overlay);
    } else {
      ordered.push_back(&overlay);
    }
  }

  if (ordered.front()->language != default_language) {
    for (const auto *overlay : ordered) {
      std::string error = "no '" + default_language + "' overlay, which has to be imported first";
      DOCTREE_LOG_ERROR("skipping " + record.slug + "[" + overlay->language + "]: " + error);
      report.failed.push_back(ImportFailure{record.slug, overlay->language, error});
    }
    return;
  }

  bool default_failed = false;
  for (const auto *overlay : ordered) {
    if (default_failed) {
      report.failed.push_back(
          ImportFailure{record.slug, overlay->language, "skipped, the '" + default_language + "' overlay failed"});
      continue;
    }
    try {
      service_.submit_language(record.slug, overlay->language, overlay->content);
    } catch (const DocTreeException &e) {
      DOCTREE_LOG_ERROR("failed to import " + record.slug + "[" + overlay->language + "]: " + e.what());
      report.failed.push_back(ImportFailure{record.slug, overlay->language, e.what()});
      default_failed = overlay->language == default_language;
    }
  }
}
