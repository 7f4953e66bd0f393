// doc_document.cpp
#include "doc_document.hpp"
#include "doc_errors.hpp"

const char *kind_name(DocumentKind kind) {
  switch (kind) {
  case DocumentKind::SCHEMA:
    return "schema";
  case DocumentKind::BASE_TEMPLATE:
    return "base_template";
  case DocumentKind::BASE_CODE:
    return "base_code";
  case DocumentKind::TEMPLATE:
    return "template";
  case DocumentKind::CODE:
    return "code";
  }
  return "unknown";
}

std::optional<DocumentKind> kind_from_name(const std::string &name) {
  for (auto kind : {DocumentKind::SCHEMA, DocumentKind::BASE_TEMPLATE, DocumentKind::BASE_CODE,
                    DocumentKind::TEMPLATE, DocumentKind::CODE}) {
    if (name == kind_name(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

DocumentKind concrete_kind_of(DocumentKind base_kind) {
  switch (base_kind) {
  case DocumentKind::BASE_TEMPLATE:
    return DocumentKind::TEMPLATE;
  case DocumentKind::BASE_CODE:
    return DocumentKind::CODE;
  case DocumentKind::SCHEMA:
    throw DocumentParseError("Schema documents cannot carry languages");
  case DocumentKind::TEMPLATE:
  case DocumentKind::CODE:
    break;
  }
  throw DocumentParseError(std::string("Not a base document kind: ") + kind_name(base_kind));
}
