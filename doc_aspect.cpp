// doc_aspect.cpp
#include "doc_aspect.hpp"
#include "doc_errors.hpp"

#include <type_traits>

namespace {

const DocSortedSet<DocKey> &known_aspect_keys() {
  static const DocSortedSet<DocKey> keys = {"name",       "type",    "label",   "description",
                                            "attr",       "items",   "list_items", "components",
                                            "view",       "comment", "options", "geo_features"};
  return keys;
}

template <class> inline constexpr bool always_false_v = false;

std::optional<std::string> optional_text(const DocTree &tree, const DocKey &key, const std::string &location) {
  const DocTree *member = tree.find(key);
  if (member == nullptr || member->is_null()) {
    return std::nullopt;
  }
  if (!member->is_text()) {
    throw DocumentParseError(location + ": '" + key + "' must be text");
  }
  return member->as_text();
}

AspectBody parse_body(const DocTree &tree, const std::string &type, ParseMode mode, const std::string &location) {
  if (type == "str") {
    return ScalarAspect{ScalarAspect::STR};
  }
  if (type == "int") {
    return ScalarAspect{ScalarAspect::INT};
  }
  if (type == "float") {
    return ScalarAspect{ScalarAspect::FLOAT};
  }

  if (type == "select" || type == "multiselect" || type == "tree" || type == "treemultiselect") {
    SelectionAspect::Kind kind = type == "select"        ? SelectionAspect::SELECT
                                 : type == "multiselect" ? SelectionAspect::MULTISELECT
                                 : type == "tree"        ? SelectionAspect::TREE
                                                         : SelectionAspect::TREEMULTISELECT;
    const DocTree *items = tree.find("items");
    if (items == nullptr || items->is_null()) {
      throw DocumentParseError(location + ": '" + type + "' aspect is missing 'items'");
    }
    if (items->is_text()) {
      return SelectionAspect{kind, items->as_text()};
    }
    if (items->is_collection()) {
      return SelectionAspect{kind, *items};
    }
    throw DocumentParseError(location + ": 'items' must be a code slug or an inline list");
  }

  if (type == "list") {
    const DocTree *list_items = tree.find("list_items");
    if (list_items == nullptr || !list_items->is_object()) {
      throw DocumentParseError(location + ": 'list' aspect is missing 'list_items'");
    }
    return ListAspect{std::make_shared<const AspectNode>(parse_aspect(*list_items, mode, location + ".list_items"))};
  }

  if (type == "composite") {
    const DocTree *components = tree.find("components");
    if (components == nullptr || !components->is_list()) {
      throw DocumentParseError(location + ": 'composite' aspect is missing 'components'");
    }
    CompositeAspect composite;
    const auto &list = components->as_list();
    for (size_t i = 0; i < list.size(); ++i) {
      composite.components.push_back(parse_aspect(list[i], mode, location + ".components." + std::to_string(i)));
    }
    return composite;
  }

  throw DocumentParseError(location + ": '" + type + "' is not a valid aspect type");
}

void collect_references(const AspectNode &node, const std::string &prefix, DocVector<Reference> &out) {
  std::string path = prefix + "." + node.name;
  std::visit(
      [&](const auto &body) {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, ScalarAspect>) {
          // no references
        } else if constexpr (std::is_same_v<T, SelectionAspect>) {
          if (const std::string *slug = body.code_slug()) {
            auto tag = node.tag();
            out.push_back(Reference{path, *slug, tag ? Reference::TAG : Reference::CODE, tag.value_or("")});
          }
        } else if constexpr (std::is_same_v<T, ListAspect>) {
          collect_references(*body.item, path, out);
        } else if constexpr (std::is_same_v<T, CompositeAspect>) {
          for (const auto &component : body.components) {
            collect_references(component, path, out);
          }
        } else {
          static_assert(always_false_v<T>, "unhandled aspect kind");
        }
      },
      node.body);
}

} // namespace

AspectNode parse_aspect(const DocTree &tree, ParseMode mode, const std::string &location) {
  if (!tree.is_object()) {
    throw DocumentParseError(location + ": aspect must be an object");
  }
  if (mode == ParseMode::Strict) {
    for (const auto &[key, value] : tree.as_object()) {
      if (!known_aspect_keys().count(key)) {
        throw DocumentParseError(location + ": unknown key '" + key + "'");
      }
    }
  }

  auto name = optional_text(tree, "name", location);
  if (!name) {
    throw DocumentParseError(location + ": aspect is missing 'name'");
  }
  auto type = optional_text(tree, "type", location);
  if (!type) {
    throw DocumentParseError(location + " '" + *name + "': aspect is missing 'type'");
  }

  std::string where = location + " '" + *name + "'";
  AspectNode node{*name, *type, optional_text(tree, "label", where), optional_text(tree, "description", where),
                  DocTree(), parse_body(tree, *type, mode, where)};
  if (const DocTree *attr = tree.find("attr")) {
    if (!attr->is_null() && !attr->is_object()) {
      throw DocumentParseError(where + ": 'attr' must be an object");
    }
    node.attr = *attr;
  }
  return node;
}

DocVector<AspectNode> parse_aspects(const DocTree &document, ParseMode mode) {
  DocVector<AspectNode> aspects;
  const DocTree *list = document.find("aspects");
  if (list == nullptr || list->is_null()) {
    return aspects;
  }
  if (!list->is_list()) {
    throw DocumentParseError("'aspects' must be a list");
  }
  const auto &items = list->as_list();
  for (size_t i = 0; i < items.size(); ++i) {
    aspects.push_back(parse_aspect(items[i], mode, "aspects." + std::to_string(i)));
  }
  return aspects;
}

DocVector<Reference> extract_references(const DocVector<AspectNode> &aspects) {
  DocVector<Reference> refs;
  for (const auto &aspect : aspects) {
    collect_references(aspect, "", refs);
  }
  return refs;
}
