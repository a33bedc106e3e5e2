// uast_bridge/engine/xpath_projection.cpp - XML projection implementation
#include "uast_bridge/engine/xpath_projection.hpp"

#include <utility>
#include <vector>

namespace uast_bridge::engine
{

namespace
{

const char * or_empty(const char * s) noexcept { return s ? s : ""; }

void set_attribute(xmlNodePtr el, const char * name, const char * value)
{
  // First writer wins: built-in attributes are set before properties.
  if (xmlHasProp(el, BAD_CAST name) != nullptr) return;
  xmlNewProp(el, BAD_CAST name, BAD_CAST value);
}

void set_attribute(xmlNodePtr el, const char * name, uint32_t value)
{
  set_attribute(el, name, std::to_string(value).c_str());
}

xmlNodePtr make_element(const UastNodeIface & iface, const RoleNames & names, uintptr_t node)
{
  const char * type = or_empty(iface.internal_type(node));
  xmlNodePtr el = xmlNewNode(nullptr, BAD_CAST(*type != '\0' ? type : "_"));
  if (el == nullptr) return nullptr;
  el->_private = reinterpret_cast<void *>(node);

  const char * token = or_empty(iface.token(node));
  if (*token != '\0') {
    set_attribute(el, "token", token);
  }

  const int roles = iface.roles_size(node);
  for (int i = 0; i < roles; ++i) {
    set_attribute(el, role_attribute_name(iface.role_at(node, i), names).c_str(), "");
  }

  if (iface.has_start_offset(node)) set_attribute(el, "startOffset", iface.start_offset(node));
  if (iface.has_start_line(node)) set_attribute(el, "startLine", iface.start_line(node));
  if (iface.has_start_col(node)) set_attribute(el, "startCol", iface.start_col(node));
  if (iface.has_end_offset(node)) set_attribute(el, "endOffset", iface.end_offset(node));
  if (iface.has_end_line(node)) set_attribute(el, "endLine", iface.end_line(node));
  if (iface.has_end_col(node)) set_attribute(el, "endCol", iface.end_col(node));

  const int props = iface.properties_size(node);
  for (int i = 0; i < props; ++i) {
    const char * key = or_empty(iface.property_key_at(node, i));
    if (*key == '\0') continue;
    set_attribute(el, key, or_empty(iface.property_value_at(node, i)));
  }

  return el;
}

}  // namespace

std::string role_attribute_name(uint16_t role, const RoleNames & names)
{
  const auto it = names.find(role);
  if (it != names.end() && !it->second.empty()) {
    return "role" + it->second;
  }
  return "role" + std::to_string(role);
}

xml_ll::Document project_tree(const UastNodeIface & iface, const RoleNames & names, uintptr_t root)
{
  xml_ll::Document doc;
  if (doc.is_null()) return doc;

  xmlNodePtr root_el = make_element(iface, names, root);
  if (root_el == nullptr) {
    doc.reset();
    return doc;
  }
  doc.set_root(root_el);

  // (node handle, element built for it)
  std::vector<std::pair<uintptr_t, xmlNodePtr>> pending{{root, root_el}};
  while (!pending.empty()) {
    const auto [node, el] = pending.back();
    pending.pop_back();

    const int count = iface.children_size(node);
    std::vector<std::pair<uintptr_t, xmlNodePtr>> built;
    built.reserve(count > 0 ? static_cast<size_t>(count) : 0U);
    for (int i = 0; i < count; ++i) {
      const uintptr_t child = iface.child_at(node, i);
      if (child == 0) continue;
      xmlNodePtr child_el = make_element(iface, names, child);
      if (child_el == nullptr) {
        doc.reset();
        return doc;
      }
      xmlAddChild(el, child_el);
      built.emplace_back(child, child_el);
    }
    pending.insert(pending.end(), built.rbegin(), built.rend());
  }

  return doc;
}

}  // namespace uast_bridge::engine
