// uast_bridge/engine/xml_ll.hpp - Low-level libxml2 wrapper (documents and XPath)
#pragma once

#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xpath.h>

#include <gsl/span>
#include <string>
#include <string_view>

namespace uast_bridge::xml_ll
{

//------------------------------------------------------------------------------
// Document - owning wrapper around xmlDocPtr
//------------------------------------------------------------------------------
class Document
{
public:
  Document() : doc_(xmlNewDoc(BAD_CAST "1.0")) {}
  Document(const Document &) = delete;
  Document & operator=(const Document &) = delete;

  Document(Document && other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document & operator=(Document && other) noexcept
  {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }

  ~Document() { reset(); }

  void reset()
  {
    if (doc_) xmlFreeDoc(doc_);
    doc_ = nullptr;
  }

  [[nodiscard]] bool is_null() const noexcept { return doc_ == nullptr; }

  /// The document takes ownership of root.
  void set_root(xmlNodePtr root) noexcept { xmlDocSetRootElement(doc_, root); }

  [[nodiscard]] xmlDocPtr raw() const noexcept { return doc_; }

private:
  xmlDocPtr doc_ = nullptr;
};

//------------------------------------------------------------------------------
// XPathObject - owning wrapper around an evaluation result
//------------------------------------------------------------------------------
class XPathObject
{
public:
  explicit XPathObject(xmlXPathObjectPtr obj = nullptr) : obj_(obj) {}
  XPathObject(const XPathObject &) = delete;
  XPathObject & operator=(const XPathObject &) = delete;

  XPathObject(XPathObject && other) noexcept : obj_(other.obj_) { other.obj_ = nullptr; }
  XPathObject & operator=(XPathObject && other) noexcept
  {
    if (this != &other) {
      if (obj_) xmlXPathFreeObject(obj_);
      obj_ = other.obj_;
      other.obj_ = nullptr;
    }
    return *this;
  }

  ~XPathObject()
  {
    if (obj_) xmlXPathFreeObject(obj_);
  }

  [[nodiscard]] bool is_null() const noexcept { return obj_ == nullptr; }

  [[nodiscard]] bool is_node_set() const noexcept
  {
    return obj_ != nullptr && obj_->type == XPATH_NODESET;
  }

  /// Nodes of a node-set result, in document order. Empty for other types.
  [[nodiscard]] gsl::span<xmlNodePtr> nodes() const noexcept
  {
    if (!is_node_set() || obj_->nodesetval == nullptr || obj_->nodesetval->nodeNr <= 0) {
      return {};
    }
    return gsl::span<xmlNodePtr>(
      obj_->nodesetval->nodeTab, static_cast<size_t>(obj_->nodesetval->nodeNr));
  }

private:
  xmlXPathObjectPtr obj_ = nullptr;
};

//------------------------------------------------------------------------------
// XPathContext - evaluation context that collects error messages
//------------------------------------------------------------------------------
class XPathContext
{
public:
  explicit XPathContext(const Document & doc);
  XPathContext(const XPathContext &) = delete;
  XPathContext & operator=(const XPathContext &) = delete;
  ~XPathContext();

  [[nodiscard]] bool is_null() const noexcept { return ctx_ == nullptr; }

  /// Evaluate expr with the document root element as context node.
  [[nodiscard]] XPathObject evaluate(const char * expr);

  /// First error reported during the last evaluate() call (empty if none).
  [[nodiscard]] const std::string & error() const noexcept { return error_; }

private:
#if LIBXML_VERSION >= 21200
  static void on_error(void * user_data, const xmlError * error);
#else
  static void on_error(void * user_data, xmlErrorPtr error);
#endif

  xmlXPathContextPtr ctx_ = nullptr;
  std::string error_;
};

/// Trim the trailing newline libxml2 appends to its messages.
[[nodiscard]] std::string_view trim_message(const char * message) noexcept;

}  // namespace uast_bridge::xml_ll
