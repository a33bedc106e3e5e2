// uast_bridge/engine/xml_ll.cpp - Low-level libxml2 wrapper implementation
#include "uast_bridge/engine/xml_ll.hpp"

#include <cstring>

namespace uast_bridge::xml_ll
{

XPathContext::XPathContext(const Document & doc)
{
  if (doc.is_null()) return;
  ctx_ = xmlXPathNewContext(doc.raw());
  if (ctx_ == nullptr) return;

  // Route errors to this object instead of libxml2's stderr default.
  ctx_->error = &XPathContext::on_error;
  ctx_->userData = this;
  ctx_->node = xmlDocGetRootElement(doc.raw());
}

XPathContext::~XPathContext()
{
  if (ctx_) xmlXPathFreeContext(ctx_);
  ctx_ = nullptr;
}

XPathObject XPathContext::evaluate(const char * expr)
{
  error_.clear();
  if (ctx_ == nullptr) {
    error_ = "failed to create XPath context";
    return XPathObject();
  }
  return XPathObject(xmlXPathEvalExpression(BAD_CAST expr, ctx_));
}

#if LIBXML_VERSION >= 21200
void XPathContext::on_error(void * user_data, const xmlError * error)
#else
void XPathContext::on_error(void * user_data, xmlErrorPtr error)
#endif
{
  auto * self = static_cast<XPathContext *>(user_data);
  if (self == nullptr || error == nullptr || !self->error_.empty()) return;

  self->error_ = std::string(trim_message(error->message));
  if (self->error_.empty()) {
    self->error_ = "XPath error " + std::to_string(error->code);
  }
}

std::string_view trim_message(const char * message) noexcept
{
  if (message == nullptr) return {};
  std::string_view msg(message, std::strlen(message));
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r' || msg.back() == ' ')) {
    msg.remove_suffix(1);
  }
  return msg;
}

}  // namespace uast_bridge::xml_ll
