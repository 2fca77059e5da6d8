#include "metadata.hpp"
#include "errors.hpp"
#include "log.hpp"

using json = nlohmann::json;

std::string encode_metadata(const Metadata& metadata) {
  if (metadata.is_null()) return "{}";
  if (!metadata.is_object()) {
    throw InvalidArgument(std::string("metadata: expected an object, got ") + metadata.type_name());
  }
  // invalid UTF-8 in values is replaced rather than failing the whole chunk
  return metadata.dump(-1, ' ', false, json::error_handler_t::replace);
}

Metadata decode_metadata(const std::string& text) {
  if (text.empty()) return json::object();
  json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    log_warn("metadata", "undecodable metadata, returning empty mapping");
    return json::object();
  }
  return j;
}

bool is_storable_document_id(const std::string& document_id) {
  try {
    json(document_id).dump();
    return true;
  } catch (const json::type_error&) {
    return false;
  }
}

void check_document_id(const std::string& document_id) {
  if (!is_storable_document_id(document_id)) {
    throw InvalidArgument("document_id is not valid UTF-8");
  }
}
