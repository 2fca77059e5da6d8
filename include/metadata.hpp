#pragma once
#include <nlohmann/json.hpp>
#include <string>

// Free-form key/value mapping attached to a chunk. Always a JSON object.
using Metadata = nlohmann::json;

// Serializes to compact JSON. A null mapping encodes as "{}"; anything that is not
// an object is rejected with InvalidArgument.
std::string encode_metadata(const Metadata& metadata);

// Total decoder: malformed text, or text that is not a JSON object, yields an
// empty object instead of an error.
Metadata decode_metadata(const std::string& text);

// Document ids travel to sqlite inside JSON bind parameters, so only valid UTF-8
// ids can be stored and looked up.
bool is_storable_document_id(const std::string& document_id);

// Throws InvalidArgument when is_storable_document_id is false.
void check_document_id(const std::string& document_id);
