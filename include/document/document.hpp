#ifndef CHUNKSTORE_DOCUMENT_HPP
#define CHUNKSTORE_DOCUMENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "document/document_error.hpp"

namespace chunkstore {
namespace document {

// Tagged value used for stored records, filters and caller metadata.
// Binary payloads are held as Document::binary_t.
using Document = nlohmann::json;

// ---- DOCUMENTS ----
// Throws INVALID_DOCUMENT unless the value is an object every backend can
// store unchanged: unsigned integers must fit int64 and keys must not hold NUL
void validate_document(const Document& document);


// ---- FILTERS ----
// Throws INVALID_FILTER unless the filter is an object of scalar equality terms
void validate_filter(const Document& filter);
// True when every filter term is present in the document with an equal value
bool matches(const Document& document, const Document& filter);
// Rejects field names that cannot be used as a top-level key path
void validate_field_name(const std::string& field);


// ---- FIELD ACCESS ----
// Reads a non-negative integer whether the backend encoded it as a signed,
// unsigned or integral floating point number
std::optional<std::uint64_t> as_uint64(const Document& value);
// Top-level string, number and boolean fields of an object; binary, array,
// object and null fields are left out
Document scalar_fields(const Document& document);

} // namespace document
} // namespace chunkstore

#endif // CHUNKSTORE_DOCUMENT_HPP
