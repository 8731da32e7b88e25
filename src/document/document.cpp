#include "document/document.hpp"
#include <cmath>
#include <limits>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace document {

namespace {

bool is_scalar(const Document& value) {
  return value.is_string() || value.is_number() || value.is_boolean();
}

void check_storable(const Document& value, const std::string& path) {
  if (value.is_number_unsigned() &&
      value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    BOOST_LOG_TRIVIAL(error) << "Document: Integer at '" << path << "' does not fit int64";
    throw DocumentStoreError(DocumentErrorCode::INVALID_DOCUMENT,
                             "integer at '" + path + "' does not fit a signed 64-bit field");
  }

  if (value.is_object()) {
    for (const auto& [field, child] : value.items()) {
      if (field.find('\0') != std::string::npos) {
        throw DocumentStoreError(DocumentErrorCode::INVALID_DOCUMENT, "field name under '" + path + "' holds NUL");
      }
      check_storable(child, path.empty() ? field : path + "." + field);
    }
  } else if (value.is_array()) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      check_storable(value[i], path + "[" + std::to_string(i) + "]");
    }
  }
}

} // namespace


//==============================================
// DOCUMENTS
//==============================================

void validate_document(const Document& document) {
  if (!document.is_object()) {
    throw DocumentStoreError(DocumentErrorCode::INVALID_DOCUMENT, "only object documents can be inserted");
  }
  check_storable(document, "");
}


//==============================================
// FILTERS
//==============================================

void validate_filter(const Document& filter) {
  if (!filter.is_object()) {
    BOOST_LOG_TRIVIAL(error) << "Document: Filter is not an object: " << filter.type_name();
    throw DocumentStoreError(DocumentErrorCode::INVALID_FILTER, "filter must be an object");
  }

  for (const auto& [field, value] : filter.items()) {
    validate_field_name(field);
    if (!is_scalar(value)) {
      BOOST_LOG_TRIVIAL(error) << "Document: Filter term '" << field << "' is not a scalar";
      throw DocumentStoreError(DocumentErrorCode::INVALID_FILTER,
                               "filter term '" + field + "' must be a string, number or boolean");
    }
  }
}

bool matches(const Document& document, const Document& filter) {
  if (!document.is_object()) {
    return false;
  }
  for (const auto& [field, value] : filter.items()) {
    auto it = document.find(field);
    if (it == document.end() || *it != value) {
      return false;
    }
  }
  return true;
}

void validate_field_name(const std::string& field) {
  if (field.empty() || field.find_first_of("\"\\.$'") != std::string::npos) {
    throw DocumentStoreError(DocumentErrorCode::INVALID_FILTER, "invalid field name '" + field + "'");
  }
}


//==============================================
// FIELD ACCESS
//==============================================

std::optional<std::uint64_t> as_uint64(const Document& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }

  if (value.is_number_integer()) {
    const auto signed_value = value.get<std::int64_t>();
    if (signed_value < 0) {
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(signed_value);
  }

  if (value.is_number_float()) {
    const double real = value.get<double>();
    // 2^64 is the first double that no longer fits
    if (!std::isfinite(real) || real < 0.0 || std::floor(real) != real ||
        real >= 18446744073709551616.0) {
      return std::nullopt;
    }
    return static_cast<std::uint64_t>(real);
  }

  return std::nullopt;
}

Document scalar_fields(const Document& document) {
  Document fields = Document::object();
  if (!document.is_object()) {
    return fields;
  }
  for (const auto& [field, value] : document.items()) {
    if (is_scalar(value)) {
      fields[field] = value;
    }
  }
  return fields;
}

} // namespace document
} // namespace chunkstore
