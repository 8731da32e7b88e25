#include "store/manifest.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace store {

using document::Document;

namespace {

std::uint64_t read_uint64(const Document& record, const char* field, const std::string& id) {
  auto it = record.find(field);
  if (it == record.end()) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: Object " << id << " has no field " << field;
    throw IncompleteObjectError("object " + id + ": missing field " + field);
  }
  auto value = document::as_uint64(*it);
  if (!value) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: Object " << id << " field " << field
                             << " is not a non-negative integer: " << it->dump();
    throw IncompleteObjectError("object " + id + ": field " + field + " is not a non-negative integer");
  }
  return *value;
}

} // namespace


//==============================================
// MANIFEST RECORDS
//==============================================

Document manifest_to_document(const Manifest& manifest) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
    manifest.created_at.time_since_epoch()).count();

  Document record = Document::object();
  record[fields::ID] = manifest.id.to_hex();
  record[fields::LENGTH] = manifest.length;
  record[fields::CHUNK_SIZE] = manifest.chunk_size;
  record[fields::UPLOAD_DATE] = static_cast<std::int64_t>(millis);
  record[fields::MD5] = manifest.checksum;
  record[fields::METADATA] = manifest.metadata.is_null() ? Document::object() : manifest.metadata;
  return record;
}

Manifest manifest_from_document(const Document& record) {
  if (!record.is_object()) {
    throw IncompleteObjectError("manifest record is not an object");
  }

  auto id_field = record.find(fields::ID);
  if (id_field == record.end() || !id_field->is_string()) {
    throw IncompleteObjectError("manifest record has no string _id");
  }

  Manifest manifest;
  try {
    manifest.id = ObjectId::from_hex(id_field->get<std::string>());
  } catch (const InvalidIdError& e) {
    throw IncompleteObjectError(std::string("manifest record has a malformed _id: ") + e.what());
  }
  const std::string hex = manifest.id.to_hex();

  manifest.length = read_uint64(record, fields::LENGTH, hex);
  manifest.chunk_size = read_uint64(record, fields::CHUNK_SIZE, hex);
  if (manifest.chunk_size == 0) {
    throw IncompleteObjectError("object " + hex + ": chunk_size is 0");
  }

  const auto millis = read_uint64(record, fields::UPLOAD_DATE, hex);
  manifest.created_at = std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::milliseconds(static_cast<std::int64_t>(millis))));

  auto md5 = record.find(fields::MD5);
  if (md5 == record.end() || !md5->is_string()) {
    throw IncompleteObjectError("object " + hex + ": missing field md5");
  }
  manifest.checksum = md5->get<std::string>();

  // Objects written without metadata read back with an empty mapping
  auto metadata = record.find(fields::METADATA);
  if (metadata == record.end() || metadata->is_null()) {
    manifest.metadata = Document::object();
  } else if (metadata->is_object()) {
    manifest.metadata = *metadata;
  } else {
    throw IncompleteObjectError("object " + hex + ": metadata is not a mapping");
  }

  return manifest;
}

Document manifest_filter(const ObjectId& id) {
  return Document{{fields::ID, id.to_hex()}};
}


//==============================================
// CHUNK RECORDS
//==============================================

Document chunk_to_document(const ObjectId& id, std::uint64_t index, std::vector<uint8_t> data) {
  Document record = Document::object();
  record[fields::FILES_ID] = id.to_hex();
  record[fields::SEQUENCE] = index;
  record[fields::DATA] = Document::binary(std::move(data));
  return record;
}

Document chunk_filter(const ObjectId& id, std::uint64_t index) {
  return Document{{fields::FILES_ID, id.to_hex()}, {fields::SEQUENCE, index}};
}

Document chunks_filter(const ObjectId& id) {
  return Document{{fields::FILES_ID, id.to_hex()}};
}

const std::vector<uint8_t>& chunk_data(const Document& record, const ObjectId& id, std::uint64_t index) {
  const std::string hex = id.to_hex();
  const std::string where = "object " + hex + " chunk " + std::to_string(index);

  if (!record.is_object()) {
    throw IncompleteObjectError(where + ": record is not an object");
  }

  auto owner = record.find(fields::FILES_ID);
  if (owner == record.end() || !owner->is_string() || owner->get<std::string>() != hex) {
    throw IncompleteObjectError(where + ": record belongs to another object");
  }

  auto sequence = record.find(fields::SEQUENCE);
  if (sequence == record.end() || document::as_uint64(*sequence) != index) {
    throw IncompleteObjectError(where + ": sequence number mismatch");
  }

  auto data = record.find(fields::DATA);
  if (data == record.end() || !data->is_binary()) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: " << where << " has no binary data field";
    throw IncompleteObjectError(where + ": data is not binary");
  }
  return data->get_binary();
}

} // namespace store
} // namespace chunkstore
