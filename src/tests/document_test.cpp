#include <gtest/gtest.h>
#include <limits>
#include "document/document.hpp"

using namespace chunkstore::document;

TEST(DocumentTest, AsUint64AcceptsEveryNumericEncoding) {
  EXPECT_EQ(as_uint64(Document(std::uint64_t{20971520})), 20971520u);
  EXPECT_EQ(as_uint64(Document(std::int64_t{8388608})), 8388608u);
  EXPECT_EQ(as_uint64(Document(std::int32_t{3})), 3u);
  EXPECT_EQ(as_uint64(Document(4194304.0)), 4194304u);
  EXPECT_EQ(as_uint64(Document(0)), 0u);
}

TEST(DocumentTest, AsUint64RejectsInvalidValues) {
  EXPECT_FALSE(as_uint64(Document(-1)).has_value());
  EXPECT_FALSE(as_uint64(Document(1.5)).has_value());
  EXPECT_FALSE(as_uint64(Document(-2.0)).has_value());
  EXPECT_FALSE(as_uint64(Document(std::numeric_limits<double>::infinity())).has_value());
  EXPECT_FALSE(as_uint64(Document(1e20)).has_value());
  EXPECT_FALSE(as_uint64(Document("12")).has_value());
  EXPECT_FALSE(as_uint64(Document()).has_value());
  EXPECT_FALSE(as_uint64(Document(true)).has_value());
}

TEST(DocumentTest, ValidateDocument) {
  EXPECT_NO_THROW(validate_document(Document::object()));
  EXPECT_NO_THROW(validate_document(Document{{"signed", std::numeric_limits<std::int64_t>::max()},
                                             {"unsigned", std::uint64_t{9223372036854775807ULL}},
                                             {"negative", -4},
                                             {"ratio", 0.5},
                                             {"nested", {{"list", Document::array({1, "two", 3.0})}}}}));

  EXPECT_THROW(validate_document(Document("text")), DocumentStoreError);
  EXPECT_THROW(validate_document(Document::array()), DocumentStoreError);

  const std::uint64_t too_big = std::numeric_limits<std::uint64_t>::max();
  EXPECT_THROW(validate_document(Document{{"big", too_big}}), DocumentStoreError);
  EXPECT_THROW(validate_document(Document{{"outer", {{"inner", too_big}}}}), DocumentStoreError);
  EXPECT_THROW(validate_document(Document{{"list", Document::array({1, too_big})}}), DocumentStoreError);
  EXPECT_THROW(validate_document(Document{{std::string("a\0b", 3), 1}}), DocumentStoreError);

  try {
    validate_document(Document{{"outer", {{"inner", too_big}}}});
    FAIL() << "Expected DocumentStoreError";
  } catch (const DocumentStoreError& e) {
    EXPECT_EQ(e.code(), DocumentErrorCode::INVALID_DOCUMENT);
    EXPECT_NE(std::string(e.what()).find("outer.inner"), std::string::npos) << e.what();
  }
}

TEST(DocumentTest, ValidateFilter) {
  EXPECT_NO_THROW(validate_filter(Document::object()));
  EXPECT_NO_THROW(validate_filter(Document{{"files_id", "abc"}, {"n", 3}}));
  EXPECT_NO_THROW(validate_filter(Document{{"flag", true}, {"ratio", 0.5}}));

  EXPECT_THROW(validate_filter(Document::array()), DocumentStoreError);
  EXPECT_THROW(validate_filter(Document("text")), DocumentStoreError);
  EXPECT_THROW(validate_filter(Document{{"nested", Document::object()}}), DocumentStoreError);
  EXPECT_THROW(validate_filter(Document{{"list", Document::array({1, 2})}}), DocumentStoreError);
  EXPECT_THROW(validate_filter(Document{{"missing", nullptr}}), DocumentStoreError);
  EXPECT_THROW(validate_filter(Document{{"a.b", 1}}), DocumentStoreError);
  EXPECT_THROW(validate_filter(Document{{"$gt", 1}}), DocumentStoreError);

  try {
    validate_filter(Document::array());
    FAIL() << "Expected DocumentStoreError";
  } catch (const DocumentStoreError& e) {
    EXPECT_EQ(e.code(), DocumentErrorCode::INVALID_FILTER);
  }
}

TEST(DocumentTest, MatchesEqualityTerms) {
  const Document doc = {{"files_id", "abc"}, {"n", 2}, {"data", Document::binary({1, 2, 3})}};

  EXPECT_TRUE(matches(doc, Document::object()));
  EXPECT_TRUE(matches(doc, Document{{"files_id", "abc"}}));
  EXPECT_TRUE(matches(doc, Document{{"files_id", "abc"}, {"n", 2}}));
  // Signed and unsigned encodings of the same number are equal
  EXPECT_TRUE(matches(doc, Document{{"n", std::uint64_t{2}}}));

  EXPECT_FALSE(matches(doc, Document{{"files_id", "abd"}}));
  EXPECT_FALSE(matches(doc, Document{{"n", 3}}));
  EXPECT_FALSE(matches(doc, Document{{"absent", 1}}));
  EXPECT_FALSE(matches(Document::array(), Document::object()));
}

TEST(DocumentTest, ScalarFieldsDropsBinaryAndContainers) {
  const Document doc = {
    {"_id", "abc"},
    {"length", 10},
    {"flag", false},
    {"data", Document::binary({1, 2})},
    {"metadata", Document{{"k", "v"}}},
    {"list", Document::array({1})},
    {"nothing", nullptr}
  };

  const Document fields = scalar_fields(doc);
  EXPECT_EQ(fields, (Document{{"_id", "abc"}, {"length", 10}, {"flag", false}}));
  EXPECT_EQ(scalar_fields(Document::array()), Document::object());
}

TEST(DocumentTest, FieldNameValidation) {
  EXPECT_NO_THROW(validate_field_name("files_id"));
  EXPECT_NO_THROW(validate_field_name("_id"));
  EXPECT_THROW(validate_field_name(""), DocumentStoreError);
  EXPECT_THROW(validate_field_name("a\"b"), DocumentStoreError);
  EXPECT_THROW(validate_field_name("a'b"), DocumentStoreError);
  EXPECT_THROW(validate_field_name("a\\b"), DocumentStoreError);
}
