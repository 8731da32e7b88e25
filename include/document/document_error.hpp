#ifndef CHUNKSTORE_DOCUMENT_ERROR_HPP
#define CHUNKSTORE_DOCUMENT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkstore {
namespace document {

enum class DocumentErrorCode {
    UNAVAILABLE,
    DUPLICATE_KEY,
    INVALID_FILTER,
    INVALID_DOCUMENT,
    CLOSED
};

inline const char* document_error_to_string(DocumentErrorCode code) {
    switch (code) {
        case DocumentErrorCode::UNAVAILABLE: return "Store unavailable";
        case DocumentErrorCode::DUPLICATE_KEY: return "Duplicate key";
        case DocumentErrorCode::INVALID_FILTER: return "Invalid filter";
        case DocumentErrorCode::INVALID_DOCUMENT: return "Invalid document";
        case DocumentErrorCode::CLOSED: return "Store closed";
        default: return "Undefined error";
    }
}

class DocumentStoreError : public std::runtime_error {
public:
    DocumentStoreError(DocumentErrorCode code, const std::string& message)
        : std::runtime_error(std::string(document_error_to_string(code)) + ": " + message)
        , code_(code) {}

    DocumentErrorCode code() const { return code_; }

private:
    DocumentErrorCode code_;
};

} // namespace document
} // namespace chunkstore

#endif // CHUNKSTORE_DOCUMENT_ERROR_HPP
