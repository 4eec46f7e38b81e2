#include "pullfeed/Validator.hpp"
#include "pullfeed/Hashing.hpp"

#include <filesystem>

namespace pullfeed {

ValidationResult validate(const FileDescriptor& remote,
                          const std::string& localPath,
                          const IngestorConfig& cfg) {
    ValidationResult r;

    if (cfg.enforce_size_match && remote.size.has_value()) {
        std::error_code ec;
        const auto actual = std::filesystem::file_size(localPath, ec);
        if (ec) {
            r.ok = false;
            r.reasons.push_back("local size unavailable: " + ec.message());
        } else if (actual != *remote.size) {
            r.ok = false;
            r.reasons.push_back("size mismatch local=" + std::to_string(actual) +
                                " remote=" + std::to_string(*remote.size));
        }
    }

    if (cfg.enforce_md5_match && remote.content_hash.has_value() && !remote.content_hash->empty()) {
        std::string digest;
        std::string err;
        if (!md5OfFile(localPath, digest, err)) {
            r.ok = false;
            r.reasons.push_back("local md5 unavailable: " + err);
        } else if (!sameDigest(digest, *remote.content_hash)) {
            r.ok = false;
            r.reasons.push_back("md5 mismatch local=" + digest + " remote=" + *remote.content_hash);
        }
    }

    return r;
}

} // namespace pullfeed
