#pragma once
#include "TransferTypes.hpp"
#include <string>

namespace pullfeed {

// Post-download integrity checks. Size is compared only when the descriptor
// knows it, MD5 only when an expected digest is present. Every failed check
// adds a reason; none short-circuits the others.
ValidationResult validate(const FileDescriptor& remote,
                          const std::string& localPath,
                          const IngestorConfig& cfg);

} // namespace pullfeed
