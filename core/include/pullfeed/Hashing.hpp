#pragma once
#include <string>

namespace pullfeed {

// Lower-case hex MD5 of a local file, read in chunks. Returns false and sets
// err when the file cannot be read.
bool md5OfFile(const std::string& path, std::string& hexDigest, std::string& err);

// Case-insensitive comparison of two hex digests.
bool sameDigest(const std::string& a, const std::string& b);

} // namespace pullfeed
