#pragma once
#include "TransferSession.hpp"
#include "TransferTypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace pullfeed {

// Shell-style glob match (*, ?, [...], [!...]), case-sensitive. Backslash is
// a literal character, not an escape.
bool globMatch(const std::string& pattern, const std::string& name);

// "<dir without trailing slashes>/<name>"
std::string joinRemotePath(const std::string& dir, const std::string& name);

// Final path segment of a remote path.
std::string remoteBaseName(const std::string& remotePath);

class RemoteCatalog {
public:
    // Lists remote_dir through session, keeps entries matching pattern and
    // stats each match for its size. A failed stat leaves the size unknown.
    // expectedMd5 (keyed by file name) fills FileDescriptor::content_hash.
    // Returns false only when the directory itself cannot be listed.
    static bool list(TransferSession& session,
                     const std::string& remote_dir,
                     const std::string& pattern,
                     const std::map<std::string, std::string>& expectedMd5,
                     std::vector<FileDescriptor>& out,
                     std::string& err);
};

} // namespace pullfeed
