#include "pullfeed/RemoteCatalog.hpp"

#include <fnmatch.h>

namespace pullfeed {

bool globMatch(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), FNM_NOESCAPE) == 0;
}

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    std::string base = dir;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + name;
}

std::string remoteBaseName(const std::string& remotePath) {
    std::string p = remotePath;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    const auto slash = p.find_last_of('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

bool RemoteCatalog::list(TransferSession& session,
                         const std::string& remote_dir,
                         const std::string& pattern,
                         const std::map<std::string, std::string>& expectedMd5,
                         std::vector<FileDescriptor>& out,
                         std::string& err) {
    std::vector<std::string> names;
    if (!session.list(remote_dir, names, err)) return false;

    out.clear();
    for (const auto& name : names) {
        if (!globMatch(pattern, name)) continue;

        FileDescriptor fd;
        fd.remote_path = joinRemotePath(remote_dir, name);

        RemoteStat st;
        std::string statErr;
        if (session.stat(fd.remote_path, st, statErr))
            fd.size = st.size;

        auto hit = expectedMd5.find(name);
        if (hit != expectedMd5.end() && !hit->second.empty())
            fd.content_hash = hit->second;

        out.push_back(std::move(fd));
    }
    return true;
}

} // namespace pullfeed
