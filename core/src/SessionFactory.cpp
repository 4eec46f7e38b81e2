#include "pullfeed/SessionFactory.hpp"
#include "pullfeed/CurlFtpSession.hpp"
#include "pullfeed/Libssh2TransferSession.hpp"

namespace pullfeed {

std::unique_ptr<TransferSession> createSession(Transport transport) {
    if (transport == Transport::Ftp)
        return std::make_unique<CurlFtpSession>();
    return std::make_unique<Libssh2TransferSession>();
}

} // namespace pullfeed
