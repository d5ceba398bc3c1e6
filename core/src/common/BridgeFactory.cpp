#include "tscp/FtpBridge.hpp"
#include "tscp/HostBridge.hpp"
#include "tscp/Libssh2ScpBridge.hpp"
#include "tscp/Libssh2SftpBridge.hpp"
#include "tscp/LocalBridge.hpp"

namespace tscp {

std::unique_ptr<HostBridge> makeBridge(Protocol p) {
    switch (p) {
    case Protocol::Scp:
        return std::make_unique<Libssh2ScpBridge>();
    case Protocol::Sftp:
        return std::make_unique<Libssh2SftpBridge>();
    case Protocol::Ftp:
        return std::make_unique<FtpBridge>(false);
    case Protocol::Ftps:
        return std::make_unique<FtpBridge>(true);
    case Protocol::Local:
        return std::make_unique<LocalBridge>();
    }
    return nullptr;
}

} // namespace tscp
