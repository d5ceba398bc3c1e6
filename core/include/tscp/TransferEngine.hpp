// Batch copy between two bridges: depth-first enumeration of the source,
// directories before their contents, bounded-buffer streaming of files and a
// report that accounts for every enumerated task.
#pragma once
#include "HostBridge.hpp"
#include "TransferTypes.hpp"
#include <string>

namespace tscp {

// Copies source_root (file or directory) to destination_root, which names
// the copy itself. One side must be local. Both bridges are leased for the
// whole batch; all calls on them are serialized on the calling thread.
TransferReport transfer(HostBridge& source,
                        const std::string& source_root,
                        HostBridge& destination,
                        const std::string& destination_root,
                        const TransferOptions& options);

} // namespace tscp
