#pragma once

#include "sync_options.hpp"

#include <ostream>

namespace linkpack::sync
{
    // Reads the dependency list, synchronizes the reference directory and reports each change.
    // Returns 0 on success, 1 on a fatal error or, with `strict`, on any unresolved declaration.
    int runSync(const SyncOptions& options, std::ostream& out, std::ostream& err);
} // namespace linkpack::sync
