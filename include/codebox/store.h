#ifndef INCLUDE_CODEBOX_STORE_H_
#define INCLUDE_CODEBOX_STORE_H_

#include "paths.h"

// Remove the whole store left over from a previous run.
// Startup only: refuses to do anything (returns false) while any Sandbox
// object is alive. Sandboxes must not be created concurrently with this call.
bool WipeStore(const fs::path& store_root = kStoreRoot);

#endif  // INCLUDE_CODEBOX_STORE_H_
