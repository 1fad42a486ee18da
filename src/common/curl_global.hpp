#pragma once

namespace scout::net {

// Initializes libcurl once per process; cleanup is registered with atexit.
bool EnsureCurlGlobalInit();

} // namespace scout::net
