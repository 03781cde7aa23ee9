#pragma once
#include <memory>

#include "secret_store.h"

namespace veto::platform {

    // secret-tool (libsecret) on Linux, `security` on macOS.
    // Returns nullptr when the platform tool is not installed.
    std::unique_ptr<SecretBackend> make_system_secret_backend();

} // namespace veto::platform
