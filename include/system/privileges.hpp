#pragma once

#include "util/result.hpp"

#include <sys/types.h>

namespace piprov {

// Raw disk writes, umount and mount need root. Usage error (EPERM) otherwise.
Result RequireRoot(uid_t euid, const char* command);

} // namespace piprov
