#include "system/privileges.hpp"

#include <cerrno>
#include <string>

namespace piprov {

Result RequireRoot(uid_t euid, const char* command) {
    if (euid == 0) return Result::Ok();
    return Result::Fail(ErrorKind::Usage, EPERM,
                        std::string("'") + command + "' must be run as root (use sudo)");
}

} // namespace piprov
