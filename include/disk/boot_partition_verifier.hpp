#pragma once

#include "disk/reenumeration_waiter.hpp"

#include <string>
#include <vector>

namespace piprov {

class BootPartitionVerifier {
public:
    // Names of required markers absent from the mount point.
    static std::vector<std::string> MissingMarkers(const BootPartitionHandle& handle);
    // Warns about each missing marker; true when all are present.
    static bool Verify(const BootPartitionHandle& handle);
};

} // namespace piprov
