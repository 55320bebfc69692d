#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace piprov {

// A mount point created under a base directory, unmounted and removed on
// destruction unless Release()d.
class MountSession {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateMountPoint(std::string_view mount_base_dir,
                                        std::string_view mount_prefix,
                                        std::string& out_dir) const = 0;
        virtual Result Mount(std::string_view device,
                             std::string_view target_dir,
                             std::string_view fs_type,
                             unsigned long mount_flags,
                             std::string_view data) const = 0;
        virtual Result Unmount(std::string_view target_dir) const = 0;
        virtual void RemoveDirectory(std::string_view dir) const = 0;
    };

    MountSession();
    explicit MountSession(std::shared_ptr<const ISystemOps> system_ops);
    MountSession(const MountSession&) = delete;
    MountSession& operator=(const MountSession&) = delete;
    MountSession(MountSession&& other) noexcept;
    MountSession& operator=(MountSession&& other) noexcept;
    ~MountSession();

    // `data` is the filesystem-specific option string ("uid=1000,gid=1000,umask=022").
    static Result MountDevice(std::string_view device,
                              std::string_view mount_base_dir,
                              std::string_view mount_prefix,
                              std::string_view fs_type,
                              unsigned long mount_flags,
                              std::string_view data,
                              MountSession& out);

    Result Unmount();
    // Leaves the filesystem mounted past this session; returns the mount point.
    std::string Release();
    const std::string& Dir() const { return dir_; }
    bool Mounted() const { return mounted_; }

  private:
    void Cleanup();

    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
    bool mounted_ = false;
};

} // namespace piprov
