#pragma once

#include "util/result.hpp"

#include <string>

namespace piprov {

// Output staged at "<final>.tmp" and renamed into place by Commit().
// The staging file is unlinked on destruction unless committed.
class PendingFile {
public:
    explicit PendingFile(std::string final_path);
    PendingFile(const PendingFile&) = delete;
    PendingFile& operator=(const PendingFile&) = delete;
    ~PendingFile();

    const std::string& TempPath() const { return temp_path_; }
    const std::string& FinalPath() const { return final_path_; }

    Result Commit();
    void Discard();

private:
    std::string final_path_;
    std::string temp_path_;
    bool settled_ = false;
};

} // namespace piprov
