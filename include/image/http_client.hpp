#pragma once

#include "util/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace piprov {

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET `url` into memory. Failures are ErrorKind::Download.
    virtual Result FetchText(const std::string& url, std::string& out_body) = 0;

    // GET `url` into `dest_path`. With `offset` > 0 the file is appended to and the
    // request asks for bytes from `offset` on; a server that ignores the range
    // causes the file to be rewritten from the start.
    virtual Result FetchToFile(const std::string& url,
                               const std::string& dest_path,
                               std::uint64_t offset,
                               IProgress* progress) = 0;
};

class CurlHttpClient final : public IHttpClient {
public:
    struct Options {
        long connect_timeout_sec = 15;
        // Abort when slower than low_speed_bytes/s for low_speed_time_sec.
        long low_speed_bytes = 1024;
        long low_speed_time_sec = 60;
        std::string user_agent = "piprov/1.0";
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options opt);

    Result FetchText(const std::string& url, std::string& out_body) override;
    Result FetchToFile(const std::string& url,
                       const std::string& dest_path,
                       std::uint64_t offset,
                       IProgress* progress) override;

private:
    Result FetchToFileOnce(const std::string& url,
                           const std::string& dest_path,
                           std::uint64_t offset,
                           IProgress* progress,
                           bool& range_ignored);

    Options opt_;
};

} // namespace piprov
