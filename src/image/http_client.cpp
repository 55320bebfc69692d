#include "image/http_client.hpp"

#include "io/fd.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <unistd.h>

namespace piprov {

namespace {

struct CurlDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t AppendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct FileSink {
    int fd = -1;
    int error = 0;
    std::uint64_t offset = 0;
    std::uint64_t written = 0;
    IProgress* progress = nullptr;
};

size_t WriteToFd(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<FileSink*>(userdata);
    const size_t total = size * nmemb;
    size_t off = 0;
    while (off < total) {
        const ssize_t n = ::write(sink->fd, ptr + off, total - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            sink->error = errno;
            return 0; // signals a write error to libcurl
        }
        off += static_cast<size_t>(n);
    }
    sink->written += total;
    return total;
}

int TransferInfo(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    if (CancelRequested()) return 1;
    auto* sink = static_cast<FileSink*>(userdata);
    if (sink->progress && dlnow > 0) {
        const std::uint64_t total =
            dltotal > 0 ? sink->offset + static_cast<std::uint64_t>(dltotal) : 0;
        sink->progress->OnProgress({.stage = "download",
                                    .done = sink->offset + static_cast<std::uint64_t>(dlnow),
                                    .total = total});
    }
    return 0;
}

void ApplyCommonOptions(CURL* h, const std::string& url, const CurlHttpClient::Options& opt,
                        char* errbuf) {
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opt.connect_timeout_sec);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, opt.low_speed_bytes);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, opt.low_speed_time_sec);
    curl_easy_setopt(h, CURLOPT_USERAGENT, opt.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
}

std::string DescribeCurlError(CURLcode rc, const char* errbuf, long status) {
    std::string msg = (errbuf && errbuf[0] != '\0') ? errbuf : curl_easy_strerror(rc);
    if (status > 0) msg += " (HTTP " + std::to_string(status) + ")";
    return msg;
}

} // namespace

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Options{}) {}

CurlHttpClient::CurlHttpClient(Options opt) : opt_(std::move(opt)) { EnsureCurlGlobalInit(); }

Result CurlHttpClient::FetchText(const std::string& url, std::string& out_body) {
    CurlHandle h(curl_easy_init());
    if (!h) return Result::Fail(ErrorKind::Download, "curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE]{};
    out_body.clear();
    ApplyCommonOptions(h.get(), url, opt_, errbuf);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, AppendToString);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &out_body);
    curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, 120L);

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(h.get());
    long status = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
    if (rc != CURLE_OK) {
        return Result::Fail(ErrorKind::Download,
                            "GET " + url + " failed: " + DescribeCurlError(rc, errbuf, status));
    }
    return Result::Ok();
}

Result CurlHttpClient::FetchToFile(const std::string& url,
                                   const std::string& dest_path,
                                   std::uint64_t offset,
                                   IProgress* progress) {
    bool range_ignored = false;
    auto r = FetchToFileOnce(url, dest_path, offset, progress, range_ignored);
    if (!r.ok && range_ignored) {
        LogWarn("Server does not support resume, restarting download from zero");
        return FetchToFileOnce(url, dest_path, 0, progress, range_ignored);
    }
    return r;
}

Result CurlHttpClient::FetchToFileOnce(const std::string& url,
                                       const std::string& dest_path,
                                       std::uint64_t offset,
                                       IProgress* progress,
                                       bool& range_ignored) {
    range_ignored = false;

    const int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (offset > 0 ? O_APPEND : O_TRUNC);
    Fd fd(::open(dest_path.c_str(), flags, 0644));
    if (!fd.Valid()) {
        const int err = errno;
        return Result::Fail(ErrorKind::Download, err,
                            "cannot open " + dest_path + " (" + std::strerror(err) + ")");
    }

    CurlHandle h(curl_easy_init());
    if (!h) return Result::Fail(ErrorKind::Download, "curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE]{};
    FileSink sink{.fd = fd.Get(), .offset = offset, .progress = progress};
    ApplyCommonOptions(h.get(), url, opt_, errbuf);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, WriteToFd);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(h.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFOFUNCTION, TransferInfo);
    curl_easy_setopt(h.get(), CURLOPT_XFERINFODATA, &sink);
    if (offset > 0) {
        curl_easy_setopt(h.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
        LogInfo("Resuming download at byte %llu", static_cast<unsigned long long>(offset));
    }

    LogDebug("GET %s -> %s", url.c_str(), dest_path.c_str());
    const CURLcode rc = curl_easy_perform(h.get());
    long status = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);

    if (fd.Close() != 0 && rc == CURLE_OK) {
        const int err = errno;
        return Result::Fail(ErrorKind::Download, err,
                            "close " + dest_path + " failed (" + std::strerror(err) + ")");
    }

    if (rc == CURLE_OK) return Result::Ok();

    // A partial file that is already complete answers a range request with 416.
    if (offset > 0 && rc == CURLE_HTTP_RETURNED_ERROR && status == 416) {
        LogInfo("Partial download already complete");
        return Result::Ok();
    }
    if (offset > 0 && rc == CURLE_RANGE_ERROR) {
        range_ignored = true;
    }
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return Result::Fail(ErrorKind::Download, ECANCELED,
                            "download cancelled; partial data kept in " + dest_path);
    }
    if (rc == CURLE_WRITE_ERROR && sink.error != 0) {
        return Result::Fail(ErrorKind::Download, sink.error,
                            "writing " + dest_path + " failed (" + std::strerror(sink.error) + ")");
    }
    return Result::Fail(ErrorKind::Download,
                        "GET " + url + " failed: " + DescribeCurlError(rc, errbuf, status));
}

} // namespace piprov
