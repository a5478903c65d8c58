#include "net/http_transport.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string_view>

namespace geoupdate {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct TransferState {
    HttpResponse* response = nullptr;
    std::uint64_t max_body_bytes = 0;
    bool body_too_large = false;
};

bool EnsureCurlGlobalInit() {
    static std::once_flag init_flag;
    static bool init_ok = false;
    std::call_once(init_flag, []() {
        init_ok = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK);
    });
    return init_ok;
}

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    const size_t count = size * nmemb;
    auto& body = st->response->body;
    if (st->max_body_bytes > 0 && body.size() + count > st->max_body_bytes) {
        st->body_too_large = true;
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    body.insert(body.end(), ptr, ptr + count);
    return count;
}

// Keeps the reason phrase of the last status line ("HTTP/1.1 200 OK").
size_t ReadHeader(char* ptr, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    const size_t count = size * nitems;
    std::string_view line(ptr, count);
    if (line.rfind("HTTP/", 0) == 0) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) {
            line.remove_suffix(1);
        }
        const size_t sp = line.find(' ');
        st->response->status_text =
            (sp == std::string_view::npos) ? std::string() : std::string(line.substr(sp + 1));
    }
    return count;
}

} // namespace

CurlHttpTransport::CurlHttpTransport() : CurlHttpTransport(Options{}) {}

CurlHttpTransport::CurlHttpTransport(Options opt) : opt_(std::move(opt)) {}

Result CurlHttpTransport::Get(const std::string& url, HttpResponse& out) {
    out = HttpResponse{};

    if (!EnsureCurlGlobalInit()) {
        return Result::TransportError("curl_global_init failed");
    }

    CurlEasy handle(curl_easy_init());
    if (!handle) {
        return Result::TransportError("curl_easy_init failed");
    }

    TransferState state;
    state.response = &out;
    state.max_body_bytes = opt_.max_body_bytes;

    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, opt_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, ReadHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
    if (opt_.connect_timeout_seconds > 0) {
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opt_.connect_timeout_seconds);
    }
    if (opt_.timeout_seconds > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT, opt_.timeout_seconds);
    }

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        if (state.body_too_large) {
            return Result::TransportError("response from " + url + " exceeds " +
                                          std::to_string(opt_.max_body_bytes) + " bytes");
        }
        return Result::TransportError("GET " + url + " failed: " + curl_easy_strerror(rc));
    }

    long code = 0;
    if (curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK) {
        return Result::TransportError("cannot read response code for " + url);
    }
    out.status = code;
    if (out.status_text.empty()) {
        out.status_text = std::to_string(code);
    }

    LogDebug("GET %s -> %s (%zu bytes)", url.c_str(), out.status_text.c_str(), out.body.size());
    return Result::Ok();
}

} // namespace geoupdate
