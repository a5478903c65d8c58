#pragma once

#include "net/http_transport.hpp"
#include "net/update_service.hpp"

#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <zlib.h>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/geoupdate_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string File(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

inline std::vector<std::uint8_t> Bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline std::string Text(const std::vector<std::uint8_t>& b) {
    return std::string(b.begin(), b.end());
}

inline std::vector<std::uint8_t> Gzip(const std::string& plain) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(plain.size())) + 32);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(plain.data()));
    strm.avail_in = static_cast<uInt>(plain.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(strm.total_out);
    return out;
}

inline void WriteFile(const std::string& path, const std::string& data) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os.good()) throw std::runtime_error("cannot write " + path);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

inline bool Exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

// Answers GETs from a per-path queue of canned responses; records every URL.
class FakeHttpTransport final : public geoupdate::IHttpTransport {
  public:
    void Enqueue(const std::string& path, long status, std::string body,
                 std::string status_text = {}) {
        geoupdate::HttpResponse r;
        r.status = status;
        r.status_text = status_text.empty() ? std::to_string(status) : std::move(status_text);
        r.body = Bytes(body);
        queued_[path].push_back(std::move(r));
    }

    void EnqueueBytes(const std::string& path, std::vector<std::uint8_t> body) {
        geoupdate::HttpResponse r;
        r.status = 200;
        r.status_text = "200 OK";
        r.body = std::move(body);
        queued_[path].push_back(std::move(r));
    }

    void FailNext(const std::string& path) { failing_[path] += 1; }

    geoupdate::Result Get(const std::string& url, geoupdate::HttpResponse& out) override {
        urls_.push_back(url);
        const std::string path = PathOf(url);
        if (failing_[path] > 0) {
            failing_[path] -= 1;
            return geoupdate::Result::TransportError("connection reset");
        }
        auto& q = queued_[path];
        if (q.empty()) {
            return geoupdate::Result::TransportError("no response scripted for " + path);
        }
        out = std::move(q.front());
        q.pop_front();
        return geoupdate::Result::Ok();
    }

    const std::vector<std::string>& Urls() const { return urls_; }

  private:
    static std::string PathOf(const std::string& url) {
        const size_t scheme = url.find("://");
        const size_t start = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
        if (start == std::string::npos) return "/";
        const size_t q = url.find('?', start);
        return url.substr(start, q == std::string::npos ? std::string::npos : q - start);
    }

    std::map<std::string, std::deque<geoupdate::HttpResponse>> queued_;
    std::map<std::string, int> failing_;
    std::vector<std::string> urls_;
};

// IUpdateService with scripted poll replies, for driving sessions directly.
class ScriptedUpdateService final : public geoupdate::IUpdateService {
  public:
    std::string client_address = "192.0.2.10";
    bool address_unavailable = false;
    std::map<std::string, std::string> filenames;

    void PushReply(std::vector<std::uint8_t> body) { replies_.push_back(std::move(body)); }
    void PushReply(const std::string& body) { replies_.push_back(Bytes(body)); }
    void PushError(geoupdate::Result err) { errors_[replies_.size() + polls_.size()] = std::move(err); }

    geoupdate::Result FetchClientAddress(std::string& out) override {
        if (address_unavailable) {
            return geoupdate::Result::TransportError("connection refused");
        }
        out = client_address;
        return geoupdate::Result::Ok();
    }

    geoupdate::Result FetchFilename(const std::string& product_id, std::string& out) override {
        auto it = filenames.find(product_id);
        if (it == filenames.end()) {
            return geoupdate::Result::ProtocolError("Status 404 Not Found received");
        }
        out = it->second;
        return geoupdate::Result::Ok();
    }

    geoupdate::Result PollSecure(const geoupdate::PollRequest& req,
                                 std::vector<std::uint8_t>& body) override {
        const size_t index = polls_.size();
        polls_.push_back(req);
        if (auto it = errors_.find(index); it != errors_.end()) {
            return it->second;
        }
        if (replies_.empty()) {
            return geoupdate::Result::TransportError("no reply scripted");
        }
        body = std::move(replies_.front());
        replies_.pop_front();
        return geoupdate::Result::Ok();
    }

    const std::vector<geoupdate::PollRequest>& Polls() const { return polls_; }

  private:
    std::deque<std::vector<std::uint8_t>> replies_;
    std::map<size_t, geoupdate::Result> errors_;
    std::vector<geoupdate::PollRequest> polls_;
};

} // namespace testutil
