#include "net/update_service.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <utility>

namespace geoupdate {

UpdateServiceClient::UpdateServiceClient(IHttpTransport& transport, ServiceEndpoint endpoint)
    : transport_(transport), endpoint_(std::move(endpoint)) {}

Result UpdateServiceClient::Fetch(const char* path,
                                  const QueryParams& params,
                                  std::vector<std::uint8_t>& body) {
    const std::string url = BuildUrl(endpoint_.protocol, endpoint_.host, path, params);

    HttpResponse response;
    auto res = transport_.Get(url, response);
    if (!res.is_ok()) {
        res.kind = ErrorKind::Transport;
        return res;
    }

    if (!IsSuccessStatus(response.status)) {
        return Result::Fail(ErrorKind::Protocol, static_cast<int>(response.status),
                            "Status " + response.status_text + " received from " + path);
    }

    body = std::move(response.body);
    return Result::Ok();
}

Result UpdateServiceClient::FetchClientAddress(std::string& out) {
    std::vector<std::uint8_t> body;
    auto res = Fetch(kClientAddressPath, {}, body);
    if (!res.is_ok()) return res;

    out.assign(body.begin(), body.end());
    if (out.empty()) {
        return Result::ProtocolError("empty client address from update service");
    }
    return Result::Ok();
}

Result UpdateServiceClient::FetchFilename(const std::string& product_id, std::string& out) {
    std::vector<std::uint8_t> body;
    auto res = Fetch(kFilenamePath, {{"product_id", product_id}}, body);
    if (!res.is_ok()) return res;

    const std::string name = PathBase(std::string(body.begin(), body.end()));
    if (name == "." || name == ".." || name == "/") {
        return Result::ProtocolError("update service returned no usable filename for product " +
                                     product_id);
    }
    out = name;
    return Result::Ok();
}

Result UpdateServiceClient::PollSecure(const PollRequest& req, std::vector<std::uint8_t>& body) {
    return Fetch(kSecureUpdatePath,
                 {
                     {"db_md5", req.db_md5},
                     {"challenge_md5", req.challenge_md5},
                     {"user_id", req.user_id},
                     {"edition_id", req.edition_id},
                 },
                 body);
}

} // namespace geoupdate
