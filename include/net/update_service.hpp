#pragma once

#include "net/http_transport.hpp"
#include "net/url.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geoupdate {

inline constexpr const char kClientAddressPath[] = "/app/update_getipaddr";
inline constexpr const char kFilenamePath[] = "/app/update_getfilename";
inline constexpr const char kSecureUpdatePath[] = "/app/update_secure";

struct PollRequest {
    std::string db_md5;
    std::string challenge_md5;
    std::string user_id;
    std::string edition_id;
};

class IUpdateService {
public:
    virtual ~IUpdateService() = default;

    virtual Result FetchClientAddress(std::string& out) = 0;
    // Base name of the file the service wants the product stored under.
    virtual Result FetchFilename(const std::string& product_id, std::string& out) = 0;
    virtual Result PollSecure(const PollRequest& req, std::vector<std::uint8_t>& body) = 0;
};

struct ServiceEndpoint {
    std::string protocol = "https";
    std::string host = "updates.maxmind.com";
};

// The service signals success with any status in [200, 209].
inline bool IsSuccessStatus(long status) { return status >= 200 && status <= 209; }

class UpdateServiceClient final : public IUpdateService {
public:
    UpdateServiceClient(IHttpTransport& transport, ServiceEndpoint endpoint);

    Result FetchClientAddress(std::string& out) override;
    Result FetchFilename(const std::string& product_id, std::string& out) override;
    Result PollSecure(const PollRequest& req, std::vector<std::uint8_t>& body) override;

    const ServiceEndpoint& Endpoint() const { return endpoint_; }

private:
    Result Fetch(const char* path, const QueryParams& params, std::vector<std::uint8_t>& body);

    IHttpTransport& transport_;
    ServiceEndpoint endpoint_;
};

} // namespace geoupdate
