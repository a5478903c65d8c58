#pragma once

#include <string>

namespace geoupdate {

struct Credential {
    std::string account_id;
    std::string license_key;
};

// Public address the update service observed for this host. Fetched once per
// run and passed by const reference from then on.
struct ClientIdentity {
    std::string public_address;
};

} // namespace geoupdate
