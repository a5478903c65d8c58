#pragma once

#include "net/update_service.hpp"
#include "update/identity.hpp"
#include "update/publisher.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace geoupdate {

enum class ProductOutcome {
    Updated,
    UpToDate,
    Failed,
};

const char* ToString(ProductOutcome outcome);

struct ProductReport {
    std::string product_id;
    std::string filename;   // empty if the filename lookup failed
    ProductOutcome outcome = ProductOutcome::Failed;
    int rounds = 0;
    Result error;           // set when outcome == Failed
};

struct RunSummary {
    std::vector<ProductReport> products;

    std::size_t Count(ProductOutcome outcome) const;
    bool AllSucceeded() const { return Count(ProductOutcome::Failed) == 0; }
};

// Updates database files in one directory, one product at a time.
class ProductUpdater {
public:
    ProductUpdater(IUpdateService& service,
                   Credential credential,
                   const ClientIdentity& identity,
                   std::string directory,
                   AtomicPublisher publisher = AtomicPublisher{});

    ProductReport UpdateProduct(const std::string& product_id);

    // Every product is attempted, whatever happened to the ones before it.
    RunSummary UpdateAll(const std::vector<std::string>& product_ids);

private:
    IUpdateService& service_;
    Credential credential_;
    const ClientIdentity& identity_;
    std::string directory_;
    AtomicPublisher publisher_;
};

} // namespace geoupdate
