#include "update/product_updater.hpp"

#include "update/challenge.hpp"
#include "update/digest_tracker.hpp"
#include "update/update_session.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <utility>

namespace geoupdate {

const char* ToString(ProductOutcome outcome) {
    switch (outcome) {
        case ProductOutcome::Updated:  return "updated";
        case ProductOutcome::UpToDate: return "up-to-date";
        case ProductOutcome::Failed:   return "failed";
    }
    return "unknown";
}

std::size_t RunSummary::Count(ProductOutcome outcome) const {
    return static_cast<std::size_t>(std::count_if(
        products.begin(), products.end(),
        [outcome](const ProductReport& r) { return r.outcome == outcome; }));
}

ProductUpdater::ProductUpdater(IUpdateService& service,
                               Credential credential,
                               const ClientIdentity& identity,
                               std::string directory,
                               AtomicPublisher publisher)
    : service_(service),
      credential_(std::move(credential)),
      identity_(identity),
      directory_(std::move(directory)),
      publisher_(publisher) {}

ProductReport ProductUpdater::UpdateProduct(const std::string& product_id) {
    ProductReport report;
    report.product_id = product_id;

    auto name_res = service_.FetchFilename(product_id, report.filename);
    if (!name_res.is_ok()) {
        report.filename.clear();
        report.error = std::move(name_res);
        return report;
    }

    LogInfo("Attempting to update %s", report.filename.c_str());
    const std::string target = JoinPath(directory_, report.filename);

    UpdateSession session({
        .product_id = product_id,
        .remote_filename = report.filename,
        .initial_digest = DigestOfFile(target),
        .challenge = ComputeChallenge(credential_.license_key, identity_.public_address),
    });

    auto run_res = session.Run(service_, credential_);
    report.rounds = session.AttemptCount();
    if (!run_res.is_ok()) {
        report.error = std::move(run_res);
        return report;
    }

    if (!session.HasPayload()) {
        report.outcome = ProductOutcome::UpToDate;
        return report;
    }

    const std::vector<std::uint8_t> payload = session.TakePayload();
    auto pub_res = publisher_.Publish(target, payload);
    if (!pub_res.is_ok()) {
        report.error = std::move(pub_res);
        return report;
    }

    LogInfo("Published %s (%zu bytes)", target.c_str(), payload.size());
    report.outcome = ProductOutcome::Updated;
    return report;
}

RunSummary ProductUpdater::UpdateAll(const std::vector<std::string>& product_ids) {
    RunSummary summary;
    summary.products.reserve(product_ids.size());

    for (const auto& product_id : product_ids) {
        ProductReport report = UpdateProduct(product_id);
        if (report.outcome == ProductOutcome::Failed) {
            LogError("Product %s (%s) failed: %s: %s",
                     product_id.c_str(),
                     report.filename.empty() ? "unknown file" : report.filename.c_str(),
                     ToString(report.error.kind),
                     report.error.message().c_str());
        }
        summary.products.push_back(std::move(report));
    }

    return summary;
}

} // namespace geoupdate
