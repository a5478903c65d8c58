#include "update/updater.hpp"

#include "update/legacy_links.hpp"
#include "util/logger.hpp"

#include <utility>

namespace geoupdate {

Updater::Updater(IUpdateService& service, SleepFn sleep)
    : service_(service), sleep_(std::move(sleep)) {}

Result Updater::Run(const config::UpdaterConfig& cfg, RunSummary& summary) {
    summary = RunSummary{};

    auto valid = cfg.Validate();
    if (!valid.is_ok()) return valid;

    if (cfg.random_delay.count() > 0) {
        auto delay_res = SleepRandomDelay(cfg.random_delay, sleep_);
        if (!delay_res.is_ok()) return delay_res;
    }

    LogInfo("Updating geoip database at %s from %s via %s",
            cfg.directory.c_str(), cfg.source.c_str(), cfg.protocol.c_str());

    ClientIdentity identity;
    auto addr_res = service_.FetchClientAddress(identity.public_address);
    if (!addr_res.is_ok()) {
        return Result::Fail(addr_res.kind, addr_res.err,
                            "Can't get client IP: " + addr_res.message());
    }
    LogDebug("Client address: %s", identity.public_address.c_str());

    ProductUpdater products(service_, Credential{cfg.user_id, cfg.license_key}, identity, cfg.directory);
    summary = products.UpdateAll(cfg.product_ids);

    if (cfg.links) {
        const auto created = CreateLegacyLinks(cfg.directory);
        LogInfo("Created %zu legacy link(s)", created.size());
    }

    LogInfo("Done: %zu updated, %zu up to date, %zu failed",
            summary.Count(ProductOutcome::Updated),
            summary.Count(ProductOutcome::UpToDate),
            summary.Count(ProductOutcome::Failed));
    return Result::Ok();
}

} // namespace geoupdate
