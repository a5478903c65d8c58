#pragma once

#include "net/update_service.hpp"
#include "system/random_delay.hpp"
#include "update/product_updater.hpp"
#include "util/config_parser.hpp"
#include "util/result.hpp"

namespace geoupdate {

// One complete run: jitter, client address lookup, every product, legacy links.
class Updater {
public:
    explicit Updater(IUpdateService& service, SleepFn sleep = {});

    // Fails only when the run cannot start (bad config, jitter source, client
    // address). Per-product failures are reported in `summary`.
    Result Run(const config::UpdaterConfig& cfg, RunSummary& summary);

private:
    IUpdateService& service_;
    SleepFn sleep_;
};

} // namespace geoupdate
