#include "update/product_updater.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace geoupdate {
namespace {

class ProductUpdaterTest : public ::testing::Test {
protected:
    ProductUpdaterTest() {
        service.filenames = {
            {"506", "GeoLiteCountry.dat"},
            {"533", "GeoLiteCity.dat"},
            {"517", "GeoLiteASNum.dat"},
        };
        identity.public_address = "192.0.2.10";
    }

    ProductUpdater MakeUpdater() {
        return ProductUpdater(service, Credential{"999999", "000000000000"}, identity, tmp.Path());
    }

    testutil::TemporaryDirectory tmp;
    testutil::ScriptedUpdateService service;
    ClientIdentity identity;
};

TEST_F(ProductUpdaterTest, EndToEndSingleRound) {
    service.PushReply(testutil::Gzip("AAA"));
    service.PushReply("No new updates available");

    auto updater = MakeUpdater();
    const ProductReport report = updater.UpdateProduct("506");

    ASSERT_EQ(report.outcome, ProductOutcome::Updated) << report.error.msg;
    EXPECT_EQ(report.filename, "GeoLiteCountry.dat");
    EXPECT_EQ(report.rounds, 1);
    EXPECT_EQ(testutil::ReadFile(tmp.File("GeoLiteCountry.dat")), "AAA");
    EXPECT_FALSE(testutil::Exists(tmp.File("GeoLiteCountry.dat.tmp")));

    ASSERT_EQ(service.Polls().size(), 2u);
    EXPECT_EQ(service.Polls()[0].db_md5, "00000000000000000000000000000000");
    EXPECT_EQ(service.Polls()[0].challenge_md5, "c8c657b5570af9c014b718521d77752e");
    EXPECT_EQ(service.Polls()[1].db_md5, "e1faffb3e614e6c2fba74296962386b7");
}

TEST_F(ProductUpdaterTest, NoUpdateWritesNothing) {
    service.PushReply("No new updates available");

    auto updater = MakeUpdater();
    const ProductReport report = updater.UpdateProduct("533");

    EXPECT_EQ(report.outcome, ProductOutcome::UpToDate);
    EXPECT_EQ(report.rounds, 0);
    EXPECT_FALSE(testutil::Exists(tmp.File("GeoLiteCity.dat")));
    EXPECT_FALSE(testutil::Exists(tmp.File("GeoLiteCity.dat.tmp")));
}

TEST_F(ProductUpdaterTest, LocalFileDigestIsSentFirst) {
    testutil::WriteFile(tmp.File("GeoLiteCity.dat"), "AAA");
    service.PushReply("No new updates available");

    auto updater = MakeUpdater();
    EXPECT_EQ(updater.UpdateProduct("533").outcome, ProductOutcome::UpToDate);
    ASSERT_EQ(service.Polls().size(), 1u);
    EXPECT_EQ(service.Polls()[0].db_md5, "e1faffb3e614e6c2fba74296962386b7");
    EXPECT_EQ(testutil::ReadFile(tmp.File("GeoLiteCity.dat")), "AAA");
}

TEST_F(ProductUpdaterTest, MalformedReplyLeavesExistingFile) {
    testutil::WriteFile(tmp.File("GeoLiteCity.dat"), "old");
    service.PushReply("Invalid user ID");

    auto updater = MakeUpdater();
    const ProductReport report = updater.UpdateProduct("533");

    EXPECT_EQ(report.outcome, ProductOutcome::Failed);
    EXPECT_EQ(report.error.kind, ErrorKind::Protocol);
    EXPECT_EQ(testutil::ReadFile(tmp.File("GeoLiteCity.dat")), "old");
    EXPECT_FALSE(testutil::Exists(tmp.File("GeoLiteCity.dat.tmp")));
}

TEST_F(ProductUpdaterTest, TooManyRoundsPublishesNothing) {
    for (int i = 0; i < 6; ++i) {
        service.PushReply(testutil::Gzip("round " + std::to_string(i)));
    }

    auto updater = MakeUpdater();
    const ProductReport report = updater.UpdateProduct("506");

    EXPECT_EQ(report.outcome, ProductOutcome::Failed);
    EXPECT_EQ(report.error.message(), "too many rounds");
    EXPECT_FALSE(testutil::Exists(tmp.File("GeoLiteCountry.dat")));
}

TEST_F(ProductUpdaterTest, FailureDoesNotStopOtherProducts) {
    // 506: malformed, 999: unknown product, 533: updated, 517: up to date.
    service.PushReply("garbage");
    service.PushReply(testutil::Gzip("city"));
    service.PushReply("No new updates available");
    service.PushReply("No new updates available");

    auto updater = MakeUpdater();
    const RunSummary summary = updater.UpdateAll({"506", "999", "533", "517"});

    ASSERT_EQ(summary.products.size(), 4u);
    EXPECT_EQ(summary.products[0].outcome, ProductOutcome::Failed);
    EXPECT_EQ(summary.products[1].outcome, ProductOutcome::Failed);
    EXPECT_TRUE(summary.products[1].filename.empty());
    EXPECT_EQ(summary.products[2].outcome, ProductOutcome::Updated);
    EXPECT_EQ(summary.products[3].outcome, ProductOutcome::UpToDate);

    EXPECT_EQ(summary.Count(ProductOutcome::Failed), 2u);
    EXPECT_FALSE(summary.AllSucceeded());
    EXPECT_EQ(testutil::ReadFile(tmp.File("GeoLiteCity.dat")), "city");
}

} // namespace
} // namespace geoupdate
