#include <gtest/gtest.h>
#include "../utils/test_utils.hpp"
#include "route_dist_client.hpp"
#include <sstream>
#include <thread>

namespace {

const std::string COPENHAGEN = "Nørregade 10, 1000 København";
const std::string GRENAA = "Rugvænget 18, 8444 Grenå";
const std::string ANS = "Søndermarksgade 43, 8643 Ans";

} // namespace

class FullSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Start GeoProvider
        provider_ = std::make_unique<test_utils::TestGeoProvider>();
        ASSERT_TRUE(provider_->start()) << "Failed to start GeoProvider";
        provider_->addPlace(COPENHAGEN, 55.68, 12.57);
        provider_->addPlace(GRENAA, 56.4167, 10.7833);
        provider_->addPlace(ANS, 56.3167, 9.6);

        // Start distance server
        server_ = std::make_unique<test_utils::TestDistanceServer>(provider_->address());
        ASSERT_TRUE(server_->start()) << "Failed to start distance server";

        // Create client
        auto channel = grpc::CreateChannel(server_->address(), grpc::InsecureChannelCredentials());
        client_ = std::make_unique<RouteDistClient>(channel, output_);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
        if (provider_) {
            provider_->stop();
        }
    }

    std::string takeOutput() {
        std::string text = output_.str();
        output_.str("");
        output_.clear();
        return text;
    }

    std::ostringstream output_;
    std::unique_ptr<test_utils::TestGeoProvider> provider_;
    std::unique_ptr<test_utils::TestDistanceServer> server_;
    std::unique_ptr<RouteDistClient> client_;
};

TEST_F(FullSystemTest, DistanceCommand) {
    EXPECT_TRUE(client_->RunCommand("distance " + COPENHAGEN + " | 1061"));

    std::string output = takeOutput();
    EXPECT_NE(output.find("[SUCCESS] 61.50 km (routed)"), std::string::npos) << output;
    EXPECT_NE(output.find("Gert Svith, Birkesig Grusgrav"), std::string::npos) << output;
}

TEST_F(FullSystemTest, DistanceDuringRoutingOutageIsMarkedAsEstimate) {
    provider_->failRoutes(grpc::StatusCode::UNAVAILABLE);

    auto reply = client_->ResolveDistance(COPENHAGEN, "1061");

    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->source(), routedist::SOURCE_GEODESIC);
    EXPECT_GT(reply->distance_km(), 100.0);
    EXPECT_NE(takeOutput().find("estimate, straight line"), std::string::npos);
}

TEST_F(FullSystemTest, RepeatedDistanceIsCached) {
    ASSERT_TRUE(client_->ResolveDistance("1061", "2191").has_value());
    auto again = client_->ResolveDistance("2191", "1061");

    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->source(), routedist::SOURCE_CACHED);
    EXPECT_EQ(provider_->routeCalls(), 1);
    EXPECT_EQ(provider_->geocodeCalls(), 2);
}

TEST_F(FullSystemTest, InvalidDistanceReportsError) {
    EXPECT_FALSE(client_->ResolveDistance("95.0,10.0", COPENHAGEN).has_value());
    EXPECT_NE(takeOutput().find("[ERROR] Invalid origin"), std::string::npos);

    EXPECT_TRUE(client_->RunCommand("distance only-one-side"));
    EXPECT_NE(takeOutput().find("Usage: distance"), std::string::npos);
}

TEST_F(FullSystemTest, LocateCommand) {
    EXPECT_TRUE(client_->RunCommand("locate 1061"));
    std::string output = takeOutput();
    EXPECT_NE(output.find("[SUCCESS] 56.4167,10.7833"), std::string::npos) << output;

    auto reply = client_->ResolveLocation("55.676 N, 12.568 E");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->location().kind(), routedist::LOCATION_COORDINATE);
    EXPECT_DOUBLE_EQ(reply->location().position().lat(), 55.676);
}

TEST_F(FullSystemTest, BatchCommandReadsRouteFile) {
    test_utils::TempFile routes(
        "# route_id;origin;destination\n"
        "r1;" + COPENHAGEN + ";1061\n"
        "r2;1061;2191\n"
        "r3;99999;1061\n");

    auto reply = client_->ResolveBatchFile(routes.path());

    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->successful(), 2);
    EXPECT_EQ(reply->failed(), 1);
    ASSERT_EQ(reply->outcomes_size(), 3);
    EXPECT_EQ(reply->outcomes(2).route_id(), "r3");
    EXPECT_FALSE(reply->outcomes(2).ok());

    std::string output = takeOutput();
    EXPECT_NE(output.find("r3: failed"), std::string::npos) << output;
    EXPECT_NE(output.find("2 successful, 1 failed"), std::string::npos) << output;
}

TEST_F(FullSystemTest, BatchCommandRejectsMalformedFile) {
    test_utils::TempFile routes("r1;only-origin\n");

    EXPECT_FALSE(client_->ResolveBatchFile(routes.path()).has_value());
    EXPECT_FALSE(client_->ResolveBatchFile("/nonexistent/routes.txt").has_value());
    EXPECT_EQ(provider_->routeCalls(), 0);
}

TEST_F(FullSystemTest, WarmStatsAndClear) {
    EXPECT_TRUE(client_->RunCommand("warm " + COPENHAGEN + " | 1061 | 2191"));
    EXPECT_NE(takeOutput().find("Geocoded 3 of 3"), std::string::npos);

    auto stats = client_->ShowStats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->geocode().size(), 3u);
    EXPECT_NE(takeOutput().find("geocode: 3/100 entries"), std::string::npos);

    EXPECT_TRUE(client_->ClearCaches());
    stats = client_->ShowStats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->geocode().size(), 0u);
}

TEST_F(FullSystemTest, ReplCommands) {
    EXPECT_TRUE(client_->RunCommand(""));
    EXPECT_TRUE(client_->RunCommand("frobnicate"));
    EXPECT_NE(takeOutput().find("[ERROR] Invalid command."), std::string::npos);

    EXPECT_TRUE(client_->RunCommand("stats"));
    EXPECT_NE(takeOutput().find("Cache statistics:"), std::string::npos);

    EXPECT_TRUE(client_->RunCommand("clear"));
    EXPECT_NE(takeOutput().find("[SUCCESS] All caches cleared"), std::string::npos);

    EXPECT_FALSE(client_->RunCommand("exit"));
}

TEST_F(FullSystemTest, ServerDownIsReported) {
    server_->stop();

    EXPECT_FALSE(client_->ResolveDistance(COPENHAGEN, "1061").has_value());
    EXPECT_FALSE(client_->ShowStats().has_value());
    EXPECT_NE(takeOutput().find("[ERROR]"), std::string::npos);
}
