#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "pipeline/persister.hpp"
#include "util/errors.hpp"
#include "temp_dir.hpp"

namespace {

DepthSnapshot sample(const std::string& symbol, std::uint64_t id) {
    DepthSnapshot s;
    s.symbol = symbol;
    s.exchange = "BINANCE";
    s.time_ms = 1700000000000;
    s.last_update_id = id;
    s.state = BookState::Consistent;
    s.bids = {{100.5, 1.25}, {100.0, 2.0}};
    s.asks = {{101.0, 0.5}};
    return s;
}

std::size_t files_in(const std::filesystem::path& dir) {
    std::size_t n = 0;
    for ([[maybe_unused]] const auto& e : std::filesystem::directory_iterator(dir)) ++n;
    return n;
}

} // namespace

TEST(PersisterTest, WritesOneFilePerExchangeAndSymbol) {
    TempDir dir;
    Persister p(dir.path());

    p.write(sample("BTC_USDT", 1));
    p.write(sample("ETH_USDT", 2));

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "BINANCE" / "BTC_USDT.json"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "BINANCE" / "ETH_USDT.json"));
    EXPECT_EQ(p.path_for("BINANCE", "BTC_USDT").string(), (dir.path() / "BINANCE" / "BTC_USDT.json").string());

    auto back = p.read("BINANCE", "BTC_USDT");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, sample("BTC_USDT", 1));
}

TEST(PersisterTest, OverwriteKeepsLatestAndLeavesNoTempFiles) {
    TempDir dir;
    Persister p(dir.path());

    for (std::uint64_t i = 1; i <= 5; ++i) p.write(sample("BTC_USDT", i));

    EXPECT_EQ(p.read("BINANCE", "BTC_USDT")->last_update_id, 5u);
    EXPECT_EQ(files_in(dir.path() / "BINANCE"), 1u);
}

TEST(PersisterTest, ReadOfUnknownSymbolIsEmpty) {
    TempDir dir;
    Persister p(dir.path());
    EXPECT_FALSE(p.read("BINANCE", "DOGE_USDT").has_value());
}

TEST(PersisterTest, UnwritableRootThrows) {
    TempDir dir;
    const auto blocker = dir.write("not_a_dir", "x");
    Persister p(blocker);
    EXPECT_THROW(p.write(sample("BTC_USDT", 1)), PersistenceError);
}

TEST(PersisterTest, CorruptFileThrowsOnRead) {
    TempDir dir;
    Persister p(dir.path());
    std::filesystem::create_directories(dir.path() / "BINANCE");
    std::ofstream(dir.path() / "BINANCE" / "BTC_USDT.json") << "{\"symbol\":";
    EXPECT_THROW(p.read("BINANCE", "BTC_USDT"), PersistenceError);
}

TEST(PersisterTest, EncodedFieldsAreStable) {
    const std::string body = Persister::encode(sample("BTC_USDT", 42));
    EXPECT_NE(body.find("\"symbol\":\"BTC_USDT\""), std::string::npos);
    EXPECT_NE(body.find("\"exchange\":\"BINANCE\""), std::string::npos);
    EXPECT_NE(body.find("\"last_update_id\":42"), std::string::npos);
    EXPECT_NE(body.find("\"state\":\"CONSISTENT\""), std::string::npos);
    EXPECT_NE(body.find("\"bids\":[[100.5,1.25],[100.0,2.0]]"), std::string::npos);
}

TEST(PersisterTest, ConcurrentWritersNeverLeaveTornFiles) {
    TempDir dir;
    Persister p(dir.path());

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&p, t] {
            for (std::uint64_t i = 0; i < 25; ++i) {
                p.write(sample(t % 2 ? "BTC_USDT" : "ETH_USDT", i));
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_NO_THROW(p.read("BINANCE", "BTC_USDT"));
    EXPECT_NO_THROW(p.read("BINANCE", "ETH_USDT"));
    EXPECT_EQ(files_in(dir.path() / "BINANCE"), 2u);
}
