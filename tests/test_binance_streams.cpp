#include <gtest/gtest.h>
#include "exchange/binance_depth_stream.hpp"

TEST(BinanceDepthStreamTest, CombinedUrlUsesLowerCaseStreams) {
    std::string url = BinanceDepthStream::buildCombinedUrl("wss://fstream.binance.com",
                                                           {"BTCUSDT", "ETHUSDT"});
    EXPECT_EQ(url, "wss://fstream.binance.com/stream?streams=btcusdt@depth@100ms/ethusdt@depth@100ms");
}

TEST(BinanceDepthStreamTest, SingleSymbolHasNoSeparator) {
    EXPECT_EQ(BinanceDepthStream::buildCombinedUrl("wss://x", {"SOLUSDT"}),
              "wss://x/stream?streams=solusdt@depth@100ms");
}
