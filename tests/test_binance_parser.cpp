#include <gtest/gtest.h>
#include "exchange/binance_parser.hpp"

TEST(BinanceParserTest, CombinedDepthMessage) {
    const std::string payload = R"({"stream":"btcusdt@depth@100ms","data":{
        "e":"depthUpdate","E":1700000000123,"T":1700000000120,"s":"BTCUSDT",
        "U":157,"u":160,"pu":149,
        "b":[["50000.10","1.500"],["49999.90","0.000"]],
        "a":[["50000.20","2.250"]]}})";

    std::string symbol;
    DepthUpdate d;
    ASSERT_TRUE(BinanceParser::parseCombinedDepthMessage(payload, symbol, d));
    EXPECT_EQ(symbol, "BTCUSDT");
    EXPECT_EQ(d.firstId, 157);
    EXPECT_EQ(d.lastId, 160);
    EXPECT_EQ(d.prevLastId, 149);
    ASSERT_EQ(d.bidUpdates.size(), 2u);
    EXPECT_DOUBLE_EQ(d.bidUpdates[0].price, 50000.10);
    EXPECT_DOUBLE_EQ(d.bidUpdates[1].quantity, 0.0);
    ASSERT_EQ(d.askUpdates.size(), 1u);
    EXPECT_DOUBLE_EQ(d.askUpdates[0].quantity, 2.25);
}

TEST(BinanceParserTest, DepthMessageWithoutSymbolUsesStreamName) {
    const std::string payload =
        R"({"stream":"ethusdt@depth@100ms","data":{"U":1,"u":2,"b":[],"a":[]}})";
    std::string symbol;
    DepthUpdate d;
    ASSERT_TRUE(BinanceParser::parseCombinedDepthMessage(payload, symbol, d));
    EXPECT_EQ(symbol, "ETHUSDT");
    EXPECT_EQ(d.prevLastId, -1);
}

TEST(BinanceParserTest, MalformedDepthMessageIsRejected) {
    std::string symbol;
    DepthUpdate d;
    EXPECT_FALSE(BinanceParser::parseCombinedDepthMessage("{not json", symbol, d));
    EXPECT_FALSE(BinanceParser::parseCombinedDepthMessage(R"({"result":null,"id":1})", symbol, d));
}

TEST(BinanceParserTest, DepthSnapshot) {
    const std::string body = R"({"lastUpdateId":1027024,"E":1589436922972,"T":1589436922959,
        "bids":[["4.00000000","431.00000000"]],"asks":[["4.00000200","12.00000000"]]})";
    DepthSnapshot s;
    ASSERT_TRUE(BinanceParser::parseDepthSnapshot(body, s));
    EXPECT_EQ(s.lastUpdateId, 1027024);
    ASSERT_EQ(s.bids.size(), 1u);
    EXPECT_DOUBLE_EQ(s.bids[0].quantity, 431.0);
    EXPECT_DOUBLE_EQ(s.asks[0].price, 4.000002);
}

TEST(BinanceParserTest, TriggeredStopReportsOriginalType) {
    const std::string payload = R"({"e":"ORDER_TRADE_UPDATE","E":1568879465651,"T":1568879465650,
        "o":{"s":"BTCUSDT","c":"bt_bp_btc_BTCUSDT_1700000000000001","S":"SELL",
             "o":"MARKET","ot":"STOP_MARKET","f":"GTC","q":"0.010","p":"0","ap":"49000.5",
             "sp":"49000","x":"TRADE","X":"FILLED","i":8886774,"l":"0.010","z":"0.010",
             "L":"49000.5","R":true}})";
    OrderUpdateEvent ev;
    std::string type;
    ASSERT_TRUE(BinanceParser::parseOrderTradeUpdate(payload, ev, &type));
    EXPECT_EQ(type, "ORDER_TRADE_UPDATE");
    EXPECT_EQ(ev.symbol, "BTCUSDT");
    EXPECT_EQ(ev.orderId, 8886774);
    EXPECT_EQ(ev.status, OrderStatus::FILLED);
    EXPECT_EQ(ev.orderType, "STOP_MARKET");
    EXPECT_EQ(ev.side, OrderSide::SELL);
    EXPECT_DOUBLE_EQ(ev.avgFillPrice, 49000.5);
    EXPECT_DOUBLE_EQ(ev.filledQuantity, 0.01);
    EXPECT_TRUE(ev.reduceOnly);
    EXPECT_EQ(ev.eventTimeMs, 1568879465651);
}

TEST(BinanceParserTest, OtherUserEventsAreNotOrderUpdates) {
    OrderUpdateEvent ev;
    std::string type;
    EXPECT_FALSE(BinanceParser::parseOrderTradeUpdate(
        R"({"e":"listenKeyExpired","E":1576653824250})", ev, &type));
    EXPECT_EQ(type, "listenKeyExpired");
    EXPECT_FALSE(BinanceParser::parseOrderTradeUpdate(R"({"e":"ACCOUNT_UPDATE","a":{}})", ev));
}

TEST(BinanceParserTest, ExchangeInfoKeepsTradingSymbolsOnly) {
    const std::string body = R"({"symbols":[
        {"symbol":"BTCUSDT","status":"TRADING","pricePrecision":2,"quantityPrecision":3,
         "filters":[{"filterType":"PRICE_FILTER","tickSize":"0.10","minPrice":"556.80"},
                    {"filterType":"LOT_SIZE","stepSize":"0.001","minQty":"0.001"}]},
        {"symbol":"OLDUSDT","status":"SETTLING","filters":[]}]})";
    std::unordered_map<std::string, SymbolRules> rules;
    ASSERT_TRUE(BinanceParser::parseExchangeInfo(body, rules));
    ASSERT_EQ(rules.size(), 1u);
    const SymbolRules& r = rules["BTCUSDT"];
    EXPECT_DOUBLE_EQ(r.priceTick, 0.1);
    EXPECT_DOUBLE_EQ(r.quantityStep, 0.001);
    EXPECT_EQ(r.pricePrecision, 2);
    EXPECT_EQ(r.quantityPrecision, 3);
}

TEST(BinanceParserTest, AvailableBalance) {
    const std::string body = R"([
        {"asset":"BNB","balance":"1.0","availableBalance":"1.0"},
        {"asset":"USDT","balance":"1200.5","availableBalance":"950.25"}])";
    double v = -1.0;
    ASSERT_TRUE(BinanceParser::parseAvailableBalance(body, "USDT", v));
    EXPECT_DOUBLE_EQ(v, 950.25);
    ASSERT_TRUE(BinanceParser::parseAvailableBalance(body, "BUSD", v));
    EXPECT_DOUBLE_EQ(v, 0.0);
}

TEST(BinanceParserTest, PositionRiskSkipsFlatSymbols) {
    const std::string body = R"([
        {"symbol":"BTCUSDT","positionAmt":"-0.020","entryPrice":"50100.0","leverage":"5"},
        {"symbol":"ETHUSDT","positionAmt":"0.000","entryPrice":"0.0","leverage":"5"},
        {"symbol":"SOLUSDT","positionAmt":"3","entryPrice":"20.5","leverage":"10"}])";
    std::vector<ExchangePosition> out;
    ASSERT_TRUE(BinanceParser::parsePositionRisk(body, out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].symbol, "BTCUSDT");
    EXPECT_EQ(out[0].side, PositionSide::Short);
    EXPECT_DOUBLE_EQ(out[0].quantity, 0.02);
    EXPECT_EQ(out[1].side, PositionSide::Long);
    EXPECT_EQ(out[1].leverage, 10);
}

TEST(BinanceParserTest, OrderResponses) {
    OrderResult ok = BinanceParser::parseOrderResponse(
        R"({"orderId":22542179,"symbol":"BTCUSDT","status":"NEW","clientOrderId":"abc"})");
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.orderId, 22542179);
    EXPECT_EQ(ok.status, "NEW");

    OrderResult unknown = BinanceParser::parseOrderResponse(R"({"code":-2011,"msg":"Unknown order sent."})");
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.error, ExchangeErrorKind::OrderNotFound);
    EXPECT_EQ(unknown.code, -2011);

    OrderResult reduceOnly = BinanceParser::parseOrderResponse(
        R"({"code":-2022,"msg":"ReduceOnly Order is rejected."})");
    EXPECT_EQ(reduceOnly.error, ExchangeErrorKind::ReduceOnlyRejected);

    EXPECT_EQ(BinanceParser::parseOrderResponse("").error, ExchangeErrorKind::Transient);
    EXPECT_EQ(BinanceParser::parseOrderResponse("<html>").error, ExchangeErrorKind::ParseError);
}

TEST(BinanceParserTest, ErrorClassification) {
    EXPECT_EQ(BinanceParser::classifyErrorCode(-2013), ExchangeErrorKind::OrderNotFound);
    EXPECT_EQ(BinanceParser::classifyErrorCode(-1003), ExchangeErrorKind::Transient);
    EXPECT_EQ(BinanceParser::classifyErrorCode(-2019), ExchangeErrorKind::Rejected);

    int code = 0;
    std::string msg;
    EXPECT_FALSE(BinanceParser::parseError(R"({"code":200,"msg":"success"})", code, msg));
}

TEST(BinanceParserTest, ListenKey) {
    std::string key;
    ASSERT_TRUE(BinanceParser::parseListenKey(
        R"({"listenKey":"pqia91ma19a5s61cv6a81va65sdf19v8a65a1a5s61cv6a81va65sdf19v8a65a1"})", key));
    EXPECT_EQ(key.size(), 64u);
    EXPECT_FALSE(BinanceParser::parseListenKey("{}", key));
}
