#include "exchange/binance_parser.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Binance sends most numbers as strings
double numberField(const json& j, const char* key, double def = 0.0) {
    if (!j.contains(key)) return def;
    const json& v = j[key];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const std::string& s = v.get_ref<const std::string&>();
        if (s.empty()) return def;
        return std::stod(s);
    }
    return def;
}

long long integerField(const json& j, const char* key, long long def = 0) {
    if (!j.contains(key)) return def;
    const json& v = j[key];
    if (v.is_number_integer()) return v.get<long long>();
    if (v.is_number()) return (long long)v.get<double>();
    if (v.is_string()) return std::stoll(v.get<std::string>());
    return def;
}

void parseLevels(const json& arr, std::vector<OrderBookLevel>& out) {
    out.clear();
    if (!arr.is_array()) return;
    out.reserve(arr.size());
    for (const auto& lvl : arr) {
        if (!lvl.is_array() || lvl.size() < 2) continue;
        double px  = lvl[0].is_string() ? std::stod(lvl[0].get<std::string>()) : lvl[0].get<double>();
        double qty = lvl[1].is_string() ? std::stod(lvl[1].get<std::string>()) : lvl[1].get<double>();
        out.push_back({px, qty});
    }
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    return s;
}

} // namespace

bool BinanceParser::parseCombinedDepthMessage(const std::string& payload,
                                              std::string& symbol,
                                              DepthUpdate& out)
{
    try {
        json j = json::parse(payload);
        if (!j.contains("stream") || !j.contains("data")) {
            return false;
        }
        std::string streamName = j["stream"].get<std::string>();
        size_t atPos = streamName.find('@');
        if (atPos == std::string::npos) return false;

        const json& d = j["data"];
        if (!d.contains("U") || !d.contains("u")) {
            return false;
        }
        symbol = d.contains("s") ? d["s"].get<std::string>()
                                 : toUpper(streamName.substr(0, atPos));

        out.firstId    = integerField(d, "U");
        out.lastId     = integerField(d, "u");
        out.prevLastId = integerField(d, "pu", -1);
        parseLevels(d.value("b", json::array()), out.bidUpdates);
        parseLevels(d.value("a", json::array()), out.askUpdates);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PARSE] depth message: " << e.what() << "\n";
        return false;
    }
}

bool BinanceParser::parseDepthSnapshot(const std::string& body, DepthSnapshot& out) {
    try {
        json j = json::parse(body);
        if (!j.is_object() || !j.contains("lastUpdateId")) {
            return false;
        }
        out.lastUpdateId = integerField(j, "lastUpdateId");
        parseLevels(j.value("bids", json::array()), out.bids);
        parseLevels(j.value("asks", json::array()), out.asks);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PARSE] depth snapshot: " << e.what() << "\n";
        return false;
    }
}

bool BinanceParser::parseOrderTradeUpdate(const std::string& payload,
                                          OrderUpdateEvent& out,
                                          std::string* eventType)
{
    try {
        json j = json::parse(payload);
        std::string e = j.value("e", std::string());
        if (eventType) *eventType = e;
        if (e != "ORDER_TRADE_UPDATE" || !j.contains("o") || !j["o"].is_object()) {
            return false;
        }
        const json& o = j["o"];

        out.symbol        = o.value("s", std::string());
        out.orderId       = integerField(o, "i");
        out.clientOrderId = o.value("c", std::string());
        out.status        = parseOrderStatus(o.value("X", std::string()));
        // a triggered STOP_MARKET reports o=MARKET, ot=STOP_MARKET
        out.orderType     = o.value("ot", o.value("o", std::string()));
        out.side          = o.value("S", std::string("BUY")) == "SELL" ? OrderSide::SELL : OrderSide::BUY;
        out.avgFillPrice  = numberField(o, "ap");
        out.filledQuantity = numberField(o, "z");
        out.reduceOnly    = o.contains("R") && o["R"].is_boolean() && o["R"].get<bool>();
        out.eventTimeMs   = integerField(j, "E");
        return !out.symbol.empty();
    } catch (const std::exception& e) {
        std::cerr << "[PARSE] user stream event: " << e.what() << "\n";
        return false;
    }
}

bool BinanceParser::parseExchangeInfo(const std::string& body,
                                      std::unordered_map<std::string, SymbolRules>& out)
{
    try {
        json j = json::parse(body);
        if (!j.contains("symbols") || !j["symbols"].is_array()) {
            return false;
        }
        for (const auto& s : j["symbols"]) {
            if (s.value("status", std::string("TRADING")) != "TRADING") continue;

            SymbolRules r;
            r.symbol            = s.value("symbol", std::string());
            r.pricePrecision    = s.value("pricePrecision", 8);
            r.quantityPrecision = s.value("quantityPrecision", 8);
            if (s.contains("filters") && s["filters"].is_array()) {
                for (const auto& f : s["filters"]) {
                    std::string type = f.value("filterType", std::string());
                    if (type == "PRICE_FILTER") {
                        r.priceTick = numberField(f, "tickSize");
                    } else if (type == "LOT_SIZE") {
                        r.quantityStep = numberField(f, "stepSize");
                    }
                }
            }
            if (!r.symbol.empty()) {
                out[r.symbol] = r;
            }
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PARSE] exchangeInfo: " << e.what() << "\n";
        return false;
    }
}

bool BinanceParser::parseAvailableBalance(const std::string& body,
                                          const std::string& asset,
                                          double& out)
{
    try {
        json j = json::parse(body);
        if (!j.is_array()) return false;
        for (const auto& b : j) {
            if (b.value("asset", std::string()) == asset) {
                out = numberField(b, "availableBalance", numberField(b, "balance"));
                return true;
            }
        }
        out = 0.0; // asset not held
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PARSE] balance: " << e.what() << "\n";
        return false;
    }
}

bool BinanceParser::parsePositionRisk(const std::string& body, std::vector<ExchangePosition>& out) {
    try {
        json j = json::parse(body);
        if (!j.is_array()) return false;
        out.clear();
        for (const auto& p : j) {
            double amt = numberField(p, "positionAmt");
            if (amt == 0.0) continue;

            ExchangePosition ep;
            ep.symbol     = p.value("symbol", std::string());
            ep.side       = amt > 0.0 ? PositionSide::Long : PositionSide::Short;
            ep.quantity   = amt > 0.0 ? amt : -amt;
            ep.entryPrice = numberField(p, "entryPrice");
            ep.leverage   = (int)integerField(p, "leverage");
            out.push_back(ep);
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PARSE] positionRisk: " << e.what() << "\n";
        return false;
    }
}

ExchangeErrorKind BinanceParser::classifyErrorCode(int code) {
    switch (code) {
        case 0:     return ExchangeErrorKind::None;
        case -2011: return ExchangeErrorKind::OrderNotFound;      // Unknown order sent
        case -2013: return ExchangeErrorKind::OrderNotFound;      // Order does not exist
        case -2022: return ExchangeErrorKind::ReduceOnlyRejected;
        case -1001: // disconnected
        case -1003: // too many requests
        case -1007: // timeout waiting for backend
        case -1008: // server busy
            return ExchangeErrorKind::Transient;
        default:
            return ExchangeErrorKind::Rejected;
    }
}

bool BinanceParser::parseError(const std::string& body, int& code, std::string& message) {
    try {
        json j = json::parse(body);
        if (!j.is_object() || !j.contains("code") || !j["code"].is_number()) {
            return false;
        }
        code = j["code"].get<int>();
        // {"code":200,"msg":"success"} is how some endpoints say ok
        if (code == 200) {
            return false;
        }
        message = j.value("msg", std::string("unknown"));
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

OrderResult BinanceParser::parseOrderResponse(const std::string& body) {
    OrderResult res;
    if (body.empty()) {
        res.error   = ExchangeErrorKind::Transient;
        res.message = "Empty response from server";
        return res;
    }

    int code = 0;
    std::string msg;
    if (parseError(body, code, msg)) {
        res.code    = code;
        res.error   = classifyErrorCode(code);
        res.message = "Binance error code=" + std::to_string(code) + " msg=" + msg;
        return res;
    }

    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            res.error   = ExchangeErrorKind::ParseError;
            res.message = "Unexpected response: " + body;
            return res;
        }
        res.orderId       = integerField(j, "orderId");
        res.clientOrderId = j.value("clientOrderId", std::string());
        res.status        = j.value("status", std::string());
        res.success       = true;
        res.message       = "Order OK";
    } catch (const std::exception& e) {
        res.error   = ExchangeErrorKind::ParseError;
        res.message = std::string("Parse error: ") + e.what();
    }
    return res;
}

bool BinanceParser::parseListenKey(const std::string& body, std::string& listenKey) {
    try {
        json j = json::parse(body);
        if (!j.contains("listenKey")) return false;
        listenKey = j["listenKey"].get<std::string>();
        return !listenKey.empty();
    } catch (const json::exception& e) {
        std::cerr << "[PARSE] listenKey: " << e.what() << "\n";
        return false;
    }
}
