#include "exchange/binance_depth_stream.hpp"
#include "exchange/binance_parser.hpp"
#include "core/orderbook_manager.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>

/**
 * Too many streams in one URL get a 414 from Binance, so symbols are split
 * into chunks, one connection each.
 */
static const size_t MAX_PER_STREAM = 50;

BinanceDepthStream::BinanceDepthStream(const std::string& wsBaseUrl, OrderBookManager* books)
    : wsBaseUrl_(wsBaseUrl)
    , books_(books)
{
}

BinanceDepthStream::~BinanceDepthStream() {
    stop();
}

std::string BinanceDepthStream::buildCombinedUrl(const std::string& wsBaseUrl,
                                                 const std::vector<std::string>& symbols)
{
    std::ostringstream url;
    url << wsBaseUrl << "/stream?streams=";
    bool first = true;
    for (const auto& s : symbols) {
        std::string lower = s;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        if (!first) url << "/";
        url << lower << "@depth@100ms";
        first = false;
    }
    return url.str();
}

void BinanceDepthStream::start() {
    std::vector<std::string> symList = books_->symbols();
    size_t total = symList.size();

    for (size_t startIdx = 0; startIdx < total; startIdx += MAX_PER_STREAM) {
        size_t endIdx = std::min(startIdx + MAX_PER_STREAM, total);
        std::vector<std::string> chunk(symList.begin() + startIdx, symList.begin() + endIdx);
        std::string url = buildCombinedUrl(wsBaseUrl_, chunk);

        auto client = std::make_unique<BinanceStreamClient>("WS-DEPTH");
        client->setMessageHandler([this](const std::string& payload) { onMessage(payload); });
        // whatever was buffered before a disconnect no longer lines up
        client->setOpenHandler([this, chunk](int) { books_->resetSymbols(chunk); });
        client->start([url]() { return url; });
        clients_.push_back(std::move(client));
    }

    std::cout << "[WS-DEPTH] Started " << clients_.size()
              << " websockets for " << total << " symbols.\n";
}

void BinanceDepthStream::stop() {
    for (auto& c : clients_) {
        c->stop();
    }
    clients_.clear();
}

void BinanceDepthStream::onMessage(const std::string& payload) {
    std::string symbol;
    DepthUpdate update;
    if (!BinanceParser::parseCombinedDepthMessage(payload, symbol, update)) {
        return;
    }
    books_->onDepthUpdate(symbol, update);
}
