#ifndef BINANCE_DEPTH_STREAM_HPP
#define BINANCE_DEPTH_STREAM_HPP

#include <string>
#include <vector>
#include <memory>

#include "exchange/binance_stream_client.hpp"

class OrderBookManager;

/**
 * Diff depth streams (<symbol>@depth@100ms) for every symbol registered in
 * the book manager, combined into as few connections as Binance allows.
 */
class BinanceDepthStream {
public:
    BinanceDepthStream(const std::string& wsBaseUrl, OrderBookManager* books);
    ~BinanceDepthStream();

    void start();
    void stop();

    // e.g. wss://fstream.binance.com/stream?streams=btcusdt@depth@100ms/ethusdt@depth@100ms
    static std::string buildCombinedUrl(const std::string& wsBaseUrl,
                                        const std::vector<std::string>& symbols);

private:
    void onMessage(const std::string& payload);

private:
    std::string wsBaseUrl_;
    OrderBookManager* books_;
    std::vector<std::unique_ptr<BinanceStreamClient>> clients_;
};

#endif // BINANCE_DEPTH_STREAM_HPP
