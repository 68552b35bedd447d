#ifndef BINANCE_STREAM_CLIENT_HPP
#define BINANCE_STREAM_CLIENT_HPP

#include <string>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <condition_variable>

/**
 * One reconnecting TLS websocket (websocketpp + asio), run on its own
 * thread. After a failure or close it waits (1s doubling to 60s, reset
 * after a successful open) and connects again, asking `urlProvider` for a
 * fresh URL each time.
 */
class BinanceStreamClient {
public:
    using MessageHandler = std::function<void(const std::string&)>;
    using OpenHandler    = std::function<void(int connectCount)>;
    using UrlProvider    = std::function<std::string()>;

    explicit BinanceStreamClient(const std::string& tag);
    ~BinanceStreamClient();

    void setMessageHandler(MessageHandler handler) { onMessage_ = std::move(handler); }
    void setOpenHandler(OpenHandler handler)       { onOpen_ = std::move(handler); }

    void start(UrlProvider urlProvider);
    void stop();

    // Drop the current connection; the run loop reconnects.
    void reconnectNow();

    bool isConnected() const { return connected_; }

private:
    void runLoop();
    bool runOnce(const std::string& url);
    void waitBackoff(int seconds);

private:
    std::string tag_;
    UrlProvider urlProvider_;
    MessageHandler onMessage_;
    OpenHandler onOpen_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    int connectCount_{0};
    std::thread thread_;

    // stops the client currently in run()
    std::mutex clientMutex_;
    std::function<void()> stopCurrent_;

    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

#endif // BINANCE_STREAM_CLIENT_HPP
