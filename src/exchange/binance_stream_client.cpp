#include "exchange/binance_stream_client.hpp"
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <iostream>
#include <chrono>
#include <algorithm>

using WebSocketClient = websocketpp::client<websocketpp::config::asio_tls_client>;

static const int INITIAL_BACKOFF_SEC = 1;
static const int MAX_BACKOFF_SEC     = 60;

BinanceStreamClient::BinanceStreamClient(const std::string& tag)
    : tag_(tag)
{
}

BinanceStreamClient::~BinanceStreamClient() {
    stop();
}

void BinanceStreamClient::start(UrlProvider urlProvider) {
    if (running_.exchange(true)) return;
    urlProvider_ = std::move(urlProvider);
    thread_ = std::thread([this]() { runLoop(); });
}

void BinanceStreamClient::stop() {
    if (!running_.exchange(false)) return;
    reconnectNow();
    sleepCv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void BinanceStreamClient::reconnectNow() {
    std::lock_guard<std::mutex> lk(clientMutex_);
    if (stopCurrent_) {
        stopCurrent_();
    }
}

void BinanceStreamClient::runLoop() {
    int backoff = INITIAL_BACKOFF_SEC;

    while (running_) {
        std::string url;
        try {
            url = urlProvider_();
        } catch (const std::exception& e) {
            std::cerr << "[" << tag_ << "] could not build stream URL: " << e.what() << "\n";
        }

        bool opened = false;
        if (!url.empty()) {
            try {
                opened = runOnce(url);
            } catch (const std::exception& e) {
                std::cerr << "[" << tag_ << "] websocket error: " << e.what() << "\n";
            }
        }
        connected_ = false;
        if (!running_) break;

        if (opened) {
            backoff = INITIAL_BACKOFF_SEC;
        }
        std::cerr << "[" << tag_ << "] disconnected => reconnect in " << backoff << "s\n";
        waitBackoff(backoff);
        backoff = std::min(backoff * 2, MAX_BACKOFF_SEC);
    }
}

// Blocks until the connection ends. True if it was open at some point.
bool BinanceStreamClient::runOnce(const std::string& url) {
    WebSocketClient client;
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio();

    bool opened = false;

    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        return websocketpp::lib::make_shared<boost::asio::ssl::context>(
            boost::asio::ssl::context::tlsv12_client
        );
    });

    client.set_open_handler([this, &opened](websocketpp::connection_hdl) {
        opened = true;
        connected_ = true;
        ++connectCount_;
        std::cout << "[" << tag_ << "] connected (#" << connectCount_ << ")\n";
        if (onOpen_) {
            try {
                onOpen_(connectCount_);
            } catch (const std::exception& e) {
                std::cerr << "[" << tag_ << "] open handler error: " << e.what() << "\n";
            }
        }
    });

    client.set_message_handler([this](websocketpp::connection_hdl, WebSocketClient::message_ptr msg) {
        if (!onMessage_) return;
        try {
            onMessage_(msg->get_payload());
        } catch (const std::exception& e) {
            std::cerr << "[" << tag_ << "] message handler error: " << e.what() << "\n";
        }
    });

    // fail/close => leave run(), the loop reconnects
    client.set_fail_handler([this, &client](websocketpp::connection_hdl hdl) {
        auto con = client.get_con_from_hdl(hdl);
        std::cerr << "[" << tag_ << "] connection failed: " << con->get_ec().message() << "\n";
        client.stop();
    });
    client.set_close_handler([this, &client](websocketpp::connection_hdl) {
        std::cerr << "[" << tag_ << "] connection closed\n";
        client.stop();
    });

    std::cout << "[" << tag_ << "] Connecting to " << url << "\n";

    websocketpp::lib::error_code ec;
    auto con = client.get_connection(url, ec);
    if (ec) {
        std::cerr << "[" << tag_ << "] connect error: " << ec.message() << "\n";
        return false;
    }
    client.connect(con);

    {
        std::lock_guard<std::mutex> lk(clientMutex_);
        stopCurrent_ = [&client]() { client.stop(); };
    }
    if (running_) {
        client.run(); // blocking
    }
    {
        std::lock_guard<std::mutex> lk(clientMutex_);
        stopCurrent_ = nullptr;
    }
    return opened;
}

void BinanceStreamClient::waitBackoff(int seconds) {
    std::unique_lock<std::mutex> lk(sleepMutex_);
    sleepCv_.wait_for(lk, std::chrono::seconds(seconds), [this] { return !running_; });
}
