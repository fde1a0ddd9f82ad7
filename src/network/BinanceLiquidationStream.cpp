#include "network/BinanceLiquidationStream.h"

#include "common/Logger.h"
#include "network/LiquidationEventParser.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace liqhunter {
namespace network {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}
}

BinanceLiquidationStream::BinanceLiquidationStream(std::vector<std::string> symbols)
    : symbols_(std::move(symbols))
{
    for (const auto& s : symbols_) {
        symbol_filter_.insert(toUpper(s));
    }
}

BinanceLiquidationStream::~BinanceLiquidationStream() {
    stop();
}

std::string BinanceLiquidationStream::streamTarget(const std::vector<std::string>& symbols) {
    if (symbols.empty()) {
        return "/ws/!forceOrder@arr";
    }
    std::string target = "/stream?streams=";
    for (size_t i = 0; i < symbols.size(); ++i) {
        if (i > 0) {
            target += "/";
        }
        target += toLower(symbols[i]) + "@forceOrder";
    }
    return target;
}

bool BinanceLiquidationStream::start(EventHandler handler) {
    if (running_.load()) {
        return false;
    }

    setHandler(std::move(handler));

    running_ = true;
    worker_thread_ = std::thread(&BinanceLiquidationStream::runLoop, this);
    return true;
}

void BinanceLiquidationStream::setHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

void BinanceLiquidationStream::stop() {
    running_ = false;
    connected_ = false;

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void BinanceLiquidationStream::runLoop() {
    int reconnect_attempt = 0;

    while (running_.load()) {
        const auto connected_since = std::chrono::steady_clock::now();
        try {
            connectAndReadLoop();
            reconnect_attempt = 0;
        } catch (const std::exception& e) {
            connected_ = false;
            if (!running_.load()) {
                break;
            }

            const auto connected_for = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - connected_since
            ).count();
            if (connected_for >= 60) {
                reconnect_attempt = 0;
            } else {
                ++reconnect_attempt;
            }
            const int backoff_seconds = std::min(30, reconnect_attempt * 2);
            LOG_WARN("forceOrder WS disconnected: {} (retry in {}s)", e.what(), backoff_seconds);
            std::this_thread::sleep_for(std::chrono::seconds(backoff_seconds));
        }
    }
}

void BinanceLiquidationStream::connectAndReadLoop() {
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    net::io_context ioc;
    ssl::context ssl_ctx(ssl::context::tlsv12_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);

    websocket::stream<beast::ssl_stream<tcp::socket>> ws(ioc, ssl_ctx);
    ws.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(15),   // handshake timeout
        std::chrono::seconds(90),   // idle timeout
        true                        // send ping automatically
    });

    const std::string host = kHost;
    const std::string port = "443";
    const std::string target = streamTarget(symbols_);

    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(host, port);
    net::connect(ws.next_layer().next_layer(), results.begin(), results.end());
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
        throw std::runtime_error("forceOrder WS SNI setup failed");
    }
    ws.next_layer().set_verify_callback(ssl::host_name_verification(host));
    ws.next_layer().handshake(ssl::stream_base::client);

    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "LiqHunter/1.0");
        }
    ));

    ws.handshake(host, target);

    connected_ = true;
    last_message_time_ms_ = nowMs();
    LOG_INFO("forceOrder WS connected ({})", target);

    ws.control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong || kind == websocket::frame_type::ping) {
            last_message_time_ms_ = nowMs();
        }
    });

    beast::flat_buffer buffer;

    while (running_.load()) {
        boost::system::error_code ec;
        ws.read(buffer, ec);
        if (!ec) {
            const std::string payload = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            last_message_time_ms_ = nowMs();
            handlePayload(payload);
        } else if (ec == boost::asio::error::operation_aborted && !running_.load()) {
            break;
        } else if (ec == beast::error::timeout) {
            throw std::runtime_error("forceOrder WS timed out");
        } else if (ec == websocket::error::closed) {
            throw std::runtime_error("forceOrder WS closed by server");
        } else {
            throw std::runtime_error("forceOrder WS read failed: " + ec.message());
        }
    }

    boost::system::error_code close_ec;
    ws.close(websocket::close_code::normal, close_ec);
    connected_ = false;
    if (close_ec && close_ec != websocket::error::closed) {
        LOG_WARN("forceOrder WS close warning: {}", close_ec.message());
    } else {
        LOG_INFO("forceOrder WS stopped");
    }
}

int BinanceLiquidationStream::handlePayload(const std::string& payload) {
    EventHandler handler_copy;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_copy = event_handler_;
    }
    if (!handler_copy) {
        return 0;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("Failed to parse forceOrder WS message: {}", e.what());
        return 0;
    }

    // 전체 시장 스트림은 배열로 묶여 올 수 있음
    std::vector<nlohmann::json> items;
    if (message.is_array()) {
        for (const auto& item : message) {
            items.push_back(item);
        }
    } else {
        items.push_back(message);
    }

    int dispatched = 0;
    for (const auto& item : items) {
        auto event = LiquidationEventParser::parse(item);
        if (!event) {
            continue;
        }
        if (!symbol_filter_.empty() && symbol_filter_.count(event->symbol) == 0) {
            continue;
        }
        handler_copy(*event);
        ++dispatched;
    }
    events_dispatched_ += dispatched;
    return dispatched;
}

} // namespace network
} // namespace liqhunter
