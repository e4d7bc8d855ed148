#include "web/api_server.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>

#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

namespace puv {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr const char* kServerName = "puvtrack";
constexpr auto kHttpTimeout = std::chrono::seconds(30);
}  // namespace

struct ApiServer::Runtime {
    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> work;
    net::thread_pool blocking;
    tcp::acceptor acceptor;

    Runtime(int io_threads, int blocking_threads)
        : ioc(io_threads),
          work(net::make_work_guard(ioc)),
          blocking(static_cast<std::size_t>(blocking_threads)),
          acceptor(net::make_strand(ioc)) {}
};

// One upgraded connection. Every member except the atomics is touched only on the
// stream's strand; deliver() and teardown() may be called from any thread.
class WsSession : public Subscriber, public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, BroadcastHub& hub, ServiceCounters& counters, std::size_t max_pending)
        : ws_(std::move(socket)), hub_(hub), counters_(counters), max_pending_(max_pending) {}

    void run(http::request<http::string_body> req, WsRoute route) {
        route_ = std::move(route);
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, kServerName);
        }));
        ws_.async_accept(req, beast::bind_front_handler(&WsSession::onAccept, shared_from_this()));
    }

    bool deliver(const std::string& message) override {
        if (!open_.load() || closed_.load()) {
            return false;
        }
        if (pending_.fetch_add(1) >= max_pending_) {
            pending_.fetch_sub(1);
            std::cerr << "[ws] slow consumer dropped after " << max_pending_ << " pending messages\n";
            teardown();
            return false;
        }
        net::post(ws_.get_executor(), [self = shared_from_this(), message]() { self->enqueue(message); });
        return true;
    }

    void teardown() {
        if (closed_.exchange(true)) {
            return;
        }
        auto self = shared_from_this();
        hub_.unsubscribeAll(self);
        if (open_.exchange(false)) {
            counters_.connectionClosed();
        }
        net::post(ws_.get_executor(), [self]() {
            beast::error_code ec;
            beast::get_lowest_layer(self->ws_).socket().close(ec);
        });
    }

private:
    void onAccept(beast::error_code ec) {
        if (ec) {
            std::cerr << "[ws] handshake failed: " << ec.message() << '\n';
            closed_.store(true);
            return;
        }
        open_.store(true);
        counters_.connectionOpened();

        pending_.fetch_add(1);
        enqueue(route_.snapshot);
        for (const auto& topic : route_.topics) {
            hub_.subscribe(shared_from_this(), topic);
        }
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed) {
                std::cerr << "[ws] read ended: " << ec.message() << '\n';
            }
            teardown();
            return;
        }
        const std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (text == "ping") {
            pending_.fetch_add(1);
            enqueue("pong");
        }
        doRead();
    }

    void enqueue(std::string message) {
        if (closed_.load()) {
            pending_.fetch_sub(1);
            return;
        }
        queue_.push_back(std::move(message));
        if (queue_.size() > 1) {
            return;
        }
        doWrite();
    }

    void doWrite() {
        ws_.text(true);
        ws_.async_write(net::buffer(queue_.front()), beast::bind_front_handler(&WsSession::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        queue_.pop_front();
        pending_.fetch_sub(1);
        if (ec) {
            std::cerr << "[ws] write failed: " << ec.message() << '\n';
            teardown();
            return;
        }
        if (!queue_.empty()) {
            doWrite();
        }
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    BroadcastHub& hub_;
    ServiceCounters& counters_;
    std::size_t max_pending_;
    WsRoute route_;
    std::deque<std::string> queue_;
    std::atomic<std::size_t> pending_{0};
    std::atomic<bool> open_{false};
    std::atomic<bool> closed_{false};
};

namespace {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, ApiServer& server, RequestRouter& router, BroadcastHub& hub,
                ServiceCounters& counters, net::thread_pool& blocking, std::size_t max_pending)
        : stream_(std::move(socket)),
          server_(server),
          router_(router),
          hub_(hub),
          counters_(counters),
          blocking_(blocking),
          max_pending_(max_pending) {}

    void run() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
    }

private:
    void doRead() {
        req_ = {};
        stream_.expires_after(kHttpTimeout);
        http::async_read(stream_, buffer_, req_, beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            doClose();
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                std::cerr << "[http] read failed: " << ec.message() << '\n';
            }
            return;
        }

        auto self = shared_from_this();
        const std::string target(req_.target());
        if (websocket::is_upgrade(req_)) {
            net::post(blocking_, [self, target]() {
                WsRoute route;
                std::string error;
                bool ok = false;
                try {
                    ok = self->router_.resolveWebSocket(target, route, error);
                } catch (const std::exception& e) {
                    error = e.what();
                }
                net::post(self->stream_.get_executor(), [self, ok, route, error]() {
                    self->onWsResolved(ok, route, error);
                });
            });
            return;
        }

        const std::string method(req_.method_string());
        const std::string body = req_.body();
        net::post(blocking_, [self, method, target, body]() {
            HttpReply reply = self->router_.route(method, target, body);
            net::post(self->stream_.get_executor(), [self, reply]() { self->sendReply(reply); });
        });
    }

    void onWsResolved(bool ok, const WsRoute& route, const std::string& error) {
        if (!ok) {
            sendReply(HttpReply{404, nlohmann::json{{"detail", error}}.dump()});
            return;
        }
        stream_.expires_never();
        auto session = std::make_shared<WsSession>(stream_.release_socket(), hub_, counters_, max_pending_);
        server_.trackSession(session);
        session->run(std::move(req_), route);
    }

    void sendReply(const HttpReply& reply) {
        auto res = std::make_shared<http::response<http::string_body>>(static_cast<http::status>(reply.status),
                                                                        req_.version());
        res->set(http::field::server, kServerName);
        res->set(http::field::content_type, "application/json");
        res->keep_alive(req_.keep_alive());
        res->body() = reply.body;
        res->prepare_payload();
        res_ = res;
        http::async_write(stream_, *res_, beast::bind_front_handler(&HttpSession::onWrite, shared_from_this(), res_->need_eof()));
    }

    void onWrite(bool close, beast::error_code ec, std::size_t) {
        res_.reset();
        if (ec) {
            std::cerr << "[http] write failed: " << ec.message() << '\n';
            return;
        }
        if (close) {
            doClose();
            return;
        }
        doRead();
    }

    void doClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<http::response<http::string_body>> res_;
    ApiServer& server_;
    RequestRouter& router_;
    BroadcastHub& hub_;
    ServiceCounters& counters_;
    net::thread_pool& blocking_;
    std::size_t max_pending_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    using Factory = std::function<void(tcp::socket&&)>;

    Listener(net::io_context& ioc, tcp::acceptor& acceptor, Factory factory)
        : ioc_(ioc), acceptor_(acceptor), factory_(std::move(factory)) {}

    void run() { doAccept(); }

private:
    void doAccept() {
        acceptor_.async_accept(net::make_strand(ioc_), beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            std::cerr << "[http] accept failed: " << ec.message() << '\n';
        } else {
            factory_(std::move(socket));
        }
        doAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor& acceptor_;
    Factory factory_;
};

}  // namespace

ApiServer::ApiServer(RequestRouter& router, BroadcastHub& hub, ServiceCounters& counters, const ServerConfig& cfg)
    : router_(router), hub_(hub), counters_(counters), cfg_(cfg) {}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start(std::string& error) {
    if (running_.load()) {
        error = "server already running";
        return false;
    }
    if (cfg_.port < 0 || cfg_.port > 65535 || cfg_.io_threads <= 0 || cfg_.blocking_threads <= 0) {
        error = "invalid server configuration";
        return false;
    }

    rt_ = std::make_unique<Runtime>(cfg_.io_threads, cfg_.blocking_threads);
    beast::error_code ec;
    const auto address = net::ip::make_address(cfg_.bind_address, ec);
    if (ec) {
        error = "bad bind address '" + cfg_.bind_address + "': " + ec.message();
        rt_.reset();
        return false;
    }
    const tcp::endpoint endpoint(address, static_cast<unsigned short>(cfg_.port));

    auto& acceptor = rt_->acceptor;
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        error = "listen on " + cfg_.bind_address + ":" + std::to_string(cfg_.port) + " failed: " + ec.message();
        rt_.reset();
        return false;
    }
    bound_port_.store(acceptor.local_endpoint().port());

    const std::size_t max_pending = static_cast<std::size_t>(cfg_.ws_max_pending_messages);
    net::thread_pool& blocking = rt_->blocking;
    auto listener = std::make_shared<Listener>(rt_->ioc, acceptor, [this, &blocking, max_pending](tcp::socket&& socket) {
        std::make_shared<HttpSession>(std::move(socket), *this, router_, hub_, counters_, blocking, max_pending)->run();
    });
    listener->run();

    running_.store(true);
    io_threads_.reserve(static_cast<std::size_t>(cfg_.io_threads));
    for (int i = 0; i < cfg_.io_threads; ++i) {
        io_threads_.emplace_back([this]() { rt_->ioc.run(); });
    }
    std::cout << "[web] listening on http://" << cfg_.bind_address << ":" << bound_port_.load() << '\n';
    error.clear();
    return true;
}

void ApiServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::vector<std::weak_ptr<WsSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (const auto& weak : sessions) {
        if (auto s = weak.lock()) {
            s->teardown();
        }
    }

    rt_->work.reset();
    rt_->ioc.stop();
    for (auto& t : io_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    io_threads_.clear();

    beast::error_code ec;
    rt_->acceptor.close(ec);
    rt_->blocking.stop();
    rt_->blocking.join();
    rt_.reset();
    std::cout << "[web] stopped\n";
}

void ApiServer::trackSession(const std::shared_ptr<WsSession>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::weak_ptr<WsSession>& w) { return w.expired(); }),
                    sessions_.end());
    sessions_.push_back(session);
}

std::size_t ApiServer::openSessions() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(),
                                                  [](const std::weak_ptr<WsSession>& w) { return !w.expired(); }));
}

}  // namespace puv
