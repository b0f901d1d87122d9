/*
 * swarmcron - Cron and event jobs for Docker Swarm
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "swarmcron/http.hpp"
#include "swarmcron/logger.hpp"
#include "swarmcron/trigger.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <system_error>
#include <thread>

namespace swarmcron {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(15);

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size()) {
            return std::nullopt;
        }
        int hi = hexValue(in[i + 1]);
        int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

Response makeResponse(unsigned version, http::status status, std::string body) {
    Response res{status, version};
    res.set(http::field::server, "swarmcron");
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

// One connection, one request. Reads and writes run on the io thread;
// reply() may be called from any thread.
class Session : public std::enable_shared_from_this<Session> {
public:
    using Handler = std::function<void(std::shared_ptr<Session>, Request)>;

    Session(tcp::socket socket, Handler handler)
        : stream_(std::move(socket)), handler_(std::move(handler)), cancel_(std::make_shared<CancelToken>()) {
    }

    void start() {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::read, shared_from_this()));
    }

    void reply(Response response) {
        net::post(stream_.get_executor(), [self = shared_from_this(), response = std::move(response)]() mutable {
            self->write(std::move(response));
        });
    }

    [[nodiscard]] std::shared_ptr<CancelToken> cancelToken() const { return cancel_; }

private:
    void read() {
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            LOG_DEBUG("HTTP read failed: " + ec.message());
            return;
        }
        stream_.expires_never();
        watchPeer();
        handler_(shared_from_this(), std::move(request_));
    }

    // EOF from the client while its request is still running aborts the wait
    void watchPeer() {
        stream_.socket().async_wait(tcp::socket::wait_read, [self = shared_from_this()](beast::error_code ec) {
            if (ec || self->responding_) {
                return;
            }
            beast::error_code availableEc;
            if (self->stream_.socket().available(availableEc) == 0 && !availableEc) {
                LOG_INFO("Client closed the connection, cancelling request");
                self->cancel_->cancel();
            }
        });
    }

    void write(Response response) {
        responding_ = true;
        response_ = std::move(response);
        http::async_write(stream_, response_, beast::bind_front_handler(&Session::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_WARN("HTTP write failed: " + ec.message());
        }
        close();
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        stream_.socket().close(ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    Request request_;
    Response response_;
    Handler handler_;
    std::shared_ptr<CancelToken> cancel_;
    bool responding_ = false;
};

}

std::optional<TriggerRoute> matchTriggerRoute(const std::string& target) {
    const std::string path = target.substr(0, target.find('?'));
    const std::string prefix = "/event/";
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    const std::string rest = path.substr(prefix.size());
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    const std::string rawService = rest.substr(0, slash);
    const std::string rawKey = rest.substr(slash + 1);
    if (rawService.empty() || rawKey.empty() || rawKey.find('/') != std::string::npos) {
        return std::nullopt;
    }

    auto service = percentDecode(rawService);
    auto key = percentDecode(rawKey);
    if (!service || !key) {
        return std::nullopt;
    }
    return TriggerRoute{*service, *key};
}

struct TriggerServer::Impl {
    struct Worker {
        std::thread thread;
        std::shared_ptr<CancelToken> cancel;
        std::shared_ptr<std::atomic<bool>> done;
    };

    Impl(TriggerService& t, std::string a, std::uint16_t p)
        : triggers(t), address(std::move(a)), port(p), acceptor(ioc) {
    }

    void accept() {
        acceptor.async_accept(net::make_strand(ioc), [this](beast::error_code ec, tcp::socket socket) {
            onAccept(ec, std::move(socket));
        });
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            LOG_WARN("Accept failed: " + ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), [this](std::shared_ptr<Session> session, Request request) {
                dispatch(std::move(session), std::move(request));
            })->start();
        }
        if (acceptor.is_open()) {
            accept();
        }
    }

    void dispatch(std::shared_ptr<Session> session, Request request) {
        const unsigned version = request.version();

        if (request.method() != http::verb::get) {
            auto res = makeResponse(version, http::status::method_not_allowed, "method not allowed\n");
            res.set(http::field::allow, "GET");
            session->reply(std::move(res));
            return;
        }

        const auto target = request.target();
        auto route = matchTriggerRoute(std::string(target.data(), target.size()));
        if (!route) {
            session->reply(makeResponse(version, http::status::not_found, "404 page not found\n"));
            return;
        }

        std::lock_guard<std::mutex> lock(workersMutex);
        reap();
        if (!accepting) {
            session->reply(makeResponse(version, http::status::service_unavailable, "shutting down\n"));
            return;
        }

        Worker worker;
        worker.cancel = session->cancelToken();
        worker.done = std::make_shared<std::atomic<bool>>(false);
        auto done = worker.done;

        try {
            worker.thread = std::thread([this, session, version, route = *route, done]() {
                ScopedThreadName named("Event-" + route.service);
                LOG_INFO("Event request for service " + route.service);

                TriggerResult result;
                try {
                    result = triggers.handle(route.service, route.key, session->cancelToken().get());
                } catch (const std::exception& e) {
                    LOG_ERROR("Event request for " + route.service + " failed: " + std::string(e.what()));
                    result.status = 500;
                    result.body = e.what();
                }
                session->reply(makeResponse(version, static_cast<http::status>(result.status), std::move(result.body)));
                done->store(true);
            });
        } catch (const std::system_error& e) {
            LOG_ERROR("Cannot start request thread: " + std::string(e.what()));
            session->reply(makeResponse(version, http::status::internal_server_error, "internal error\n"));
            return;
        }
        workers.push_back(std::move(worker));
    }

    // Caller holds workersMutex
    void reap() {
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done->load()) {
                if (it->thread.joinable()) {
                    it->thread.join();
                }
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    TriggerService& triggers;
    std::string address;
    std::uint16_t port;

    net::io_context ioc;
    tcp::acceptor acceptor;
    std::thread ioThread;

    std::mutex workersMutex;
    std::list<Worker> workers;
    bool accepting = true;
};

TriggerServer::TriggerServer(TriggerService& triggers, std::string address, std::uint16_t port)
    : impl_(std::make_unique<Impl>(triggers, std::move(address), port)) {
}

TriggerServer::~TriggerServer() {
    stop();
}

bool TriggerServer::start() {
    if (running_.load()) {
        LOG_WARN("Event server already running");
        return false;
    }

    const std::string where = impl_->address + ":" + std::to_string(impl_->port);
    try {
        tcp::endpoint endpoint{net::ip::make_address(impl_->address), impl_->port};
        impl_->acceptor.open(endpoint.protocol());
        impl_->acceptor.set_option(net::socket_base::reuse_address(true));
        impl_->acceptor.bind(endpoint);
        impl_->acceptor.listen(net::socket_base::max_listen_connections);
        boundPort_.store(impl_->acceptor.local_endpoint().port());
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Cannot listen on " + where + ": " + std::string(e.what()));
        beast::error_code ec;
        impl_->acceptor.close(ec);
        return false;
    }

    impl_->accept();
    running_.store(true);

    try {
        impl_->ioThread = std::thread([this]() {
            setThreadName("HTTP");
            while (true) {
                try {
                    impl_->ioc.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("HTTP handler error: " + std::string(e.what()));
                }
            }
        });
    } catch (const std::system_error& e) {
        LOG_ERROR("Cannot start event server thread: " + std::string(e.what()));
        running_.store(false);
        beast::error_code ec;
        impl_->acceptor.close(ec);
        return false;
    }

    LOG_INFO("Listening for events on port " + std::to_string(boundPort_.load()));
    return true;
}

void TriggerServer::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("Stopping event server...");

    net::post(impl_->ioc, [this]() {
        beast::error_code ec;
        impl_->acceptor.close(ec);
    });

    std::list<Impl::Worker> workers;
    {
        std::lock_guard<std::mutex> lock(impl_->workersMutex);
        impl_->accepting = false;
        for (auto& worker : impl_->workers) {
            worker.cancel->cancel();
        }
        workers.swap(impl_->workers);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    impl_->ioc.stop();
    if (impl_->ioThread.joinable()) {
        impl_->ioThread.join();
    }
    LOG_INFO("Event server stopped");
}

}
