#include "linewire/net/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "linewire/util/logger.hpp"

namespace linewire::net {

namespace {

/*
    writing to a socket whose peer has gone away raises SIGPIPE, which terminates the
    process by default. FdStream already sends with MSG_NOSIGNAL; ignoring the signal
    process-wide also covers anything a handler writes on its own.
*/
struct SigpipeIgnorer {
    SigpipeIgnorer() {
        signal(SIGPIPE, SIG_IGN);
    }
};

SigpipeIgnorer sigpipe_ignorer;

}  // namespace

class Server::Impl {
   public:
    Impl(ConnectionHandler handler, const ServerOptions& options)
        : handler_(std::move(handler)), options_(options) {
        if (!handler_) {
            throw std::invalid_argument("server needs a connection handler");
        }
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw std::runtime_error("failed to create socket: " + std::string(strerror(errno)));
        }

        // SO_REUSEADDR lets a restarted server rebind while old connections sit in TIME_WAIT
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            close(fd);
            throw std::runtime_error("failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw std::runtime_error("Invalid address: " + options_.host);
        }

        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw std::runtime_error("failed to bind to port " + std::to_string(options_.port) +
                                     ": " + std::string(strerror(errno)));
        }

        // query actual bound port (for options_.port == 0)
        sockaddr_in bound_addr{};
        socklen_t bound_len = sizeof(bound_addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_len) == 0) {
            actual_port_ = ntohs(bound_addr.sin_port);
        } else {
            actual_port_ = options_.port;
        }

        if (listen(fd, SOMAXCONN) < 0) {
            close(fd);
            throw std::runtime_error("failed to listen: " + std::string(strerror(errno)));
        }

        server_fd_.store(fd);
        running_ = true;
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        LOG_INFO("Server started on " + options_.host + ":" + std::to_string(actual_port_));
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }

        LOG_INFO("Server stopping...");

        // shutdown unblocks the accept thread, close releases the fd
        int fd = server_fd_.exchange(-1);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        // sessions blocked in a read see end of stream once their socket is shut down.
        // join outside the lock: a finishing client thread takes it to clear its fd
        std::vector<std::unique_ptr<ClientInfo>> clients;
        {
            std::lock_guard lock(clients_mutex_);
            for (auto& info : clients_) {
                if (info->fd >= 0) {
                    shutdown(info->fd, SHUT_RDWR);
                }
            }
            clients.swap(clients_);
        }
        for (auto& info : clients) {
            if (info->thread.joinable()) {
                info->thread.join();
            }
        }

        LOG_INFO("Server stopped");
    }

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return actual_port_;
    }

    [[nodiscard]] std::size_t active_connections() {
        std::lock_guard lock(clients_mutex_);
        std::size_t n = 0;
        for (const auto& info : clients_) {
            if (!info->finished.load()) {
                ++n;
            }
        }
        return n;
    }

   private:
    struct ClientInfo {
        std::thread thread;
        std::atomic<bool> finished{false};
        int fd = -1;  // guarded by clients_mutex_, -1 once the session is over
    };

    void accept_loop() {
        while (running_) {
            cleanup_finished_clients();

            bool at_limit = false;
            {
                std::lock_guard lock(clients_mutex_);
                at_limit = clients_.size() >= options_.max_connections;
            }
            if (at_limit) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);

            int fd = server_fd_.load();
            if (fd < 0) {
                break;
            }

            int client_fd = accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client_fd < 0) {
                if (running_ && errno != EINTR) {
                    LOG_ERROR("Accept failed: " + std::string(strerror(errno)));
                }
                continue;
            }

            if (options_.client_timeout_seconds > 0) {
                struct timeval tv;
                tv.tv_sec = options_.client_timeout_seconds;
                tv.tv_usec = 0;
                setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            }

            char peer[INET_ADDRSTRLEN] = "?";
            inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer));
            LOG_DEBUG("Client connected from " + std::string(peer) + ":" +
                      std::to_string(ntohs(client_addr.sin_port)) +
                      ", fd=" + std::to_string(client_fd));

            std::lock_guard lock(clients_mutex_);
            auto info = std::make_unique<ClientInfo>();
            info->fd = client_fd;
            // raw pointer: the unique_ptr keeps the ClientInfo at a stable address while
            // the vector reallocates
            auto* info_ptr = info.get();
            info->thread = std::thread(&Impl::handle_client, this, client_fd, info_ptr);
            clients_.push_back(std::move(info));
        }
    }

    void cleanup_finished_clients() {
        std::lock_guard lock(clients_mutex_);
        auto it = clients_.begin();
        while (it != clients_.end()) {
            if ((*it)->finished.load()) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void handle_client(int client_fd, ClientInfo* info) {
        {
            FdStream stream(client_fd);
            try {
                auto result = handler_(stream);
                if (!result) {
                    LOG_DEBUG("Session closed by server, fd=" + std::to_string(client_fd));
                } else if (result->kind == IoErrorKind::Eof) {
                    LOG_DEBUG("Client disconnected, fd=" + std::to_string(client_fd));
                } else {
                    LOG_WARN("Session failed, fd=" + std::to_string(client_fd) + ": " +
                             to_string(*result));
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Session handler error, fd=" + std::to_string(client_fd) + ": " +
                          e.what());
            }
            stream.close();
        }

        // stop() may shut down fds of live sessions, so retire this one before the number
        // can be reused
        {
            std::lock_guard lock(clients_mutex_);
            info->fd = -1;
        }
        close(client_fd);
        info->finished.store(true);
    }

    ConnectionHandler handler_;
    ServerOptions options_;

    uint16_t actual_port_{0};

    // written by stop() on the caller's thread while accept_loop() reads it
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    std::vector<std::unique_ptr<ClientInfo>> clients_;
    std::mutex clients_mutex_;
};

// PIMPL INTERFACE -------------------------------------------------------------------------------
Server::Server(ConnectionHandler handler, const ServerOptions& options)
    : impl_(std::make_unique<Impl>(std::move(handler), options)) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;
void Server::start() {
    impl_->start();
}
void Server::stop() {
    impl_->stop();
}
bool Server::running() const noexcept {
    return impl_->running();
}
uint16_t Server::port() const noexcept {
    return impl_->port();
}
std::size_t Server::active_connections() const {
    return impl_->active_connections();
}

}  // namespace linewire::net
