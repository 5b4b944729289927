#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "ApiRouter.hpp"
#include "../common/ByteBuffer.hpp"

namespace lanwatch::server
{
    struct ClientContext
    {
        int socketfd = -1;
        SSL *ssl_handle = nullptr;
        lanwatch::common::ByteBuffer buff;
        bool is_handshake_complete = false;

        // Serialized response waiting to be written; the connection closes
        // once it has been sent.
        std::string outbox;
        size_t sent = 0;
        bool responding = false;

        std::chrono::steady_clock::time_point last_activity;
    };

    // Single-threaded epoll HTTP server, optionally wrapped in TLS.
    class NetworkCore
    {
    private:
        static constexpr std::chrono::seconds IDLE_TIMEOUT{10};

        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::atomic<bool> m_running;
        std::map<int, ClientContext> registry;

        const ApiRouter &m_router;
        SSL_CTX *m_ssl_ctx;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd, uint32_t events);
        void EpollControlModify(int fd, uint32_t events);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientEvent(int fd, uint32_t events);
        bool ContinueHandshake(ClientContext &ctx);
        bool ReadAvailable(ClientContext &ctx);
        bool FlushOutbox(ClientContext &ctx);
        void ProcessBuffer(ClientContext &ctx);
        void QueueResponse(ClientContext &ctx, const http::HttpResponse &response, bool head_only);
        void CloseIdleClients();

    public:
        NetworkCore(int port, const ApiRouter &router);
        ~NetworkCore();

        NetworkCore(const NetworkCore &) = delete;
        NetworkCore &operator=(const NetworkCore &) = delete;

        // Binds and listens; enables TLS when both paths are non-empty.
        // Throws std::runtime_error on failure.
        void Init(const std::string &cert_path = "", const std::string &key_path = "");

        // Serves until Stop() is called.
        void Run();

        // Safe to call from another thread or a signal handler.
        void Stop();

        // Actual listening port (useful when constructed with port 0).
        int Port() const;
    };
}
