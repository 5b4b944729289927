#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <iostream>
#include <vector>

#include "NetworkCore.hpp"
#include "../common/HttpMessage.hpp"
#include <netinet/in.h>

namespace lanwatch::server
{

    void NetworkCore::LogOpenSSLErrors()
    {
        unsigned long err;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            std::cerr << "[Server] OpenSSL: " << buf << std::endl;
        }
    }

    void NetworkCore::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            throw std::runtime_error("Failed to set O_NONBLOCK.");
        }
    }

    void NetworkCore::EpollControlAdd(int fd, uint32_t events)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void NetworkCore::EpollControlModify(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));
        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1)
        {
            std::cerr << "[Server] Warning: Failed to modify FD in epoll" << std::endl;
        }
    }

    void NetworkCore::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Server] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void NetworkCore::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        EpollControlRemove(fd);
        if (it->second.ssl_handle)
        {
            if (it->second.is_handshake_complete)
                SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }
        close(fd);
        registry.erase(it);
    }

    void NetworkCore::HandleNewConnection()
    {
        while (true)
        {
            struct sockaddr clientAddress;
            socklen_t clientAddressLength = sizeof(clientAddress);
            // Close-on-exec: ping and ARP children must not hold client sockets open.
            int client_fd = accept4(m_server_fd, &clientAddress, &clientAddressLength, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (client_fd == -1)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    return;
                std::cerr << "[Server] accept failed: " << std::strerror(errno) << std::endl;
                return;
            }

            ClientContext &ctx = registry[client_fd];
            ctx.socketfd = client_fd;
            ctx.last_activity = std::chrono::steady_clock::now();

            if (m_ssl_ctx)
            {
                SSL *ssl_handle = SSL_new(m_ssl_ctx);
                if (!ssl_handle)
                {
                    LogOpenSSLErrors();
                    registry.erase(client_fd);
                    close(client_fd);
                    continue;
                }
                SSL_set_fd(ssl_handle, client_fd);
                ctx.ssl_handle = ssl_handle;
            }
            else
            {
                ctx.is_handshake_complete = true;
            }

            try
            {
                EpollControlAdd(client_fd, EPOLLIN | EPOLLRDHUP);
            }
            catch (const std::runtime_error &e)
            {
                std::cerr << "[Server] " << e.what() << std::endl;
                if (ctx.ssl_handle)
                    SSL_free(ctx.ssl_handle);
                registry.erase(client_fd);
                close(client_fd);
            }
        }
    }

    bool NetworkCore::ContinueHandshake(ClientContext &ctx)
    {
        int ret = SSL_accept(ctx.ssl_handle);
        if (ret == 1)
        {
            ctx.is_handshake_complete = true;
            return true;
        }

        int err = SSL_get_error(ctx.ssl_handle, ret);
        if (err == SSL_ERROR_WANT_READ)
        {
            EpollControlModify(ctx.socketfd, EPOLLIN | EPOLLRDHUP);
            return true;
        }
        if (err == SSL_ERROR_WANT_WRITE)
        {
            EpollControlModify(ctx.socketfd, EPOLLOUT | EPOLLRDHUP);
            return true;
        }

        std::cerr << "[Server] TLS handshake failed on " << ctx.socketfd << " (error " << err << ")" << std::endl;
        LogOpenSSLErrors();
        return false;
    }

    // Returns false when the peer closed the connection or it failed.
    bool NetworkCore::ReadAvailable(ClientContext &ctx)
    {
        uint8_t temp_buffer[4096];

        while (true)
        {
            if (ctx.ssl_handle)
            {
                int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));
                if (count > 0)
                {
                    ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                    continue;
                }

                int err = SSL_get_error(ctx.ssl_handle, count);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    return true;
                return false;
            }

            ssize_t count = recv(ctx.socketfd, temp_buffer, sizeof(temp_buffer), 0);
            if (count > 0)
            {
                ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                continue;
            }
            if (count == 0)
                return false;
            if (errno == EINTR)
                continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

    // Returns true when the whole response has been written.
    bool NetworkCore::FlushOutbox(ClientContext &ctx)
    {
        while (ctx.sent < ctx.outbox.size())
        {
            const char *data = ctx.outbox.data() + ctx.sent;
            size_t remaining = ctx.outbox.size() - ctx.sent;

            if (ctx.ssl_handle)
            {
                int written = SSL_write(ctx.ssl_handle, data, static_cast<int>(remaining));
                if (written > 0)
                {
                    ctx.sent += static_cast<size_t>(written);
                    continue;
                }
                int err = SSL_get_error(ctx.ssl_handle, written);
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                    return false;
                ctx.sent = ctx.outbox.size();
                return true;
            }

            ssize_t written = send(ctx.socketfd, data, remaining, MSG_NOSIGNAL);
            if (written > 0)
            {
                ctx.sent += static_cast<size_t>(written);
                continue;
            }
            if (written == -1 && errno == EINTR)
                continue;
            if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
                return false;

            // Peer went away; nothing left to deliver.
            ctx.sent = ctx.outbox.size();
            return true;
        }
        return true;
    }

    void NetworkCore::QueueResponse(ClientContext &ctx, const http::HttpResponse &response, bool head_only)
    {
        ctx.outbox = http::SerializeResponse(response, head_only);
        ctx.sent = 0;
        ctx.responding = true;
        ctx.buff.Clear();
        EpollControlModify(ctx.socketfd, EPOLLOUT | EPOLLRDHUP);
    }

    void NetworkCore::ProcessBuffer(ClientContext &ctx)
    {
        http::ParseResult parsed = http::ParseRequest(ctx.buff.View());

        switch (parsed.status)
        {
        case http::ParseStatus::Incomplete:
            return;

        case http::ParseStatus::Malformed:
            QueueResponse(ctx, http::HttpResponse::Text(400, "Bad Request"), false);
            return;

        case http::ParseStatus::TooLarge:
            QueueResponse(ctx, http::HttpResponse::Text(431, "Request Header Fields Too Large"), false);
            return;

        case http::ParseStatus::Complete:
            break;
        }

        http::HttpResponse response;
        try
        {
            response = m_router.Handle(parsed.request);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Server] " << parsed.request.method << " " << parsed.request.path
                      << " failed: " << e.what() << std::endl;
            response = http::HttpResponse::Text(500, "Internal Server Error");
        }

        QueueResponse(ctx, response, parsed.request.method == "HEAD");
    }

    void NetworkCore::HandleClientEvent(int fd, uint32_t events)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        ClientContext &ctx = it->second;
        ctx.last_activity = std::chrono::steady_clock::now();

        if ((events & EPOLLERR) != 0)
        {
            DisconnectClient(fd);
            return;
        }

        if (!ctx.is_handshake_complete)
        {
            if (!ContinueHandshake(ctx))
            {
                DisconnectClient(fd);
                return;
            }
            if (!ctx.is_handshake_complete)
                return;

            // The request may already sit in OpenSSL's buffer; read it now.
            EpollControlModify(fd, EPOLLIN | EPOLLRDHUP);
        }

        if (ctx.responding)
        {
            if (FlushOutbox(ctx))
                DisconnectClient(fd);
            return;
        }

        bool open = ReadAvailable(ctx);
        ProcessBuffer(ctx);

        if (ctx.responding)
        {
            if (FlushOutbox(ctx))
                DisconnectClient(fd);
            return;
        }

        if (!open || (events & (EPOLLHUP | EPOLLRDHUP)) != 0)
            DisconnectClient(fd);
    }

    void NetworkCore::CloseIdleClients()
    {
        auto now = std::chrono::steady_clock::now();
        std::vector<int> idle;
        for (const auto &entry : registry)
        {
            if (now - entry.second.last_activity > IDLE_TIMEOUT)
                idle.push_back(entry.first);
        }
        for (int fd : idle)
            DisconnectClient(fd);
    }

    NetworkCore::NetworkCore(int port, const ApiRouter &router)
        : m_server_fd(-1), m_epoll_fd(-1), m_wake_fd(-1), m_port(port),
          m_running(false), m_router(router), m_ssl_ctx(nullptr)
    {
    }

    NetworkCore::~NetworkCore()
    {
        std::vector<int> fds;
        for (const auto &it : registry)
            fds.push_back(it.first);
        for (int fd : fds)
            DisconnectClient(fd);

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void NetworkCore::Init(const std::string &cert_path, const std::string &key_path)
    {
        if (!cert_path.empty() && !key_path.empty())
        {
            m_ssl_ctx = SSL_CTX_new(TLS_server_method());
            if (m_ssl_ctx == nullptr)
            {
                throw std::runtime_error("Failed to create SSL Context. Is OpenSSL installed?");
            }

            SSL_CTX_set_mode(m_ssl_ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

            if (SSL_CTX_use_certificate_file(m_ssl_ctx, cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load certificate '" + cert_path + "'.");
            }

            if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load private key '" + key_path + "'.");
            }

            if (!SSL_CTX_check_private_key(m_ssl_ctx))
            {
                throw std::runtime_error("Private Key does not match the Certificate!");
            }
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(m_port);
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, (struct sockaddr *)&serverAddress, sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind server socket. Is the port taken?");
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        m_epoll_fd = epoll_create1(EPOLL_CLOEXEC);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create wake-up eventfd.");
        }

        EpollControlAdd(m_server_fd, EPOLLIN);
        EpollControlAdd(m_wake_fd, EPOLLIN);
        m_running = true;
    }

    int NetworkCore::Port() const
    {
        struct sockaddr_in addr;
        socklen_t len = sizeof(addr);
        if (m_server_fd == -1 || getsockname(m_server_fd, (struct sockaddr *)&addr, &len) != 0)
            return m_port;
        return ntohs(addr.sin_port);
    }

    void NetworkCore::Stop()
    {
        m_running = false;
        if (m_wake_fd != -1)
        {
            uint64_t one = 1;
            ssize_t ignored = write(m_wake_fd, &one, sizeof(one));
            (void)ignored;
        }
    }

    void NetworkCore::Run()
    {
        std::cout << "[Server] Serving " << (m_ssl_ctx ? "HTTPS" : "HTTP") << " on port " << Port() << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, 1000)) == -1)
            {
                if (errno == EINTR)
                    continue;
                std::cerr << "[Server] epoll_wait failed: " << std::strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                if (current_fd == m_wake_fd)
                    continue;
                if (current_fd == m_server_fd)
                    HandleNewConnection();
                else
                    HandleClientEvent(current_fd, ev[i].events);
            }

            CloseIdleClients();
        }

        std::cout << "[Server] Stopped" << std::endl;
    }
}
