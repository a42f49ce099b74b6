/*-------------------------------------------------------------------------
 *
 * CTcpStream.cpp
 *      TCP stream, optionally wrapped in TLS, driven by the event loop.
 *      Part of the DocLink document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CTcpStream.hpp"

#include "CErrors.hpp"
#include "CLogMacros.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace DocLink
{

namespace
{
std::error_code lastError() noexcept
{
    return std::error_code(errno, std::generic_category());
}

bool isIpLiteral(const std::string& host)
{
    unsigned char buffer[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buffer) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buffer) == 1;
}
} /* anonymous namespace */

std::shared_ptr<CTcpStream>
CTcpStream::create(const CServerAddress& address,
                   const CStreamSettings& settings,
                   const CSslSettings& sslSettings,
                   std::shared_ptr<CEventLoop> loop,
                   std::shared_ptr<CBufferPool> pool,
                   std::shared_ptr<CLogger> logger)
{
    return std::shared_ptr<CTcpStream>(
        new CTcpStream(address, settings, sslSettings, std::move(loop),
                       std::move(pool), std::move(logger)));
}

CTcpStream::CTcpStream(const CServerAddress& address,
                       const CStreamSettings& settings,
                       const CSslSettings& sslSettings,
                       std::shared_ptr<CEventLoop> loop,
                       std::shared_ptr<CBufferPool> pool,
                       std::shared_ptr<CLogger> logger)
    : CAsyncStream(address, std::move(pool), std::move(logger)),
      settings_(settings), sslSettings_(sslSettings), loop_(std::move(loop)),
      phase_(Phase::Idle), fd_(-1),
      registration_(CEventLoop::INVALID_REGISTRATION), addresses_(nullptr),
      nextAddress_(nullptr), connectAttempt_(0),
      connectTimer_(CEventLoop::INVALID_REGISTRATION), openHandler_(),
      sslContext_(nullptr), ssl_(nullptr), writeQueue_(),
      idleTimer_(CEventLoop::INVALID_REGISTRATION), idleGeneration_(0),
      readBuffer_()
{
    if (!loop_)
        loop_ = CEventLoop::defaultLoop();
}

CTcpStream::~CTcpStream()
{
    teardown();
}

std::weak_ptr<CTcpStream> CTcpStream::weakSelf()
{
    return std::static_pointer_cast<CTcpStream>(weak_from_this().lock());
}

/*-------------------------------------------------------------------------
 * Lower layer hooks, called from application threads
 *-------------------------------------------------------------------------*/

void CTcpStream::doOpen(OpenHandler handler)
{
    std::weak_ptr<CTcpStream> weak = weakSelf();

    loop_->post(
        [weak, handler = std::move(handler)]() mutable
        {
            std::shared_ptr<CTcpStream> self = weak.lock();
            if (!self)
                return;
            self->openHandler_ = std::move(handler);
            self->startConnect();
        });
}

/*
 * doWrite
 *		Gather the buffers into one transmission and queue it on the loop
 */
void CTcpStream::doWrite(std::vector<CByteBuffer> buffers, WriteHandler handler)
{
    std::vector<uint8_t> data;
    size_t total = 0;

    for (const auto& buffer : buffers)
        total += buffer.size();
    data.reserve(total);
    for (auto& buffer : buffers)
    {
        data.insert(data.end(), buffer.data(), buffer.data() + buffer.size());
        buffer.release();
    }

    std::weak_ptr<CTcpStream> weak = weakSelf();
    loop_->post(
        [weak, data = std::move(data), handler = std::move(handler)]() mutable
        {
            std::shared_ptr<CTcpStream> self = weak.lock();
            if (!self)
                return;
            if (self->phase_ == Phase::TornDown)
            {
                handler(make_error_code(CDocLinkErrc::GenericIOFailure));
                return;
            }
            self->writeQueue_.push_back(
                PendingWrite{std::move(data), 0, std::move(handler)});
            if (self->phase_ == Phase::Established)
                self->flushWrites();
        });
}

void CTcpStream::doClose() noexcept
{
    std::weak_ptr<CTcpStream> weak = weakSelf();

    loop_->post(
        [weak]()
        {
            if (std::shared_ptr<CTcpStream> self = weak.lock())
                self->teardown();
        });
}

void CTcpStream::onReadPendingChanged()
{
    std::weak_ptr<CTcpStream> weak = weakSelf();

    loop_->post(
        [weak]()
        {
            if (std::shared_ptr<CTcpStream> self = weak.lock())
                self->updateIdleTimer(false);
        });
}

/*-------------------------------------------------------------------------
 * Connection establishment, on the loop thread
 *-------------------------------------------------------------------------*/

void CTcpStream::startConnect()
{
    /* closed before the connect task ran */
    if (phase_ != Phase::Idle)
    {
        OpenHandler handler = std::move(openHandler_);
        openHandler_ = nullptr;
        if (handler)
            handler(make_error_code(CDocLinkErrc::ClosedTransportUse));
        return;
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const CServerAddress& address = getAddress();
    std::string port = std::to_string(address.getPort());
    int rc = getaddrinfo(address.getHost().c_str(), port.c_str(), &hints,
                         &addresses_);
    if (rc != 0)
    {
        addresses_ = nullptr;
        failOpen(make_error_code(CDocLinkErrc::ConnectFailure),
                 "cannot resolve " + address.getHost() + ": " +
                     gai_strerror(rc));
        return;
    }

    phase_ = Phase::Connecting;
    nextAddress_ = addresses_;
    connectNext();
}

/*
 * connectNext
 *		Try the resolved addresses in order until one accepts a
 *		non-blocking connect.
 */
void CTcpStream::connectNext()
{
    std::weak_ptr<CTcpStream> weak = weakSelf();

    cancelConnectTimer();
    closeSocket();

    while (nextAddress_)
    {
        struct addrinfo* candidate = nextAddress_;
        nextAddress_ = candidate->ai_next;

        int fd = ::socket(candidate->ai_family,
                          candidate->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          candidate->ai_protocol);
        if (fd < 0)
        {
            debug_log("socket() failed: " + lastError().message());
            continue;
        }

        std::error_code ec = applySocketOptions(fd);
        if (ec)
        {
            debug_log("failed to set socket options: " + ec.message());
            ::close(fd);
            continue;
        }

        int rc = ::connect(fd, candidate->ai_addr, candidate->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS)
        {
            debug_log("connect to " + getAddress().toString() +
                      " failed: " + lastError().message());
            ::close(fd);
            continue;
        }

        fd_ = fd;
        registration_ = loop_->addFd(
            fd_, EPOLLOUT,
            [weak](uint32_t events)
            {
                if (std::shared_ptr<CTcpStream> self = weak.lock())
                    self->handleEvents(events);
            },
            ec);
        if (ec)
        {
            warn_log("failed to register socket: " + ec.message());
            ::close(fd_);
            fd_ = -1;
            registration_ = CEventLoop::INVALID_REGISTRATION;
            continue;
        }

        if (rc == 0)
        {
            finishConnect();
            return;
        }

        if (settings_.connectTimeout.count() > 0)
        {
            uint64_t attempt = ++connectAttempt_;
            connectTimer_ = loop_->armTimer(
                settings_.connectTimeout,
                [weak, attempt]()
                {
                    if (std::shared_ptr<CTcpStream> self = weak.lock())
                        self->onConnectTimeout(attempt);
                },
                ec);
            if (ec)
                warn_log("failed to arm connect timer: " + ec.message());
        }
        return;
    }

    failOpen(make_error_code(CDocLinkErrc::ConnectFailure),
             "unable to connect to " + getAddress().toString());
}

void CTcpStream::finishConnect()
{
    int error = 0;
    socklen_t length = sizeof(error);

    cancelConnectTimer();
    if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &length) < 0)
        error = errno;
    if (error != 0)
    {
        debug_log("connect to " + getAddress().toString() + " failed: " +
                  std::strerror(error));
        connectNext();
        return;
    }

    freeaddrinfo(addresses_);
    addresses_ = nullptr;
    nextAddress_ = nullptr;

    if (sslSettings_.enabled)
        startTls();
    else
        establish();
}

void CTcpStream::onConnectTimeout(uint64_t attempt)
{
    if (phase_ != Phase::Connecting || attempt != connectAttempt_)
        return;

    /* the loop already removed the fired timer */
    connectTimer_ = CEventLoop::INVALID_REGISTRATION;
    debug_log("connect to " + getAddress().toString() + " timed out after " +
              std::to_string(settings_.connectTimeout.count()) + " ms");
    connectNext();
}

std::error_code CTcpStream::applySocketOptions(int fd)
{
    int one = 1;

    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0)
        return lastError();
    if (settings_.keepAlive &&
        setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one)) < 0)
        return lastError();
    if (settings_.sendBufferSize > 0 &&
        setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &settings_.sendBufferSize,
                   sizeof(settings_.sendBufferSize)) < 0)
        return lastError();
    if (settings_.receiveBufferSize > 0 &&
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &settings_.receiveBufferSize,
                   sizeof(settings_.receiveBufferSize)) < 0)
        return lastError();
    return std::error_code();
}

/*
 * startTls
 *		Client context with peer verification; the host name is checked
 *		unless invalid host names are explicitly allowed.
 */
void CTcpStream::startTls()
{
    const std::string& host = getAddress().getHost();
    bool ipLiteral = isIpLiteral(host);

    sslContext_ = SSL_CTX_new(TLS_client_method());
    if (!sslContext_)
    {
        failOpen(make_error_code(CDocLinkErrc::TlsFailure),
                 "SSL_CTX_new failed: " + sslErrorString());
        return;
    }
    SSL_CTX_set_verify(sslContext_, SSL_VERIFY_PEER, nullptr);

    int loaded = sslSettings_.caFile.empty()
                     ? SSL_CTX_set_default_verify_paths(sslContext_)
                     : SSL_CTX_load_verify_locations(
                           sslContext_, sslSettings_.caFile.c_str(), nullptr);
    if (loaded != 1)
    {
        failOpen(make_error_code(CDocLinkErrc::TlsFailure),
                 "cannot load CA certificates: " + sslErrorString());
        return;
    }

    ssl_ = SSL_new(sslContext_);
    if (!ssl_ || SSL_set_fd(ssl_, fd_) != 1)
    {
        failOpen(make_error_code(CDocLinkErrc::TlsFailure),
                 "cannot create TLS session: " + sslErrorString());
        return;
    }

    if (!ipLiteral && SSL_set_tlsext_host_name(ssl_, host.c_str()) != 1)
    {
        failOpen(make_error_code(CDocLinkErrc::TlsFailure),
                 "cannot set server name: " + sslErrorString());
        return;
    }

    if (!sslSettings_.invalidHostNameAllowed)
    {
        int ok = ipLiteral ? X509_VERIFY_PARAM_set1_ip_asc(
                                 SSL_get0_param(ssl_), host.c_str())
                           : SSL_set1_host(ssl_, host.c_str());
        if (ok != 1)
        {
            failOpen(make_error_code(CDocLinkErrc::TlsFailure),
                     "cannot enable host name verification: " +
                         sslErrorString());
            return;
        }
    }
    else
    {
        warn_log("TLS host name verification disabled for " +
                 getAddress().toString());
    }

    SSL_set_mode(ssl_, SSL_MODE_ENABLE_PARTIAL_WRITE |
                           SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    SSL_set_connect_state(ssl_);
    phase_ = Phase::Handshaking;
    continueHandshake();
}

void CTcpStream::continueHandshake()
{
    ERR_clear_error();
    int rc = SSL_connect(ssl_);
    if (rc == 1)
    {
        info_log(std::string("TLS established with ") +
                 getAddress().toString() + " using " + SSL_get_version(ssl_));
        establish();
        return;
    }

    int error = SSL_get_error(ssl_, rc);
    if (error == SSL_ERROR_WANT_READ)
    {
        updateInterest(EPOLLIN);
        return;
    }
    if (error == SSL_ERROR_WANT_WRITE)
    {
        updateInterest(EPOLLOUT);
        return;
    }

    std::string reason = "TLS handshake failed: " + sslErrorString();
    long verify = SSL_get_verify_result(ssl_);
    if (verify != X509_V_OK)
        reason += std::string(" (") + X509_verify_cert_error_string(verify) +
                  ")";
    failOpen(make_error_code(CDocLinkErrc::TlsFailure), reason);
}

void CTcpStream::establish()
{
    phase_ = Phase::Established;
    updateInterest(writeQueue_.empty() ? EPOLLIN : (EPOLLIN | EPOLLOUT));
    updateIdleTimer(false);

    OpenHandler handler = std::move(openHandler_);
    openHandler_ = nullptr;
    if (handler)
        handler(std::error_code());
}

void CTcpStream::failOpen(const std::error_code& ec, const std::string& reason)
{
    OpenHandler handler = std::move(openHandler_);
    openHandler_ = nullptr;

    warn_log(reason);
    teardown();
    if (handler)
        handler(ec);
}

/*-------------------------------------------------------------------------
 * Established connection, on the loop thread
 *-------------------------------------------------------------------------*/

void CTcpStream::handleEvents(uint32_t events)
{
    switch (phase_)
    {
    case Phase::Connecting:
        if (events & (EPOLLOUT | EPOLLERR | EPOLLHUP))
            finishConnect();
        break;
    case Phase::Handshaking:
        continueHandshake();
        break;
    case Phase::Established:
        if (events & (EPOLLIN | EPOLLERR | EPOLLHUP))
            handleReadable();
        if (phase_ == Phase::Established && (events & EPOLLOUT))
            flushWrites();
        break;
    case Phase::Idle:
    case Phase::TornDown:
        break;
    }
}

/*
 * handleReadable
 *		Drain the socket into the read buffer and push each received slice
 *		upward. Slices share the pooled storage until it runs short.
 */
void CTcpStream::handleReadable()
{
    while (phase_ == Phase::Established && !isClosed())
    {
        if (readBuffer_.writableBytes() < MIN_READ_SPACE)
            readBuffer_ = pool_->getBuffer(READ_CHUNK_SIZE);

        CByteBuffer& buffer = readBuffer_;
        size_t received = 0;

        if (ssl_)
        {
            ERR_clear_error();
            int rc = SSL_read(ssl_, buffer.writePointer(),
                              static_cast<int>(buffer.writableBytes()));
            if (rc <= 0)
            {
                int error = SSL_get_error(ssl_, rc);
                if (error == SSL_ERROR_WANT_READ ||
                    error == SSL_ERROR_WANT_WRITE)
                    return;
                if (error == SSL_ERROR_ZERO_RETURN)
                    failStream(make_error_code(CDocLinkErrc::GenericIOFailure),
                               "connection closed by peer");
                else
                    failStream(make_error_code(CDocLinkErrc::GenericIOFailure),
                               "TLS read failed: " + sslErrorString());
                return;
            }
            received = static_cast<size_t>(rc);
        }
        else
        {
            ssize_t rc = ::recv(fd_, buffer.writePointer(),
                                buffer.writableBytes(), 0);
            if (rc == 0)
            {
                failStream(make_error_code(CDocLinkErrc::GenericIOFailure),
                           "connection closed by peer");
                return;
            }
            if (rc < 0)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    return;
                if (errno == EINTR)
                    continue;
                failStream(make_error_code(CDocLinkErrc::GenericIOFailure),
                           "recv failed: " + lastError().message());
                return;
            }
            received = static_cast<size_t>(rc);
        }

        buffer.commit(received);
        trace_log("received " + std::to_string(received) + " bytes from " +
                  getAddress().toString());
        updateIdleTimer(true);
        onInboundData(buffer.split(received));
    }
}

void CTcpStream::flushWrites()
{
    while (!writeQueue_.empty() && phase_ == Phase::Established)
    {
        PendingWrite& pending = writeQueue_.front();

        while (pending.offset < pending.data.size())
        {
            const uint8_t* data = pending.data.data() + pending.offset;
            size_t length = pending.data.size() - pending.offset;
            size_t sent = 0;

            if (ssl_)
            {
                ERR_clear_error();
                int rc = SSL_write(ssl_, data, static_cast<int>(length));
                if (rc <= 0)
                {
                    int error = SSL_get_error(ssl_, rc);
                    if (error == SSL_ERROR_WANT_WRITE ||
                        error == SSL_ERROR_WANT_READ)
                    {
                        updateInterest(EPOLLIN | EPOLLOUT);
                        return;
                    }
                    failStream(make_error_code(CDocLinkErrc::GenericIOFailure),
                               "TLS write failed: " + sslErrorString());
                    return;
                }
                sent = static_cast<size_t>(rc);
            }
            else
            {
                ssize_t rc = ::send(fd_, data, length, MSG_NOSIGNAL);
                if (rc < 0)
                {
                    if (errno == EAGAIN || errno == EWOULDBLOCK)
                    {
                        updateInterest(EPOLLIN | EPOLLOUT);
                        return;
                    }
                    if (errno == EINTR)
                        continue;
                    failStream(make_error_code(CDocLinkErrc::GenericIOFailure),
                               "send failed: " + lastError().message());
                    return;
                }
                sent = static_cast<size_t>(rc);
            }
            pending.offset += sent;
        }

        WriteHandler handler = std::move(pending.handler);
        writeQueue_.pop_front();
        if (handler)
            handler(std::error_code());
    }

    if (phase_ == Phase::Established)
        updateInterest(EPOLLIN);
}

/*
 * failStream
 *		Stop all I/O, then report the error to queued writes and, through
 *		the base class, to the pending read.
 */
void CTcpStream::failStream(const std::error_code& ec,
                            const std::string& reason)
{
    warn_log(reason + " (" + getAddress().toString() + ")");

    std::deque<PendingWrite> writes;
    writes.swap(writeQueue_);
    teardown();

    onInboundFailure(ec);
    for (auto& write : writes)
    {
        if (write.handler)
            write.handler(ec);
    }
}

void CTcpStream::updateInterest(uint32_t events)
{
    if (registration_ == CEventLoop::INVALID_REGISTRATION)
        return;

    std::error_code ec = loop_->modifyFd(registration_, events);
    if (ec)
        warn_log("failed to update socket interest: " + ec.message());
}

/*
 * updateIdleTimer
 *		Keep the idle read timer armed exactly while a read is waiting on an
 *		established connection; restart begins a fresh period.
 */
void CTcpStream::updateIdleTimer(bool restart)
{
    bool wanted = phase_ == Phase::Established &&
                  settings_.readTimeout.count() > 0 && hasPendingRead();

    if (!wanted || restart)
    {
        if (idleTimer_ != CEventLoop::INVALID_REGISTRATION)
        {
            loop_->disarmTimer(idleTimer_);
            idleTimer_ = CEventLoop::INVALID_REGISTRATION;
        }
        idleGeneration_++;
    }
    if (!wanted || idleTimer_ != CEventLoop::INVALID_REGISTRATION)
        return;

    std::weak_ptr<CTcpStream> weak = weakSelf();
    uint64_t generation = idleGeneration_;
    std::error_code ec;

    idleTimer_ = loop_->armTimer(
        settings_.readTimeout,
        [weak, generation]()
        {
            if (std::shared_ptr<CTcpStream> self = weak.lock())
                self->onIdleTimeout(generation);
        },
        ec);
    if (ec)
    {
        warn_log("failed to arm read timer: " + ec.message());
        idleTimer_ = CEventLoop::INVALID_REGISTRATION;
    }
}

void CTcpStream::onIdleTimeout(uint64_t generation)
{
    if (generation != idleGeneration_)
        return;

    idleTimer_ = CEventLoop::INVALID_REGISTRATION;
    if (!hasPendingRead())
        return;

    failStream(make_error_code(CDocLinkErrc::ReadTimeout),
               "no data received within " +
                   std::to_string(settings_.readTimeout.count()) + " ms");
}

void CTcpStream::cancelConnectTimer() noexcept
{
    if (connectTimer_ != CEventLoop::INVALID_REGISTRATION)
    {
        loop_->disarmTimer(connectTimer_);
        connectTimer_ = CEventLoop::INVALID_REGISTRATION;
    }
}

void CTcpStream::closeSocket() noexcept
{
    if (registration_ != CEventLoop::INVALID_REGISTRATION)
    {
        loop_->removeFd(registration_);
        registration_ = CEventLoop::INVALID_REGISTRATION;
    }
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

/*
 * teardown
 *		Release every connection resource. Queued writes and the open
 *		handler are dropped without being called.
 */
void CTcpStream::teardown() noexcept
{
    cancelConnectTimer();
    if (idleTimer_ != CEventLoop::INVALID_REGISTRATION)
    {
        loop_->disarmTimer(idleTimer_);
        idleTimer_ = CEventLoop::INVALID_REGISTRATION;
    }
    idleGeneration_++;

    if (ssl_)
    {
        if (phase_ == Phase::Established)
        {
            ERR_clear_error();
            /* close_notify only; the peer's reply is not awaited */
            if (SSL_shutdown(ssl_) < 0)
                ERR_clear_error();
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (sslContext_)
    {
        SSL_CTX_free(sslContext_);
        sslContext_ = nullptr;
    }

    closeSocket();

    if (addresses_)
    {
        freeaddrinfo(addresses_);
        addresses_ = nullptr;
    }
    nextAddress_ = nullptr;
    writeQueue_.clear();
    openHandler_ = nullptr;
    readBuffer_.release();
    phase_ = Phase::TornDown;
}

std::string CTcpStream::sslErrorString() const
{
    std::string result;
    unsigned long code;

    while ((code = ERR_get_error()) != 0)
    {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if (!result.empty())
            result += "; ";
        result += buffer;
    }
    return result.empty() ? "unknown TLS error" : result;
}

} /* namespace DocLink */
