#include "conduit/network/tcp_transport.h"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#define CONDUIT_LOG_COMPONENT "Transport"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace network {

namespace {

bool setNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace

Result<AddressList> resolveAddresses(const std::string& host, uint16_t port) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_ADDRCONFIG;

  struct addrinfo* found = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
  if (rc != 0) {
    return makeError<AddressList>(
        socketError("Failed to resolve " + host + ": " + ::gai_strerror(rc)));
  }

  AddressList addresses;
  for (struct addrinfo* ai = found; ai; ai = ai->ai_next) {
    if (ai->ai_addrlen > sizeof(sockaddr_storage)) {
      continue;
    }
    ResolvedAddress entry;
    std::memset(&entry.address, 0, sizeof(entry.address));
    std::memcpy(&entry.address, ai->ai_addr, ai->ai_addrlen);
    entry.length = static_cast<socklen_t>(ai->ai_addrlen);
    addresses.push_back(entry);
  }
  ::freeaddrinfo(found);

  if (addresses.empty()) {
    return makeError<AddressList>(
        socketError("Failed to resolve " + host + ": no addresses"));
  }
  return makeSuccess(std::move(addresses));
}

TcpTransport::TcpTransport(event::Dispatcher& dispatcher,
                           const std::string& host,
                           uint16_t port,
                           Resolver resolver)
    : dispatcher_(dispatcher),
      host_(host),
      port_(port),
      resolver_(std::move(resolver)) {}

TcpTransport::~TcpTransport() {
  close();
  error_cb_.reset();
  retry_cb_.reset();
  file_event_.reset();
}

void TcpTransport::connect() {
  if (fd_ >= 0 || connecting_) {
    return;
  }

  auto resolved = resolver_(host_, port_);
  if (isError(resolved)) {
    scheduleError(errorOf(resolved).message);
    return;
  }
  addresses_ = std::move(get<AddressList>(resolved));
  next_address_ = 0;
  last_connect_error_.clear();
  if (addresses_.empty()) {
    scheduleError("Failed to resolve " + host_ + ": no addresses");
    return;
  }

  connecting_ = true;
  connectNextAddress();
}

void TcpTransport::connectNextAddress() {
  // Stale from the previous attempt; never destroyed from its own callback
  file_event_.reset();

  while (next_address_ < addresses_.size()) {
    const ResolvedAddress& target = addresses_[next_address_++];
    const auto* addr = reinterpret_cast<const sockaddr*>(&target.address);

    int fd = ::socket(addr->sa_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      last_connect_error_ =
          std::string("socket() failed: ") + std::strerror(errno);
      continue;
    }
    setNonBlocking(fd);
    int val = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val));

    if (::connect(fd, addr, target.length) != 0 && errno != EINPROGRESS) {
      last_connect_error_ =
          std::string("connect() failed: ") + std::strerror(errno);
      ::close(fd);
      continue;
    }

    fd_ = fd;
    file_event_ = dispatcher_.createFileEvent(
        fd_, [this](uint32_t events) { onFileEvent(events); },
        event::FileTriggerType::Edge,
        static_cast<uint32_t>(event::FileReadyType::Read |
                              event::FileReadyType::Write));
    CONDUIT_LOG(Debug, "connecting to {}:{} fd={} (address {} of {})", host_,
                port_, fd_, next_address_, addresses_.size());
    return;
  }

  scheduleError(last_connect_error_);
}

void TcpTransport::onFileEvent(uint32_t events) {
  if (fd_ < 0) {
    return;
  }

  if (connecting_) {
    if (!(events & static_cast<uint32_t>(event::FileReadyType::Write))) {
      return;
    }
    onConnectComplete();
    if (!connected_) {
      return;
    }
  }

  if (events & static_cast<uint32_t>(event::FileReadyType::Write)) {
    flushWriteBuffer();
    if (fd_ < 0) {
      return;
    }
  }

  if (events & static_cast<uint32_t>(event::FileReadyType::Read)) {
    if (callbacks_) {
      callbacks_->onTransportReadable();
    }
  }
}

void TcpTransport::onConnectComplete() {
  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
    so_error = errno;
  }
  if (so_error != 0) {
    last_connect_error_ =
        std::string("connect() failed: ") + std::strerror(so_error);
    if (next_address_ < addresses_.size()) {
      CONDUIT_LOG(Debug, "{}:{} {}; trying next address", host_, port_,
                  last_connect_error_);
      closeSocket();
      if (!retry_cb_) {
        retry_cb_ = dispatcher_.createSchedulableCallback(
            [this]() { connectNextAddress(); });
      }
      retry_cb_->scheduleCallbackNextIteration();
      return;
    }
    raiseError(last_connect_error_);
    return;
  }

  connecting_ = false;

  connected_ = true;
  CONDUIT_LOG(Debug, "connected to {}:{} fd={}", host_, port_, fd_);
  if (callbacks_) {
    callbacks_->onTransportConnected();
  }
  if (fd_ >= 0 && !write_buffer_.empty()) {
    flushWriteBuffer();
  }
}

IoCallResult TcpTransport::read(std::string& buffer, size_t max_length) {
  if (fd_ < 0) {
    return IoCallResult::error(EBADF, "transport closed");
  }

  size_t old_size = buffer.size();
  buffer.resize(old_size + max_length);
  ssize_t result = ::recv(fd_, &buffer[old_size], max_length, 0);
  if (result < 0) {
    int err = errno;
    buffer.resize(old_size);
    return IoCallResult::from_errno(err);
  }
  buffer.resize(old_size + static_cast<size_t>(result));
  return IoCallResult::success(static_cast<size_t>(result));
}

void TcpTransport::write(const std::string& data) {
  if (!isOpen()) {
    CONDUIT_LOG(Warning, "dropping {} bytes written to closed transport",
                data.size());
    return;
  }
  write_buffer_.append(data);
  if (connected_) {
    flushWriteBuffer();
  }
}

void TcpTransport::flushWriteBuffer() {
  while (!write_buffer_.empty()) {
    ssize_t sent = ::send(fd_, write_buffer_.data(), write_buffer_.size(),
                          MSG_NOSIGNAL);
    if (sent < 0) {
      int err = errno;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        // Resumed by the next write-ready edge
        return;
      }
      if (err == EINTR) {
        continue;
      }
      write_buffer_.clear();
      scheduleError(std::string("send() failed: ") + std::strerror(err));
      return;
    }
    write_buffer_.erase(0, static_cast<size_t>(sent));
  }
}

void TcpTransport::resumeReading() {
  if (file_event_ && connected_) {
    file_event_->activate(static_cast<uint32_t>(event::FileReadyType::Read));
  }
}

void TcpTransport::close() {
  if (error_cb_) {
    error_cb_->cancel();
  }
  if (retry_cb_) {
    retry_cb_->cancel();
  }
  deferred_error_.reset();
  connecting_ = false;
  connected_ = false;
  write_buffer_.clear();
  closeSocket();
}

void TcpTransport::closeSocket() {
  if (fd_ < 0) {
    return;
  }
  // The file event itself lives until the next attempt or destruction;
  // this may run inside its callback.
  if (file_event_) {
    file_event_->setEnabled(0);
  }
  ::close(fd_);
  fd_ = -1;
}

void TcpTransport::scheduleError(const std::string& message) {
  // Failures found inside connect() or write() are reported on the next
  // loop iteration, never from inside the caller's own call
  deferred_error_ = message;
  if (!error_cb_) {
    error_cb_ = dispatcher_.createSchedulableCallback([this]() {
      if (deferred_error_) {
        std::string pending = *deferred_error_;
        raiseError(pending);
      }
    });
  }
  error_cb_->scheduleCallbackNextIteration();
}

void TcpTransport::raiseError(const std::string& message) {
  CONDUIT_LOG(Debug, "transport {}:{} failed: {}", host_, port_, message);
  close();
  if (callbacks_) {
    callbacks_->onTransportError(socketError(message));
  }
}

TransportFactory createTcpTransportFactory(event::Dispatcher& dispatcher,
                                           const std::string& host,
                                           uint16_t port) {
  return [&dispatcher, host, port]() -> TransportPtr {
    return std::make_unique<TcpTransport>(dispatcher, host, port);
  };
}

}  // namespace network
}  // namespace conduit
