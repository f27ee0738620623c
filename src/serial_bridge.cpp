// ============================================================================
// serial_bridge.cpp: implementation for transport/serial_bridge.hpp
// For the bridge message layout see the header. Framing: transport/slip.hpp.
// ============================================================================

#include "creditrx/transport/serial_bridge.hpp"
#include "creditrx/packet_codec.hpp"       // MAX_FRAME bounds the decoder
#include "creditrx/transport/slip.hpp"

#include <chrono>
#include <fcntl.h>         // ::open flags
#include <poll.h>          // poll(2) drives the reader loop
#include <termios.h>       // raw mode
#include <unistd.h>        // ::read, ::write, ::close
#include <cerrno>

namespace creditrx::transport {

namespace {

// Reader wakes at least this often to notice close().
constexpr int READER_POLL_MS = 100;

// ---------------------------------------------------------------------------
// baud_constant()
// Map the handful of rates USB bridges actually use; anything else is 115200.
// ---------------------------------------------------------------------------
speed_t baud_constant(int baud) {
  switch (baud) {
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 230400: return B230400;
    default:     return B115200;
  }
}

// ---------------------------------------------------------------------------
// set_raw()
// 8N1, no echo, no line discipline, no flow control, VMIN=VTIME=0 (poll() owns
// all waiting). Flushes both directions once applied.
// ---------------------------------------------------------------------------
bool set_raw(int fd, speed_t speed) {
  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) return false;

  ::cfmakeraw(&tio);
  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);

  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) return false;
  ::tcflush(fd, TCIOFLUSH);
  return true;
}

} // namespace

SerialBridge::SerialBridge(const SerialBridgeConfig& cfg)
: cfg_(cfg) {
}

SerialBridge::~SerialBridge() {
  close();
}

bool SerialBridge::open() {
  if (fd_ >= 0) return true;
  if (cfg_.path.empty()) return false;

  int fd = ::open(cfg_.path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) return false;                          // missing device or no permission

  if (!set_raw(fd, baud_constant(cfg_.baud))) {
    ::close(fd);
    return false;
  }

  if (cfg_.boot_delay_ms > 0) {                      // let a USB CDC auto-reset finish
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.boot_delay_ms));
  }
  ::tcflush(fd, TCIOFLUSH);                          // drop boot chatter

  fd_ = fd;
  link_up_ = true;
  running_ = true;
  reader_  = std::thread(&SerialBridge::reader_loop, this);
  return true;
}

void SerialBridge::close() {
  running_ = false;
  if (reader_.joinable()) reader_.join();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  link_up_ = false;
}

bool SerialBridge::subscribe(FrameHandler handler) {
  {
    std::lock_guard<std::mutex> lock(handler_mtx_);
    handler_ = std::move(handler);
  }
  if (send(TAG_SUBSCRIBE, nullptr, 0) == TxResult::Ok) return true;

  std::lock_guard<std::mutex> lock(handler_mtx_);
  handler_ = nullptr;
  return false;
}

void SerialBridge::unsubscribe() {
  // A failed 'U' write is harmless here: with the handler cleared, late
  // notifications are dropped on the floor by dispatch().
  (void)send(TAG_UNSUBSCRIBE, nullptr, 0);
  std::lock_guard<std::mutex> lock(handler_mtx_);
  handler_ = nullptr;
}

TxResult SerialBridge::write_credits(uint8_t credits) {
  return send(TAG_CREDITS, &credits, 1);
}

bool SerialBridge::read_file_info(std::vector<uint8_t>& out) {
  {
    std::lock_guard<std::mutex> lock(info_mtx_);
    info_.clear();
    info_ready_ = false;
  }
  if (send(TAG_FILE_INFO, nullptr, 0) != TxResult::Ok) return false;

  std::unique_lock<std::mutex> lock(info_mtx_);
  const bool got = info_cv_.wait_for(lock, std::chrono::milliseconds(cfg_.info_timeout_ms),
                                     [this] { return info_ready_ || !link_up_.load(); });
  if (!got || !info_ready_) return false;
  out = info_;
  return true;
}

bool SerialBridge::connected() const {
  return fd_ >= 0 && link_up_.load();
}

// ---------------------------------------------------------------------------
// send()
// Frame [tag | body] as one SLIP message and write it in a single call.
// Partial writes count as errors; EAGAIN is Busy. No retry loop: credit
// grants are fire-and-forget and the session copes with a lost one.
// ---------------------------------------------------------------------------
TxResult SerialBridge::send(uint8_t tag, const uint8_t* body, std::size_t n) {
  if (fd_ < 0) return TxResult::Error;

  std::vector<uint8_t> msg;
  msg.reserve(1 + n);
  msg.push_back(tag);
  if (n) msg.insert(msg.end(), body, body + n);

  std::vector<uint8_t> wire;
  slip::encode(msg.data(), msg.size(), wire);

  std::lock_guard<std::mutex> lock(write_mtx_);
  const ssize_t w = ::write(fd_, wire.data(), wire.size());
  if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return TxResult::Busy;
  return (w == static_cast<ssize_t>(wire.size())) ? TxResult::Ok : TxResult::Error;
}

// ---------------------------------------------------------------------------
// reader_loop()
// poll -> read chunk -> feed SLIP decoder -> dispatch each complete message.
// Hang-up, read error or EOF marks the link down and ends the thread.
// ---------------------------------------------------------------------------
void SerialBridge::reader_loop() {
  slip::Decoder dec(1 + MAX_FRAME);
  std::vector<uint8_t> msg;
  uint8_t chunk[256];
  pollfd pfd{fd_, POLLIN, 0};

  while (running_) {
    pfd.revents = 0;
    const int pr = ::poll(&pfd, 1, READER_POLL_MS);
    if (pr == 0) continue;                               // idle tick
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) break;
    if (!(pfd.revents & POLLIN)) continue;

    const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
    if (n <= 0) break;                                   // EOF after POLLIN: device went away

    for (ssize_t i = 0; i < n; ++i) {
      if (dec.feed(chunk[i], msg)) dispatch(msg);
    }
    dropped_ = dec.dropped();
  }

  link_up_ = false;
  info_cv_.notify_all();                                 // unblock a pending read_file_info()
}

void SerialBridge::dispatch(const std::vector<uint8_t>& msg) {
  if (msg.empty()) return;
  const uint8_t tag = msg[0];

  switch (tag) {
    case TAG_NOTIFY: {
      std::lock_guard<std::mutex> lock(handler_mtx_);
      if (handler_) handler_(msg.data() + 1, msg.size() - 1);
      break;
    }
    case TAG_FILE_INFO: {
      {
        std::lock_guard<std::mutex> lock(info_mtx_);
        info_.assign(msg.begin() + 1, msg.end());
        info_ready_ = true;
      }
      info_cv_.notify_all();
      break;
    }
    case TAG_DISCONNECTED:
      link_up_ = false;
      info_cv_.notify_all();
      break;
    default:
      break;                                             // unknown tags: newer bridge firmware
  }
}

} // namespace creditrx::transport
