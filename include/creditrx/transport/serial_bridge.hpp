#pragma once
/**
 * @file serial_bridge.hpp
 * @brief IChannel over a BLE-to-UART bridge dongle (Linux TTY, raw mode, SLIP framing).
 *
 * @details
 * PURPOSE
 * -------
 * The peripheral speaks BLE GATT. The host talks to a small bridge dongle over
 * USB CDC; the dongle holds the BLE connection and relays both directions as
 * SLIP-framed messages. The first byte of each message is a tag:
 *
 *   host -> bridge                      bridge -> host
 *   'S'          subscribe              'N' <frame>   one notification frame
 *   'U'          unsubscribe            'I' <record>  file-info read result
 *   'C' <n>      grant n credits        'D'           peripheral disconnected
 *   'I'          read file info
 *
 * THREADING
 * ---------
 * open() starts one reader thread. It decodes SLIP and calls the frame handler
 * for every 'N' message, one at a time, so the handler never runs concurrently
 * with itself. unsubscribe() waits for an in-flight handler call to return.
 * Writes come from any thread and are serialized internally.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Prefer /dev/serial/by-id/... paths; ttyACM numbering moves across replugs.
 * - The runtime user needs access to the device (dialout group or udev rule).
 * - Writes are single-shot on a non-blocking fd: a full driver buffer yields
 *   TxResult::Busy and the credit grant is reported as failed. The session treats
 *   that as a delay, never as data loss.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "creditrx/transport/channel_base.hpp"

namespace creditrx::transport {

/// Bridge message tags (first byte of every SLIP frame).
enum : uint8_t {
  TAG_SUBSCRIBE    = 'S',
  TAG_UNSUBSCRIBE  = 'U',
  TAG_CREDITS      = 'C',
  TAG_FILE_INFO    = 'I',
  TAG_NOTIFY       = 'N',
  TAG_DISCONNECTED = 'D'
};

struct SerialBridgeConfig {
  std::string path;               ///< e.g. /dev/serial/by-id/usb-...
  int baud{115200};               ///< 9600..230400; unknown values fall back to 115200.
  int boot_delay_ms{400};         ///< Settle time after open (USB CDC auto-reset).
  int info_timeout_ms{3000};      ///< Wait for the file-info reply.
};

class SerialBridge : public IChannel {
public:
  explicit SerialBridge(const SerialBridgeConfig& cfg);
  ~SerialBridge() override;

  SerialBridge(const SerialBridge&) = delete;
  SerialBridge& operator=(const SerialBridge&) = delete;

  /**
   * @brief Open the TTY in raw mode and start the reader thread.
   * @return false if the device cannot be opened or configured.
   */
  bool open();

  /// Stop the reader thread and close the TTY. Idempotent.
  void close();

  bool is_open() const { return fd_ >= 0; }

  // IChannel
  bool        subscribe(FrameHandler handler) override;
  void        unsubscribe() override;
  TxResult    write_credits(uint8_t credits) override;
  bool        read_file_info(std::vector<uint8_t>& out) override;
  bool        connected() const override;
  const char* name() const override { return "serial-bridge"; }

  /// SLIP frames the decoder threw away (malformed escape or overlength).
  std::size_t frames_dropped() const { return dropped_.load(); }

private:
  void reader_loop();
  void dispatch(const std::vector<uint8_t>& msg);
  TxResult send(uint8_t tag, const uint8_t* body, std::size_t n);

  SerialBridgeConfig cfg_;
  int fd_{-1};

  std::thread       reader_;
  std::atomic<bool> running_{false};
  std::atomic<bool> link_up_{false};
  std::atomic<std::size_t> dropped_{0};

  std::mutex   handler_mtx_;
  FrameHandler handler_;

  std::mutex              info_mtx_;
  std::condition_variable info_cv_;
  std::vector<uint8_t>    info_;
  bool                    info_ready_{false};

  std::mutex write_mtx_;
};

} // namespace creditrx::transport
