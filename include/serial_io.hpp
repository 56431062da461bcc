#pragma once
/**
 * @file serial_io.hpp
 * @brief SerialPort — a raw-mode Linux TTY that moves SLIP frames.
 *
 * @details
 * PURPOSE
 * -------
 * The USB radio shows up as /dev/ttyACM* or /dev/ttyUSB*. This class owns
 * the descriptor, puts the line into raw 8N1 mode, and exchanges whole
 * frames with it. It knows nothing about what the frames mean.
 *
 * USAGE
 * -----
 * @code
 *   meshwx::SerialPort port;
 *   if (!port.open("/dev/ttyACM0", 115200)) { ... port.last_error() ... }
 *   port.write_frame(meshwx::radio::make_get_node_num(1));
 *   std::vector<uint8_t> reply;
 *   if (port.read_frame(reply, 1500)) { ... }
 * @endcode
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Opening a CDC-ACM device resets many boards; open() waits
 *   @p boot_delay_ms and then flushes whatever the board printed.
 * - The decoder persists across read_frame() calls: bytes after a frame
 *   boundary stay buffered for the next call.
 * - One reader, one writer: reads are not synchronized with each other,
 *   writes are serialized internally so a frame is never interleaved.
 * - Permissions: the user needs the dialout group (or a udev rule).
 */

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "slip.hpp"

namespace meshwx {

class SerialPort {
public:
    SerialPort() = default;
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    /// Open and configure @p dev. Unknown baud values fall back to 115200.
    bool open(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);
    void close();
    bool is_open() const { return fd_ >= 0; }

    /// SLIP-encode and write one frame completely (loops over short writes).
    bool write_frame(const std::vector<uint8_t>& payload);

    /**
     * @brief Wait up to @p timeout_ms for one complete frame.
     * @return false on timeout or I/O error; last_error() tells which.
     */
    bool read_frame(std::vector<uint8_t>& out, int timeout_ms);

    const std::string& device() const { return device_; }
    std::string last_error() const;

private:
    void set_error(const std::string& what);

    int fd_ = -1;
    std::string device_;
    mutable std::mutex err_mu_;
    std::string last_error_;
    slip::Decoder decoder_;
    std::mutex write_mu_;
};

} // namespace meshwx
