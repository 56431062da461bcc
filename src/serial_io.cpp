// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// ============================================================================
#include "serial_io.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace meshwx {

// ---------------------------------------------------------------------------
// Raw 8N1, no flow control, VMIN=VTIME=0 (poll() does the waiting).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 230400: return B230400;
        case 460800: return B460800;
        case 921600: return B921600;
        default:     return B115200;
    }
}

SerialPort::~SerialPort() { close(); }

bool SerialPort::open(const std::string& dev, int baud, int boot_delay_ms) {
    close();

    const int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        set_error("open " + dev + ": " + std::strerror(errno));
        return false;
    }
    if (!set_raw(fd, to_speed(baud))) {
        set_error("termios " + dev + ": " + std::strerror(errno));
        ::close(fd);
        return false;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000u);
    tcflush(fd, TCIOFLUSH);   // boot chatter

    fd_ = fd;
    device_ = dev;
    decoder_.reset();
    return true;
}

void SerialPort::close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

bool SerialPort::write_frame(const std::vector<uint8_t>& payload) {
    const std::vector<uint8_t> wire = slip::encode(payload);

    std::lock_guard<std::mutex> lock(write_mu_);
    if (fd_ < 0) { set_error("port closed"); return false; }

    size_t off = 0;
    while (off < wire.size()) {
        const ssize_t n = ::write(fd_, wire.data() + off, wire.size() - off);
        if (n > 0) { off += static_cast<size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd_, POLLOUT, 0};
            if (::poll(&pfd, 1, 500) > 0) continue;
            set_error("write timeout");
            return false;
        }
        set_error(std::string("write: ") + std::strerror(errno));
        return false;
    }
    return true;
}

bool SerialPort::read_frame(std::vector<uint8_t>& out, int timeout_ms) {
    if (fd_ < 0) { set_error("port closed"); return false; }

    pollfd pfd{fd_, POLLIN, 0};
    uint8_t byte = 0;

    while (true) {
        const int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr == 0) { set_error("timeout"); return false; }
        if (pr < 0) {
            if (errno == EINTR) continue;
            set_error(std::string("poll: ") + std::strerror(errno));
            return false;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            set_error("device gone");
            return false;
        }

        const ssize_t n = ::read(fd_, &byte, 1);
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
        if (n <= 0) {
            set_error(n == 0 ? "eof" : std::string("read: ") + std::strerror(errno));
            return false;
        }
        if (decoder_.feed(byte, out)) return true;
    }
}

std::string SerialPort::last_error() const {
    std::lock_guard<std::mutex> lock(err_mu_);
    return last_error_;
}

void SerialPort::set_error(const std::string& what) {
    std::lock_guard<std::mutex> lock(err_mu_);
    last_error_ = what;
}

} // namespace meshwx
