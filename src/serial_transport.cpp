#include "serial_transport.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <errno.h>
#include <string.h>
#include <opencv2/core/utils/logger.hpp>

SerialTransport::SerialTransport() : fd(-1) {}
SerialTransport::~SerialTransport() { close(); }

static speed_t baudToFlag(int baud)
{
    switch (baud)
    {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    case 921600: return B921600;
    default: return B115200;
    }
}

bool SerialTransport::configurePort(int baudRate)
{
    struct termios tio;
    if (tcgetattr(fd, &tio) != 0)
    {
        CV_LOG_ERROR(NULL, "tcgetattr failed: " << strerror(errno));
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~PARENB;
    tio.c_cflag &= ~CRTSCTS; // no HW flow
    tio.c_cflag &= ~HUPCL;   // keep DTR low on close, no auto-reset
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;
    tio.c_cc[VMIN] = 0;   // non-blocking read
    tio.c_cc[VTIME] = 0;  // no inter-byte timer

    speed_t sp = baudToFlag(baudRate);
    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    if (tcsetattr(fd, TCSANOW, &tio) != 0)
    {
        CV_LOG_ERROR(NULL, "tcsetattr failed: " << strerror(errno));
        return false;
    }

    return true;
}

// CH340 boards wire DTR/RTS to EN/IO0. Both asserted on open would hold the
// chip in reset or drop it into the ROM bootloader.
void SerialTransport::releaseModemLines()
{
    int bits = TIOCM_DTR | TIOCM_RTS;
    if (ioctl(fd, TIOCMBIC, &bits) != 0)
    {
        CV_LOG_WARNING(NULL, "could not clear DTR/RTS on " << devicePath << ": " << strerror(errno));
    }
}

bool SerialTransport::open(const std::string &path, int baudRate)
{
    close();
    fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0)
    {
        CV_LOG_ERROR(NULL, "open(" << path << ") failed: " << strerror(errno));
        return false;
    }
    devicePath = path;
    if (!configurePort(baudRate))
    {
        close();
        return false;
    }
    releaseModemLines();
    return true;
}

void SerialTransport::close()
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

bool SerialTransport::sendBytes(const void* data, size_t len)
{
    if (fd < 0) return false;
    if (data == nullptr || len == 0) return false;
    const uint8_t* p = static_cast<const uint8_t*>(data);
    size_t left = len;
    while (left > 0)
    {
        ssize_t n = ::write(fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
            {
                CV_LOG_ERROR(NULL, "write(" << devicePath << ") failed: " << strerror(errno));
                return false;
            }
            // output queue full, wait for the driver to drain it
            struct pollfd pfd = {fd, POLLOUT, 0};
            if (::poll(&pfd, 1, 1000) <= 0)
                return false;
            continue;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return tcdrain(fd) == 0;
}

int SerialTransport::readBytes(uint8_t* buffer, size_t size, int timeoutMs)
{
    if (fd < 0) return -1;
    if (buffer == nullptr || size == 0) return 0;

    struct pollfd pfd = {fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, timeoutMs < 0 ? 0 : timeoutMs);
    if (rc < 0)
        return errno == EINTR ? 0 : -1;
    if (rc == 0)
        return 0;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        return -1;

    ssize_t n = ::read(fd, buffer, size);
    if (n < 0)
        return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) ? 0 : -1;
    return static_cast<int>(n);
}

void SerialTransport::drainInput()
{
    if (fd < 0) return;
    tcflush(fd, TCIFLUSH);
}
