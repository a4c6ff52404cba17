#include "serial_key_transport.hpp"
#include "utils/logging.hpp"
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

using namespace std;

bool DryRunTransport::sendKey(const string &key)
{
    sent_++;
    log_info("Dry run key press: " + log_string_src(key));
    return true;
}

static speed_t toSpeed(int baudrate)
{
    switch (baudrate)
    {
    case 9600:
        return B9600;
    case 19200:
        return B19200;
    case 38400:
        return B38400;
    case 57600:
        return B57600;
    case 115200:
        return B115200;
    case 230400:
        return B230400;
    default:
        log_warning("Unsupported baud rate " + to_string(baudrate) + ", using 115200");
        return B115200;
    }
}

SerialKeyTransport::SerialKeyTransport(const string &device, int baudrate)
    : device_(device), baudrate_(baudrate)
{
}

SerialKeyTransport::~SerialKeyTransport()
{
    close();
}

bool SerialKeyTransport::open()
{
    lock_guard<mutex> lock(mutex_);
    if (fd_ >= 0)
        return true;

    fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_SYNC);
    if (fd_ < 0)
    {
        log_error("Cannot open serial port " + device_ + ": " + strerror(errno));
        return false;
    }

    struct termios tty{};
    if (tcgetattr(fd_, &tty) != 0)
    {
        log_error("Cannot read serial attributes of " + device_ + ": " + strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    speed_t speed = toSpeed(baudrate_);
    cfsetospeed(&tty, speed);
    cfsetispeed(&tty, speed);

    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8; // 8 data bits
    tty.c_iflag &= ~IGNBRK;
    tty.c_lflag = 0;
    tty.c_oflag = 0;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 1;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~(PARENB | PARODD); // No parity
    tty.c_cflag &= ~CSTOPB;            // 1 stop bit
    tty.c_cflag &= ~CRTSCTS;           // No hardware flow control

    if (tcsetattr(fd_, TCSANOW, &tty) != 0)
    {
        log_error("Cannot configure serial port " + device_ + ": " + strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    log_info("Serial key transport open on " + describe());
    return true;
}

void SerialKeyTransport::close()
{
    lock_guard<mutex> lock(mutex_);
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
        log_info("Serial port " + device_ + " closed");
    }
}

bool SerialKeyTransport::writeLine(const string &line)
{
    size_t offset = 0;
    while (offset < line.size())
    {
        ssize_t written = ::write(fd_, line.data() + offset, line.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            log_error("Serial write failed on " + device_ + ": " + strerror(errno));
            return false;
        }
        offset += static_cast<size_t>(written);
    }

    if (tcdrain(fd_) != 0)
    {
        log_warning("Serial drain failed on " + device_ + ": " + strerror(errno));
        return false;
    }
    return true;
}

bool SerialKeyTransport::sendKey(const string &key)
{
    if (key.empty() || key.find('\n') != string::npos)
    {
        log_warning("Refusing to send malformed key '" + key + "'");
        return false;
    }

    lock_guard<mutex> lock(mutex_);
    if (fd_ < 0)
    {
        log_warning("Serial port not open, key " + key + " not sent");
        return false;
    }

    if (!writeLine("KEY " + key + "\n"))
        return false;

    log_debug("Sent key " + log_string_src(key));
    return true;
}
