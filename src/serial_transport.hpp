#pragma once
#include <string>
#include "byte_channel.hpp"

// POSIX serial transport for USB-serial bridges (CH340, CP210x, CDC ACM).
// Open with a device path like /dev/ttyUSB0 or /dev/ttyACM0.
class SerialTransport : public ByteChannel
{
public:
    SerialTransport();
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    bool open(const std::string &path, int baudRate);
    void close();

    bool sendBytes(const void* data, size_t len) override;
    int readBytes(uint8_t* buffer, size_t size, int timeoutMs) override;
    void drainInput() override;

private:
    int fd;
    std::string devicePath;
    bool configurePort(int baudRate);
    void releaseModemLines();
};
