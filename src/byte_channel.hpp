#pragma once
#include <cstddef>
#include <cstdint>

// Duplex byte channel to one device. SerialTransport is the real one;
// tests plug in an emulated device.
class ByteChannel
{
public:
    virtual ~ByteChannel() = default;

    virtual bool sendBytes(const void* data, size_t len) = 0;
    // Returns bytes read, 0 on timeout, -1 on error.
    virtual int readBytes(uint8_t* buffer, size_t size, int timeoutMs) = 0;
    // Discard whatever the device already sent.
    virtual void drainInput() = 0;
};
