#pragma once



#include <cstdint>
#include <vector>



namespace mdlink
{

// raw command / reply exchange with the device, command encoding is up to the caller
class Transport
{
public:
    virtual ~Transport() = default;

    virtual void sendCommand(const std::vector<uint8_t> &command, bool factory = false) = 0;
    virtual std::vector<uint8_t> readReply(bool factory = false) = 0;
    virtual void writeBulk(const std::vector<uint8_t> &data) = 0;
};

}
