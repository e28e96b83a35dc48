#pragma once



#include <cstdint>
#include <string>
#include <vector>
#include "netmd/interface.hh"



namespace mdlink
{

// track content prepared for download: already encoded in the wire format and
// encrypted with the key encryption key, handed out packet by packet
class Payload
{
public:
    virtual ~Payload() = default;

    virtual std::string title() const = 0;
    virtual Wireformat wireformat() const = 0;
    virtual uint8_t discFormat() const = 0;
    virtual uint32_t frameCount() const = 0;
    virtual uint32_t totalSize() const = 0;

    virtual std::vector<uint8_t> contentId() const = 0;
    virtual std::vector<uint8_t> keyEncryptionKey() const = 0;

    // returns false once all packets were handed out
    virtual bool nextPacket(std::vector<uint8_t> &packet) = 0;
};

}
