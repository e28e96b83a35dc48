#pragma once



#include <cstdint>
#include <vector>



namespace mdlink
{

// enabling key block provider, the key material itself and the session key
// derivation are opaque to the session
class KeyBlockSource
{
public:
    virtual ~KeyBlockSource() = default;

    virtual uint32_t id() const = 0;
    virtual std::vector<std::vector<uint8_t>> chain() const = 0;
    virtual uint32_t depth() const = 0;
    virtual std::vector<uint8_t> signature() const = 0;

    virtual std::vector<uint8_t> deriveSessionKey(const std::vector<uint8_t> &host_nonce, const std::vector<uint8_t> &device_nonce) const = 0;
};

}
