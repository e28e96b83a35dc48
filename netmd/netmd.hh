#pragma once



#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "netmd/transport.hh"
#include "usb/usb.hh"



namespace mdlink
{

struct DeviceId
{
    uint16_t vendor_id;
    uint16_t product_id;
    std::string name;
};


std::optional<DeviceId> netmd_device_lookup(uint16_t vendor_id, uint16_t product_id);
std::vector<USBDeviceInfo> netmd_list_devices(const std::filesystem::path &sysfs_root = "/sys");


// NetMD framing over vendor control requests on interface 0
class NetMD : public Transport
{
public:
    static constexpr uint32_t DEFAULT_POLL_RETRIES = 100;

    NetMD(const std::string &device_path, uint32_t poll_retries = DEFAULT_POLL_RETRIES, uint32_t timeout = USBDevice::DEFAULT_TIMEOUT);

    // length of the reply pending on the device, 0 if none
    uint32_t replyLength();

    void sendCommand(const std::vector<uint8_t> &command, bool factory = false) override;
    std::vector<uint8_t> readReply(bool factory = false) override;
    void writeBulk(const std::vector<uint8_t> &data) override;

private:
    enum class Request : uint8_t
    {
        POLL    = 0x01,
        COMMAND = 0x80,
        REPLY   = 0x81,
        FACTORY = 0xFF
    };

    static constexpr uint8_t _BULK_OUT_ENDPOINT = 0x02;
    static constexpr uint16_t _POLL_SIZE = 4;

    USBDevice _device;
    uint32_t _pollRetries;
};

}
