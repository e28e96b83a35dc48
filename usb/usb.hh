#pragma once



#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>



namespace mdlink
{

struct USBDeviceInfo
{
    uint32_t bus;
    uint32_t address;
    uint16_t vendor_id;
    uint16_t product_id;
    std::string manufacturer;
    std::string product;
};


std::string usb_device_path(const USBDeviceInfo &info);
std::vector<USBDeviceInfo> usb_list_devices(const std::filesystem::path &sysfs_root = "/sys");


// usbdevfs device node with a claimed interface
class USBDevice
{
public:
    static constexpr uint32_t DEFAULT_TIMEOUT = 5000;

    enum RequestType : uint8_t
    {
        VENDOR_INTERFACE_OUT = 0x41,
        VENDOR_INTERFACE_IN  = 0xC1
    };

    USBDevice(const std::string &device_path, uint32_t interface_number = 0, uint32_t timeout = DEFAULT_TIMEOUT);
    ~USBDevice();

    uint32_t controlIn(uint8_t request_type, uint8_t request, uint16_t value, uint16_t index, uint8_t *data, uint16_t length);
    void controlOut(uint8_t request_type, uint8_t request, uint16_t value, uint16_t index, const uint8_t *data, uint16_t length);
    void bulkOut(uint8_t endpoint, const uint8_t *data, uint32_t length);

    USBDevice(USBDevice const &) = delete;
    void operator=(USBDevice const &) = delete;

private:
    int _handle;
    unsigned int _interface;
    uint32_t _timeout;

    static std::string getLastError();
};

}
