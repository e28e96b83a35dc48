#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <linux/usbdevice_fs.h>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>
#include <vector>
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "usb/usb.hh"



namespace mdlink
{

static std::string read_attribute(const std::filesystem::path &path)
{
    std::string value;

    std::ifstream ifs(path);
    if(ifs.is_open())
        std::getline(ifs, value);

    return trim(value);
}


std::string usb_device_path(const USBDeviceInfo &info)
{
    return fmt::format("/dev/bus/usb/{:03}/{:03}", info.bus, info.address);
}


std::vector<USBDeviceInfo> usb_list_devices(const std::filesystem::path &sysfs_root)
{
    std::vector<USBDeviceInfo> devices;

    std::filesystem::path devices_path(sysfs_root / "bus" / "usb" / "devices");
    if(!std::filesystem::is_directory(devices_path))
        return devices;

    for(auto const &de : std::filesystem::directory_iterator(devices_path))
    {
        // interface entries ("1-1:1.0") carry no device descriptor attributes
        auto vendor_id = str_hex_to_uint64(read_attribute(de.path() / "idVendor"));
        auto product_id = str_hex_to_uint64(read_attribute(de.path() / "idProduct"));
        auto bus = str_to_uint64(read_attribute(de.path() / "busnum"));
        auto address = str_to_uint64(read_attribute(de.path() / "devnum"));
        if(!vendor_id || !product_id || !bus || !address)
            continue;

        USBDeviceInfo info;
        info.bus = *bus;
        info.address = *address;
        info.vendor_id = *vendor_id;
        info.product_id = *product_id;
        info.manufacturer = read_attribute(de.path() / "manufacturer");
        info.product = read_attribute(de.path() / "product");

        devices.push_back(info);
    }

    return devices;
}


USBDevice::USBDevice(const std::string &device_path, uint32_t interface_number, uint32_t timeout)
    : _interface(interface_number)
    , _timeout(timeout)
{
    _handle = open(device_path.c_str(), O_RDWR);
    if(_handle < 0)
        throw_line("unable to open device ({}, SYSTEM: {})", device_path, getLastError());

    if(ioctl(_handle, USBDEVFS_CLAIMINTERFACE, &_interface) < 0)
    {
        auto error = getLastError();
        ::close(_handle);
        throw_line("unable to claim device interface ({}, interface: {}, SYSTEM: {})", device_path, _interface, error);
    }
}


USBDevice::~USBDevice()
{
    if(ioctl(_handle, USBDEVFS_RELEASEINTERFACE, &_interface) < 0)
        LOG("warning: unable to release device interface (SYSTEM: {})", getLastError());

    if(::close(_handle))
        LOG("warning: unable to close device (SYSTEM: {})", getLastError());
}


uint32_t USBDevice::controlIn(uint8_t request_type, uint8_t request, uint16_t value, uint16_t index, uint8_t *data, uint16_t length)
{
    usbdevfs_ctrltransfer ctrl = {};
    ctrl.bRequestType = request_type;
    ctrl.bRequest = request;
    ctrl.wValue = value;
    ctrl.wIndex = index;
    ctrl.wLength = length;
    ctrl.timeout = _timeout;
    ctrl.data = data;

    int result = ioctl(_handle, USBDEVFS_CONTROL, &ctrl);
    if(result < 0)
        throw_line("control transfer failed (request: {:02X}, SYSTEM: {})", request, getLastError());

    return result;
}


void USBDevice::controlOut(uint8_t request_type, uint8_t request, uint16_t value, uint16_t index, const uint8_t *data, uint16_t length)
{
    usbdevfs_ctrltransfer ctrl = {};
    ctrl.bRequestType = request_type;
    ctrl.bRequest = request;
    ctrl.wValue = value;
    ctrl.wIndex = index;
    ctrl.wLength = length;
    ctrl.timeout = _timeout;
    ctrl.data = const_cast<uint8_t *>(data);

    int result = ioctl(_handle, USBDEVFS_CONTROL, &ctrl);
    if(result < 0)
        throw_line("control transfer failed (request: {:02X}, SYSTEM: {})", request, getLastError());
    if((uint32_t)result != length)
        throw_line("control transfer incomplete (request: {:02X}, sent: {}, expected: {})", request, result, length);
}


void USBDevice::bulkOut(uint8_t endpoint, const uint8_t *data, uint32_t length)
{
    usbdevfs_bulktransfer bulk = {};
    bulk.ep = endpoint;
    bulk.len = length;
    bulk.timeout = _timeout;
    bulk.data = const_cast<uint8_t *>(data);

    int result = ioctl(_handle, USBDEVFS_BULK, &bulk);
    if(result < 0)
        throw_line("bulk transfer failed (endpoint: {:02X}, SYSTEM: {})", endpoint, getLastError());
    if((uint32_t)result != length)
        throw_line("bulk transfer incomplete (endpoint: {:02X}, sent: {}, expected: {})", endpoint, result, length);
}


std::string USBDevice::getLastError()
{
    return std::strerror(errno);
}

}
