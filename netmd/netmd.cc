#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "utils/throw_line.hh"
#include "netmd/netmd.hh"



namespace mdlink
{

// clang-format off
static const std::vector<DeviceId> DEVICE_IDS =
{
    { 0x04dd, 0x7202, "Sharp IM-MT880H/MT899H"    },
    { 0x04dd, 0x9013, "Sharp IM-DR400/DR410"      },
    { 0x04dd, 0x9014, "Sharp IM-DR80/DR420/DR580" },
    { 0x054c, 0x0075, "Sony MZ-N1"                },
    { 0x054c, 0x0080, "Sony LAM-1"                },
    { 0x054c, 0x0081, "Sony MDS-JB980/MDS-NT1"    },
    { 0x054c, 0x0084, "Sony MZ-N505"              },
    { 0x054c, 0x0085, "Sony MZ-S1"                },
    { 0x054c, 0x0086, "Sony MZ-N707"              },
    { 0x054c, 0x008e, "Sony CMT-C7NT"             },
    { 0x054c, 0x0097, "Sony PCGA-MDN1"            },
    { 0x054c, 0x00ad, "Sony CMT-L7HD"             },
    { 0x054c, 0x00c6, "Sony MZ-N10"               },
    { 0x054c, 0x00c7, "Sony MZ-N910"              },
    { 0x054c, 0x00c8, "Sony MZ-N710/NF810"        },
    { 0x054c, 0x00c9, "Sony MZ-N510/N610"         },
    { 0x054c, 0x00ca, "Sony MZ-NE410/NF520D"      },
    { 0x054c, 0x00eb, "Sony MZ-NE810/NE910"       },
    { 0x054c, 0x0101, "Sony LAM-10"               },
    { 0x054c, 0x0113, "Aiwa AM-NX1"               },
    { 0x054c, 0x014c, "Aiwa AM-NX9"               },
    { 0x054c, 0x017e, "Sony MZ-NH1"               },
    { 0x054c, 0x0180, "Sony MZ-NH3D"              },
    { 0x054c, 0x0182, "Sony MZ-NH900"             },
    { 0x054c, 0x0184, "Sony MZ-NH700/NH800"       },
    { 0x054c, 0x0186, "Sony MZ-NH600"             },
    { 0x054c, 0x0187, "Sony MZ-NH600D"            },
    { 0x054c, 0x0188, "Sony MZ-N920"              },
    { 0x054c, 0x018a, "Sony LAM-3"                },
    { 0x054c, 0x01e9, "Sony MZ-DH10P"             },
    { 0x054c, 0x0219, "Sony MZ-RH10"              },
    { 0x054c, 0x021b, "Sony MZ-RH710/MZ-RH910"    },
    { 0x054c, 0x021d, "Sony CMT-AH10"             },
    { 0x054c, 0x022c, "Sony CMT-AH10"             },
    { 0x054c, 0x023c, "Sony DS-HMD1"              },
    { 0x054c, 0x0286, "Sony MZ-RH1"               },
    { 0x04da, 0x23b3, "Panasonic SJ-MR250"        },
    { 0x04da, 0x23b6, "Panasonic SJ-MR270"        }
};
// clang-format on


std::optional<DeviceId> netmd_device_lookup(uint16_t vendor_id, uint16_t product_id)
{
    auto it = std::find_if(DEVICE_IDS.begin(), DEVICE_IDS.end(), [=](const DeviceId &d) { return d.vendor_id == vendor_id && d.product_id == product_id; });
    return it == DEVICE_IDS.end() ? std::nullopt : std::make_optional(*it);
}


std::vector<USBDeviceInfo> netmd_list_devices(const std::filesystem::path &sysfs_root)
{
    std::vector<USBDeviceInfo> devices;

    for(auto const &d : usb_list_devices(sysfs_root))
        if(netmd_device_lookup(d.vendor_id, d.product_id))
            devices.push_back(d);

    std::sort(devices.begin(), devices.end(), [](const USBDeviceInfo &a, const USBDeviceInfo &b) { return a.bus < b.bus || (a.bus == b.bus && a.address < b.address); });

    return devices;
}


NetMD::NetMD(const std::string &device_path, uint32_t poll_retries, uint32_t timeout)
    : _device(device_path, 0, timeout)
    , _pollRetries(poll_retries)
{
    ;
}


uint32_t NetMD::replyLength()
{
    uint8_t poll[_POLL_SIZE] = {};
    auto size = _device.controlIn(USBDevice::VENDOR_INTERFACE_IN, (uint8_t)Request::POLL, 0, 0, poll, sizeof(poll));
    if(size != sizeof(poll))
        throw_line("unexpected poll reply size (size: {})", size);

    return poll[2];
}


void NetMD::sendCommand(const std::vector<uint8_t> &command, bool factory)
{
    // poll first, the device discards a stale reply this way
    replyLength();

    _device.controlOut(USBDevice::VENDOR_INTERFACE_OUT, (uint8_t)(factory ? Request::FACTORY : Request::COMMAND), 0, 0, command.data(), command.size());
}


std::vector<uint8_t> NetMD::readReply(bool factory)
{
    uint32_t length = 0;
    for(uint32_t i = 0; !length; ++i)
    {
        if(i == _pollRetries)
            throw_line("device reply timeout (poll retries: {})", _pollRetries);

        length = replyLength();
        if(!length)
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(10 * (i + 1), 100U)));
    }

    std::vector<uint8_t> reply(length);
    auto size = _device.controlIn(USBDevice::VENDOR_INTERFACE_IN, (uint8_t)(factory ? Request::FACTORY : Request::REPLY), 0, 0, reply.data(), reply.size());
    reply.resize(size);

    return reply;
}


void NetMD::writeBulk(const std::vector<uint8_t> &data)
{
    _device.bulkOut(_BULK_OUT_ENDPOINT, data.data(), data.size());
}

}
