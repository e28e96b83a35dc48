#pragma once



#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "netmd/interface.hh"



namespace mdlink
{

enum class OperatingState
{
    READY,
    PLAYING,
    FAST_FORWARD,
    REWIND,
    READING_TOC,
    UNKNOWN
};

extern const std::map<OperatingState, std::string> OPERATING_STATE_STRING;


struct DeviceStatus
{
    struct TimeMSF
    {
        uint32_t minute;
        uint32_t second;
        uint32_t frame;
    };

    bool disc_present;
    OperatingState state;
    std::optional<uint32_t> track;
    std::optional<TimeMSF> time;
};


OperatingState operating_state(uint16_t operating_status);
DeviceStatus decode_status(const std::vector<uint8_t> &status, const std::vector<uint8_t> &playback_status2, const std::optional<Position> &position);
DeviceStatus get_device_status(Interface &iface);
void status_print(const DeviceStatus &status);

}
