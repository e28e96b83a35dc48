#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "utils/logger.hh"
#include "utils/misc.hh"
#include "netmd/status.hh"



namespace mdlink
{

const std::map<OperatingState, std::string> OPERATING_STATE_STRING = {
    { OperatingState::READY,        "ready"       },
    { OperatingState::PLAYING,      "playing"     },
    { OperatingState::FAST_FORWARD, "fastForward" },
    { OperatingState::REWIND,       "rewind"      },
    { OperatingState::READING_TOC,  "readingTOC"  },
    { OperatingState::UNKNOWN,      "unknown"     }
};


static constexpr uint32_t STATUS_DISC_OFFSET = 4;
static constexpr uint8_t STATUS_DISC_PRESENT = 0x40;
static constexpr uint32_t PLAYBACK_STATUS_OFFSET = 4;


OperatingState operating_state(uint16_t operating_status)
{
    OperatingState state;

    switch(operating_status)
    {
    case 50687:
        state = OperatingState::READY;
        break;

    case 50037:
        state = OperatingState::PLAYING;
        break;

    case 49983:
        state = OperatingState::FAST_FORWARD;
        break;

    case 49999:
        state = OperatingState::REWIND;
        break;

    case 65315:
        state = OperatingState::READING_TOC;
        break;

    default:
        state = OperatingState::UNKNOWN;
    }

    return state;
}


DeviceStatus decode_status(const std::vector<uint8_t> &status, const std::vector<uint8_t> &playback_status2, const std::optional<Position> &position)
{
    DeviceStatus device_status;

    device_status.disc_present = status.size() > STATUS_DISC_OFFSET && status[STATUS_DISC_OFFSET] == STATUS_DISC_PRESENT;

    // big-endian operating status word, a truncated reply carries no state
    if(playback_status2.size() > PLAYBACK_STATUS_OFFSET + 1)
        device_status.state = operating_state((uint16_t)(playback_status2[PLAYBACK_STATUS_OFFSET] << 8 | playback_status2[PLAYBACK_STATUS_OFFSET + 1]));
    else
        device_status.state = OperatingState::UNKNOWN;

    // firmware keeps reporting playback after the disc was ejected
    if(device_status.state == OperatingState::PLAYING && !device_status.disc_present)
        device_status.state = OperatingState::READY;

    if(position)
    {
        auto const &p = *position;
        device_status.track = p[0];
        device_status.time = DeviceStatus::TimeMSF{ p[2], p[3], p[4] };
    }

    return device_status;
}


DeviceStatus get_device_status(Interface &iface)
{
    auto status = iface.getStatus();
    auto playback_status2 = iface.getPlaybackStatus2();
    auto position = iface.getPosition();

    return decode_status(status, playback_status2, position);
}


void status_print(const DeviceStatus &status)
{
    LOG("disc present: {}", status.disc_present ? "yes" : "no");
    LOG("state: {}", enum_to_string(status.state, OPERATING_STATE_STRING));
    if(status.track)
        LOG("track: {}", *status.track);
    if(status.time)
        LOG("time: {:02}:{:02}:{:02}", status.time->minute, status.time->second, status.time->frame);
}

}
