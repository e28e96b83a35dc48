#include <map>
#include <string>
#include "netmd/interface.hh"



namespace mdlink
{

const std::map<Encoding, std::string> ENCODING_STRING = {
    { Encoding::SP,  "sp"  },
    { Encoding::LP2, "lp2" },
    { Encoding::LP4, "lp4" }
};


const std::map<Channels, std::string> CHANNELS_STRING = {
    { Channels::MONO,   "mono"   },
    { Channels::STEREO, "stereo" }
};


const std::map<TrackFlag, std::string> TRACK_FLAG_STRING = {
    { TrackFlag::PROTECTED,   "protected"   },
    { TrackFlag::UNPROTECTED, "unprotected" }
};


uint32_t time_to_frames(const Time &time)
{
    return ((time.h * 60 + time.m) * 60 + time.s) * FRAMES_PER_SECOND + time.f;
}

}
