#pragma once



#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "netmd/interface.hh"



namespace mdlink
{

struct Track
{
    uint16_t index;
    std::optional<std::string> title;
    uint32_t duration;
    Channels channel;
    Encoding encoding;
    TrackFlag protection;
};


struct Group
{
    uint32_t index;
    std::optional<std::string> title;
    std::vector<Track> tracks;
};


// snapshot of the loaded disc, capacities and durations are in frames
struct Disc
{
    std::string title;
    bool writable;
    bool write_protected;
    uint32_t used;
    uint32_t left;
    uint32_t total;
    uint16_t track_count;
    std::vector<Group> groups;
};


Disc list_content(Interface &iface);
uint32_t count_tracks_in_disc(const Disc &disc);
std::vector<Track> get_tracks(const Disc &disc);
void disc_print(const Disc &disc);

}
