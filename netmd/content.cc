#include <cstdint>
#include <fmt/format.h>
#include <set>
#include <string>
#include <vector>
#include "utils/logger.hh"
#include "utils/misc.hh"
#include "utils/throw_line.hh"
#include "netmd/content.hh"



namespace mdlink
{

static void validate_track_groups(const std::vector<TrackGroup> &track_groups, uint16_t track_count)
{
    std::set<uint16_t> tracks;

    for(uint32_t i = 0; i < track_groups.size(); ++i)
    {
        for(auto t : track_groups[i].tracks)
        {
            if(t >= track_count)
                throw_line("track group list references nonexistent track (group: {}, track: {}, track count: {})", i, t, track_count);

            if(!tracks.insert(t).second)
                throw_line("track group list references track more than once (group: {}, track: {})", i, t);
        }
    }

    if(tracks.size() != track_count)
        throw_line("track group list is incomplete (grouped: {}, track count: {})", tracks.size(), track_count);
}


static Track read_track(Interface &iface, uint16_t index)
{
    Track track;

    track.index = index;
    track.title = iface.getTrackTitle(index);
    auto [encoding, channel] = iface.getTrackEncoding(index);
    track.encoding = encoding;
    track.channel = channel;
    track.duration = time_to_frames(iface.getTrackLength(index));
    track.protection = iface.getTrackFlags(index);

    return track;
}


Disc list_content(Interface &iface)
{
    Disc disc;

    auto flags = iface.getDiscFlags();
    disc.title = iface.getDiscTitle();
    auto capacity = iface.getDiscCapacity();
    disc.track_count = iface.getTrackCount();

    disc.writable = flags & (uint8_t)DiscFlag::WRITABLE;
    disc.write_protected = flags & (uint8_t)DiscFlag::WRITE_PROTECTED;
    disc.used = time_to_frames(capacity.used);
    disc.left = time_to_frames(capacity.left);
    disc.total = time_to_frames(capacity.total);

    auto track_groups = iface.getTrackGroupList();
    validate_track_groups(track_groups, disc.track_count);

    for(uint32_t i = 0; i < track_groups.size(); ++i)
    {
        Group group;
        group.index = i;
        group.title = track_groups[i].name;

        for(auto t : track_groups[i].tracks)
            group.tracks.push_back(read_track(iface, t));

        disc.groups.push_back(group);
    }

    return disc;
}


uint32_t count_tracks_in_disc(const Disc &disc)
{
    uint32_t count = 0;

    for(auto const &g : disc.groups)
        count += g.tracks.size();

    return count;
}


std::vector<Track> get_tracks(const Disc &disc)
{
    std::vector<Track> tracks;

    for(auto const &g : disc.groups)
        tracks.insert(tracks.end(), g.tracks.begin(), g.tracks.end());

    return tracks;
}


static std::string frames_string(uint32_t frames)
{
    uint32_t f = frames % FRAMES_PER_SECOND;
    frames /= FRAMES_PER_SECOND;

    return fmt::format("{:02}:{:02}:{:02}.{:02}", frames / 3600, frames / 60 % 60, frames % 60, f);
}


void disc_print(const Disc &disc)
{
    LOG("disc: {}", disc.title.empty() ? "<no title>" : disc.title);
    LOG("  writable: {}, write protected: {}", disc.writable ? "yes" : "no", disc.write_protected ? "yes" : "no");
    LOG("  capacity: used {}, left {}, total {}", frames_string(disc.used), frames_string(disc.left), frames_string(disc.total));
    LOG("  tracks: {}", disc.track_count);

    for(auto const &g : disc.groups)
    {
        LOG("  group {}: {}", g.index, g.title ? *g.title : "<ungrouped>");

        for(auto const &t : g.tracks)
        {
            LOG("    {:03}: {} [{}, {}, {}, {}]", t.index + 1, t.title ? *t.title : "<no title>", frames_string(t.duration),
                enum_to_string_or(t.encoding, ENCODING_STRING, "unknown"), enum_to_string_or(t.channel, CHANNELS_STRING, "unknown"),
                enum_to_string_or(t.protection, TRACK_FLAG_STRING, "unknown"));
        }
    }
}

}
