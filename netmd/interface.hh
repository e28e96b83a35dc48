#pragma once



#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>



namespace mdlink
{

// medium clock, 75 frames per second
constexpr uint32_t FRAMES_PER_SECOND = 75;

enum class DiscFlag : uint8_t
{
    WRITABLE        = 0x10,
    WRITE_PROTECTED = 0x40
};

enum class Encoding : uint8_t
{
    SP  = 0x90,
    LP2 = 0x92,
    LP4 = 0x93
};

enum class Channels : uint8_t
{
    STEREO = 0x00,
    MONO   = 0x01
};

enum class TrackFlag : uint8_t
{
    UNPROTECTED = 0x00,
    PROTECTED   = 0x03
};

enum class Wireformat : uint8_t
{
    PCM       = 0x00,
    L105KBPS  = 0x90,
    LP2       = 0x94,
    LP4       = 0xA8
};

extern const std::map<Encoding, std::string> ENCODING_STRING;
extern const std::map<Channels, std::string> CHANNELS_STRING;
extern const std::map<TrackFlag, std::string> TRACK_FLAG_STRING;


// device time value as reported by disc capacity and track length queries
struct Time
{
    uint32_t h;
    uint32_t m;
    uint32_t s;
    uint32_t f;
};

uint32_t time_to_frames(const Time &time);


// [track, index, minute, second, frame]
using Position = std::array<uint32_t, 5>;


struct TrackGroup
{
    std::optional<std::string> name;
    std::vector<uint16_t> tracks;
};


struct DiscCapacity
{
    Time used;
    Time total;
    Time left;
};


struct TrackCommit
{
    uint16_t track;
    std::vector<uint8_t> uuid;
    std::vector<uint8_t> ccid;
};


// device command set, one method per protocol command
// every method either returns the decoded device reply or throws
class Interface
{
public:
    virtual ~Interface() = default;

    // status
    virtual std::vector<uint8_t> getStatus() = 0;
    virtual std::vector<uint8_t> getPlaybackStatus2() = 0;
    virtual std::optional<Position> getPosition() = 0;

    // disc
    virtual uint8_t getDiscFlags() = 0;
    virtual std::string getDiscTitle() = 0;
    virtual DiscCapacity getDiscCapacity() = 0;
    virtual uint16_t getTrackCount() = 0;
    virtual std::vector<TrackGroup> getTrackGroupList() = 0;

    // track
    virtual std::optional<std::string> getTrackTitle(uint16_t track) = 0;
    virtual std::pair<Encoding, Channels> getTrackEncoding(uint16_t track) = 0;
    virtual Time getTrackLength(uint16_t track) = 0;
    virtual TrackFlag getTrackFlags(uint16_t track) = 0;

    // exclusive control
    virtual void acquire() = 0;
    virtual void release() = 0;
    virtual void disableNewTrackProtection(uint16_t value) = 0;

    // secure session
    virtual void enterSecureSession() = 0;
    virtual void leaveSecureSession() = 0;
    virtual void sendKeyData(uint32_t ekb_id, const std::vector<std::vector<uint8_t>> &key_chain, uint32_t depth, const std::vector<uint8_t> &signature) = 0;
    virtual std::vector<uint8_t> sessionKeyExchange(const std::vector<uint8_t> &host_nonce) = 0;
    virtual void sessionKeyForget() = 0;

    // track download
    virtual void setupDownload(const std::vector<uint8_t> &content_id, const std::vector<uint8_t> &key_encryption_key, const std::vector<uint8_t> &session_key) = 0;
    virtual void beginTrackTransfer(Wireformat wireformat, uint8_t disc_format, uint32_t frames, uint32_t total_bytes) = 0;
    virtual void sendTrackData(const std::vector<uint8_t> &packet) = 0;
    virtual TrackCommit endTrackTransfer(const std::vector<uint8_t> &session_key) = 0;
    virtual void commitTrack(uint16_t track, const std::vector<uint8_t> &session_key) = 0;

    // TOC
    virtual void cacheTOC() = 0;
    virtual void syncTOC() = 0;
    virtual void setTrackTitle(uint16_t track, const std::string &title) = 0;
};

}
