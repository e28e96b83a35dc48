#pragma once



#include <cstdint>
#include <functional>
#include <vector>
#include "netmd/interface.hh"
#include "netmd/key_block.hh"
#include "netmd/payload.hh"



namespace mdlink
{

struct DownloadProgress
{
    uint32_t written_bytes;
    uint32_t total_bytes;
};

// invoked synchronously on the transferring thread after every packet, must return promptly
using ProgressCallback = std::function<void(const DownloadProgress &)>;


// secure session bound to a key block source, one instance per download
// UNINITIALIZED -> KEYED -> CLOSED, a closed session can't be reopened
class SecureSession
{
public:
    enum class State
    {
        UNINITIALIZED,
        KEYED,
        CLOSED
    };

    SecureSession(Interface &iface, const KeyBlockSource &key_block_source);
    ~SecureSession();

    void init();
    TrackCommit downloadTrack(Payload &payload, const ProgressCallback &progress_callback, const std::function<bool()> &interrupt = nullptr);
    void close();

    State state() const;

    SecureSession(SecureSession const &) = delete;
    void operator=(SecureSession const &) = delete;

private:
    static constexpr uint32_t _NONCE_SIZE = 8;

    Interface &_iface;
    const KeyBlockSource &_keyBlockSource;

    State _state;
    bool _entered;
    std::vector<uint8_t> _sessionKey;

    static std::vector<uint8_t> generateNonce();
};

}
