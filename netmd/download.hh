#pragma once



#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "netmd/interface.hh"
#include "netmd/key_block.hh"
#include "netmd/payload.hh"
#include "netmd/session.hh"



namespace mdlink
{

struct DownloadResult
{
    uint16_t track;
    std::vector<uint8_t> uuid;
    std::vector<uint8_t> ccid;

    // failures of the final close / release, the track itself was committed
    std::vector<std::string> teardown_errors;
};


// Transfers one track to the device:
//   1. clears leftover session state (best effort)
//   2. acquires exclusive control
//   3. disables new track protection (best effort)
//   4. establishes a secure session with the key block source
//   5. transfers the payload, reporting progress
//   6. closes the session and releases exclusive control
//
// An empty payload is rejected before any device command.
//
// Once exclusive control is acquired it is released exactly once on every exit path,
// and an initialized session is closed exactly once before that. If an earlier step
// fails, that error is the one propagated: close / release failures are only logged,
// releasing the device takes priority over reporting every error.
//
// interrupt is polled before acquiring, before the session setup, between packets and
// after teardown, a raised interrupt fails the download. The caller owns the signal
// handling (SignalINT), download() leaves process signal dispositions alone.
DownloadResult download(Interface &iface, const KeyBlockSource &key_block_source, Payload &payload, const ProgressCallback &progress_callback = nullptr,
    const std::function<bool()> &interrupt = nullptr);

}
