#include <exception>
#include <fmt/format.h>
#include <functional>
#include <string>
#include <vector>
#include "utils/logger.hh"
#include "utils/throw_line.hh"
#include "utils/unique_resource.hh"
#include "netmd/download.hh"



namespace mdlink
{

static void clear_stale_session(Interface &iface)
{
    // best effort: a previous run may have died mid-session leaving the session key or the
    // secure session itself open on the device, if there is nothing to finalize the device
    // rejects these commands
    try
    {
        iface.sessionKeyForget();
    }
    catch(const std::exception &e)
    {
        LOG("warning: unable to forget stale session key, ignoring ({})", e.what());
    }

    try
    {
        iface.leaveSecureSession();
    }
    catch(const std::exception &e)
    {
        LOG("warning: unable to leave stale secure session, ignoring ({})", e.what());
    }
}


DownloadResult download(Interface &iface, const KeyBlockSource &key_block_source, Payload &payload, const ProgressCallback &progress_callback,
    const std::function<bool()> &interrupt)
{
    if(!payload.totalSize())
        throw_line("track payload is empty");

    auto interrupted = [&interrupt]() { return interrupt && interrupt(); };

    clear_stale_session(iface);

    if(interrupted())
        throw_line("track transfer interrupted before acquiring the device");

    std::vector<std::string> teardown_errors;

    iface.acquire();
    auto control = make_unique_resource(&iface, [&teardown_errors](Interface *i) {
        try
        {
            i->release();
        }
        catch(const std::exception &e)
        {
            LOG("warning: unable to release exclusive control ({})", e.what());
            teardown_errors.emplace_back(fmt::format("release: {}", e.what()));
        }
    });

    // best effort: some firmware (Sharp) doesn't implement this command, new tracks
    // then keep the device default protection which doesn't affect the transfer
    try
    {
        iface.disableNewTrackProtection(1);
    }
    catch(const std::exception &e)
    {
        LOG("warning: unable to disable new track protection, ignoring ({})", e.what());
    }

    SecureSession session(iface, key_block_source);
    auto session_guard = make_unique_resource(&session, [&teardown_errors](SecureSession *s) {
        try
        {
            s->close();
        }
        catch(const std::exception &e)
        {
            LOG("warning: unable to close secure session ({})", e.what());
            teardown_errors.emplace_back(fmt::format("close: {}", e.what()));
        }
    });

    if(interrupted())
        throw_line("track transfer interrupted before session setup");

    session.init();
    auto commit = session.downloadTrack(payload, progress_callback, interrupt);

    // close, then release
    session_guard.reset();
    control.reset();

    // the track is already committed, the interrupt still has to reach the caller
    if(interrupted())
        throw_line("track transfer interrupted after commit (track: {})", commit.track);

    DownloadResult result;
    result.track = commit.track;
    result.uuid = commit.uuid;
    result.ccid = commit.ccid;
    result.teardown_errors = teardown_errors;

    return result;
}

}
