#include <cstdint>
#include <exception>
#include <functional>
#include <random>
#include <vector>
#include "utils/logger.hh"
#include "utils/throw_line.hh"
#include "netmd/session.hh"



namespace mdlink
{

SecureSession::SecureSession(Interface &iface, const KeyBlockSource &key_block_source)
    : _iface(iface)
    , _keyBlockSource(key_block_source)
    , _state(State::UNINITIALIZED)
    , _entered(false)
{
    ;
}


SecureSession::~SecureSession()
{
    try
    {
        close();
    }
    catch(const std::exception &e)
    {
        LOG("warning: unable to close secure session ({})", e.what());
    }
}


void SecureSession::init()
{
    if(_state != State::UNINITIALIZED)
        throw_line("secure session can't be reinitialized");

    _iface.enterSecureSession();
    _entered = true;

    _iface.sendKeyData(_keyBlockSource.id(), _keyBlockSource.chain(), _keyBlockSource.depth(), _keyBlockSource.signature());

    auto host_nonce = generateNonce();
    auto device_nonce = _iface.sessionKeyExchange(host_nonce);

    _sessionKey = _keyBlockSource.deriveSessionKey(host_nonce, device_nonce);
    _state = State::KEYED;
}


TrackCommit SecureSession::downloadTrack(Payload &payload, const ProgressCallback &progress_callback, const std::function<bool()> &interrupt)
{
    if(_state != State::KEYED)
        throw_line("secure session is not established");

    uint32_t total_bytes = payload.totalSize();
    if(!total_bytes)
        throw_line("track payload is empty");

    _iface.setupDownload(payload.contentId(), payload.keyEncryptionKey(), _sessionKey);
    _iface.beginTrackTransfer(payload.wireformat(), payload.discFormat(), payload.frameCount(), total_bytes);

    uint32_t written_bytes = 0;
    std::vector<uint8_t> packet;
    while(payload.nextPacket(packet))
    {
        if(interrupt && interrupt())
            throw_line("track transfer interrupted (written: {}, total: {})", written_bytes, total_bytes);

        // progress is reported strictly increasing
        if(packet.empty())
            continue;

        if(packet.size() > total_bytes - written_bytes)
            throw_line("track payload exceeds declared size (total: {})", total_bytes);

        _iface.sendTrackData(packet);
        written_bytes += packet.size();

        if(progress_callback)
            progress_callback(DownloadProgress{ written_bytes, total_bytes });
    }

    if(written_bytes != total_bytes)
        throw_line("track payload is shorter than declared size (written: {}, total: {})", written_bytes, total_bytes);

    auto commit = _iface.endTrackTransfer(_sessionKey);

    _iface.cacheTOC();
    _iface.setTrackTitle(commit.track, payload.title());
    _iface.syncTOC();
    _iface.commitTrack(commit.track, _sessionKey);

    return commit;
}


void SecureSession::close()
{
    if(_state == State::CLOSED)
        return;

    bool keyed = _state == State::KEYED;
    bool entered = _entered;

    // closing is attempted once, a failed close leaves nothing to retry
    _state = State::CLOSED;
    _entered = false;
    _sessionKey.clear();

    // attempt every step, report the first failure
    std::exception_ptr error;

    if(keyed)
    {
        try
        {
            _iface.sessionKeyForget();
        }
        catch(...)
        {
            error = std::current_exception();
        }
    }

    if(entered)
    {
        try
        {
            _iface.leaveSecureSession();
        }
        catch(...)
        {
            if(!error)
                error = std::current_exception();
        }
    }

    if(error)
        std::rethrow_exception(error);
}


SecureSession::State SecureSession::state() const
{
    return _state;
}


std::vector<uint8_t> SecureSession::generateNonce()
{
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> distribution(0, 0xFF);

    std::vector<uint8_t> nonce(_NONCE_SIZE);
    for(auto &n : nonce)
        n = (uint8_t)distribution(rd);

    return nonce;
}

}
