#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include "netmd/netmd.hh"
#include "usb/usb.hh"
#include "utils/hex_bin.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "mdlink.hh"



#define XSTRINGIFY(arg__) STRINGIFY(arg__)
#define STRINGIFY(arg__) #arg__



namespace mdlink
{

struct Context
{
    USBDeviceInfo device;
    std::shared_ptr<NetMD> netmd;
};


std::string mdlink_version()
{
    return fmt::format("mdlink (build: {})", XSTRINGIFY(MDLINK_VERSION_BUILD));
}


static std::string device_string(const USBDeviceInfo &d)
{
    auto id = netmd_device_lookup(d.vendor_id, d.product_id);

    return fmt::format("{:03}:{:03} [{:04x}:{:04x}] {}", d.bus, d.address, d.vendor_id, d.product_id, id ? id->name : d.product);
}


USBDeviceInfo mdlink_select_device(const Options &options)
{
    auto devices = netmd_list_devices(options.sysfs);

    if(options.device.empty())
    {
        if(devices.empty())
            throw_line("no NetMD devices detected on the system");

        return devices.front();
    }

    auto delimiter = options.device.find(':');
    if(delimiter == std::string::npos)
        throw_line("malformed device address, BUS:ADDRESS expected ({})", options.device);

    auto bus = str_to_uint64(options.device.substr(0, delimiter));
    auto address = str_to_uint64(options.device.substr(delimiter + 1));
    if(!bus || !address)
        throw_line("malformed device address, BUS:ADDRESS expected ({})", options.device);

    auto it = std::find_if(devices.begin(), devices.end(), [&](const USBDeviceInfo &d) { return d.bus == *bus && d.address == *address; });
    if(it == devices.end())
        throw_line("NetMD device not found ({})", options.device);

    return *it;
}


void mdlink_print_devices(const Options &options)
{
    auto devices = netmd_list_devices(options.sysfs);
    if(devices.empty())
    {
        LOG("no NetMD devices detected");
        return;
    }

    LOG("NetMD devices:");
    for(auto const &d : devices)
    {
        LOG("  {}", device_string(d));
        if(options.verbose)
            LOGC("    manufacturer: {}, product: {}, path: {}", d.manufacturer, d.product, usb_device_path(d));
    }
}


int mdlink_devices(Context &, Options &options)
{
    mdlink_print_devices(options);

    return 0;
}


int mdlink_probe(Context &ctx, Options &)
{
    auto length = ctx.netmd->replyLength();
    if(length)
        LOG("device answers, pending reply discarded (length: {})", length);
    else
        LOG("device answers, no pending reply");

    return 0;
}


int mdlink_raw(Context &ctx, Options &options)
{
    if(options.bytes.empty())
        throw_line("command bytes are not provided");

    auto command = hex2bin(options.bytes);
    auto bulk = hex2bin(options.bulk);

    ctx.netmd->sendCommand(command, options.factory);
    auto reply = ctx.netmd->readReply(options.factory);
    LOG("reply: {}", bin2hex(reply));

    if(!bulk.empty())
    {
        ctx.netmd->writeBulk(bulk);
        LOG("bulk: {} bytes written", bulk.size());
    }

    return 0;
}


struct Command
{
    using Handler = int (*)(Context &, Options &);

    bool device_required;
    Handler handler;
};


const std::map<std::string, Command> COMMANDS{
    // NAME        DEVICE HANDLER
    { "devices", { false, mdlink_devices } },
    { "probe",   { true, mdlink_probe }    },
    { "raw",     { true, mdlink_raw }      }
};


int mdlink(Options &options)
{
    if(!options.log_path.empty())
        Logger::get().setFile(options.log_path);

    auto command = options.command.empty() ? std::string("devices") : options.command;

    auto it = COMMANDS.find(command);
    if(it == COMMANDS.end())
        throw_line("unknown command (command: {})", command);

    if(options.verbose)
    {
        LOG("{}", mdlink_version());
        if(!options.arguments.empty())
            LOG("arguments: {}", options.arguments);
        LOG("");
    }

    Context ctx;

    if(it->second.device_required)
    {
        ctx.device = mdlink_select_device(options);
        LOG("device: {}", device_string(ctx.device));

        ctx.netmd = std::make_shared<NetMD>(usb_device_path(ctx.device), options.poll_retries, options.timeout);
    }

    if(options.verbose)
        LOG("*** {}", str_uppercase(command));

    return it->second.handler(ctx, options);
}

}
