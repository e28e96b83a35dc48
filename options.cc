#include <limits>
#include <string>
#include "netmd/netmd.hh"
#include "usb/usb.hh"
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "options.hh"



namespace mdlink
{

Options::Options(int argc, const char *argv[])
    : help(false)
    , version(false)
    , verbose(false)
    , sysfs("/sys")
    , poll_retries(NetMD::DEFAULT_POLL_RETRIES)
    , timeout(USBDevice::DEFAULT_TIMEOUT)
    , factory(false)
{
    for(int i = 1; i < argc; ++i)
        arguments += str_quoted_if_space(argv[i]) + " ";
    if(!arguments.empty())
        arguments.pop_back();

    std::string *s_value = nullptr;
    int *i_value = nullptr;
    for(int i = 1; i < argc; ++i)
    {
        std::string o(argv[i]);

        // option
        if(o[0] == '-')
        {
            std::string key;
            auto value_pos = o.find("=");
            if(value_pos == std::string::npos)
            {
                key = o;
                o.clear();
            }
            else
            {
                key = std::string(o, 0, value_pos);
                o = std::string(o, value_pos + 1);
            }

            if(s_value == nullptr && i_value == nullptr)
            {
                if(key == "--help" || key == "-h")
                    help = true;
                else if(key == "--version")
                    version = true;
                else if(key == "--verbose")
                    verbose = true;
                else if(key == "--device")
                    s_value = &device;
                else if(key == "--log-path")
                    s_value = &log_path;
                else if(key == "--sysfs")
                    s_value = &sysfs;
                else if(key == "--poll-retries")
                    i_value = &poll_retries;
                else if(key == "--timeout")
                    i_value = &timeout;
                else if(key == "--bytes")
                    s_value = &bytes;
                else if(key == "--bulk")
                    s_value = &bulk;
                else if(key == "--factory")
                    factory = true;
                // unknown option
                else
                {
                    throw_line("unknown option ({})", key);
                }
            }
            else
                throw_line("option value expected ({})", argv[i - 1]);
        }

        if(!o.empty())
        {
            if(s_value != nullptr)
            {
                *s_value = o;
                s_value = nullptr;
            }
            else if(i_value != nullptr)
            {
                auto value = str_to_int(o);
                if(value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
                    throw_line("option value is out of range ({})", argv[i]);
                *i_value = (int)value;
                i_value = nullptr;
            }
            else
            {
                if(command.empty())
                    command = o;
                else
                    throw_line("command already provided ({})", command);
            }
        }
    }

    if(s_value != nullptr || i_value != nullptr)
        throw_line("option value expected ({})", argv[argc - 1]);

    if(poll_retries <= 0)
        throw_line("poll retries must be positive ({})", poll_retries);
    if(timeout <= 0)
        throw_line("timeout must be positive ({})", timeout);
}


void Options::printUsage()
{
    LOG("usage: mdlink [command] [options]");
    LOG("");

    LOG("COMMANDS:");
    LOG("\tdevices \tlists attached NetMD devices (default)");
    LOG("\tprobe   \topens the device and checks that it answers the reply poll");
    LOG("\traw     \tsends raw command bytes, prints the reply, optionally writes bulk data");
    LOG("");

    LOG("OPTIONS:");
    LOG("\t(general)");
    LOG("\t--help,-h           \tprint usage");
    LOG("\t--version           \tprint version");
    LOG("\t--verbose           \tverbose output");
    LOG("\t--log-path=VALUE    \tlog file, console only if not provided");
    LOG("");
    LOG("\t(device)");
    LOG("\t--device=BUS:ADDRESS\tdevice to use, first attached NetMD device if not provided");
    LOG("\t--sysfs=VALUE       \tsysfs mount point used for device discovery (default: {})", sysfs);
    LOG("\t--poll-retries=VALUE\tnumber of reply polls before giving up (default: {})", poll_retries);
    LOG("\t--timeout=VALUE     \tUSB transfer timeout in milliseconds (default: {})", timeout);
    LOG("");
    LOG("\t(raw)");
    LOG("\t--bytes=HEX         \tcommand bytes to send");
    LOG("\t--bulk=HEX          \tdata written to the bulk endpoint after the reply");
    LOG("\t--factory           \tuse factory mode requests");
}

}
