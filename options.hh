#pragma once



#include <string>



namespace mdlink
{

struct Options
{
    std::string command;
    std::string arguments;

    bool help;
    bool version;
    bool verbose;

    std::string device;
    std::string log_path;
    std::string sysfs;
    int poll_retries;
    int timeout;

    std::string bytes;
    std::string bulk;
    bool factory;

    Options(int argc, const char *argv[]);

    void printUsage();
};

}
