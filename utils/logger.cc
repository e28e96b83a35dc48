#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>
#include "utils/misc.hh"
#include "utils/throw_line.hh"
#include "utils/logger.hh"



namespace mdlink
{

Logger Logger::_logger;


Logger &Logger::get()
{
    return _logger;
}


Logger &Logger::setFile(const std::filesystem::path &log_path)
{
    if(_fs.is_open())
        _fs.close();

    auto pp = log_path.parent_path();
    if(!pp.empty())
        std::filesystem::create_directories(pp);

    bool nl = false;
    if(std::filesystem::exists(log_path))
        nl = true;

    _fs.open(log_path, std::fstream::out | std::fstream::app);
    if(_fs.fail())
        throw_line("unable to open file ({})", log_path.filename().string());

    if(nl)
        _fs << std::endl;

    auto dt = system_date_time(" %F %T ");
    _fs << fmt::format("{}{}{}", std::string(3, '='), dt, std::string(_LINE_WIDTH - 3 - dt.length(), '=')) << std::endl;

    return *this;
}


Logger &Logger::lineFeed(bool file)
{
    std::cout << std::endl;
    if(file && _fs.is_open())
        _fs << std::endl;

    return *this;
}

}
