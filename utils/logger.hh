#pragma once



#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>



namespace mdlink
{

class Logger
{
public:
    static Logger &get();

    Logger &setFile(const std::filesystem::path &log_path);


    template<typename... Args>
    Logger &log(bool file, fmt::format_string<Args...> fmt_str, Args &&... args)
    {
        auto message = fmt::format(fmt_str, std::forward<Args>(args)...);

        std::cout << message;

        if(file && _fs.is_open())
            _fs << message;

        return *this;
    }


    Logger &lineFeed(bool file);

private:
    static constexpr unsigned int _LINE_WIDTH = 80;

    static Logger _logger;

    std::fstream _fs;
};


// log message followed by a new line (console & file)
template<typename... Args>
void LOG(fmt::format_string<Args...> fmt_str, Args &&... args)
{
    Logger::get().log(true, fmt_str, std::forward<Args>(args)...).lineFeed(true);
}


// log message followed by a new line (console only)
template<typename... Args>
void LOGC(fmt::format_string<Args...> fmt_str, Args &&... args)
{
    Logger::get().log(false, fmt_str, std::forward<Args>(args)...).lineFeed(false);
}

}
