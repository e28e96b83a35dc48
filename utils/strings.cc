#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include "utils/throw_line.hh"
#include "utils/strings.hh"



namespace mdlink
{

void trim_inplace(std::string &s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); }));
}


std::string trim(std::string s)
{
    trim_inplace(s);
    return s;
}


std::string str_uppercase(const std::string &s)
{
    std::string str_uc;
    std::transform(s.begin(), s.end(), std::back_inserter(str_uc), [](unsigned char c) { return (char)std::toupper(c); });

    return str_uc;
}


std::string str_quoted_if_space(const std::string &s)
{
    const std::string quote("\"");

    return s.find(' ') == std::string::npos ? s : quote + s + quote;
}


std::optional<uint64_t> str_to_uint64(const std::string &str)
{
    uint64_t value = 0;

    bool valid = false;
    for(auto c : str)
    {
        if(std::isdigit((unsigned char)c))
        {
            uint64_t digit = c - '0';
            if(value > (std::numeric_limits<uint64_t>::max() - digit) / 10)
            {
                valid = false;
                break;
            }

            value = value * 10 + digit;
            valid = true;
        }
        else
        {
            valid = false;
            break;
        }
    }

    return valid ? std::make_optional(value) : std::nullopt;
}


// sysfs exposes USB ids as bare hexadecimal digits without prefix
std::optional<uint64_t> str_hex_to_uint64(const std::string &str)
{
    uint64_t value = 0;

    bool valid = false;
    for(auto c : str)
    {
        uint8_t base;
        if(c >= '0' && c <= '9')
            base = '0';
        else if(c >= 'a' && c <= 'f')
            base = 'a' - 0x0A;
        else if(c >= 'A' && c <= 'F')
            base = 'A' - 0x0A;
        else
        {
            valid = false;
            break;
        }

        if(value >> 60)
        {
            valid = false;
            break;
        }

        value = value << 4 | (uint8_t)(c - base);
        valid = true;
    }

    return valid ? std::make_optional(value) : std::nullopt;
}


int64_t str_to_int(const std::string &str)
{
    if(str.empty())
        throw_line("string is not an integer number ({})", str);

    int64_t negative = 1;
    auto s = str;
    if(s.front() == '+')
        s.erase(s.begin());
    else if(s.front() == '-')
    {
        negative = -1;
        s.erase(s.begin());
    }

    auto value = str_to_uint64(s);
    if(!value)
        throw_line("string is not an integer number ({})", str);

    // magnitude limit is one higher for negative numbers
    if(*value > (uint64_t)std::numeric_limits<int64_t>::max() + (negative < 0 ? 1 : 0))
        throw_line("integer number is out of range ({})", str);

    return negative < 0 ? (int64_t)(0 - *value) : (int64_t)*value;
}

}
