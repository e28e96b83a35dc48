#include <cctype>
#include <cstdint>
#include <string>
#include <vector>
#include "utils/throw_line.hh"
#include "utils/hex_bin.hh"



namespace mdlink
{

std::vector<uint8_t> hex2bin(const std::string &hex_string)
{
    std::vector<uint8_t> data;

    bool high = true;
    for(auto c : hex_string)
    {
        if(std::isspace((unsigned char)c))
        {
            if(!high)
                throw_line("odd number of hex digits in a byte ({})", hex_string);
            continue;
        }

        uint8_t base;
        if(c >= '0' && c <= '9')
            base = '0';
        else if(c >= 'a' && c <= 'f')
            base = 'a' - 0x0A;
        else if(c >= 'A' && c <= 'F')
            base = 'A' - 0x0A;
        else
            throw_line("invalid hex digit ({})", hex_string);

        uint8_t nibble = c - base;
        if(high)
            data.push_back(nibble << 4);
        else
            data.back() |= nibble;
        high = !high;
    }

    if(!high)
        throw_line("odd number of hex digits ({})", hex_string);

    return data;
}


std::string bin2hex(const std::vector<uint8_t> &data)
{
    std::string hex_string;

    for(auto b : data)
    {
        for(uint32_t k = 0; k < 2; ++k)
        {
            uint8_t c = b >> (k ? 0 : 4) & 0x0F;
            hex_string += c >= 0xA ? 'a' + c - 0xA : '0' + c;
        }
    }

    return hex_string;
}

}
