#pragma once



#include <cstdint>
#include <string>
#include <vector>



namespace mdlink
{

// whitespace between bytes is allowed ("00 18 06"), throws on anything else
std::vector<uint8_t> hex2bin(const std::string &hex_string);
std::string bin2hex(const std::vector<uint8_t> &data);

}
