#pragma once



#include <cstdint>
#include <optional>
#include <string>



namespace mdlink
{

void trim_inplace(std::string &s);
std::string trim(std::string s);
std::string str_uppercase(const std::string &s);
std::string str_quoted_if_space(const std::string &s);

std::optional<uint64_t> str_to_uint64(const std::string &str);
std::optional<uint64_t> str_hex_to_uint64(const std::string &str);
int64_t str_to_int(const std::string &str);

}
