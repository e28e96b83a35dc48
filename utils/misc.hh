#pragma once



#include <map>
#include <string>
#include "utils/throw_line.hh"



namespace mdlink
{

template<typename T>
std::string dictionary_values(const std::map<T, std::string> &dictionary)
{
    std::string values;

    std::string delimiter;
    for(auto &d : dictionary)
    {
        values += delimiter + d.second;
        if(delimiter.empty())
            delimiter = ", ";
    }

    return values;
}


template<typename T>
std::string enum_to_string(T value, const std::map<T, std::string> &dictionary)
{
    auto it = dictionary.find(value);
    if(it == dictionary.end())
        throw_line("enum_to_string failed, no such value in dictionary (possible values: {})", dictionary_values(dictionary));

    return it->second;
}


// lenient variant for values reported by the device, firmware may return codes outside of the known set
template<typename T>
std::string enum_to_string_or(T value, const std::map<T, std::string> &dictionary, const std::string &fallback)
{
    auto it = dictionary.find(value);
    return it == dictionary.end() ? fallback : it->second;
}


std::string system_date_time(std::string fmt);

}
