#pragma once



#include <fmt/format.h>
#include <stdexcept>



#ifdef NDEBUG
#define throw_line(...) throw std::runtime_error(fmt::format(__VA_ARGS__))
#else
#define throw_line(...) throw std::runtime_error(fmt::format("{} {{{}:{}}}", fmt::format(__VA_ARGS__), __FILE__, __LINE__))
#endif
