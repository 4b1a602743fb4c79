#include "Log.hpp"
#include <iostream>

namespace atomrt::util {

void Log::d_([[maybe_unused]] std::string_view tag, [[maybe_unused]] std::string_view msg) {
#ifndef NDEBUG
    std::cout << "[" << tag << "/D]: " << msg << std::endl;
#endif
}

void Log::w_(std::string_view tag, std::string_view msg) {
    std::cout << "[" << tag << "/W]: " << msg << std::endl;
}

void Log::i_(std::string_view tag, std::string_view msg) {
    std::cout << "[" << tag << "/I]: " << msg << std::endl;
}

void Log::e_(std::string_view tag, std::string_view msg) {
    std::cerr << "[" << tag << "/E]: " << msg << std::endl;
}

}
