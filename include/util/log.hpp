#pragma once
#ifndef HPL_UTIL_LOG_HPP
#define HPL_UTIL_LOG_HPP

#include <iostream>

namespace hpl {

    #ifdef ENABLE_DEBUG_PRINTING
        #define DEBUG(X) { std::cout << X; }
    #else
        #define DEBUG(X) {}
    #endif

    #define INFO(X) { std::cout << X; }

    #define WARNING(X) { std::cerr << "WARNING: " << X; }

    #define ERROR(X) { std::cerr << "ERROR: " << X; }

} // namespace hpl

#endif //HPL_UTIL_LOG_HPP
