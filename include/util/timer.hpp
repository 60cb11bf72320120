#pragma once
#ifndef HPL_UTIL_TIMER_HPP
#define HPL_UTIL_TIMER_HPP

#include <chrono>
#include <sstream>
#include <string>
#include "log.hpp"

namespace hpl {

    class Timer {
    private:
        std::string info;
        std::size_t counter;
        std::chrono::microseconds elapsed;

        [[nodiscard]] inline std::string ToString(const std::string& note) const {
            std::stringstream stream;
            stream << note << " '" << info << "' (" << counter << "): ";
            stream << elapsed.count() << "us" << std::endl;
            return stream.str();
        }

    public:
        class Measurement {
        private:
            Timer& parent;
            std::chrono::time_point<std::chrono::steady_clock> start;

        public:
            Measurement(const Measurement& other) = delete;
            explicit Measurement(Timer& parent) : parent(parent), start(std::chrono::steady_clock::now()) {}

            ~Measurement() {
                auto end = std::chrono::steady_clock::now();
                parent.elapsed += std::chrono::duration_cast<std::chrono::microseconds>(end - start);
                parent.counter++;
            }
        };

        explicit Timer(std::string info) : info(std::move(info)), counter(0), elapsed(0) {}
        ~Timer() { INFO(ToString("Total time measured for")) }
        Measurement Measure() { return Measurement(*this); }
    };


    #ifdef ENABLE_TIMER
        #define MEASURE(X) static thread_local Timer timer(X); auto measurement = timer.Measure();
    #else
        #define MEASURE(X) {}
    #endif

} // namespace hpl

#endif //HPL_UTIL_TIMER_HPP
