#pragma once
#ifndef HPL_UTIL_SHORTCUTS_HPP
#define HPL_UTIL_SHORTCUTS_HPP

#include <memory>
#include <string>
#include <iterator>
#include <exception>
#include <algorithm>

namespace hpl {

    template<typename T, typename U>
    static inline void MoveInto(T&& srcContainer, U& dstContainer) {
        std::move(srcContainer.begin(), srcContainer.end(), std::back_inserter(dstContainer));
    }

    template<typename T, typename U>
    static inline void InsertInto(T&& srcContainer, U& dstContainer) {
        dstContainer.insert(srcContainer.begin(), srcContainer.end());
    }

    template<typename T, typename U>
    static inline void RemoveIf(T& container, const U& unaryPredicate) {
        container.erase(std::remove_if(container.begin(), container.end(), unaryPredicate), container.end());
    }

    template<typename T, typename U>
    static inline bool ContainsIf(T& container, const U& unaryPredicate) {
        return std::find_if(container.begin(), container.end(), unaryPredicate) != container.end();
    }

    template<typename T, typename U>
    static inline bool Any(const T& container, const U& unaryPredicate) {
        return std::any_of(container.begin(), container.end(), unaryPredicate);
    }

    template<typename T, typename U>
    static inline bool All(const T& container, const U& unaryPredicate) {
        return std::all_of(container.begin(), container.end(), unaryPredicate);
    }

    template<typename T, typename U>
    static inline bool Membership(const T& container, const U& element) {
        return std::find(container.begin(), container.end(), element) != container.end();
    }

    struct ExceptionWithMessage : public std::exception {
        std::string message;
        explicit ExceptionWithMessage(std::string message) : message(std::move(message)) {}
        [[nodiscard]] const char* what() const noexcept override { return message.c_str(); }
    };

} // namespace hpl

#endif //HPL_UTIL_SHORTCUTS_HPP
