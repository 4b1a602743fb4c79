#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace atomrt::util {

struct Log final {
    Log() = delete;
    ~Log() = delete;
    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

#ifndef NDEBUG
    template <typename ... Ts>
    static inline void d(std::string_view tag, Ts&& ... args) {
        Log::d_(tag, format(std::forward<Ts>(args)...));
    }
#else
    template <typename ... Ts>
    static inline void d(std::string_view, Ts&& ...) {
    }
#endif

    template <typename ... Ts>
    static inline void w(std::string_view tag, Ts&& ... args) {
        Log::w_(tag, format(std::forward<Ts>(args)...));
    }

    template <typename ... Ts>
    static inline void i(std::string_view tag, Ts&& ... args) {
        Log::i_(tag, format(std::forward<Ts>(args)...));
    }

    template <typename ... Ts>
    static inline void e(std::string_view tag, Ts&& ... args) {
        Log::e_(tag, format(std::forward<Ts>(args)...));
    }

private:
    template <typename ... Ts>
    static inline std::string format(Ts&& ... args) {
        std::stringstream stream;

        ((stream << to_string(std::forward<Ts>(args))), ...);

        return stream.str();
    }

    template <typename T>
    static inline std::string to_string(T&& arg) {
        using type = std::decay_t<T>;

        if constexpr (std::is_same_v<type, bool>)
            return arg ? "true " : "false ";
        else if constexpr (std::is_arithmetic_v<type>)
            return std::to_string(arg) + " ";
        else
            return std::string{arg};
    }

    static void d_(std::string_view tag, std::string_view msg);
    static void w_(std::string_view tag, std::string_view msg);
    static void i_(std::string_view tag, std::string_view msg);
    static void e_(std::string_view tag, std::string_view msg);

};

}
