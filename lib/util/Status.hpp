#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace atomrt::util {

/**
 * @brief Outcome of a checked operation
 */
class Status final {
    enum class Code: unsigned {
        Ok,
        InvalidArgument,
        Undefined
    };

    static constexpr std::size_t MAX_MESSAGE_LEN = 36;

public:
    [[nodiscard]] static Status Ok();

    template<typename T>
    [[nodiscard]] static constexpr Status InvalidArgument(T&& m) {
        return create(Code::InvalidArgument, std::forward<T>(m));
    }

    constexpr Status() = default;
    ~Status() = default;

    Status(const Status&) = default;
    Status& operator=(const Status&) = default;

    Status(Status&&) noexcept = default;
    Status& operator=(Status&&) noexcept = default;

    [[nodiscard]] const char* message() const noexcept;

    [[nodiscard]] bool isOk() const noexcept;
    [[nodiscard]] bool isInvalidArgument() const noexcept;

private:
    template<std::size_t N>
    [[nodiscard]] static inline constexpr Status create(Code code, const char (&m)[N]) {
        static_assert(N < MAX_MESSAGE_LEN, "Message too long. Max length is 36 chars");

        return Status{code, m};
    }

    template<typename Array, typename String, std::size_t... I>
    constexpr void str2array(Array& a, const String& s, std::index_sequence<I...>)
    {
        ((a[I] = s[I]), ...);
    }

    template<std::size_t N, typename Indices = std::make_index_sequence<N>>
    constexpr Status(Code code, const char (&m)[N]) noexcept:
        code_(code)
    {
        str2array(message_, m, Indices{});
    }

    Code code_{Code::Undefined};
    std::array<char, MAX_MESSAGE_LEN> message_{0};
};

}
