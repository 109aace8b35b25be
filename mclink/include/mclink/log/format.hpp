#pragma once

#include <reflect>

#include <algorithm>
#include <array>
#include <concepts>
#include <format>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace mclink::log::format
{
    namespace detail
    {
        // clang-format off
        template<typename T>
        consteval auto namespace_name() noexcept -> std::string_view
        {
            using Type = std::remove_pointer_t<std::remove_cvref_t<T>>;
            using type_name_info = reflect::detail::type_name_info<Type>;
            constexpr std::string_view function_name{ reflect::detail::function_name<Type>() };
            constexpr std::string_view qualified{
                function_name.substr(type_name_info::begin, function_name.find(type_name_info::end) - type_name_info::begin)
            };
            constexpr std::string_view unqualified_template{ qualified.substr(0, qualified.find_first_of('<', 1)) };
            return unqualified_template.substr(0, unqualified_template.find_last_of(':') + 1);
        }
        // clang-format on

        template<typename T>
        consteval auto is_std_type() -> bool
        {
            return namespace_name<T>().starts_with("std::");
        }

        template<typename T>
        concept ScopedEnum = std::is_scoped_enum_v<std::remove_cvref_t<T>>;

        template<typename T>
        concept Reflectable = std::is_class_v<std::remove_cvref_t<T>> &&
                              std::is_aggregate_v<std::remove_cvref_t<T>> &&
                              !is_std_type<std::remove_cvref_t<T>>();

        template<Reflectable T>
        consteval auto member_names()
        {
            return []<size_t... Is>(std::index_sequence<Is...>) {
                return std::array<std::string_view, sizeof...(Is)>{ reflect::member_name<Is, T>()... };
            }(std::make_index_sequence<reflect::size<T>()>{});
        }

        // "[ <type>: { <m0>: {}, <m1>: {} } ]" with braces escaped for std::vformat
        template<Reflectable T>
        consteval auto class_format_size() -> size_t
        {
            constexpr auto names{ member_names<T>() };

            auto size{ 0uz };
            size += 2 + reflect::type_name<T>().size() + 5;
            for (auto i{ 0uz }; i < names.size(); ++i) {
                size += names[i].size() + 4;
                if (i + 1 < names.size()) {
                    size += 2;
                }
            }
            size += 5;
            return size;
        }

        template<Reflectable T>
        consteval auto class_format() -> std::array<char, class_format_size<T>()>
        {
            constexpr auto names{ member_names<T>() };

            std::array<char, class_format_size<T>()> fmt{};
            auto iter{ fmt.begin() };
            auto append = [&](std::string_view s) { iter = std::ranges::copy(s, iter).out; };

            append("[ ");
            append(reflect::type_name<T>());
            append(": {{ ");
            for (auto i{ 0uz }; i < names.size(); ++i) {
                append(names[i]);
                append(": {}");
                if (i + 1 < names.size()) {
                    append(", ");
                }
            }
            append(" }} ]");
            return fmt;
        }

        template<typename Field>
        auto formattable_or_placeholder(const Field& field) -> decltype(auto)
        {
            if constexpr (std::formattable<Field, char>) {
                return field;
            }
            else {
                return std::string_view{ "-" };
            }
        }
    }
} // namespace mclink::log::format

/** Aggregates are printed member-wise, e.g. "[ Device: { type: D, number: 28 } ]". */
template<mclink::log::format::detail::Reflectable T>
struct std::formatter<T>
{
    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        auto it{ ctx.begin() };
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("Invalid format args");
        }
        return it;
    }

    template<typename Ctx>
    auto format(const T& t, Ctx& ctx) const -> Ctx::iterator
    {
        static constexpr auto fmt{ mclink::log::format::detail::class_format<T>() };

        auto args = [&]<size_t... Is>(std::index_sequence<Is...>) {
            return std::tuple<decltype(mclink::log::format::detail::formattable_or_placeholder(reflect::get<Is>(t)))...>(
              mclink::log::format::detail::formattable_or_placeholder(reflect::get<Is>(t))...);
        }(std::make_index_sequence<reflect::size<T>()>{});

        return std::apply(
          [&ctx](const auto&... args) {
              return std::vformat_to(
                ctx.out(), std::string_view{ fmt.data(), fmt.size() }, std::make_format_args(args...));
          },
          args);
    }
};

template<mclink::log::format::detail::ScopedEnum T>
struct std::formatter<T>
{
    bool verbose{ false };

    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        auto it{ ctx.begin() };
        if (it == ctx.end()) {
            return it;
        }

        if (*it == 'v') {
            verbose = true;
            ++it;
        }

        if (it != ctx.end() && *it != '}') {
            throw std::format_error("Invalid format args");
        }

        return it;
    }

    template<typename Ctx>
    auto format(T t, Ctx& ctx) const -> Ctx::iterator
    {
        if (verbose) {
            return std::format_to(ctx.out(), "{}:{}", reflect::type_name(t), reflect::enum_name(t));
        }
        return std::format_to(ctx.out(), "{}", reflect::enum_name(t));
    }
};

template<std::formattable<char> T>
struct std::formatter<std::optional<T>> : std::formatter<T>
{
    using Base = std::formatter<T>;

    template<typename Ctx>
    auto format(const std::optional<T>& t, Ctx& ctx) const -> Ctx::iterator
    {
        if (!t) {
            return std::ranges::copy(std::string_view{ "[ null ]" }, ctx.out()).out;
        }

        ctx.advance_to(std::ranges::copy(std::string_view{ "[ " }, ctx.out()).out);
        ctx.advance_to(Base::format(*t, ctx));
        return std::ranges::copy(std::string_view{ " ]" }, ctx.out()).out;
    }
};
