#pragma once

#include <assessgrader/common/formatters/debug.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>
#include <string_view>
#include <type_traits>

namespace assessgrader::detail {

template <typename Underlying>
fmt::format_context::iterator format_enumerator(fmt::format_context::iterator out, std::string_view enum_name,
                                                const char* enumerator, Underlying value, bool debug) {
    if (debug) {
        out = fmt::format_to(out, "{}{{", enum_name);
    }

    if (enumerator != nullptr) {
        out = fmt::format_to(out, "{}", enumerator);
    } else {
        out = fmt::format_to(out, "<unknown ({})>", value);
    }

    if (debug) {
        out = fmt::format_to(out, "}}");
    }

    return out;
}

template <typename T>
void write_value(fmt::format_context::iterator& out, const T& value) {
    if constexpr (fmt::is_formattable<T>::value) {
        out = fmt::format_to(out, "{}", value);
    } else {
        out = fmt::format_to(out, "<unformattable>");
    }
}

template <typename T>
void write_value(fmt::format_context::iterator& out, const std::optional<T>& value) {
    if (!value) {
        out = fmt::format_to(out, "none");
        return;
    }

    write_value(out, *value);
}

template <typename T>
void write_field(fmt::format_context::iterator& out, bool first, std::string_view name, const T& value) {
    out = fmt::format_to(out, "{}{} = ", first ? "" : ", ", name);
    write_value(out, value);
}

} // namespace assessgrader::detail

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, ident)                                                            \
    case enum_name::ident:                                                                                             \
        return BOOST_PP_STRINGIZE(ident);

/// Generate a fmt::formatter for an enum class. ``{}`` prints the enumerator, ``{:?}`` prints ``Enum{Enumerator}``
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::assessgrader::DebugFormatter                                                  \
    {                                                                                                                  \
        static constexpr const char* enumerator_name(enum_name from) {                                                 \
            switch (from) {                                                                                            \
                BOOST_PP_SEQ_FOR_EACH(FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)) \
            }                                                                                                          \
            return nullptr;                                                                                            \
        }                                                                                                              \
                                                                                                                       \
        auto format(enum_name from, fmt::format_context& ctx) const {                                                  \
            return ::assessgrader::detail::format_enumerator(ctx.out(), #enum_name, enumerator_name(from),             \
                                                             fmt::underlying(from), is_debug_format);                  \
        }                                                                                                              \
    }

#define FMT_SERIALIZE_CLASS_MEMBER_IMPL(r, obj, i, ident)                                                             \
    ::assessgrader::detail::write_field(out, (i) == 0, BOOST_PP_STRINGIZE(ident), obj.ident);

/// Generate a fmt::formatter for a class printing ``Name{member = value, ...}`` for the listed members
#define FMT_SERIALIZE_CLASS(class_name, ... /*members*/)                                                               \
    template <>                                                                                                        \
    struct fmt::formatter<class_name> : ::assessgrader::DebugFormatter                                                 \
    {                                                                                                                  \
        auto format(const class_name& from, fmt::format_context& ctx) const {                                          \
            auto out = fmt::format_to(ctx.out(), "{}{{", #class_name);                                                 \
            BOOST_PP_SEQ_FOR_EACH_I(FMT_SERIALIZE_CLASS_MEMBER_IMPL, from, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))      \
            return fmt::format_to(out, "}}");                                                                          \
        }                                                                                                              \
    }
