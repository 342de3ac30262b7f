#ifndef STORES_FORMAT_H
#define STORES_FORMAT_H

#include <stores/types/cell.h>
#include <stores/types/deduped.h>
#include <stores/types/derived.h>
#include <stores/types/event.h>

#include <fmt/format.h>

namespace stores::detail {
    /**
     * Accepts only the empty format spec, e.g. "{}".
     */
    struct plain_formatter {
        constexpr auto parse(fmt::format_parse_context &ctx) {
            auto it = ctx.begin();
            if (it != ctx.end() && *it != '}') { throw fmt::format_error("stores entities take no format specifier"); }
            return it;
        }
    };
} // namespace stores::detail

template<typename Value>
    requires fmt::is_formattable<Value>::value
struct fmt::formatter<stores::Cell<Value>> : stores::detail::plain_formatter {
    template<typename FormatContext>
    auto format(const stores::Cell<Value> &cell, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "Cell {{ value: {}, callbacks: {} }}", cell.get(), cell.callback_count());
    }
};

template<typename Value>
    requires fmt::is_formattable<Value>::value
struct fmt::formatter<stores::Derived<Value>> : stores::detail::plain_formatter {
    template<typename FormatContext>
    auto format(const stores::Derived<Value> &derived, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "Derived {{ value: {}, callbacks: {} }}", derived.get(),
                              derived.callback_count());
    }
};

template<typename Value, typename Target>
    requires fmt::is_formattable<Value>::value
struct fmt::formatter<stores::Deduped<Value, Target>> : stores::detail::plain_formatter {
    template<typename FormatContext>
    auto format(const stores::Deduped<Value, Target> &deduped, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "Deduped {{ value: {}, callbacks: {} }}", deduped.get(),
                              deduped.callback_count());
    }
};

template<>
struct fmt::formatter<stores::Event> : stores::detail::plain_formatter {
    template<typename FormatContext>
    auto format(const stores::Event &event, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "Event {{ callbacks: {} }}", event.callback_count());
    }
};

#endif  // STORES_FORMAT_H
