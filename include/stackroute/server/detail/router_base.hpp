//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_DETAIL_ROUTER_BASE_HPP
#define STACKROUTE_SERVER_DETAIL_ROUTER_BASE_HPP

#include <stackroute/detail/config.hpp>
#include <stackroute/server/router_types.hpp>
#include <boost/url/url_view.hpp>
#include <exception>
#include <memory>
#include <string_view>
#include <vector>

namespace stackroute {

template<class> class basic_router;

namespace detail {

// The untyped part of basic_router. Layers live
// in a shared impl, so copies see the same stack.
class STACKROUTE_DECL
    router_base
{
    struct impl;
    struct layer;
    std::shared_ptr<impl> impl_;

    template<class>
    friend class ::stackroute::basic_router;

protected:
    using opt_flags = unsigned int;

    // what a handler is, decided from its signature
    enum
    {
        is_invalid = 0,
        is_plain = 1,
        is_error = 2,
        is_router = 4,
        is_exception = 8
    };

    struct STACKROUTE_DECL
        handler
    {
        char const kind;

        explicit
        handler(char kind_) noexcept
            : kind(kind_)
        {
        }

        virtual ~handler() = default;

        // 1, or 1 plus the size of a mounted router
        virtual std::size_t count() const noexcept = 0;

        virtual route_result invoke(
            route_params_base&) const = 0;

        virtual router_base* get_router() noexcept
        {
            return nullptr;
        }
    };

    using handler_ptr = std::unique_ptr<handler>;
    using match_result = route_params_base::match_result;

    explicit router_base(opt_flags);

    std::size_t count() const noexcept;
    void add_impl(std::string_view, std::vector<handler_ptr>);
    route_result resume_impl(
        route_params_base&, route_result const&) const;
    route_result resume_impl(
        route_params_base&, std::exception_ptr) const;
    route_result dispatch_impl(
        urls::url_view const&, route_params_base&) const;
    route_result dispatch_impl(route_params_base&) const;

private:
    bool contains(impl const*) const noexcept;
    std::size_t height() const noexcept;
    void set_depth(std::size_t) noexcept;

    route_result run(route_params_base&) const;
    route_result walk(route_params_base&) const;
    route_result step(handler const&, route_params_base&) const;

    static void reset_path(route_params_base&) noexcept;
    static bool visible(char, route_params_base const&) noexcept;
    static route_result call(handler const&, route_params_base&);
    static route_result settle(char, route_params_base&, route_result);

public:
    /** The deepest allowed nesting of routers

        Mounting a router which would end up this
        many levels below the root throws
        `std::length_error`.
    */
    static constexpr std::size_t max_path_depth = 16;
};

} // detail
} // stackroute

#endif
