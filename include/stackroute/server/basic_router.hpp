//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_BASIC_ROUTER_HPP
#define STACKROUTE_SERVER_BASIC_ROUTER_HPP

#include <stackroute/detail/config.hpp>
#include <stackroute/server/router_types.hpp>
#include <stackroute/server/detail/router_base.hpp>
#include <boost/url/url_view.hpp>
#include <concepts>
#include <exception>
#include <memory>
#include <string_view>
#include <type_traits>
#include <vector>

namespace stackroute {

namespace detail {

// true if `T const&` is callable with Args
// and the result converts to route_result
template<class T, class... Args>
concept returns_route_result =
    std::invocable<T const&, Args...> &&
    std::convertible_to<
        std::invoke_result_t<T const&, Args...>,
        route_result>;

} // detail

/** Options for a router

    An option left unset is taken from the router this one
    is mounted in, at the time a request passes through it.
*/
struct router_options
{
    router_options() = default;

    /** Set whether mount paths are matched case-sensitively

        A router which never sets this follows its parent.
        The root router matches without regard to case.

        @par Example
        @code
        router api( router_options()
            .case_sensitive( true ) );
        @endcode
    */
    router_options&
    case_sensitive(
        bool value) noexcept
    {
        // bit 2 forces on, bit 4 forces off
        v_ &= ~6u;
        v_ |= value ? 2u : 4u;
        return *this;
    }

private:
    template<class> friend class basic_router;
    unsigned int v_ = 0;
};

//-----------------------------------------------

/** An ordered stack of middleware

    Each call to @ref use or @ref except adds a layer: a
    mount path and the handlers registered with it. A
    request visits the layers in the order they were added,
    skipping those whose mount path is not a prefix of the
    request path on a segment boundary. "/api" therefore
    sees "/api" and "/api/users", but not "/apiv2".

    Inside a layer, @ref route_params_base::base_path holds
    the part of the path the mount points consumed and
    @ref route_params_base::path holds the rest.

    A handler takes one of three forms, told apart by
    its signature:

    @code
    route_result( P& p );                           // plain
    route_result( P& p, system::error_code ec );    // error
    route_result( P& p, std::exception_ptr ep );    // exception
    @endcode

    A request starts on the normal track, where plain
    handlers and mounted routers run. A handler returning a
    failed error code, or throwing, moves it to the error
    track, where only error handlers run, and exception
    handlers too when the failure came from an exception.
    An error or exception handler returning @ref route::next
    clears the failure and the request goes back to the
    normal track.

    Mount paths are percent-decoded, so "/a%2Fb" and
    "/a/b" are the same mount path.

    Copies of a router share one stack. Adding handlers
    through any copy is seen by all of them.

    @par Example
    @code
    router<route_params> api;
    api.use( "/users", list_users );

    router<route_params> r;
    r.use( log_request );
    r.use( "/api", std::move( api ) );
    @endcode

    @par Thread Safety
    The `const` members may run concurrently on routers
    sharing a stack. Adding handlers may not.

    @tparam P The params type. It must derive publicly
    from @ref route_params_base.
*/
template<class P>
class basic_router : public detail::router_base
{
    static_assert(std::derived_from<P, route_params_base>);

    // classifies a handler by its signature, a mounted
    // router must accept the params of this one
    template<class H>
    static constexpr
    char
    kind_of() noexcept
    {
        using T = std::decay_t<H>;
        if constexpr(std::is_base_of_v<router_base, T>)
            return std::derived_from<P, typename T::params_type>
                ? is_router : is_invalid;
        else if constexpr(detail::returns_route_result<T, P&>)
            return is_plain;
        else if constexpr(detail::returns_route_result<
                T, P&, system::error_code>)
            return is_error;
        else if constexpr(detail::returns_route_result<
                T, P&, std::exception_ptr>)
            return is_exception;
        else
            return is_invalid;
    }

    // handlers are stored by value, so an lvalue
    // argument must be const or a function
    template<class H>
    static constexpr bool stored_by_value =
        ! std::is_lvalue_reference_v<H> ||
        std::is_const_v<std::remove_reference_t<H>> ||
        std::is_function_v<std::remove_reference_t<H>>;

    template<class H>
    struct entry : handler
    {
        static constexpr char K = kind_of<H>();

        std::decay_t<H> h;

        template<class Arg>
        explicit
        entry(Arg&& arg)
            : handler(K)
            , h(std::forward<Arg>(arg))
        {
        }

        std::size_t
        count() const noexcept override
        {
            if constexpr(K == is_router)
                return h.count() + 1;
            else
                return 1;
        }

        route_result
        invoke(route_params_base& rp) const override
        {
            auto& p = static_cast<P&>(rp);
            if constexpr(K == is_router)
            {
                return h.dispatch_impl(p);
            }
            else
            {
                route_result rv;
                if constexpr(K == is_plain)
                    rv = h(p);
                else if constexpr(K == is_error)
                    rv = h(p, system::error_code(rp.ec_));
                else
                    rv = h(p, rp.ep_);
                if(rv == route::suspend)
                    rp.resume_ = rp.pos_;
                return rv;
            }
        }

        router_base*
        get_router() noexcept override
        {
            if constexpr(K == is_router)
                return &h;
            else
                return nullptr;
        }
    };

    template<class... HN>
    void
    add(std::string_view pattern, HN&&... hn)
    {
        std::vector<handler_ptr> v;
        v.reserve(sizeof...(HN));
        (v.push_back(std::make_unique<entry<HN>>(
            std::forward<HN>(hn))), ...);
        add_impl(pattern, std::move(v));
    }

public:
    /// The params type handlers receive
    using params_type = P;

    /** Constructor

        @param options Options for requests passing
        through this router.
    */
    explicit
    basic_router(
        router_options options = {})
        : router_base(options.v_)
    {
    }

    basic_router(basic_router const&) = default;
    basic_router(basic_router&&) noexcept = default;
    basic_router& operator=(basic_router const&) = default;
    basic_router& operator=(basic_router&&) noexcept = default;

    /** Constructor

        Shares the stack of a router whose params
        type derives from `P`.
    */
    template<class OtherP>
        requires std::derived_from<OtherP, P>
    basic_router(
        basic_router<OtherP> const& other) noexcept
        : router_base(other)
    {
    }

    /** Add a layer of middleware under a mount path

        The handlers may be plain handlers, error handlers or
        routers, in any mix. They run in the order given. A
        router passed here is mounted: its own mount paths
        are matched against what remains of the path after
        `pattern`.

        @par Example
        @code
        r.use( "/admin",
            []( route_params& p )
            {
                if( ! is_admin( p ) )
                    return route_result( error::bad_target );
                return route_result( route::next );
            },
            std::move( admin ) );
        @endcode

        @param pattern The mount path. Empty means "/".

        @throw std::invalid_argument `pattern` does not start
        with a slash or holds a malformed escape, or a router
        would be mounted inside itself.

        @throw std::length_error A mounted router would nest
        deeper than @ref max_path_depth.
    */
    template<class H1, class... HN>
    void use(
        std::string_view pattern,
        H1&& h1, HN&&... hn)
    {
        static_assert(stored_by_value<H1> && (stored_by_value<HN> && ...),
            "a handler lvalue must be const, or std::move() it");
        static_assert(
            kind_of<H1>() != is_exception &&
            ((kind_of<HN>() != is_exception) && ...),
            "exception handlers are added with except()");
        static_assert(
            kind_of<H1>() != is_invalid &&
            ((kind_of<HN>() != is_invalid) && ...),
            "not a handler for this router");
        add(pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a layer of middleware under "/"
    template<class H1, class... HN>
    void use(H1&& h1, HN&&... hn)
        requires (!std::convertible_to<H1, std::string_view>)
    {
        use(std::string_view(),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a layer of exception handlers under a mount path

        They see a failure only when it carries the
        exception a handler threw, or which was passed
        to a resumer.

        @throw std::invalid_argument `pattern` is invalid.
    */
    template<class H1, class... HN>
    void except(
        std::string_view pattern,
        H1&& h1, HN&&... hn)
    {
        static_assert(stored_by_value<H1> && (stored_by_value<HN> && ...),
            "a handler lvalue must be const, or std::move() it");
        static_assert(
            kind_of<H1>() == is_exception &&
            ((kind_of<HN>() == is_exception) && ...),
            "except() only takes exception handlers");
        add(pattern,
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /// Add a layer of exception handlers under "/"
    template<class H1, class... HN>
    void except(H1&& h1, HN&&... hn)
        requires (!std::convertible_to<H1, std::string_view>)
    {
        except(std::string_view(),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Route a request

        Handlers run on the calling thread. No exception
        thrown by a handler leaves this function.

        @return One of:
        @li @ref route::send, @ref route::complete or
        @ref route::close from the handler which finished;
        @li @ref route::suspend when a handler suspended;
        @li the failure still pending at the end;
        @li @ref route::next when nothing finished.

        @param url The request target. Only its
        path takes part in routing.

        @throw std::invalid_argument A handler returned
        a successful error code.
    */
    route_result
    dispatch(
        urls::url_view const& url,
        P& p) const
    {
        return dispatch_impl(url, p);
    }

    /** Continue a suspended request

        Handlers before the suspended one are not run
        again, but mount paths are matched again so that
        later handlers see the same paths they would
        have seen without the suspension.

        @return As for @ref dispatch.

        @param rv Taken as the return value of the
        handler which suspended.

        @throw std::invalid_argument `rv` is @ref route::suspend,
        or a successful error code.
    */
    route_result
    resume(
        P& p,
        route_result const& rv) const
    {
        return resume_impl(p, rv);
    }

    /** Continue a suspended request with an exception

        The suspended handler is taken to have thrown `ep`.

        @throw std::invalid_argument `ep` is null.
    */
    route_result
    resume(
        P& p,
        std::exception_ptr ep) const
    {
        return resume_impl(p, std::move(ep));
    }
};

} // stackroute

#endif
