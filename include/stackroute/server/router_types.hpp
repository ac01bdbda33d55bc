//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef STACKROUTE_SERVER_ROUTER_TYPES_HPP
#define STACKROUTE_SERVER_ROUTER_TYPES_HPP

#include <stackroute/detail/config.hpp>
#include <stackroute/detail/except.hpp>
#include <boost/system/error_code.hpp>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

namespace stackroute {

/** What a handler tells the router to do next

    A handler returns either a value from @ref route, or an
    error code for which `failed()` is `true`. An error sends
    the request down the error track: from then on only error
    handlers see it, until one of them finishes the request or
    returns @ref route::next.

    A default-constructed (successful) code is never a valid
    result and causes the router to throw.
*/
using route_result = system::error_code;

/** Control values returned by handlers
*/
enum class route
{
    /** Finish the request and close the connection.

        Routing stops. The server closes the connection
        after writing the response, if there is one.
    */
    close = 1,

    /** Finish the request, the response was already written.

        Routing stops and the server writes nothing further
        for this request.
    */
    complete,

    /** Stop routing until the request is resumed.

        Returned by @ref suspender. The router records the
        position of the handler, and @ref basic_router::resume
        continues from the handler after it.
    */
    suspend,

    /** Pass the request to the next matching handler.

        Returned from an error handler, this also clears the
        pending error. A dispatch where every handler passed
        returns this value.
    */
    next,

    /** Finish the request, the response is ready to be written.
    */
    send
};

} // stackroute

namespace boost {
namespace system {
template<>
struct is_error_code_enum<
    ::stackroute::route>
{
    static bool const value = true;
};
} // system
} // boost

namespace stackroute {

namespace detail {

struct STACKROUTE_SYMBOL_VISIBLE
    route_cat_type
    : system::error_category
{
    STACKROUTE_DECL const char* name(
        ) const noexcept override;
    STACKROUTE_DECL std::string message(
        int) const override;
    STACKROUTE_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR route_cat_type()
        : error_category(0x3f1a6c8e52d4b097)
    {
    }
};

STACKROUTE_DECL extern
    route_cat_type route_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    route ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            route>::type>(ev),
        detail::route_cat};
}

/** Return true if `rv` holds a @ref route value
*/
inline
bool
is_route_result(
    route_result const& rv) noexcept
{
    return &rv.category() == &detail::route_cat;
}

//------------------------------------------------

class resumer;

/** Suspends the handler which is running

    Every request carries one of these, bound to whatever
    is driving the dispatch. A handler calls it with a
    function which takes the @ref resumer, and returns the
    result immediately:

    @code
    app.use( "/slow",
        []( route_params& p )
        {
            return p.suspend(
                []( resumer resume )
                {
                    start_lookup( std::move( resume ) );
                } );
        } );
    @endcode
*/
class suspender
{
public:
    /** Interface for the object driving a dispatch
    */
    struct STACKROUTE_SYMBOL_VISIBLE
        owner
    {
        /** Return the resumer for a suspended handler

            The default throws `std::logic_error`, for
            drivers which cannot suspend.
        */
        STACKROUTE_DECL
        virtual resumer do_suspend();

        virtual void do_resume(route_result const&) = 0;
        virtual void do_resume(std::exception_ptr) = 0;

    protected:
        ~owner() = default;
    };

    suspender() = default;

    explicit
    suspender(
        owner& who) noexcept
        : p_(&who)
    {
    }

    /** Suspend, then call `f` with the resumer

        @return @ref route::suspend

        @throw std::logic_error The suspender is empty.
    */
    template<class F>
    route_result
    operator()(F&& f);

private:
    owner* p_ = nullptr;
};

//------------------------------------------------

/** Continues a suspended dispatch

    It may be copied and stored, and called from any
    thread, but only one call may be made in total.
*/
class resumer
{
public:
    resumer() = default;

    explicit
    resumer(
        suspender::owner& who) noexcept
        : p_(&who)
    {
    }

    /** Resume as if the handler had returned `rv`

        @throw std::invalid_argument The resumer is empty.
    */
    void
    operator()(
        route_result const& rv) const
    {
        if(! p_)
            detail::throw_invalid_argument();
        p_->do_resume(rv);
    }

    /** Resume as if the handler had thrown `ep`

        @throw std::invalid_argument The resumer is empty.
    */
    void
    operator()(
        std::exception_ptr ep) const
    {
        if(! p_)
            detail::throw_invalid_argument();
        p_->do_resume(std::move(ep));
    }

private:
    suspender::owner* p_ = nullptr;
};

template<class F>
route_result
suspender::
operator()(F&& f)
{
    if(! p_)
        detail::throw_logic_error();
    std::forward<F>(f)(p_->do_suspend());
    return route::suspend;
}

//------------------------------------------------

namespace detail {
class router_base;
} // detail

template<class> class basic_router;

/** Routing state of one request

    Every params type used with @ref basic_router derives
    from this. Handlers read the two path fields. The rest
    belongs to the router, and survives a suspension so the
    dispatch can be resumed.
*/
class route_params_base
{
public:
    /// The part of the path consumed by mount points
    std::string_view base_path;

    /// The rest of the path, starting with a slash
    std::string_view path;

    route_params_base() = default;

    // moves a matched prefix from path to base_path
    class match_result
    {
    public:
        STACKROUTE_DECL
        void
        consume(
            route_params_base& p,
            std::size_t n);

        STACKROUTE_DECL
        void
        restore(route_params_base& p);

    private:
        std::size_t n_ = 0;
    };

private:
    friend class detail::router_base;
    template<class>
    friend class basic_router;

    route_params_base& operator=(
        route_params_base const&) = delete;

    std::string decoded_path_;  // with a trailing slash
    system::error_code ec_;     // pending error
    std::exception_ptr ep_;     // captured exception
    route_result rv_;           // resume value
    std::size_t pos_ = 0;
    std::size_t resume_ = 0;
    bool addedSlash_ = false;
    bool case_sensitive_ = false;
};

} // stackroute

#endif
