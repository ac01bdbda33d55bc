//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/server/detail/router_base.hpp"
#include "src/server/detail/pct_decode.hpp"
#include <stackroute/server/detail/router_base.hpp>
#include <stackroute/detail/except.hpp>
#include <stackroute/error.hpp>
#include <boost/assert.hpp>
#include <algorithm>
#include <utility>

/*
    Every handler, including each mounted router, takes
    one position in a depth-first numbering of the stack.
    A dispatch counts positions in p.pos_ as it walks.
    When a handler suspends, its position is stored in
    p.resume_, and resuming walks again from the root,
    re-matching mount points and skipping entries until
    the count reaches the suspended handler.

    mount       target      base_path   path
    ---------------------------------------------
    /           /x                      /x
    /x          /x          /x          /
    /x          /x/y        /x          /y
    /x          /xy         (no match)
*/

namespace stackroute {
namespace detail {

router_base::
router_base(
    opt_flags opt)
    : impl_(std::make_shared<impl>(opt))
{
}

std::size_t
router_base::
count() const noexcept
{
    std::size_t total = 0;
    for(auto const& lay : impl_->layers)
        total += lay.count();
    return total;
}

void
router_base::
add_impl(
    std::string_view pattern,
    std::vector<handler_ptr> hv)
{
    if(pattern.empty())
        pattern = "/";

    // check every mounted router first, so
    // a throw leaves this router unchanged
    for(auto const& h : hv)
    {
        auto* r = h->get_router();
        if(! r)
            continue;
        if(r->contains(impl_.get()))
            detail::throw_invalid_argument();
        if(impl_->depth + 1 + r->height() >= max_path_depth)
            detail::throw_length_error(
                "router nesting depth exceeds max_path_depth");
    }

    impl_->layers.emplace_back(pattern, std::move(hv));
    for(auto const& h : impl_->layers.back().entries)
        if(auto* r = h->get_router())
            r->set_depth(impl_->depth + 1);
}

// true if this router is `other` or mounts it
bool
router_base::
contains(impl const* other) const noexcept
{
    if(impl_.get() == other)
        return true;
    for(auto const& lay : impl_->layers)
        for(auto const& h : lay.entries)
            if(auto* r = h->get_router())
                if(r->contains(other))
                    return true;
    return false;
}

// nesting levels below this router
std::size_t
router_base::
height() const noexcept
{
    std::size_t levels = 0;
    for(auto const& lay : impl_->layers)
        for(auto const& h : lay.entries)
            if(auto* r = h->get_router())
                levels = (std::max)(levels, r->height() + 1);
    return levels;
}

void
router_base::
set_depth(std::size_t d) noexcept
{
    BOOST_ASSERT(d < max_path_depth);
    impl_->depth = d;
    for(auto const& lay : impl_->layers)
        for(auto const& h : lay.entries)
            if(auto* r = h->get_router())
                r->set_depth(d + 1);
}

//------------------------------------------------

void
router_base::
reset_path(
    route_params_base& p) noexcept
{
    auto const& s = p.decoded_path_;
    p.base_path = { s.data(), 0 };
    p.path = { s.data(), s.size() - (p.addedSlash_ ? 1 : 0) };
}

bool
router_base::
visible(
    char kind,
    route_params_base const& p) noexcept
{
    // exception handlers only see a
    // failure which carries an exception
    if(p.ec_.failed())
        return kind == is_error ||
            (kind == is_exception && p.ep_);
    return kind == is_plain || kind == is_router;
}

route_result
router_base::
call(
    handler const& h,
    route_params_base& p)
{
#ifdef BOOST_NO_EXCEPTIONS
    return h.invoke(p);
#else
    try
    {
        return h.invoke(p);
    }
    catch(...)
    {
        p.ep_ = std::current_exception();
        return error::unhandled_exception;
    }
#endif
}

// Folds the result of an entry into p. Returns
// route::next to keep walking, or the final value.
route_result
router_base::
settle(
    char kind,
    route_params_base& p,
    route_result rv)
{
    if(rv == route::next)
    {
        if(kind == is_error || kind == is_exception)
        {
            p.ec_ = {};
            p.ep_ = nullptr;
        }
        return rv;
    }
    if(is_route_result(rv))
        return rv;
    if(! rv.failed())
        detail::throw_invalid_argument();
    // a different failure drops the exception
    if( rv != p.ec_ &&
        rv != error::unhandled_exception)
        p.ep_ = nullptr;
    p.ec_ = rv;
    return route::next;
}

route_result
router_base::
step(
    handler const& h,
    route_params_base& p) const
{
    auto const n = h.count();
    bool const skip = p.resume_ > 0
        ? p.pos_ + n < p.resume_
        : ! visible(h.kind, p);
    if(skip)
    {
        p.pos_ += n;
        return route::next;
    }

    ++p.pos_;
    if(p.pos_ == p.resume_)
    {
        // the suspended handler, its
        // result comes from resume
        BOOST_ASSERT(n == 1);
        p.resume_ = 0;
        return settle(h.kind, p,
            std::exchange(p.rv_, {}));
    }

    auto rv = call(h, p);
    // p may belong to another thread now
    if(rv == route::suspend)
        return rv;
    return settle(h.kind, p, rv);
}

route_result
router_base::
walk(
    route_params_base& p) const
{
    for(auto const& lay : impl_->layers)
    {
        auto const n = lay.count();
        bool const replay = p.resume_ > 0;
        if(replay && p.pos_ + n < p.resume_)
        {
            p.pos_ += n;
            continue;
        }
        match_result mr;
        if(! lay.pattern(p, p.case_sensitive_, mr))
        {
            // the path has not changed since
            // the suspended dispatch matched
            BOOST_ASSERT(! replay);
            p.pos_ += n;
            continue;
        }
        for(auto const& h : lay.entries)
        {
            auto rv = step(*h, p);
            if(rv != route::next)
                return rv;
        }
        mr.restore(p);
    }
    return route::next;
}

route_result
router_base::
dispatch_impl(
    route_params_base& p) const
{
    bool const inherited = p.case_sensitive_;
    if(impl_->opt & 2)
        p.case_sensitive_ = true;
    else if(impl_->opt & 4)
        p.case_sensitive_ = false;

    auto rv = walk(p);
    if(rv == route::suspend)
        return rv;
    p.case_sensitive_ = inherited;
    return rv;
}

// Walks from the root. A pending failure left
// over at the end becomes the result.
route_result
router_base::
run(
    route_params_base& p) const
{
    auto rv = dispatch_impl(p);
    if(rv == route::suspend)
        return rv;
    if(rv == route::next && p.ec_.failed())
        rv = p.ec_;
    p.ec_ = {};
    p.ep_ = nullptr;
    return rv;
}

route_result
router_base::
dispatch_impl(
    urls::url_view const& url,
    route_params_base& p) const
{
    p.ec_ = {};
    p.ep_ = nullptr;
    p.rv_ = {};
    p.pos_ = 0;
    p.resume_ = 0;
    p.case_sensitive_ = false;

    auto& s = p.decoded_path_;
    s = pct_decode(url.encoded_path(), true);
    p.addedSlash_ = ! s.empty() && s.back() != '/';
    if(s.empty() || p.addedSlash_)
        s.push_back('/');
    reset_path(p);
    return run(p);
}

route_result
router_base::
resume_impl(
    route_params_base& p,
    route_result const& rv) const
{
    BOOST_ASSERT(p.resume_ > 0);
    if(rv == route::suspend)
        detail::throw_invalid_argument();
    if(! is_route_result(rv) && ! rv.failed())
        detail::throw_invalid_argument();
    if( rv == route::send ||
        rv == route::complete ||
        rv == route::close)
    {
        p.ec_ = {};
        p.ep_ = nullptr;
        return rv;
    }

    // replay from the root, with the default
    // options and the whole path
    BOOST_ASSERT(p.resume_ == p.pos_);
    p.case_sensitive_ = false;
    reset_path(p);
    p.pos_ = 0;
    p.rv_ = rv;
    return run(p);
}

route_result
router_base::
resume_impl(
    route_params_base& p,
    std::exception_ptr ep) const
{
    if(! ep)
        detail::throw_invalid_argument();
    p.ep_ = std::move(ep);
    return resume_impl(p,
        error::unhandled_exception);
}

} // detail
} // stackroute
