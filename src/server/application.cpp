//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <stackroute/server/application.hpp>
#include <stackroute/error.hpp>
#include <boost/url/parse.hpp>
#include <boost/assert.hpp>
#include <boost/beast/http/field.hpp>
#include <mutex>
#include <utility>

namespace stackroute {

// Routes one request and outlives the handle
// call when a handler suspends. Deletes itself
// after invoking the done handler.
class application::handle_op
    : public suspender::owner
{
public:
    handle_op(
        application const& app,
        route_params& p,
        done_handler done)
        : app_(app)
        , p_(p)
        , done_(std::move(done))
    {
    }

    ~handle_op() = default;

    void
    start()
    {
        p_.suspend = suspender(*this);
        in_dispatch_ = true;
        route_result rv;
        try
        {
            rv = app_.dispatch(p_.url, p_);
        }
        catch(...)
        {
            // a handler broke the contract,
            // the request is abandoned
            p_.suspend = {};
            delete this;
            throw;
        }
        run(rv);
    }

private:
    resumer
    do_suspend() override
    {
        return resumer(*this);
    }

    void
    do_resume(route_result const& rv) override
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            if(in_dispatch_)
            {
                // the suspending dispatch has not
                // returned yet, it resumes for us
                BOOST_ASSERT(! pending_);
                pending_ = true;
                pending_rv_ = rv;
                return;
            }
            in_dispatch_ = true;
        }
        route_result rv1;
        try
        {
            rv1 = app_.resume(p_, rv);
        }
        catch(...)
        {
            // still suspended
            std::lock_guard<std::mutex> lock(m_);
            in_dispatch_ = false;
            throw;
        }
        run(rv1);
    }

    void
    do_resume(std::exception_ptr ep) override
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            if(in_dispatch_)
            {
                BOOST_ASSERT(! pending_);
                pending_ = true;
                pending_rv_ = {};
                pending_ep_ = std::move(ep);
                return;
            }
            in_dispatch_ = true;
        }
        route_result rv1;
        try
        {
            rv1 = app_.resume(p_, std::move(ep));
        }
        catch(...)
        {
            // still suspended
            std::lock_guard<std::mutex> lock(m_);
            in_dispatch_ = false;
            throw;
        }
        run(rv1);
    }

    // called with the result of dispatch or resume
    void
    run(route_result rv)
    {
        for(;;)
        {
            route_result prv;
            std::exception_ptr ep;
            {
                std::lock_guard<std::mutex> lock(m_);
                if(rv != route::suspend || ! pending_)
                {
                    in_dispatch_ = false;
                    break;
                }
                pending_ = false;
                ep = std::exchange(pending_ep_, nullptr);
                prv = pending_rv_;
            }
            try
            {
                if(ep)
                    rv = app_.resume(p_, std::move(ep));
                else
                    rv = app_.resume(p_, prv);
            }
            catch(...)
            {
                // the deferred resume broke the
                // contract, the request is abandoned
                p_.suspend = {};
                delete this;
                throw;
            }
        }
        if(rv == route::suspend)
            return;
        complete(rv);
    }

    void
    complete(route_result rv)
    {
        auto done = std::move(done_);
        auto& p = p_;
        p.suspend = {};
        delete this;
        done(p, rv);
    }

    application app_;
    route_params& p_;
    done_handler done_;
    std::mutex m_;
    route_result pending_rv_;
    std::exception_ptr pending_ep_;
    bool in_dispatch_ = false;
    bool pending_ = false;
};

//------------------------------------------------

application::
application(
    router_options options)
    : router(options)
{
}

void
application::
handle(route_params& p) const
{
    handle(p, &application::final_handler);
}

void
application::
handle(
    route_params& p,
    done_handler done) const
{
    BOOST_ASSERT(done);
    p.res.version(p.req.version());
    p.res.keep_alive(p.req.keep_alive());
    p.res.result(http::status::ok);

    auto rv = urls::parse_origin_form(
        p.req.target());
    if(! rv)
    {
        p.url = {};
        done(p, error::bad_target);
        return;
    }
    p.url = *rv;

    (new handle_op(*this, p, std::move(done)))->start();
}

void
application::
final_handler(
    route_params& p,
    route_result rv)
{
    if(rv == route::next)
    {
        p.res.set(http::field::content_type, "text/plain");
        p.status(http::status::not_found);
        p.set_body("Not Found");
        return;
    }
    if(is_route_result(rv))
        return;
    BOOST_ASSERT(rv.failed());
    p.res.set(http::field::content_type, "text/plain");
    if(rv == error::bad_target)
    {
        p.status(http::status::bad_request);
        p.set_body("Bad Request");
        return;
    }
    p.status(http::status::internal_server_error);
    p.set_body(rv.message());
}

} // stackroute
