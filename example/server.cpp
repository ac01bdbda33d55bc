//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

//------------------------------------------------------------------------------
//
// Example: synchronous HTTP server routing requests through an application
//
//------------------------------------------------------------------------------

#include <stackroute.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

using namespace stackroute;

// Report a failure
static
void
fail(
    system::error_code ec,
    char const* what)
{
    std::cerr << what << ": " << ec.message() << "\n";
}

static
application
make_app()
{
    application app;

    // log every request
    app.use(
        [](route_params& p) -> route_result
        {
            std::cerr <<
                p.req.method_string() << " " <<
                p.req.target() << "\n";
            return route::next;
        });

    app.use("/hello",
        [](route_params& p)
        {
            return p.send("Hello, world!\n");
        });

    // resumed from another thread
    app.use("/slow",
        [](route_params& p)
        {
            return p.suspend(
                [](resumer resume)
                {
                    std::thread(
                        [resume]
                        {
                            std::this_thread::sleep_for(
                                std::chrono::milliseconds(100));
                            resume(route::next);
                        }).detach();
                });
        },
        [](route_params& p)
        {
            return p.send("That took a while\n");
        });

    app.use("/boom",
        [](route_params&) -> route_result
        {
            throw std::runtime_error("boom");
        });

    application api;
    api.use("/status",
        [](route_params& p)
        {
            p.res.set(http::field::content_type,
                "application/json");
            return p.send("{\"status\":\"ok\"}\n");
        });
    app.use("/api", std::move(api));

    app.except(
        [](route_params& p, std::exception_ptr ep) -> route_result
        {
            try
            {
                std::rethrow_exception(ep);
            }
            catch(std::exception const& e)
            {
                std::cerr << "exception: " << e.what() << "\n";
            }
            p.status(http::status::internal_server_error);
            return p.send("Something broke\n");
        });

    return app;
}

// Handles an HTTP server connection
static
void
do_session(
    tcp::socket& socket,
    application const& app)
{
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    system::error_code ec;

    for(;;)
    {
        route_params p;
        http::read(stream, buffer, p.req, ec);
        if(ec == http::error::end_of_stream)
            break;
        if(ec)
            return fail(ec, "read");

        // handlers may finish on another thread
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        route_result result;
        app.handle(p,
            [&](route_params& p, route_result rv)
            {
                application::final_handler(p, rv);
                std::lock_guard<std::mutex> lock(m);
                result = rv;
                done = true;
                cv.notify_one();
            });
        {
            std::unique_lock<std::mutex> lock(m);
            cv.wait(lock, [&done]{ return done; });
        }

        if(result == route::complete)
            continue;
        if(result == route::close)
            break;
        p.res.prepare_payload();
        http::write(stream, p.res, ec);
        if(ec)
            return fail(ec, "write");
        if(! p.res.keep_alive())
            break;
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

int
main(int argc, char* argv[])
{
    if(argc != 3)
    {
        std::cerr <<
            "Usage: stackroute_example_server <address> <port>\n" <<
            "Example:\n" <<
            "    stackroute_example_server 0.0.0.0 8080\n";
        return EXIT_FAILURE;
    }

    try
    {
        auto const address = net::ip::make_address(argv[1]);
        auto const port = static_cast<unsigned short>(
            std::atoi(argv[2]));
        auto const app = make_app();

        net::io_context ioc{1};
        tcp::acceptor acceptor{ioc, {address, port}};
        for(;;)
        {
            tcp::socket socket{ioc};
            acceptor.accept(socket);
            std::thread(
                [s = std::move(socket), &app]() mutable
                {
                    do_session(s, app);
                }).detach();
        }
    }
    catch(std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
