/*

split_inbox.cpp
---------------

Moves new messages of the inbox into mailboxes chosen from their sender, deleting spam.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <utility>
#include <string_view>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mailsync/imap/session_registry.hpp>
#include <mailsync/imap/split.hpp>

#include "example_util.hpp"

using std::cout;
using std::endl;


static mailsync::imap::classification by_sender(std::string_view raw)
{
    mailsync::imap::classification where;
    if (raw.find("X-Spam-Flag: YES") != std::string_view::npos)
        where.discard = true;
    else if (raw.find("@lists.example.org") != std::string_view::npos)
        where.destinations = {"Lists"};
    else if (raw.find("@work.example.com") != std::string_view::npos)
        where.destinations = {"Work", "Archive"};
    return where;
}

int main()
{
    boost::asio::io_context io_ctx;
    boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);

    // modify to use an existing account
    example_credentials credentials("mailsync@example.com", "mailsyncpass");

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            mailsync::imap::session_registry registry(io_ctx.get_executor(), credentials, ssl_ctx);

            mailsync::imap::server_config config;
            config.name = "imap.example.com";
            config.transport = mailsync::net::tls_mode::starttls;

            auto s = co_await registry.open(config);
            if (!s)
            {
                print_error(s.error());
                co_return;
            }

            auto report = co_await mailsync::imap::split_incoming(**s, by_sender);
            if (!report)
                print_error(report.error());
            else
            {
                cout << "New: " << report->incoming.to_imap_set() << endl;
                for (const auto& [dest, uids] : report->copied)
                    cout << "  " << dest << " <- " << uids.to_imap_set() << endl;
                cout << "Deleted: " << report->deleted.to_imap_set() << " (" << report->expunge << ")" << endl;
                if (report->partial_failure)
                    print_error(*report->partial_failure);
            }

            co_await registry.close(config.name);
        },
        boost::asio::detached);

    io_ctx.run();
    return EXIT_SUCCESS;
}
