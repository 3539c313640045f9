/*

mailbox_sync.cpp
----------------

Connects to an IMAP server over TLS, synchronizes the flags of a mailbox twice and prints what changed.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mailsync/detail/log.hpp>
#include <mailsync/imap/reconcile.hpp>
#include <mailsync/imap/session_registry.hpp>

#include "example_util.hpp"

using std::cout;
using std::endl;


int main()
{
    boost::asio::io_context io_ctx;
    boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
    if (const char* name = std::getenv("MAILSYNC_LOG_LEVEL"))
    {
        if (auto lvl = mailsync::log::parse_level(name))
            mailsync::log::logger::instance().set_level(*lvl);
        mailsync::log::logger::instance().set_trace_enabled(std::getenv("MAILSYNC_TRACE") != nullptr);
    }

    // modify to use an existing account
    example_credentials credentials("mailsync@example.com", "mailsyncpass");
    mailsync::imap::memory_info_store store;

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            mailsync::imap::session_registry registry(io_ctx.get_executor(), credentials, ssl_ctx);

            mailsync::imap::server_config config;
            config.name = "imap.example.com";
            config.transport = mailsync::net::tls_mode::implicit;

            auto s = co_await registry.open(config);
            if (!s)
            {
                print_error(s.error());
                co_return;
            }

            for (int pass = 0; pass < 2; ++pass)
            {
                auto synced = co_await mailsync::imap::sync_mailbox(**s, "INBOX", store);
                if (!synced)
                {
                    print_error(synced.error());
                    break;
                }
                if (synced->skipped)
                {
                    cout << "INBOX unchanged" << endl;
                    continue;
                }
                const auto info = store.load("INBOX");
                cout << "INBOX: " << synced->fetched << " fetched from " << synced->start_article << ", "
                     << synced->summary.unread << " unread, read set " << info->read.to_imap_set() << endl;
                for (const auto& [mark, uids] : info->marks)
                    cout << "  " << mark << ": " << uids.to_imap_set() << endl;
            }

            co_await registry.close(config.name);
        },
        boost::asio::detached);

    io_ctx.run();
    return EXIT_SUCCESS;
}
