#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <mailsync/detail/result.hpp>
#include <mailsync/imap/collaborators.hpp>

inline void print_error(const mailsync::error_info& err)
{
    std::cout << "Error: " << mailsync::to_string(err.code) << " - " << err.message << "\n";
    std::cout << "Detail: " << err.detail << "\n";
    std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Where: " << err.where.file_name() << ":" << err.where.line()
              << " " << err.where.function_name() << "\n";
}

/// One fixed account; forgetting only reports it.
class example_credentials : public mailsync::imap::credential_provider
{
public:
    example_credentials(std::string user, std::string secret) : cred_{std::move(user), std::move(secret)}
    {
    }

    std::optional<mailsync::imap::credentials> lookup(std::string_view, const std::vector<std::string>&) override
    {
        return cred_;
    }

    void forget(std::string_view host, std::string_view port) override
    {
        std::cout << "Credentials for " << host << ":" << port << " were rejected\n";
    }

private:
    mailsync::imap::credentials cred_;
};
