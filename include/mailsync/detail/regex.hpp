#pragma once

#include <string>
#include <boost/regex.hpp>

namespace mailsync::detail
{
using regex = boost::regex;

[[nodiscard]] inline regex make_icase_regex(const std::string& pattern)
{
    return regex(pattern, boost::regex::perl | boost::regex::icase);
}

/// Whole-string match, as content-type rules are written ("text/.*" rather than "^text/").
inline bool regex_match(const std::string& input, const regex& pattern)
{
    return boost::regex_match(input, pattern);
}
} // namespace mailsync::detail
