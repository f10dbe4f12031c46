//
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/multipart.hpp"
#include "src/detail/strings.hpp"
#include <boost/http/rfc/parameter.hpp>
#include <boost/http/rfc/token_rule.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/tuple_rule.hpp>
#include <tuple>

namespace boost {
namespace csrf {
namespace detail {

namespace {

struct part_header
{
    std::string name;
    bool is_file = false;
};

// Parse the header block of one part, which
// does not include the terminating empty line.
bool
parse_part_header(
    core::string_view s,
    part_header& ph)
{
    bool disposition = false;
    while(! s.empty())
    {
        core::string_view line;
        auto const crlf = s.find("\r\n");
        if(crlf == core::string_view::npos)
        {
            line = s;
            s = {};
        }
        else
        {
            line = s.substr(0, crlf);
            s.remove_prefix(crlf + 2);
        }

        auto const colon = line.find(':');
        if(colon == core::string_view::npos)
            return false;
        auto const fname = trim_ows(line.substr(0, colon));
        auto const fvalue = trim_ows(line.substr(colon + 1));
        if(! grammar::ci_is_equal(
            fname, "Content-Disposition"))
            continue;

        // disposition-type *( OWS ";" OWS disposition-parm )
        auto rv = grammar::parse(fvalue,
            grammar::tuple_rule(
                http::token_rule,
                http::parameters_rule));
        if(! rv)
            return false;
        if(! grammar::ci_is_equal(
            std::get<0>(*rv), "form-data"))
            return false;
        bool has_name = false;
        for(auto p : std::get<1>(*rv))
        {
            if(grammar::ci_is_equal(p.name, "name"))
            {
                ph.name = unquote(p.value);
                has_name = true;
            }
            else if(grammar::ci_is_equal(p.name, "filename"))
            {
                ph.is_file = true;
            }
        }
        if(! has_name)
            return false;
        disposition = true;
    }
    return disposition;
}

} // (anon)

boost::optional<std::string>
find_multipart_field(
    core::string_view body,
    core::string_view boundary,
    core::string_view name)
{
    if(boundary.empty())
        return boost::none;

    std::string needle("\r\n--");
    needle.append(boundary.data(), boundary.size());
    core::string_view const delim =
        core::string_view(needle).substr(2);

    // skip the preamble
    std::size_t pos;
    if(body.starts_with(delim))
    {
        pos = 0;
    }
    else
    {
        pos = body.find(needle);
        if(pos == core::string_view::npos)
            return boost::none;
        pos += 2;
    }

    for(;;)
    {
        pos += delim.size();
        auto rest = body.substr(pos);

        // close-delimiter
        if(rest.starts_with("--"))
            return boost::none;

        // transport-padding
        std::size_t pad = 0;
        while(pad < rest.size() && is_ows(rest[pad]))
            ++pad;
        rest.remove_prefix(pad);
        if(! rest.starts_with("\r\n"))
            return boost::none;
        rest.remove_prefix(2);
        pos += pad + 2;

        core::string_view header;
        std::size_t content_pos;
        if(rest.starts_with("\r\n"))
        {
            content_pos = pos + 2;
        }
        else
        {
            auto const end = rest.find("\r\n\r\n");
            if(end == core::string_view::npos)
                return boost::none;
            header = rest.substr(0, end);
            content_pos = pos + end + 4;
        }

        part_header ph;
        if(! parse_part_header(header, ph))
            return boost::none;

        auto const content_end =
            body.find(needle, content_pos);
        if(content_end == core::string_view::npos)
            return boost::none;

        if( ! ph.is_file &&
            core::string_view(ph.name) == name &&
            content_end > content_pos)
        {
            auto const v = body.substr(
                content_pos, content_end - content_pos);
            return std::string(v.data(), v.size());
        }

        // position on the next delimiter
        pos = content_end + 2;
    }
}

} // detail
} // csrf
} // boost
