//------------------------------------------------------------------------------
/*
    This file is part of cassmig
    Copyright (c) 2024, the cassmig developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "migration/impl/CqlScript.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace migration::impl {

namespace {

std::size_t
currentLineStart(std::string const& current)
{
    auto const eol = current.find_last_of('\n');
    return eol == std::string::npos ? 0 : eol + 1;
}

bool
onlyBlanksOnCurrentLine(std::string const& current)
{
    return current.find_first_not_of(" \t\r", currentLineStart(current)) == std::string::npos;
}

}  // namespace

std::vector<std::string>
splitStatements(std::string_view text)
{
    std::vector<std::string> statements;

    auto flush = [&statements](std::string& current) {
        boost::algorithm::trim(current);
        if (not current.empty())
            statements.push_back(current);
        current.clear();
    };

    std::string current;
    std::string_view closing;  // delimiter ending the literal being read; empty outside of literals
    std::size_t pos = 0;

    while (pos < text.size()) {
        auto const rest = text.substr(pos);

        if (not closing.empty()) {
            // a doubled quote inside a literal closes and reopens it, which leaves the state unchanged
            if (rest.starts_with(closing)) {
                current += closing;
                pos += closing.size();
                closing = {};
            } else {
                current += rest.front();
                ++pos;
            }
            continue;
        }

        if (rest.starts_with("--") or rest.starts_with("//")) {
            auto const eol = rest.find('\n');
            if (eol == std::string_view::npos) {
                pos = text.size();
            } else if (onlyBlanksOnCurrentLine(current)) {
                current.erase(currentLineStart(current));
                pos += eol + 1;
            } else {
                pos += eol;
            }
            continue;
        }

        if (rest.starts_with("/*")) {
            auto const end = rest.find("*/", 2);
            pos = end == std::string_view::npos ? text.size() : pos + end + 2;
            if (not current.empty() and std::isspace(static_cast<unsigned char>(current.back())) == 0)
                current += ' ';
            continue;
        }

        if (rest.starts_with("$$")) {
            closing = "$$";
            current += closing;
            pos += closing.size();
            continue;
        }

        auto const ch = rest.front();
        if (ch == '\'') {
            closing = "'";
        } else if (ch == '"') {
            closing = "\"";
        } else if (ch == ';') {
            flush(current);
            ++pos;
            continue;
        }

        current += ch;
        ++pos;
    }
    flush(current);

    return statements;
}

}  // namespace migration::impl
