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

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace migration::impl {

/**
 * @brief Split the text of a CQL script into statements.
 *
 * Comments are removed wherever they start outside of a literal: `--` and `//` up to the end of the line, and C-style
 * block comments. A line holding nothing but a comment disappears entirely. Statements are separated by `;`
 * outside of single quoted, double quoted and `$$` literals; the terminating `;` is not part of the returned statement.
 * Blank statements are dropped.
 *
 * @param text The script text
 * @return The statements in order of appearance
 */
[[nodiscard]] std::vector<std::string>
splitStatements(std::string_view text);

}  // namespace migration::impl
