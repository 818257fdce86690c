/*
 * Splice - lexical token splicing and macro expansion toolkit
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */




#pragma once

#include "splice/expander.hpp"

/**
 * \file concat_idents.hpp
 * The `concat_idents` expander
 *
 * \ingroup expansion
 */


namespace spl {

/**
 * Concatenate two identifiers
 *
 * The input must be exactly `<ident> , <ident>`. The resulting identifier has
 * the provenance of the second one, so that names built by other macros, as in
 * `concat_idents!(prefix_, NAME)`, are reported where `NAME` was written.
 *
 * \throws expansion_error if the input has any other shape
 *
 * \ingroup expansion
 */
[[nodiscard]] token_stream
concat_idents(const token_stream &input);

} // namespace spl
