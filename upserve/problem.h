//
// Copyright (c) 2024-present, The upserve authors
//
// This file is part of upserve.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#pragma once

#include <upserve/problem_kind.h>

#include <iosfwd>
#include <string>

/*!
 * \file
 * \brief Reader for problem envelopes.
 *
 * A problem file starts with a header describing the problem followed by an
 * opaque body that is passed unchanged to concrete solvers:
 * \code
 * % comment
 * upp 1
 * name <identifier>
 * kind <CATEGORY> <TAG> [<TAG>...]
 * begin
 * <body>
 * \endcode
 * Only the header is interpreted.
 */
namespace Upserve {

//! A problem instance identified by its locator.
struct Problem {
    std::string name;       //!< Instance name; defaults to the stem of the locator.
    std::string locator;    //!< Opaque locator (file path) of the serialized problem.
    ProblemKind kind;       //!< Frozen set of required features.
    uint32_t    body{0};    //!< Line on which the opaque body starts or 0 if there is none.
};

//! Returns the features required by the given problem.
inline const ProblemKind& problemKind(const Problem& p) { return p.kind; }

//! Returns true if the next non-comment line of in is a problem envelope header.
/*!
 * The stream position is not changed.
 */
bool isProblemEnvelope(std::istream& in);

//! Reads the header of a problem envelope.
/*!
 * \throw std::runtime_error with errc not_supported if the header is malformed.
 * \throw std::invalid_argument if it references unknown features.
 */
Problem readProblem(std::istream& in, const std::string& locator);

//! Opens locator and reads its header.
/*!
 * \throw std::runtime_error with errc no_such_file_or_directory if locator can't be opened.
 */
Problem loadProblem(const std::string& locator);

} // namespace Upserve
