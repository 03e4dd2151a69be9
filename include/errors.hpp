#ifndef _ERRORS_HPP_
#define _ERRORS_HPP_
/* errors.hpp - exceptions thrown when building statements
 * 
 * Copyright (C) 2021, LWE-PVSS
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
 * OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL
 * THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR
 * OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE,
 * ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 **/
#include <string>
#include <stdexcept>

namespace SIGMAZK {

// Structural problems with a statement are reported at construction
// time by throwing one of the exceptions below. A proof that is
// well-formed but false is NOT an error, verification just returns
// false in that case.
class SigmaError: public std::runtime_error {
public:
    explicit SigmaError(const std::string& what): std::runtime_error(what) {}
};

// Generators (or the occurrences of a shared secret) span more than one group
class GroupMismatch: public SigmaError {
public:
    explicit GroupMismatch(const std::string& what): SigmaError(what) {}
};

// Empty expressions, conjunctions with less than two children,
// inequality tuples of the wrong size, invalid point encodings, etc.
class MalformedStatement: public SigmaError {
public:
    explicit MalformedStatement(const std::string& what): SigmaError(what) {}
};

// No value was supplied for a secret that the statement references
class MissingSecret: public SigmaError {
public:
    explicit MissingSecret(const std::string& what): SigmaError(what) {}
};

} /* end of namespace SIGMAZK */
#endif // ifndef _ERRORS_HPP_
