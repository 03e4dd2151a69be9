/* secret.cpp - secrets and linear expressions
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
#include <atomic>
#include <algorithm>
#include "secret.hpp"

namespace SIGMAZK {

static std::atomic<size_t> nextSecretId(1);

Secret::Secret(const std::string& name): id(nextSecretId++), label(name) {
    if (label.empty())
        label = "s"+std::to_string(id);
}

const Scalar& valueOf(const SecretValues& values, const Secret& s) {
    auto it = values.find(s);
    if (it == values.end())
        throw MissingSecret("no value for secret "+s.name());
    return it->second;
}

void appendDistinct(std::vector<Secret>& out, const std::vector<Secret>& in) {
    for (auto& s : in)
        if (std::find(out.begin(), out.end(), s) == out.end())
            out.push_back(s);
}

std::vector<Secret> LinearExpr::secrets() const {
    std::vector<Secret> distinct;
    for (auto& t : terms)
        if (std::find(distinct.begin(), distinct.end(), t.secret) == distinct.end())
            distinct.push_back(t.secret);
    return distinct;
}

Element LinearExpr::evaluate(const SecretValues& values) const {
    if (terms.empty())
        return Element();
    Element sum = terms[0].generator.group().identity();
    for (auto& t : terms)
        sum += t.generator * valueOf(values, t.secret);
    return sum;
}

} /* end of namespace SIGMAZK */
