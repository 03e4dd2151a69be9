/* naive.cpp - Naive multi-exponentiation and Pedersen statements
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
#include "scalar25519.hpp"
#include "group.hpp"
#include "pedersen.hpp"

namespace SIGMAZK {

// compute \sum_i Gi*xi, naive implementation
Element multiExp(const Element* Gs, size_t n, const Scalar* xes, const Group& g) {
    if (n == 0)
        return g.identity();
    Element c = Gs[0].group().identity();
    for (size_t i=0; i<n; i++)
        c += Gs[i]*xes[i];
    return c;
}

std::vector<Element> PedersenContext::getGenerators(size_t n) const {
    std::vector<Element> Gs;
    Gs.reserve(n);
    for (size_t i=0; i<n; i++)
        Gs.push_back(getG(i));
    return Gs;
}

Statement pedersenProof(const std::vector<Element>& generators,
                        const std::vector<Secret>& secrets, const Element& lhs) {
    if (generators.size() != secrets.size())
        throw MalformedStatement("pedersenProof: "+std::to_string(generators.size())
                +" generators but "+std::to_string(secrets.size())+" secrets");
    LinearExpr expr;
    for (size_t i=0; i<generators.size(); i++)
        expr += secrets[i] * generators[i];
    return dlRep(lhs, expr); // throws on empty lists and group mismatch
}

Statement openingProof(const PedersenContext& ped, const Element& C,
                       const std::vector<Secret>& secrets, const Secret& r) {
    std::vector<Element> Gs = ped.getGenerators(secrets.size());
    LinearExpr expr = r * ped.getH();
    for (size_t i=0; i<secrets.size(); i++)
        expr += secrets[i] * Gs[i];
    return dlRep(C, expr);
}

} // end of namespace SIGMAZK
