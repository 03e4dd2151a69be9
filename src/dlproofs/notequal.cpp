/* notequal.cpp - proofs of inequality of discrete logarithms
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
#include <memory>
#include <stdexcept>
#include "notequal.hpp"

namespace SIGMAZK {

DLRepNotEqual::DLRepNotEqual(const std::pair<Element,Element>& valid,
        const std::pair<Element,Element>& invalid, const Secret& s, bool bind):
    bigH0(valid.first), h0(valid.second), bigH1(invalid.first), h1(invalid.second),
    x(s), alpha(s.name()+"_alpha"), beta(s.name()+"_beta"), binding(bind)
{
    for (const Element* e : {&bigH0, &bigH1, &h1}) {
        if (!e->sameGroup(h0))
            throw GroupMismatch("dlRepNotEqual: cannot mix "+h0.group().name()
                                +" and "+e->group().name()+" elements");
    }
    if (h0.isIdentity() || h1.isIdentity())
        throw MalformedStatement("dlRepNotEqual: generators cannot be the identity");
}

std::string DLRepNotEqual::describe() const {
    return "DLRepNotEqual[" + group().name() + "](" + x.name()
        + (binding? ", binding)" : ")");
}

Precommitment DLRepNotEqual::precommit(const SecretValues& values,
                                       SecretValues& internal) const {
    const Scalar& xValue = valueOf(values, x);
    Scalar blinder = CRV25519::randomNonzeroScalar();

    // Set the value of the two internal secrets
    internal[alpha] = xValue * blinder;
    internal[beta] = negationOf(blinder);

    return Precommitment{ (h1*xValue - bigH1) * blinder };
}

// Draws a random non-identity element of the group
Precommitment DLRepNotEqual::simulatePrecommitment() const {
    const Group& g = group();
    Element ret = g.identity();
    while (ret.isIdentity()) {
        Scalar s = g.randomScalar();
        ret = g.hashToPoint(s.bytes, sizeof s.bytes);
    }
    return Precommitment{ret};
}

// The constructed proof is only meaningful if the precommitment is
// a valid group element other than the identity
bool DLRepNotEqual::isAdequate(const Precommitment& pre) const {
    if (pre.size() != precommitmentSize())
        return false;
    for (auto& el : pre) {
        if (!el.sameGroup(h0) || el.isIdentity() || !el.isValid())
            return false;
    }
    return true;
}

Statement DLRepNotEqual::buildConstructedProof(const Precommitment& pre) const {
    if (pre.size() != precommitmentSize())
        throw MalformedStatement("DLRepNotEqual: expected one precommitment element, got "
                                 +std::to_string(pre.size()));
    std::vector<Statement> proofs;
    proofs.push_back(dlRep(group().identity(), alpha*h0 + beta*bigH0));
    proofs.push_back(dlRep(pre[0], alpha*h1 + beta*bigH1));

    // Repeat the first member without randomizing the secret
    if (binding)
        proofs.push_back(dlRep(bigH0, x*h0));

    return andProof(proofs);
}

Statement dlRepNotEqual(const std::pair<Element,Element>& validPair,
                        const std::pair<Element,Element>& invalidPair,
                        const Secret& x, bool binding) {
    return extendedProof(std::make_shared<DLRepNotEqual>(validPair, invalidPair, x, binding));
}

Statement dlRepNotEqual(const std::vector<Element>& validTuple,
                        const std::vector<Element>& invalidTuple,
                        const Secret& x, bool binding) {
    if (validTuple.size() != 2 || invalidTuple.size() != 2)
        throw MalformedStatement("dlRepNotEqual: the valid and invalid tuples must be pairs");
    return dlRepNotEqual(std::make_pair(validTuple[0], validTuple[1]),
                         std::make_pair(invalidTuple[0], invalidTuple[1]), x, binding);
}

} /* end of namespace SIGMAZK */
