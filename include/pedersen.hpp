#ifndef _PEDERSEN_HPP_
#define _PEDERSEN_HPP_
/* pedersen.hpp - Pedersen commitments and proofs of their openings
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
#include <vector>

#include "scalar25519.hpp"
#include "group.hpp"
#include "secret.hpp"
#include "statement.hpp"

/* Pedersen commitments and the related proofs are defined relative to
 * some generators. A context object has a string tag and a group, and
 * the generators are computed as
 *
 *   G_i = hashToPoint(tag+"G"+str(i))
 *   H   = hashToPoint(tag+"H")
 *
 * so nobody knows the discrete logs between them. A commitment to the
 * scalars x_1,...,x_n with randomness r is the point
 *
 *   C = r*H + \sum_i x_i*G_i
 *
 * A Pedersen proof is the canonical "I know the openings" statement,
 * namely the DLRep statement lhs = \sum_i x_i*g_i for a list of
 * generators and a list of secrets of the same length. The same secret
 * may appear more than once in the list.
 **/
namespace SIGMAZK {
using CRV25519::Scalar, CRV25519::Element, CRV25519::Group;

// compute \sum_i Gi*xi (code in naive.cpp). The empty sum is the
// identity of the group g, otherwise g is ignored.
Element multiExp(const Element* Gs, size_t n, const Scalar* xes,
                 const Group& g=Group::ed25519());
inline Element multiExp(const std::vector<Element>& Gs, const std::vector<Scalar>& xes,
                        const Group& g=Group::ed25519()) {
    if (Gs.size() != xes.size())
        throw MalformedStatement("multiExp: "+std::to_string(Gs.size())
                +" generators but "+std::to_string(xes.size())+" scalars");
    return multiExp(Gs.data(), Gs.size(), xes.data(), g);
}

// A Pedersen context defines the generators to use
struct PedersenContext {
    std::string tag;
    const Group* grp;

    explicit PedersenContext(const std::string& t=std::string(),
                             const Group& g=Group::ed25519()): tag(t), grp(&g) {}

    const Group& group() const { return *grp; }

    Element getG(int i) const { // returns G_i
        return CRV25519::hashToPoint(*grp, tag+"G"+std::to_string(i));
    }
    Element getH() const {      // the generator for the randomness
        return CRV25519::hashToPoint(*grp, tag+"H");
    }
    std::vector<Element> getGenerators(size_t n) const; // G_0,...,G_{n-1}

    Element commit(const std::vector<Scalar>& xes, const Scalar& r) const {
        return getH()*r + multiExp(getGenerators(xes.size()), xes, *grp);
    }
    bool verifyCom(const Element& c, const std::vector<Scalar>& xes, const Scalar& r) const {
        return commit(xes, r) == c;
    }
};

// The statement lhs = \sum_i secrets[i]*generators[i]. Throws
// MalformedStatement if the lists are empty or of different lengths,
// GroupMismatch if the generators span more than one group.
Statement pedersenProof(const std::vector<Element>& generators,
                        const std::vector<Secret>& secrets, const Element& lhs);

// The statement C = x*H + \sum_i secrets[i]*G_i, proving knowledge of an
// opening (x_1,...,x_n,r) of a commitment in this context
Statement openingProof(const PedersenContext& ped, const Element& C,
                       const std::vector<Secret>& secrets, const Secret& r);

} // end of namespace SIGMAZK
#endif // ifndef _PEDERSEN_HPP_
