#ifndef _NOTEQUAL_HPP_
#define _NOTEQUAL_HPP_
/* notequal.hpp - proofs of inequality of discrete logarithms
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
#include <utility>

#include "group.hpp"
#include "secret.hpp"
#include "statement.hpp"

/* A proof that two discrete logarithms are not equal, following Protocol 1
 * of Henry and Goldberg, "Thinking Inside the BLAC Box: Smarter Protocols
 * for Faster Anonymous Blacklisting" (WPES 2013):
 *
 *   PK{ x: H0 = x*h0 and H1 != x*h1 }
 *
 * The prover chooses a random nonzero b, sets alpha = x*b, beta = -b, and
 * sends the precommitment C = b*(x*h1 - H1). Then it proves
 *
 *   identity = alpha*h0 + beta*H0   and   C = alpha*h1 + beta*H1.
 *
 * The first part forces alpha = x*beta (where x is the dlog of H0), and
 * the second part then gives C = beta*(x*h1 - H1), which is the identity
 * if H1 = x*h1. The verifier rejects an identity C. Soundness relies on
 * beta being nonzero.
 *
 * alpha and beta are internal to the proof, so x is NOT tied to uses of
 * the same secret elsewhere unless binding is set, in which case we add
 * a third part H0 = x*h0 with the original secret. Building a conjunction
 * where an unbound x is also used by another statement is an error.
 **/
namespace SIGMAZK {
using CRV25519::Element, CRV25519::Group;

class DLRepNotEqual: public ExtendedStatement {
    Element bigH0, h0, bigH1, h1;
    Secret x, alpha, beta;
    bool binding;
public:
    // valid = (H0,h0), invalid = (H1,h1)
    DLRepNotEqual(const std::pair<Element,Element>& valid,
                  const std::pair<Element,Element>& invalid,
                  const Secret& x, bool binding=false);

    const Group& group() const override { return h0.group(); }
    std::string describe() const override;

    std::vector<Secret> freeSecrets() const override { return {x}; }
    std::vector<Secret> boundSecrets() const override {
        return binding? std::vector<Secret>{x} : std::vector<Secret>();
    }
    size_t precommitmentSize() const override { return 1; }

    Precommitment precommit(const SecretValues& values, SecretValues& internal) const override;
    Precommitment simulatePrecommitment() const override;
    bool isAdequate(const Precommitment& pre) const override;
    Statement buildConstructedProof(const Precommitment& pre) const override;
};

// Throws GroupMismatch if the four elements are not all in the same
// group, MalformedStatement if h0 or h1 is the identity
Statement dlRepNotEqual(const std::pair<Element,Element>& validPair,
                        const std::pair<Element,Element>& invalidPair,
                        const Secret& x, bool binding=false);

// Same as above, with the pairs given as vectors. Throws
// MalformedStatement unless both have exactly two elements.
Statement dlRepNotEqual(const std::vector<Element>& validTuple,
                        const std::vector<Element>& invalidTuple,
                        const Secret& x, bool binding=false);

} /* end of namespace SIGMAZK */
#endif // ifndef _NOTEQUAL_HPP_
