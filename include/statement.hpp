#ifndef _STATEMENT_HPP_
#define _STATEMENT_HPP_
/* statement.hpp - composable statements for Sigma protocols
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
#include <vector>
#include <variant>
#include <string>
#include <iostream>

#include "group.hpp"
#include "secret.hpp"
#include "errors.hpp"

/* A statement is an immutable description of a relation that a prover
 * can prove knowledge of. It is one of three kinds:
 *
 * 1. Linear (DLRep): lhs = \sum_i x_i * g_i, for secrets x_i and
 *    public generators g_i (a secret may be used with several g's).
 *
 * 2. Conjunction (And): all of two or more child statements hold.
 *    A secret that appears in several children denotes the same value,
 *    it gets one randomizer and one response for the entire tree.
 *
 * 3. Extended: a statement whose final form is only fixed after the
 *    prover sends a randomized precommitment. Both sides build the
 *    same inner statement from the precommitment, then prove it as
 *    usual. The discrete-log inequality proof is of this kind.
 *
 * Statement objects are cheap handles to shared immutable nodes, they
 * can be copied and shared between threads. All the structural checks
 * (non-empty expressions, one group per tree, etc.) are done when the
 * statement is built, by throwing one of the exceptions in errors.hpp.
 **/
namespace SIGMAZK {
using CRV25519::Scalar, CRV25519::Element, CRV25519::Group;

class Statement;
class Prover;
class Verifier;

typedef std::vector<Element> Precommitment;

// The interface for statements with a precommitment phase
class ExtendedStatement {
public:
    virtual ~ExtendedStatement() = default;

    virtual const Group& group() const = 0;
    virtual std::string describe() const = 0;

    // Secrets that the prover must supply values for
    virtual std::vector<Secret> freeSecrets() const = 0;

    // The subset of freeSecrets() that are tied to their external uses,
    // and so can be shared with other statements in a conjunction
    virtual std::vector<Secret> boundSecrets() const = 0;

    virtual size_t precommitmentSize() const = 0;

    // Prover side: draw the randomness, set the values of the internal
    // secrets of the constructed proof in internal, and return the
    // precommitment. Called once per protocol run.
    virtual Precommitment precommit(const SecretValues& values,
                                    SecretValues& internal) const = 0;

    // A precommitment distributed as in a real run, without any secrets
    virtual Precommitment simulatePrecommitment() const = 0;

    // The verifier must reject precommitments that make the inner
    // statement trivial, before trusting the constructed proof
    virtual bool isAdequate(const Precommitment& pre) const = 0;

    // Deterministically build the inner statement from the precommitment
    virtual Statement buildConstructedProof(const Precommitment& pre) const = 0;
};

class Statement {
public:
    struct Linear {
        Element lhs;
        LinearExpr expr;
    };
    struct Conjunction {
        std::vector<Statement> children;
    };
    struct Extended {
        std::shared_ptr<const ExtendedStatement> impl;
    };
    typedef std::variant<Linear, Conjunction, Extended> Node;

    const Node& node() const { return *nd; }
    const Group& group() const { return *grp; }

    // identifies the node, copies of the handle have the same id
    const void* id() const { return nd.get(); }

    // The secrets that a prover must supply values for, in order of
    // first occurrence
    std::vector<Secret> secrets() const;

    // Throws MissingSecret if values does not cover secrets()
    Prover getProver(const SecretValues& values) const;
    Verifier getVerifier() const;

    std::ostream& prettyPrint(std::ostream& os, int indent=0) const;

private:
    std::shared_ptr<const Node> nd;
    const Group* grp;

    Statement(const std::shared_ptr<const Node>& n, const Group& g): nd(n), grp(&g) {}

    friend Statement dlRep(const Element& lhs, const LinearExpr& expr);
    friend Statement andProof(const std::vector<Statement>& children);
    friend Statement extendedProof(const std::shared_ptr<const ExtendedStatement>& impl);
};

// Factories, all of them do the structural checks and throw on failure

// lhs = expr, throws MalformedStatement if expr is empty, GroupMismatch
// if lhs and the generators are not all from the same group
Statement dlRep(const Element& lhs, const LinearExpr& expr);

// The conjunction of the children, throws MalformedStatement if there
// are less than two of them or if an unbound secret of an extended child
// is used elsewhere, GroupMismatch if the children use different groups
Statement andProof(const std::vector<Statement>& children);

inline Statement andProof(const Statement& a, const Statement& b) {
    return andProof(std::vector<Statement>{a, b});
}

Statement extendedProof(const std::shared_ptr<const ExtendedStatement>& impl);

inline std::ostream& operator<<(std::ostream& os, const Statement& st) {
    return st.prettyPrint(os);
}

} /* end of namespace SIGMAZK */
#endif // ifndef _STATEMENT_HPP_
