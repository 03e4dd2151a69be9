#ifndef _SIGMA_HPP_
#define _SIGMA_HPP_
/* sigma.hpp - provers, verifiers, and the three-move protocol
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
#include <map>
#include <string>
#include <vector>

#include "scalar25519.hpp"
#include "group.hpp"
#include "secret.hpp"
#include "statement.hpp"

/* The three-move protocol, for any statement tree:
 *
 *   ProverRound pr = prover.commit();                  // randomizers
 *   VerifierRound vr = verifier.sendChallenge(pr.commitment());
 *   Response resp = std::move(pr).computeResponse(vr.challenge());
 *   bool ok = vr.verify(resp);
 *
 * (which is what SigmaProtocol::run does). A ProverRound answers exactly
 * one challenge, and each call to Prover::commit draws fresh randomizers,
 * so randomizers are never reused across challenges.
 *
 * Internally, the statement tree is first "resolved": every extended node
 * is replaced by the inner statement built from its precommitment, and the
 * tree is flattened to a list of linear leaves. The commitment consists of
 * the precommitments, followed by one point per leaf,
 *
 *   C_j = \sum_i r(x_i) * g_i   (over the terms of leaf j)
 *
 * where r(x) is the randomizer of the secret x. Each distinct secret in
 * the tree has one randomizer, and the response is one scalar per distinct
 * secret (in order of first occurrence), z(x) = r(x) + c*value(x). The
 * verifier accepts iff for every leaf j
 *
 *   \sum_i z(x_i) * g_i == C_j + c * lhs_j.
 *
 * A single challenge is used for the entire tree.
 **/
namespace SIGMAZK {
using CRV25519::Scalar, CRV25519::Element, CRV25519::Group;

struct Commitment {
    std::vector<Element> precommitments; // extended nodes, in traversal order
    std::vector<Element> points;         // one per linear leaf
};

typedef std::vector<Scalar> Response; // one per distinct secret

// A non-interactive proof, bound to an application message
struct NIProof {
    std::vector<Element> precommitments;
    Scalar challenge;
    Response responses;
};

// A complete (commitment, challenge, response) triple
struct SigmaTranscript {
    Commitment commitment;
    Scalar challenge;
    Response response;
};

// A statement tree with all the extended nodes expanded, see above
struct ResolvedStatement {
    Statement root;
    std::vector<Statement> constructed; // keeps the inner statements alive
    std::vector<const Statement::Linear*> leaves;
    std::vector<Secret> secrets;        // distinct, first-occurrence order
    std::map<Secret, size_t> index;     // position of each secret in secrets
    std::vector<Element> precommitments;
    bool adequate = true; // false if some precommitment was rejected

    explicit ResolvedStatement(const Statement& st): root(st) {}

    // Returns \sum_i perSecret[x_i] * g_i over the terms of leaf j,
    // where perSecret is indexed like the secrets vector
    Element combine(size_t j, const std::vector<Scalar>& perSecret) const;
};

class ProverRound {
    ResolvedStatement rs;
    SecretValues values; // includes the internal secrets of extended nodes
    std::vector<Scalar> randomizers;
    Commitment com;

    explicit ProverRound(const Statement& st): rs(st) {}
    friend class Prover;
public:
    const Commitment& commitment() const { return com; }

    // Computes the responses r(x) + c*value(x). The randomizers are
    // erased afterwards, so a round can only be used once.
    Response computeResponse(const Scalar& challenge) &&;
};

class Prover {
    Statement stmt;
    SecretValues values;

    ProverRound newRound() const;
public:
    std::string tag; // domain separation for non-interactive proofs

    // Throws MissingSecret if some secret of st has no value
    Prover(const Statement& st, const SecretValues& vals);

    const Statement& statement() const { return stmt; }

    ProverRound commit() const;

    // Commit, derive the challenge from the commitment and message, respond
    NIProof getNIProof(const std::string& message) const;
};

class VerifierRound {
    ResolvedStatement rs;
    Commitment com;
    Scalar chal;

    explicit VerifierRound(const Statement& st): rs(st) {}
    friend class Verifier;
public:
    const Scalar& challenge() const { return chal; }

    // Returns false for every well-formed-but-false or malformed
    // response, never throws on a failed check
    bool verify(const Response& response) const;
};

class Verifier {
    Statement stmt;
public:
    std::string tag; // domain separation for non-interactive proofs

    explicit Verifier(const Statement& st);

    const Statement& statement() const { return stmt; }

    // Resolves the statement using the precommitments in com, and draws
    // a random challenge. An inadequate precommitment is not an error,
    // the round will just reject every response.
    VerifierRound sendChallenge(const Commitment& com) const;

    bool verifyNI(const NIProof& proof, const std::string& message) const;

    // Checks a full transcript (e.g., one produced by simulate)
    bool verifyTranscript(const SigmaTranscript& t) const;

    // Produce an accepting transcript without knowing any secret, by
    // choosing the challenge and responses first
    SigmaTranscript simulate() const;
};

// Drives one interactive run between a verifier and a prover of the
// same statement. The runner keeps its own copies of both, and can
// only be used once.
class SigmaProtocol {
    Verifier verifier;
    Prover prover;
    bool used;
public:
    SigmaProtocol(const Verifier& v, const Prover& p): verifier(v), prover(p), used(false) {}
    bool run();
};

} /* end of namespace SIGMAZK */
#endif // ifndef _SIGMA_HPP_
