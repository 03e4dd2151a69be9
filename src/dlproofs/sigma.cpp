/* sigma.cpp - provers, verifiers, and the three-move protocol
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
#include <stdexcept>
extern "C" {
    #include <sodium.h>
}
#include "sigma.hpp"
#include "fiatshamir.hpp"

namespace SIGMAZK {

namespace {

// Where the precommitments of the extended nodes come from: the prover
// computes them, the simulator draws them, and the verifier reads them
// from the commitment that it received.
class PrecommitSource {
public:
    virtual ~PrecommitSource() = default;
    // Returns false if no adequate precommitment is available
    virtual bool next(const ExtendedStatement& ext, Precommitment& pre) = 0;
};

class ProverSource: public PrecommitSource {
    const SecretValues& values;
    SecretValues& internal;
public:
    ProverSource(const SecretValues& v, SecretValues& in): values(v), internal(in) {}
    bool next(const ExtendedStatement& ext, Precommitment& pre) override {
        pre = ext.precommit(values, internal);
        return true;
    }
};

class SimulatorSource: public PrecommitSource {
public:
    bool next(const ExtendedStatement& ext, Precommitment& pre) override {
        pre = ext.simulatePrecommitment();
        return true;
    }
};

// Received points must decode before we do any arithmetic on them
bool isValidOrIdentity(const Element& p) {
    return p.isIdentity() || p.isValid();
}

class ReceivedSource: public PrecommitSource {
    const std::vector<Element>& received;
    size_t pos;
public:
    explicit ReceivedSource(const std::vector<Element>& r): received(r), pos(0) {}
    bool next(const ExtendedStatement& ext, Precommitment& pre) override {
        size_t n = ext.precommitmentSize();
        if (pos + n > received.size())
            return false;
        pre.assign(received.begin()+pos, received.begin()+pos+n);
        pos += n;
        for (auto& p : pre) { // check the group before building anything
            if (&p.group() != &ext.group() || !isValidOrIdentity(p))
                return false;
        }
        return ext.isAdequate(pre);
    }
    bool exhausted() const { return pos == received.size(); }
};

// Each extended node is expanded once per run, even if it appears more
// than once in the tree, so all its occurrences share the same inner
// statement (and the same values for its internal secrets).
void resolveNode(ResolvedStatement& rs, const Statement& st, PrecommitSource& src,
                 std::map<const void*, size_t>& built) {
    if (!rs.adequate)
        return;
    const Statement::Node& nd = st.node();
    if (auto lin = std::get_if<Statement::Linear>(&nd)) {
        rs.leaves.push_back(lin);
    }
    else if (auto conj = std::get_if<Statement::Conjunction>(&nd)) {
        for (auto& child : conj->children)
            resolveNode(rs, child, src, built);
    }
    else {
        auto& ext = std::get<Statement::Extended>(nd);
        auto it = built.find(st.id());
        if (it == built.end()) {
            Precommitment pre;
            if (!src.next(*ext.impl, pre)) {
                rs.adequate = false;
                return;
            }
            rs.precommitments.insert(rs.precommitments.end(), pre.begin(), pre.end());
            rs.constructed.push_back(ext.impl->buildConstructedProof(pre));
            it = built.insert({st.id(), rs.constructed.size()-1}).first;
        }
        Statement inner = rs.constructed[it->second]; // a copy, the vector may grow
        resolveNode(rs, inner, src, built);
    }
}

ResolvedStatement resolve(const Statement& st, PrecommitSource& src) {
    ResolvedStatement rs(st);
    std::map<const void*, size_t> built;
    resolveNode(rs, st, src, built);

    // Number the distinct secrets in order of first occurrence
    for (auto leaf : rs.leaves) {
        for (auto& t : leaf->expr.terms) {
            if (rs.index.insert({t.secret, rs.secrets.size()}).second)
                rs.secrets.push_back(t.secret);
        }
    }
    return rs;
}

// The Fiat-Shamir challenge binds the resolved statement (including the
// precommitments), the commitment points, and the message
Scalar niChallenge(const std::string& tag, const ResolvedStatement& rs,
                   const std::vector<Element>& points, const std::string& message) {
    FiatShamir fs(tag);
    for (auto& p : rs.precommitments)
        fs.processPoint("precommitment", p);
    for (size_t j=0; j<rs.leaves.size(); j++) {
        const Statement::Linear* leaf = rs.leaves[j];
        fs.processPoint("lhs", leaf->lhs);
        for (auto& t : leaf->expr.terms) {
            fs.processScalar("secret", Scalar().setInteger(rs.index.at(t.secret)));
            fs.processPoint("generator", t.generator);
        }
        fs.processPoint("commitment", points[j]);
    }
    fs.processMessage("message", message);
    return fs.newChallenge("c");
}

// Check that \sum_i z(x_i)*g_i == C_j + c*lhs_j for all the leaves
bool checkResponse(const ResolvedStatement& rs, const Commitment& com,
                   const Scalar& c, const Response& resp) {
    if (!rs.adequate || com.points.size() != rs.leaves.size()
        || resp.size() != rs.secrets.size())
        return false;
    for (size_t j=0; j<rs.leaves.size(); j++) {
        const Element& lhs = rs.leaves[j]->lhs;
        if (!com.points[j].sameGroup(lhs) || !isValidOrIdentity(com.points[j]))
            return false;
        if (rs.combine(j, resp) != com.points[j] + lhs * c)
            return false;
    }
    return true;
}

// The commitments implied by the challenge and responses,
// C_j = \sum_i z(x_i)*g_i - c*lhs_j
std::vector<Element> impliedCommitments(const ResolvedStatement& rs,
                                        const Scalar& c, const Response& resp) {
    std::vector<Element> points;
    points.reserve(rs.leaves.size());
    for (size_t j=0; j<rs.leaves.size(); j++)
        points.push_back(rs.combine(j, resp) - rs.leaves[j]->lhs * c);
    return points;
}
} // end of anonymous namespace

Element ResolvedStatement::combine(size_t j, const std::vector<Scalar>& perSecret) const {
    const Statement::Linear* leaf = leaves.at(j);
    Element sum = leaf->lhs.group().identity();
    for (auto& t : leaf->expr.terms)
        sum += t.generator * perSecret.at(index.at(t.secret));
    return sum;
}

Prover Statement::getProver(const SecretValues& values) const {
    return Prover(*this, values);
}
Verifier Statement::getVerifier() const {
    return Verifier(*this);
}

/*******************************************************************/
/***************************** Prover ******************************/
/*******************************************************************/

Prover::Prover(const Statement& st, const SecretValues& vals): stmt(st), tag("sigmazk") {
    for (auto& s : st.secrets())
        values[s] = valueOf(vals, s); // throws MissingSecret
}

ProverRound Prover::newRound() const {
    ProverRound round(stmt);
    SecretValues internal;
    ProverSource src(values, internal);
    round.rs = resolve(stmt, src);
    round.values = values;
    for (auto& v : internal)
        round.values[v.first] = v.second;

    // One randomizer per distinct secret
    round.randomizers.resize(round.rs.secrets.size());
    for (auto& r : round.randomizers)
        r.randomize();

    round.com.precommitments = round.rs.precommitments;
    for (size_t j=0; j<round.rs.leaves.size(); j++)
        round.com.points.push_back(round.rs.combine(j, round.randomizers));
    return round;
}

ProverRound Prover::commit() const {
    return newRound();
}

Response ProverRound::computeResponse(const Scalar& challenge) && {
    if (randomizers.size() != rs.secrets.size())
        throw std::runtime_error("ProverRound::computeResponse: round was already used");

    Response resp(rs.secrets.size());
    for (size_t i=0; i<rs.secrets.size(); i++)
        resp[i] = randomizers[i] + challenge * valueOf(values, rs.secrets[i]);

    for (auto& r : randomizers)
        sodium_memzero(r.bytes, sizeof r.bytes);
    randomizers.clear();
    return resp;
}

NIProof Prover::getNIProof(const std::string& message) const {
    ProverRound round = newRound();
    NIProof proof;
    proof.precommitments = round.com.precommitments;
    proof.challenge = niChallenge(tag, round.rs, round.com.points, message);
    proof.responses = std::move(round).computeResponse(proof.challenge);
    return proof;
}

/*******************************************************************/
/**************************** Verifier *****************************/
/*******************************************************************/

Verifier::Verifier(const Statement& st): stmt(st), tag("sigmazk") {}

VerifierRound Verifier::sendChallenge(const Commitment& com) const {
    VerifierRound round(stmt);
    ReceivedSource src(com.precommitments);
    round.rs = resolve(stmt, src);
    if (!src.exhausted())
        round.rs.adequate = false;
    round.com = com;
    round.chal = stmt.group().randomScalar();
    return round;
}

bool VerifierRound::verify(const Response& response) const {
    return checkResponse(rs, com, chal, response);
}

bool Verifier::verifyNI(const NIProof& proof, const std::string& message) const {
    ReceivedSource src(proof.precommitments);
    ResolvedStatement rs = resolve(stmt, src);
    if (!rs.adequate || !src.exhausted() || proof.responses.size() != rs.secrets.size())
        return false;
    std::vector<Element> points = impliedCommitments(rs, proof.challenge, proof.responses);
    return niChallenge(tag, rs, points, message) == proof.challenge;
}

bool Verifier::verifyTranscript(const SigmaTranscript& t) const {
    ReceivedSource src(t.commitment.precommitments);
    ResolvedStatement rs = resolve(stmt, src);
    if (!src.exhausted())
        return false;
    return checkResponse(rs, t.commitment, t.challenge, t.response);
}

SigmaTranscript Verifier::simulate() const {
    SimulatorSource src;
    ResolvedStatement rs = resolve(stmt, src);

    SigmaTranscript t;
    t.challenge = stmt.group().randomScalar();
    t.response.resize(rs.secrets.size());
    for (auto& z : t.response)
        z.randomize();
    t.commitment.precommitments = rs.precommitments;
    t.commitment.points = impliedCommitments(rs, t.challenge, t.response);
    return t;
}

/*******************************************************************/

bool SigmaProtocol::run() {
    if (used)
        throw std::runtime_error("SigmaProtocol::run: a runner can only be used once");
    used = true;

    ProverRound pr = prover.commit();
    VerifierRound vr = verifier.sendChallenge(pr.commitment());
    Response resp = std::move(pr).computeResponse(vr.challenge());
    return vr.verify(resp);
}

} /* end of namespace SIGMAZK */
