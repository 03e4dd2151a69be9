#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "pedersen.hpp"
#include "notequal.hpp"
#include "sigma.hpp"
#include "tests.hpp" // define strings SIGMAZK_TESTS::passed and SIGMAZK_TESTS::failed

using namespace SIGMAZK;

// H0 = x*h0, and H1 = y*h1 for y != x (or y == x if equal is set)
struct NotEqualSetup {
    const Group& g;
    Element h0, h1, bigH0, bigH1;
    Secret x;
    SecretValues values;

    explicit NotEqualSetup(bool equal=false, const Group& grp=Group::ed25519()):
            g(grp), x("x") {
        h0 = CRV25519::hashToPoint(g, "h0");
        h1 = CRV25519::hashToPoint(g, "h1");
        Scalar xVal = g.randomScalar();
        Scalar yVal = equal? xVal : xVal + Scalar().setInteger(1);
        values[x] = xVal;
        bigH0 = h0 * xVal;
        bigH1 = h1 * yVal;
    }
    Statement statement(bool binding=false) const {
        return dlRepNotEqual(std::make_pair(bigH0, h0), std::make_pair(bigH1, h1), x, binding);
    }
};

static bool runInteractive(const Statement& st, const SecretValues& values) {
    return SigmaProtocol(st.getVerifier(), st.getProver(values)).run();
}
static bool runNI(const Statement& st, const SecretValues& values) {
    return st.getVerifier().verifyNI(st.getProver(values).getNIProof("msg"), "msg");
}

static bool testNotEqual() {
    for (const Group* g : {&Group::ed25519(), &Group::ristretto255()}) {
        NotEqualSetup s(false, *g);
        for (bool binding : {false, true}) {
            Statement st = s.statement(binding);
            if (!runInteractive(st, s.values) || !runNI(st, s.values)) {
                std::cout << "  honest inequality proof failed in "<<g->name()
                          <<", binding="<<binding<<std::endl;
                return false;
            }
            if (st.secrets().size() != 1)
                return false;
        }
    }
    return true;
}

// If H1 = x*h1 the precommitment is the identity and the verifier rejects
static bool testEqual() {
    NotEqualSetup s(true);
    for (bool binding : {false, true}) {
        Statement st = s.statement(binding);
        Prover prover = st.getProver(s.values);
        ProverRound pr = prover.commit();
        if (pr.commitment().precommitments.size() != 1
            || !pr.commitment().precommitments[0].isIdentity())
            return false;
        if (runInteractive(st, s.values) || runNI(st, s.values)) {
            std::cout << "  inequality proof of equal logs was accepted\n";
            return false;
        }
    }
    return true;
}

// A wrong x is caught by the first part of the constructed proof
static bool testWrongSecret() {
    NotEqualSetup s;
    Statement st = s.statement();
    SecretValues wrong{{s.x, s.values[s.x] + Scalar().setInteger(2)}};
    return !runInteractive(st, wrong) && !runNI(st, wrong);
}

static bool testWithAnd() {
    NotEqualSetup s;
    Element g1 = CRV25519::hashToPoint(s.g, "g1");
    Secret r("r");
    SecretValues values = s.values;
    values[r] = s.g.randomScalar();
    Element lhs = g1*values[s.x] + s.h1*values[r];
    Statement dl = dlRep(lhs, s.x*g1 + r*s.h1);

    Statement bound = s.statement(true);
    Statement both = andProof(dl, bound);
    if (!runInteractive(both, values) || !runNI(both, values))
        return false;

    // the same extended node twice is expanded once
    Statement twice = andProof({bound, dl, bound});
    Prover prover = twice.getProver(values);
    if (prover.commit().commitment().precommitments.size() != 1)
        return false;
    if (!runInteractive(twice, values))
        return false;

    // an unbound x cannot be shared with another statement
    try {
        andProof(dl, s.statement(false));
        std::cout << "  unbound secret in a conjunction should throw\n";
        return false;
    } catch (const MalformedStatement&) {}

    // repeating an unbound node, also at different nesting levels
    Statement unbound = s.statement(false);
    Secret y("y");
    SecretValues vals1 = s.values;
    vals1[y] = s.g.randomScalar();
    Statement other1 = dlRep(g1 * vals1[y], y * g1);
    Statement nested = andProof(andProof(other1, unbound), unbound);
    if (!runInteractive(nested, vals1) || !runNI(nested, vals1)) {
        std::cout << "  nested conjunction with a repeated unbound node failed\n";
        return false;
    }
    if (nested.getProver(vals1).commit().commitment().precommitments.size() != 1)
        return false;

    // but an unbound x is still caught below the top level
    try {
        andProof(andProof(other1, unbound), dl);
        return false;
    } catch (const MalformedStatement&) {}
    try {
        andProof(andProof(other1, dl), andProof(unbound, other1));
        return false;
    } catch (const MalformedStatement&) {}

    // two unrelated statements are fine
    NotEqualSetup other;
    Statement pair = andProof(s.statement(false), other.statement(false));
    SecretValues vals2 = s.values;
    vals2[other.x] = other.values[other.x];
    return runInteractive(pair, vals2) && runNI(pair, vals2);
}

static bool testErrors() {
    NotEqualSetup s;
    try {
        dlRepNotEqual(std::vector<Element>{s.bigH0, s.h0, s.h0},
                      std::vector<Element>{s.bigH1, s.h1}, s.x);
        return false;
    } catch (const MalformedStatement&) {}
    try {
        dlRepNotEqual(std::vector<Element>{s.bigH0, s.h0}, std::vector<Element>{s.bigH1}, s.x);
        return false;
    } catch (const MalformedStatement&) {}
    Statement st = dlRepNotEqual(std::vector<Element>{s.bigH0, s.h0},
                                 std::vector<Element>{s.bigH1, s.h1}, s.x);
    if (!runInteractive(st, s.values))
        return false;

    Element ris = Group::ristretto255().generator();
    try {
        dlRepNotEqual(std::make_pair(s.bigH0, s.h0), std::make_pair(s.bigH1, ris), s.x);
        return false;
    } catch (const GroupMismatch&) {}
    try {
        dlRepNotEqual(std::make_pair(s.bigH0, s.h0),
                      std::make_pair(s.bigH1, s.g.identity()), s.x);
        return false;
    } catch (const MalformedStatement&) {}
    try {
        st.getProver(SecretValues());
        return false;
    } catch (const MissingSecret&) {}
    return true;
}

// Verifiers reject precommitments that are the identity, in the wrong
// group, or of the wrong size, without throwing
static bool testBadPrecommitments() {
    NotEqualSetup s;
    Statement st = s.statement();
    Verifier verifier = st.getVerifier();
    NIProof pf = st.getProver(s.values).getNIProof("msg");
    if (!verifier.verifyNI(pf, "msg"))
        return false;
    if (verifier.verifyNI(pf, "other msg"))
        return false;

    NIProof bad = pf;
    bad.precommitments[0] = s.g.identity();
    if (verifier.verifyNI(bad, "msg"))
        return false;
    bad.precommitments[0] = Group::ristretto255().generator();
    if (verifier.verifyNI(bad, "msg"))
        return false;

    // corrupted encodings are rejected before any arithmetic is done
    try {
        bad = pf;
        bad.precommitments[0].bytes[5] ^= 0x10;
        if (verifier.verifyNI(bad, "msg"))
            return false;
        std::memset(bad.precommitments[0].bytes, 0xff, CRV25519::ELEMENT_BYTES);
        if (verifier.verifyNI(bad, "msg"))
            return false;

        SigmaTranscript t = verifier.simulate();
        std::memset(t.commitment.precommitments[0].bytes, 0xff, CRV25519::ELEMENT_BYTES);
        if (verifier.verifyTranscript(t))
            return false;
    } catch (const std::exception& e) {
        std::cout << "  corrupted precommitment raised an exception: "<<e.what()<<std::endl;
        return false;
    }
    bad = pf;
    bad.precommitments.push_back(pf.precommitments[0]);
    if (verifier.verifyNI(bad, "msg"))
        return false;
    bad.precommitments.clear();
    if (verifier.verifyNI(bad, "msg"))
        return false;

    // the interactive verifier also rejects an identity precommitment
    Prover prover = st.getProver(s.values);
    ProverRound pr = prover.commit();
    Commitment com = pr.commitment();
    com.precommitments[0] = s.g.identity();
    VerifierRound vr = verifier.sendChallenge(com);
    return !vr.verify(std::move(pr).computeResponse(vr.challenge()));
}

static bool testSimulate() {
    NotEqualSetup s(true); // simulation works even if the claim is false
    Statement st = s.statement(true);
    Verifier verifier = st.getVerifier();
    SigmaTranscript t = verifier.simulate();
    if (t.commitment.precommitments.size() != 1
        || t.commitment.precommitments[0].isIdentity())
        return false;
    if (!verifier.verifyTranscript(t))
        return false;
    t.response[0] += Scalar().setInteger(1);
    return !verifier.verifyTranscript(t);
}

int main(int, char**) {
    if (!testNotEqual() || !testEqual() || !testWrongSecret() || !testWithAnd()
        || !testErrors() || !testBadPrecommitments() || !testSimulate()) {
        std::cout << SIGMAZK_TESTS::failed << std::endl;
        return 1;
    }
    std::cout << SIGMAZK_TESTS::passed << std::endl;
    return 0;
}
