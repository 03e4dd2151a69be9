#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include "pedersen.hpp"
#include "sigma.hpp"
#include "tests.hpp" // define strings SIGMAZK_TESTS::passed and SIGMAZK_TESTS::failed

using namespace SIGMAZK;

static std::vector<Element> getGenerators(size_t n, const Group& g=Group::ed25519()) {
    return PedersenContext("test_pedersen", g).getGenerators(n);
}

// The setup from most tests: n secrets x0,...,x{n-1} with random values
struct Setup {
    std::vector<Element> gens;
    std::vector<Secret> secrets;
    std::vector<Scalar> vals;
    SecretValues values;
    Element lhs;

    explicit Setup(size_t n) {
        gens = getGenerators(n);
        for (size_t i=0; i<n; i++) {
            secrets.emplace_back("x"+std::to_string(i));
            vals.push_back(CRV25519::randomScalar());
            values[secrets[i]] = vals[i];
        }
        lhs = multiExp(gens, vals);
    }
};

static bool testMultiExp() {
    constexpr size_t nGs = 5;
    const Element& base = Group::ed25519().generator();
    std::vector<Element> Gs(nGs, base); // a vector of generators
    for (size_t i=0; i<nGs; i++)
        Gs[i] *= Scalar().setInteger(i+1); // G[i] = B*(i+1)
    std::vector<Scalar> exps(nGs);  // a vector of random scalars
    for (auto& x : exps) x.randomize();
    Element res = multiExp(Gs, exps);

    // compute the overall exponent
    Scalar theExp;
    for (size_t i=0; i<nGs; i++)
        theExp += exps[i] * Scalar().setInteger(i+1);
    return base * theExp == res;
}

static bool testCommit() {
    PedersenContext ped("blah");
    std::vector<Scalar> xes(4);
    for (auto& x : xes) x.randomize();
    Scalar r = CRV25519::randomScalar();
    Element c = ped.commit(xes, r);
    if (!ped.verifyCom(c, xes, r))
        return false;
    if (ped.verifyCom(c, xes, r + Scalar().setInteger(1)))
        return false;
    if (PedersenContext("blah2").verifyCom(c, xes, r)) // other generators
        return false;
    if (ped.getG(0) == ped.getG(1) || ped.getG(0) == ped.getH())
        return false;

    // the empty sum is the identity of the right group
    const Group& ris = Group::ristretto255();
    if (multiExp({}, {}, ris) != ris.identity())
        return false;
    PedersenContext risPed("blah", ris);
    if (risPed.commit({}, r) != risPed.getH()*r || !risPed.verifyCom(risPed.getH()*r, {}, r))
        return false;
    return true;
}

// Honest interactive and non-interactive runs are accepted
static bool testCompleteness() {
    for (size_t n : {1, 3, 5, 10}) {
        Setup s(n);
        Statement pp = pedersenProof(s.gens, s.secrets, s.lhs);
        Prover prover = pp.getProver(s.values);
        Verifier verifier = pp.getVerifier();
        if (!SigmaProtocol(verifier, prover).run()) {
            std::cout << "  interactive run with "<<n<<" generators failed\n";
            return false;
        }
        NIProof pf = prover.getNIProof("mymessage");
        if (pf.responses.size() != n || !verifier.verifyNI(pf, "mymessage")) {
            std::cout << "  NI proof with "<<n<<" generators failed\n";
            return false;
        }
    }
    return true;
}

// Same generators and secrets, but a random public value
static bool testWrongPublic() {
    Setup s(5);
    Element wrong = CRV25519::hashToPoint(Group::ed25519(), "some random word");
    Statement pp = pedersenProof(s.gens, s.secrets, wrong);
    Prover prover = pp.getProver(s.values);
    Verifier verifier = pp.getVerifier();
    if (SigmaProtocol(verifier, prover).run())
        return false;
    return !verifier.verifyNI(prover.getNIProof("mymessage"), "mymessage");
}

static bool testTamperedNI() {
    Setup s(5);
    Statement pp = pedersenProof(s.gens, s.secrets, s.lhs);
    Prover prover = pp.getProver(s.values);
    Verifier verifier = pp.getVerifier();
    NIProof pf = prover.getNIProof("mymessage");
    if (!verifier.verifyNI(pf, "mymessage"))
        return false;

    if (verifier.verifyNI(pf, "mymessagE")) {
        std::cout << "  NI proof verified with another message\n";
        return false;
    }
    NIProof bad = pf;
    bad.responses[1] = CRV25519::randomScalar();
    if (verifier.verifyNI(bad, "mymessage"))
        return false;
    bad = pf;
    bad.challenge += Scalar().setInteger(1);
    if (verifier.verifyNI(bad, "mymessage"))
        return false;
    bad = pf;
    bad.responses.pop_back(); // wrong size is a failure, not an exception
    if (verifier.verifyNI(bad, "mymessage"))
        return false;

    // a verifier with another domain-separation tag
    Verifier other = pp.getVerifier();
    other.tag = "another tag";
    return !other.verifyNI(pf, "mymessage");
}

// A secret used with k generators gets a single randomizer
static bool testSharedSecret() {
    for (size_t k : {1, 3, 10}) {
        std::vector<Element> gens = getGenerators(k);
        Secret x("x");
        Scalar xVal = CRV25519::randomScalar();
        std::vector<Secret> secrets(k, x);
        Element sumG = multiExp(gens, std::vector<Scalar>(k, Scalar().setInteger(1)));
        Statement pp = pedersenProof(gens, secrets, sumG * xVal);

        Prover prover = pp.getProver({{x, xVal}});
        Verifier verifier = pp.getVerifier();
        ProverRound pr = prover.commit();
        Commitment com = pr.commitment();
        VerifierRound vr = verifier.sendChallenge(com);
        Response z = std::move(pr).computeResponse(vr.challenge());
        if (com.points.size() != 1 || z.size() != 1)
            return false;

        // the randomizer is z - c*x, and the commitment is r*\sum_i g_i
        Scalar r = z[0] - vr.challenge() * xVal;
        if (com.points[0] != sumG * r) {
            std::cout << "  shared secret got more than one randomizer, k="<<k<<std::endl;
            return false;
        }
        if (!vr.verify(z))
            return false;
    }

    // the same generator three times
    Element g = getGenerators(1)[0];
    Secret x1("x1");
    Statement pp = pedersenProof({g, g, g}, {x1, x1, x1}, g * Scalar().setInteger(300));
    Prover prover = pp.getProver({{x1, Scalar().setInteger(100)}});
    return SigmaProtocol(pp.getVerifier(), prover).run();
}

static bool testErrors() {
    Setup s(5);
    std::vector<Element> gens = s.gens;
    gens[2] = Group::ristretto255().generator();
    try {
        pedersenProof(gens, s.secrets, s.lhs);
        std::cout << "  generators from two groups should throw\n";
        return false;
    } catch (const GroupMismatch&) {}
    try { // lhs in another group
        pedersenProof(s.gens, s.secrets, Group::ristretto255().generator());
        return false;
    } catch (const GroupMismatch&) {}
    try {
        pedersenProof(s.gens, std::vector<Secret>(s.secrets.begin(), s.secrets.end()-1), s.lhs);
        return false;
    } catch (const MalformedStatement&) {}
    try {
        pedersenProof({}, {}, s.lhs);
        return false;
    } catch (const MalformedStatement&) {}
    try {
        dlRep(s.lhs, LinearExpr());
        return false;
    } catch (const MalformedStatement&) {}

    Statement pp = pedersenProof(s.gens, s.secrets, s.lhs);
    SecretValues partial = s.values;
    partial.erase(s.secrets[3]);
    try {
        pp.getProver(partial);
        std::cout << "  a prover without all the secrets should throw\n";
        return false;
    } catch (const MissingSecret&) {}

    // A secret with the same name is still a different secret
    SecretValues renamed;
    for (size_t i=0; i<s.secrets.size(); i++)
        renamed[Secret(s.secrets[i].name())] = s.vals[i];
    try {
        pp.getProver(renamed);
        return false;
    } catch (const MissingSecret&) {}
    return true;
}

// Commitments that are not valid encodings are rejected, not thrown on
static bool testCorruptedCommitment() {
    Setup s(4);
    Statement pp = pedersenProof(s.gens, s.secrets, s.lhs);
    Prover prover = pp.getProver(s.values);
    Verifier verifier = pp.getVerifier();
    try {
        for (int flavor=0; flavor<2; flavor++) {
            ProverRound pr = prover.commit();
            Commitment com = pr.commitment();
            if (flavor == 0)
                com.points[0].bytes[3] ^= 0x01;
            else
                std::memset(com.points[0].bytes, 0xff, CRV25519::ELEMENT_BYTES);
            VerifierRound vr = verifier.sendChallenge(com);
            if (vr.verify(std::move(pr).computeResponse(vr.challenge())))
                return false;
        }
        SigmaTranscript t = verifier.simulate();
        std::memset(t.commitment.points[1].bytes, 0xff, CRV25519::ELEMENT_BYTES);
        if (verifier.verifyTranscript(t))
            return false;
    } catch (const std::exception& e) {
        std::cout << "  corrupted commitment raised an exception: "<<e.what()<<std::endl;
        return false;
    }
    return true;
}

// Proof of knowledge of an opening of a commitment
static bool testOpening() {
    const Group& ris = Group::ristretto255();
    PedersenContext ped("opening", ris);
    std::vector<Scalar> xes(3);
    for (auto& x : xes) x.randomize();
    Scalar r = ris.randomScalar();
    Element C = ped.commit(xes, r);

    std::vector<Secret> xSecrets{Secret("a"), Secret("b"), Secret("c")};
    Secret rSecret("r");
    Statement st = openingProof(ped, C, xSecrets, rSecret);
    if (&st.group() != &ris)
        return false;
    SecretValues values{{rSecret, r}};
    for (size_t i=0; i<3; i++)
        values[xSecrets[i]] = xes[i];
    if (!SigmaProtocol(st.getVerifier(), st.getProver(values)).run())
        return false;

    values[xSecrets[1]] += Scalar().setInteger(1); // a wrong opening
    return !SigmaProtocol(st.getVerifier(), st.getProver(values)).run();
}

// Rounds and runners are single-use
static bool testSingleUse() {
    Setup s(3);
    Statement pp = pedersenProof(s.gens, s.secrets, s.lhs);
    Prover prover = pp.getProver(s.values);
    Verifier verifier = pp.getVerifier();

    ProverRound pr = prover.commit();
    Scalar c = CRV25519::randomScalar();
    Response z = std::move(pr).computeResponse(c);
    if (z.size() != 3)
        return false;
    try {
        std::move(pr).computeResponse(c + Scalar().setInteger(1));
        std::cout << "  a round answered two challenges\n";
        return false;
    } catch (const std::runtime_error&) {}

    // two commits use different randomizers
    if (prover.commit().commitment().points == prover.commit().commitment().points)
        return false;

    SigmaProtocol proto(verifier, prover);
    if (!proto.run())
        return false;
    try {
        proto.run();
        return false;
    } catch (const std::runtime_error&) {}

    // a runner built from temporaries, run after they are gone
    SigmaProtocol later(pp.getVerifier(), pp.getProver(s.values));
    return later.run();
}

int main(int, char**) {
    if (!testMultiExp() || !testCommit() || !testCompleteness() || !testWrongPublic()
        || !testTamperedNI() || !testSharedSecret() || !testErrors()
        || !testCorruptedCommitment() || !testOpening() || !testSingleUse()) {
        std::cout << SIGMAZK_TESTS::failed << std::endl;
        return 1;
    }
    std::cout << SIGMAZK_TESTS::passed << std::endl;
    return 0;
}
