/* main.cpp - a "main" file, just a debugging tool
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
 
// This file is just a convenience, a handy tool that lets us run
// small programs without having to use the awkward ctest syntax.
#include <chrono>
#include <string>
#include <iostream>
using namespace std;

#include "group.hpp"
#include "pedersen.hpp"
#include "sigma.hpp"
#include "notequal.hpp"

using namespace SIGMAZK;

int main(int argc, char** argv) {
    std::cout << "- Found Sodium version "<<SODIUM_VERSION_STRING<<std::endl;

    int nGens = 10;
    if (argc > 1) {
        nGens = std::stoi(argv[1]);
    }
    if (nGens < 1 || nGens > 1024)
        nGens = 10;
    const Group& grp = (argc > 2 && std::string(argv[2])=="ristretto255")?
        Group::ristretto255() : Group::ed25519();
    std::cout << "nGens="<<nGens << ", group="<<grp.name() << std::endl;

    // A Pedersen proof with nGens generators, where every other
    // generator uses the same secret
    PedersenContext ped("sigmazk-demo", grp);
    std::vector<Element> gens = ped.getGenerators(nGens);
    std::vector<Secret> secrets;
    SecretValues values;
    Secret shared("shared");
    values[shared] = grp.randomScalar();
    for (int i=0; i<nGens; i++) {
        if (i % 2 == 0)
            secrets.push_back(shared);
        else {
            secrets.emplace_back("x"+std::to_string(i));
            values[secrets.back()] = grp.randomScalar();
        }
    }
    Element lhs = grp.identity();
    for (int i=0; i<nGens; i++)
        lhs += gens[i] * values[secrets[i]];
    Statement pp = pedersenProof(gens, secrets, lhs);
    if (nGens <= 16)
        pp.prettyPrint(std::cout);

    Prover prover = pp.getProver(values);
    Verifier verifier = pp.getVerifier();

    Element::counter = 0;
    auto start = chrono::steady_clock::now();
    bool ok = SigmaProtocol(verifier, prover).run();
    auto end = chrono::steady_clock::now();
    auto ticks = chrono::duration_cast<chrono::microseconds>(end - start).count();
    std::cout << "interactive run "<<(ok? "accepted" : "REJECTED")<<" in "<<ticks
        << " microseconds, "<< Element::counter << " exponentiations\n";

    Element::counter = 0;
    start = chrono::steady_clock::now();
    NIProof pf = prover.getNIProof("demo message");
    ok = verifier.verifyNI(pf, "demo message");
    end = chrono::steady_clock::now();
    ticks = chrono::duration_cast<chrono::microseconds>(end - start).count();
    std::cout << "non-interactive proof "<<(ok? "accepted" : "REJECTED")<<" in "<<ticks
        << " microseconds, "<< Element::counter << " exponentiations\n";

    // Inequality of discrete logs, bound to the Pedersen proof via the
    // shared secret
    Element h0 = ped.getG(nGens), h1 = ped.getG(nGens+1);
    Element bigH0 = h0 * values[shared];
    Element bigH1 = h1 * grp.randomScalar();
    Statement neq = dlRepNotEqual(std::make_pair(bigH0, h0), std::make_pair(bigH1, h1),
                                  shared, /*binding=*/true);
    Statement both = andProof(pp, neq);
    both.prettyPrint(std::cout);

    Element::counter = 0;
    start = chrono::steady_clock::now();
    ok = SigmaProtocol(both.getVerifier(), both.getProver(values)).run();
    end = chrono::steady_clock::now();
    ticks = chrono::duration_cast<chrono::microseconds>(end - start).count();
    std::cout << "inequality+pedersen run "<<(ok? "accepted" : "REJECTED")<<" in "<<ticks
        << " microseconds, "<< Element::counter << " exponentiations\n";
    return 0;
}
