#ifndef _FIAT_SHAMIR_HPP_
#define _FIAT_SHAMIR_HPP_
/* fiatshamir.hpp - deriving challenges from a hash transcript
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
extern "C" {
    #include <sodium.h>
}
#include "scalar25519.hpp"
#include "group.hpp"

/* A Fiat-Shamir transcript: a running BLAKE2b state that absorbs labeled
 * points, scalars and byte strings, and produces challenges that depend
 * on everything absorbed so far. The interface is modeled on the Merlin
 * transcripts used by the bulletproof code (processPoint, processScalar,
 * newChallenge), built here on libsodium's generichash. Each item is
 * absorbed as
 *
 *   len(label) | label | len(data) | data
 *
 * with 8-byte little-endian lengths, so that different sequences of items
 * never produce the same byte stream. Points are absorbed together with
 * the name of their group.
 *
 * newChallenge(label) absorbs the label, hashes a copy of the state to
 * 64 bytes and reduces it modulo the group order. The challenge itself
 * is then absorbed, so the next challenge depends on it.
 **/
namespace SIGMAZK {
using CRV25519::Scalar, CRV25519::Element;

class FiatShamir {
    crypto_generichash_state state;
    void absorb(const std::string& label, const unsigned char* data, size_t len);
public:
    explicit FiatShamir(const std::string& tag);

    void processBytes(const std::string& label, const unsigned char* data, size_t len) {
        absorb(label, data, len);
    }
    void processMessage(const std::string& label, const std::string& msg) {
        absorb(label, (const unsigned char*)msg.data(), msg.size());
    }
    void processScalar(const std::string& label, const Scalar& s) {
        absorb(label, s.bytes, crypto_core_ed25519_SCALARBYTES);
    }
    void processPoint(const std::string& label, const Element& p);

    Scalar newChallenge(const std::string& label);
};

} /* end of namespace SIGMAZK */
#endif // ifndef _FIAT_SHAMIR_HPP_
