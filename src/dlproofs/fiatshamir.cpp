/* fiatshamir.cpp - deriving challenges from a hash transcript
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
#include <stdexcept>
#include "fiatshamir.hpp"

namespace SIGMAZK {

static void lengthBytes(unsigned char* out, size_t len) {
    for (int i=0; i<8; i++) {
        out[i] = (unsigned char)(len & 0xff);
        len >>= 8;
    }
}

FiatShamir::FiatShamir(const std::string& tag) {
    if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES_MAX) != 0)
        throw std::runtime_error("FiatShamir: failed to initialize hash state");
    processMessage("dom-sep", tag);
}

void FiatShamir::absorb(const std::string& label, const unsigned char* data, size_t len) {
    unsigned char lenBytes[8];
    lengthBytes(lenBytes, label.size());
    crypto_generichash_update(&state, lenBytes, sizeof lenBytes);
    crypto_generichash_update(&state, (const unsigned char*)label.data(), label.size());
    lengthBytes(lenBytes, len);
    crypto_generichash_update(&state, lenBytes, sizeof lenBytes);
    crypto_generichash_update(&state, data, len);
}

void FiatShamir::processPoint(const std::string& label, const Element& p) {
    processMessage(label+"/group", p.group().name());
    absorb(label, p.bytes, CRV25519::ELEMENT_BYTES);
}

Scalar FiatShamir::newChallenge(const std::string& label) {
    processMessage("challenge", label);

    // hash a copy of the state, so we can keep absorbing into the original
    crypto_generichash_state tmp = state;
    unsigned char wide[crypto_generichash_BYTES_MAX]; // 64 bytes
    crypto_generichash_final(&tmp, wide, sizeof wide);

    Scalar c;
    c.fromWideBytes(wide);
    processScalar(label, c);
    return c;
}

} /* end of namespace SIGMAZK */
