/* groups.cpp - the ed25519 and ristretto255 groups over libsodium
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
#include <stdexcept>

#include "scalar25519.hpp"
#include "group.hpp"

namespace CRV25519 {

size_t Element::counter = 0;

namespace {

// The order of the main subgroup: 2^{252} + 27742317777372353535851937790883648493
const unsigned char groupOrder[ELEMENT_BYTES] = {
    0xed, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58,
    0xd6, 0x9c, 0xf7, 0xa2, 0xde, 0xf9, 0xde, 0x14,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10
};

void initSodium() {
    static bool firstTime = true; // ensure that init only happens once
    if (!firstTime)
        return;
    firstTime = false;

    int ret = sodium_init();
    if (ret < 0) { // 1 means that it was already initialized
        throw std::runtime_error("libsodium failed to initialize, #errno="+std::to_string(ret));
    }
}

void checkResult(int res, const std::string& what) {
    if (res != 0) {
        throw std::runtime_error("failed to perform "+what+", err#="+std::to_string(res));
    }
}

/********************** The ed25519 group **************************/

class Ed25519Group: public Group {
    std::string groupName;
    Element base, ident;

    static const unsigned char* baseBytes() {
        static unsigned char b[ELEMENT_BYTES];
        initSodium();
        Scalar one = Scalar().setInteger(1);
        checkResult(crypto_scalarmult_ed25519_base_noclamp(b, one.bytes),
                    "scalar multiplication by base");
        return b;
    }
    static const unsigned char* identityBytes() {
        static unsigned char id[ELEMENT_BYTES];
        const unsigned char* b = baseBytes();
        checkResult(crypto_core_ed25519_sub(id, b, b), "point subtraction");
        return id;
    }
public:
    Ed25519Group(): groupName("ed25519"),
        base(*this, baseBytes()), ident(*this, identityBytes()) {}

    const std::string& name() const override { return groupName; }
    const Element& generator() const override { return base; }
    const Element& identity() const override { return ident; }

    Element hashToPoint(const unsigned char* data, size_t len) const override {
        unsigned char h[crypto_core_ed25519_UNIFORMBYTES];
        crypto_generichash(h, sizeof h, data, len, nullptr, 0);
        unsigned char p[ELEMENT_BYTES];
        checkResult(crypto_core_ed25519_from_uniform(p, h), "hash to ed25519");
        return Element(*this, p);
    }
    Element randomElement() const override {
        unsigned char p[ELEMENT_BYTES];
        crypto_core_ed25519_random(p);
        return Element(*this, p);
    }

    void add(unsigned char* out, const unsigned char* a, const unsigned char* b) const override {
        checkResult(crypto_core_ed25519_add(out, a, b), "point addition");
    }
    void sub(unsigned char* out, const unsigned char* a, const unsigned char* b) const override {
        checkResult(crypto_core_ed25519_sub(out, a, b), "point subtraction");
    }
    void mul(unsigned char* out, const Scalar& n, const unsigned char* p) const override {
        checkResult(crypto_scalarmult_ed25519_noclamp(out, n.bytes, p), "scalar multiplication");
    }
    bool isValidEncoding(const unsigned char* p) const override {
        return crypto_core_ed25519_is_valid_point(p) == 1;
    }
};

/******************** The ristretto255 group ***********************/

class Ristretto255Group: public Group {
    std::string groupName;
    Element base, ident;

    static const unsigned char* baseBytes() {
        static unsigned char b[ELEMENT_BYTES];
        initSodium();
        Scalar one = Scalar().setInteger(1);
        checkResult(crypto_scalarmult_ristretto255_base(b, one.bytes),
                    "scalar multiplication by base");
        return b;
    }
    static const unsigned char* identityBytes() {
        static unsigned char id[ELEMENT_BYTES]; // the all-zero encoding
        return id;
    }
public:
    Ristretto255Group(): groupName("ristretto255"),
        base(*this, baseBytes()), ident(*this, identityBytes()) {}

    const std::string& name() const override { return groupName; }
    const Element& generator() const override { return base; }
    const Element& identity() const override { return ident; }

    Element hashToPoint(const unsigned char* data, size_t len) const override {
        unsigned char h[crypto_core_ristretto255_HASHBYTES];
        crypto_generichash(h, sizeof h, data, len, nullptr, 0);
        unsigned char p[ELEMENT_BYTES];
        checkResult(crypto_core_ristretto255_from_hash(p, h), "hash to ristretto255");
        return Element(*this, p);
    }
    Element randomElement() const override {
        unsigned char p[ELEMENT_BYTES];
        crypto_core_ristretto255_random(p);
        return Element(*this, p);
    }

    void add(unsigned char* out, const unsigned char* a, const unsigned char* b) const override {
        checkResult(crypto_core_ristretto255_add(out, a, b), "point addition");
    }
    void sub(unsigned char* out, const unsigned char* a, const unsigned char* b) const override {
        checkResult(crypto_core_ristretto255_sub(out, a, b), "point subtraction");
    }
    void mul(unsigned char* out, const Scalar& n, const unsigned char* p) const override {
        checkResult(crypto_scalarmult_ristretto255(out, n.bytes, p), "scalar multiplication");
    }
    bool isValidEncoding(const unsigned char* p) const override {
        return crypto_core_ristretto255_is_valid_point(p) == 1;
    }
};

} // end of anonymous namespace

const unsigned char* Group::orderBytes() const { return groupOrder; }

const Group& Group::ed25519() {
    static const Ed25519Group theGroup;
    return theGroup;
}
const Group& Group::ristretto255() {
    static const Ristretto255Group theGroup;
    return theGroup;
}

// forcing a run of the libsodium initialization at load time
static const Group& defaultGroup = Group::ed25519();

Element Element::fromBytes(const Group& g, const unsigned char* data, size_t len) {
    if (len != ELEMENT_BYTES)
        throw SIGMAZK::MalformedStatement("Element::fromBytes: expected "
                +std::to_string(ELEMENT_BYTES)+" bytes, got "+std::to_string(len));
    Element e(g, data);
    if (!e.isIdentity() && !g.isValidEncoding(data))
        throw SIGMAZK::MalformedStatement("Element::fromBytes: not a valid "+g.name()+" element");
    return e;
}

} /* end of namespace CRV25519 */
