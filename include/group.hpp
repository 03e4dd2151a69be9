#ifndef _GROUP_HPP_
#define _GROUP_HPP_
/* group.hpp - abstract group interface over libsodium's curves
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
#include <cstring>
#include <stdexcept>
#include <iostream>
extern "C" {
    #include <sodium.h>
}
#include "scalar25519.hpp"
#include "errors.hpp"

// The proofs are written against the abstract group interface below.
// We have two implementations, both using the libsodium low-level
// interfaces: the prime-order subgroup of edwards25519, and the
// ristretto255 group. Both groups have the same order, so scalars
// from either are interchangeable as far as the arithmetic goes, but
// mixing elements of the two groups is an error (GroupMismatch).

namespace CRV25519 {

constexpr size_t ELEMENT_BYTES = 32; // same for ed25519 and ristretto255
static_assert(crypto_core_ed25519_BYTES == ELEMENT_BYTES, "unexpected ed25519 encoding size");
static_assert(crypto_core_ristretto255_BYTES == ELEMENT_BYTES, "unexpected ristretto255 encoding size");

class Element;

class Group {
public:
    virtual ~Group() = default;

    virtual const std::string& name() const = 0;
    virtual const Element& generator() const = 0;
    virtual const Element& identity() const = 0;

    // Hash arbitrary byte array to the group
    virtual Element hashToPoint(const unsigned char* data, size_t len) const = 0;
    virtual Element randomElement() const = 0;

    // The group order, as a 32-byte little-endian integer
    const unsigned char* orderBytes() const;

    // uniform in [0, order), from the libsodium CSPRNG
    Scalar randomScalar() const { return CRV25519::randomScalar(); }

    // Low-level arithmetic on encodings, throw on failure. The identity
    // and zero-scalar cases are handled by the Element class before we
    // get here, as libsodium rejects them.
    virtual void add(unsigned char* out, const unsigned char* a, const unsigned char* b) const = 0;
    virtual void sub(unsigned char* out, const unsigned char* a, const unsigned char* b) const = 0;
    virtual void mul(unsigned char* out, const Scalar& n, const unsigned char* p) const = 0;
    virtual bool isValidEncoding(const unsigned char* p) const = 0;

    // The two supported groups, process-wide singletons
    static const Group& ed25519();
    static const Group& ristretto255();
};

// A group element, together with the group that it belongs to
class Element {
    const Group* grp;

    void checkSameGroup(const Element& other, const char* op) const {
        if (grp != other.grp)
            throw SIGMAZK::GroupMismatch(std::string("Element::")+op+": cannot mix "
                                         +grp->name()+" and "+other.grp->name()+" elements");
    }
public:
    static size_t counter; // used for profiling and performance measurements
    unsigned char bytes[ELEMENT_BYTES];

    Element() { *this = Group::ed25519().identity(); }
    Element(const Group& g, const unsigned char* encoding): grp(&g) {
        std::memcpy(bytes, encoding, ELEMENT_BYTES);
    }

    const unsigned char* dataBytes() const { return bytes; }
    const Group& group() const { return *grp; }
    bool sameGroup(const Element& other) const { return grp == other.grp; }

    bool isIdentity() const { return *this == grp->identity(); }
    bool isValid() const { return grp->isValidEncoding(bytes); }

    // returns true if two elements are equal. Elements of different
    // groups are never equal
    bool operator==(const Element& other) const {
        return grp == other.grp
            && sodium_memcmp(bytes, other.bytes, ELEMENT_BYTES) == 0;
    }
    bool operator!=(const Element& other) const { return !(*this == other); }

    Element& operator+=(const Element& other) {
        checkSameGroup(other, "add");
        if (other.isIdentity())
            return *this;
        if (isIdentity())
            *this = other;
        else
            grp->add(bytes, bytes, other.bytes);
        return *this;
    }
    Element operator+(const Element& other) const { return Element(*this).operator+=(other); }

    Element& operator-=(const Element& other) {
        checkSameGroup(other, "sub");
        if (other.isIdentity())
            return *this;
        grp->sub(bytes, bytes, other.bytes);
        return *this;
    }
    Element operator-(const Element& other) const { return Element(*this).operator-=(other); }

    // Computes the product of a scalar with an element
    Element& operator*=(const Scalar& n) {
        Scalar m = n;
        m.reduce(); // so a non-reduced zero is handled too
        if (isIdentity() || m.isZero())
            *this = grp->identity();
        else {
            grp->mul(bytes, m, bytes);
            counter++; // count exponentiations
        }
        return *this;
    }
    Element operator*(const Scalar& s) const { return Element(*this).operator*=(s); }

    std::vector<unsigned char> toBytes() const {
        return std::vector<unsigned char>(bytes, bytes+ELEMENT_BYTES);
    }
    std::string toHex() const {
        char hex[2*ELEMENT_BYTES +1];
        sodium_bin2hex(hex, sizeof hex, bytes, ELEMENT_BYTES);
        return std::string(hex);
    }

    // Decode an element of the given group, throws MalformedStatement
    // if the encoding is not a valid group element
    static Element fromBytes(const Group& g, const unsigned char* data, size_t len);
    static Element fromBytes(const Group& g, const std::vector<unsigned char>& data) {
        return fromBytes(g, data.data(), data.size());
    }
};

inline Element operator*(const Scalar& n, const Element& p) { return p*n; }

// I/O, the group is not part of the encoding
inline std::ostream& operator<<(std::ostream& os, const Element& p) {
  os.write((const char*)p.dataBytes(), ELEMENT_BYTES);
  return os;
}

// Hash a string label to the group (convenience wrapper)
inline Element hashToPoint(const Group& g, const std::string& label) {
    return g.hashToPoint((const unsigned char*)label.data(), label.size());
}

} /* end of namespace CRV25519 */
#endif // ifndef _GROUP_HPP_
