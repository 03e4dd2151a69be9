#ifndef _SCALAR_25519_HPP_
#define _SCALAR_25519_HPP_
/* scalar25519.hpp - a thin layer around libsodium scalar arithmetic
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
#include <string>
#include <cstring>
#include <stdexcept>
#include <iostream>
extern "C" {
    #include <sodium.h>
}

namespace CRV25519 {

// A class that holds a scalar modulo the order of the main subgroup,
// l = 2^{252}+27742317777372353535851937790883648493. Both groups that
// we support (ed25519 and ristretto255) have this same order.
class Scalar {
public:
    unsigned char bytes[crypto_core_ed25519_SCALARBYTES];

    Scalar() { std::memset(bytes, 0, crypto_core_ed25519_SCALARBYTES); }

    const unsigned char* dataBytes() const { return bytes; }

    // returns true if two scalars are equal
    bool operator==(const Scalar& other) const {
        return sodium_memcmp(bytes, other.bytes, crypto_core_ed25519_SCALARBYTES) == 0;
    }
    bool operator!=(const Scalar& other) const { return !(*this == other); }
    bool isZero() const { return sodium_is_zero(bytes, crypto_core_ed25519_SCALARBYTES) == 1; }

    // select a random scalar in the range [0, l)
    Scalar& randomize() {
        crypto_core_ed25519_scalar_random(bytes);
        return *this;
    }

    // Reduce a 64-byte (little endian) integer modulo l. This is how
    // hash outputs are turned into challenges.
    Scalar& fromWideBytes(const unsigned char* wide) {
        crypto_core_ed25519_scalar_reduce(bytes, wide);
        return *this;
    }

    // Reduce the representation to the range [0, l)
    Scalar& reduce() {
        unsigned char wide[crypto_core_ed25519_NONREDUCEDSCALARBYTES];
        std::memset(wide, 0, sizeof wide);
        std::memcpy(wide, bytes, crypto_core_ed25519_SCALARBYTES);
        return fromWideBytes(wide);
    }

    // Computes the multiplicative inverse mod l, throws on zero
    Scalar& invert() {
        auto res = crypto_core_ed25519_scalar_invert(bytes, bytes);
        if (res != 0) {
            throw std::runtime_error("failed to perform scalar inversion, err#="+std::to_string(res));
        }
        return *this;
    }

    // Computes the additive inverse mod l
    Scalar& negate() {
        crypto_core_ed25519_scalar_negate(bytes, bytes);
        return *this;
    }

    Scalar& operator+=(const Scalar& other) {
        crypto_core_ed25519_scalar_add(bytes, bytes, other.bytes);
        return *this;
    }
    Scalar operator+(const Scalar& other) const {
        return Scalar(*this).operator+=(other);
    }

    Scalar& operator-=(const Scalar& other) {
        crypto_core_ed25519_scalar_sub(bytes, bytes, other.bytes);
        return *this;
    }
    Scalar operator-(const Scalar& other) const {
        return Scalar(*this).operator-=(other);
    }

    Scalar& operator*=(const Scalar& other) {
        crypto_core_ed25519_scalar_mul(bytes, bytes, other.bytes);
        return *this;
    }
    Scalar operator*(const Scalar& other) const {
        return Scalar(*this).operator*=(other);
    }

    // Convert a signed integer to a scalar (useful for tests and debugging)
    Scalar& setInteger(long n) {
        std::memset(bytes, 0, crypto_core_ed25519_SCALARBYTES); // reset to zero
        bool negated = (n < 0);
        unsigned long u = negated? -(unsigned long)n : (unsigned long)n;
        for (size_t i=0; i < sizeof(long); i++) {
            bytes[i] = (unsigned char)(u & 0xff);
            u >>= 8;
        }
        if (negated) {
            negate();
        }
        return *this;
    }

    // hex string of the little-endian bytes, for debugging
    std::string toHex() const {
        char hex[2*crypto_core_ed25519_SCALARBYTES +1];
        sodium_bin2hex(hex, sizeof hex, bytes, crypto_core_ed25519_SCALARBYTES);
        return std::string(hex);
    }
};

// A factory method, returning a random scalar in the range [0, l)
inline Scalar randomScalar() { return Scalar().randomize(); }

// Returns a random scalar in the range [1, l)
inline Scalar randomNonzeroScalar() {
    Scalar s;
    do { s.randomize(); } while (s.isZero());
    return s;
}

// I/O
inline std::ostream& operator<<(std::ostream& os, const Scalar& s) {
  os.write((const char*)s.dataBytes(), crypto_core_ed25519_SCALARBYTES);
  return os;
}
inline std::istream& operator>>(std::istream& is, Scalar& s) {
  is.read((char*)s.bytes, crypto_core_ed25519_SCALARBYTES);
  return is;
}

inline Scalar inverseOf(const Scalar& a) { return Scalar(a).invert(); }
inline Scalar negationOf(const Scalar& a) {return Scalar(a).negate(); }

} /* end of namespace CRV25519 */
#endif // ifndef _SCALAR_25519_HPP_
