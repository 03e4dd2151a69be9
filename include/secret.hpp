#ifndef _SECRET_HPP_
#define _SECRET_HPP_
/* secret.hpp - secrets and linear expressions over group elements
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
#include "errors.hpp"

/* A Secret is a handle for an unknown scalar. Each Secret object gets a
 * process-unique id when it is constructed, and copies of the handle all
 * refer to the same unknown. The name is only a label for printing, two
 * distinct Secret objects with the same name are different secrets.
 *
 * A linear expression is an ordered list of (secret, generator) terms,
 * built with the operators
 *
 *   LinearExpr e = x1*g1 + x2*g2 + x1*g3;
 *
 * It represents the group element \sum_i value(x_i)*g_i. A secret may
 * appear in several terms, the same value is used for all of them.
 * No group checks are done here, they happen when a statement is built.
 **/
namespace SIGMAZK {
using CRV25519::Scalar, CRV25519::Element;

class Secret {
    size_t id;
    std::string label;
public:
    explicit Secret(const std::string& name=std::string());

    size_t getId() const { return id; }
    const std::string& name() const { return label; }

    bool operator==(const Secret& other) const { return id == other.id; }
    bool operator!=(const Secret& other) const { return id != other.id; }
    bool operator<(const Secret& other) const { return id < other.id; }
};

// The values of secrets, owned by a prover for the duration of a run
typedef std::map<Secret, Scalar> SecretValues;

// Returns the value of s, throws MissingSecret if it is not there
const Scalar& valueOf(const SecretValues& values, const Secret& s);

struct Term {
    Secret secret;
    Element generator;
};

class LinearExpr {
public:
    std::vector<Term> terms;

    LinearExpr() = default;
    LinearExpr(const Secret& s, const Element& g): terms{Term{s,g}} {}

    bool empty() const { return terms.empty(); }
    size_t size() const { return terms.size(); }

    LinearExpr& operator+=(const LinearExpr& other) {
        terms.insert(terms.end(), other.terms.begin(), other.terms.end());
        return *this;
    }
    LinearExpr operator+(const LinearExpr& other) const {
        return LinearExpr(*this).operator+=(other);
    }

    // The distinct secrets in order of first occurrence
    std::vector<Secret> secrets() const;

    // Returns \sum_i values[x_i]*g_i, throws MissingSecret if some
    // x_i has no value. Also used with randomizers/responses in place
    // of the secret values.
    Element evaluate(const SecretValues& values) const;
};

inline LinearExpr operator*(const Secret& s, const Element& g) { return LinearExpr(s, g); }
inline LinearExpr operator*(const Element& g, const Secret& s) { return LinearExpr(s, g); }

// Append to out the secrets from in that are not already there
void appendDistinct(std::vector<Secret>& out, const std::vector<Secret>& in);

} /* end of namespace SIGMAZK */
#endif // ifndef _SECRET_HPP_
