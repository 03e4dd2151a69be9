/* statement.cpp - building and validating statements
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
#include <set>
#include <string>
#include <algorithm>
#include <type_traits>
#include "statement.hpp"

namespace SIGMAZK {

// A helper class for collecting the secrets of a tree together with the
// group that each of them is used in
namespace {
typedef std::map<Secret, const Group*> SecretGroups;

void collectGroups(SecretGroups& sg, const Statement& st);

void addSecretGroup(SecretGroups& sg, const Secret& s, const Group& g) {
    auto [it, inserted] = sg.insert({s, &g});
    if (!inserted && it->second != &g)
        throw GroupMismatch("secret "+s.name()+" is used in both "
                            +it->second->name()+" and "+g.name());
}

void collectGroups(SecretGroups& sg, const Statement& st) {
    const Statement::Node& nd = st.node();
    if (auto lin = std::get_if<Statement::Linear>(&nd)) {
        for (auto& t : lin->expr.terms)
            addSecretGroup(sg, t.secret, t.generator.group());
    }
    else if (auto conj = std::get_if<Statement::Conjunction>(&nd)) {
        for (auto& child : conj->children)
            collectGroups(sg, child);
    }
    else {
        auto& ext = std::get<Statement::Extended>(nd);
        for (auto& s : ext.impl->freeSecrets())
            addSecretGroup(sg, s, ext.impl->group());
    }
}

// For each secret, the nodes that use it (linear leaves and extended
// nodes), and whether some extended node keeps it unbound
struct SecretUse {
    std::set<const void*> users;
    bool unbound = false;
};
typedef std::map<Secret, SecretUse> SecretUses;

void collectUses(SecretUses& uses, const Statement& st) {
    const Statement::Node& nd = st.node();
    if (auto lin = std::get_if<Statement::Linear>(&nd)) {
        for (auto& t : lin->expr.terms)
            uses[t.secret].users.insert(st.id());
    }
    else if (auto conj = std::get_if<Statement::Conjunction>(&nd)) {
        for (auto& child : conj->children)
            collectUses(uses, child);
    }
    else {
        auto& ext = std::get<Statement::Extended>(nd);
        std::vector<Secret> bound = ext.impl->boundSecrets();
        for (auto& s : ext.impl->freeSecrets()) {
            SecretUse& u = uses[s];
            u.users.insert(st.id());
            if (std::find(bound.begin(), bound.end(), s) == bound.end())
                u.unbound = true;
        }
    }
}
} // end of anonymous namespace

std::vector<Secret> Statement::secrets() const {
    std::vector<Secret> out;
    std::visit([&out](auto&& n) {
        typedef std::decay_t<decltype(n)> T;
        if constexpr (std::is_same_v<T, Linear>)
            appendDistinct(out, n.expr.secrets());
        else if constexpr (std::is_same_v<T, Conjunction>) {
            for (auto& child : n.children)
                appendDistinct(out, child.secrets());
        }
        else
            appendDistinct(out, n.impl->freeSecrets());
    }, *nd);
    return out;
}

Statement dlRep(const Element& lhs, const LinearExpr& expr) {
    if (expr.empty())
        throw MalformedStatement("dlRep: empty list of generators");
    const Group& g = lhs.group();
    for (auto& t : expr.terms) {
        if (!t.generator.sameGroup(lhs))
            throw GroupMismatch("dlRep: generator for "+t.secret.name()+" is in "
                                +t.generator.group().name()+", lhs is in "+g.name());
    }
    std::shared_ptr<const Statement::Node> nd = std::make_shared<Statement::Node>(Statement::Linear{lhs, expr});
    return Statement(nd, g);
}

Statement andProof(const std::vector<Statement>& children) {
    if (children.size() < 2)
        throw MalformedStatement("andProof: need at least two statements, got "
                                 +std::to_string(children.size()));

    // A shared secret must live in the same group everywhere
    SecretGroups sg;
    for (auto& child : children)
        collectGroups(sg, child);

    const Group& g = children[0].group();
    for (auto& child : children) {
        if (&child.group() != &g)
            throw GroupMismatch("andProof: cannot mix "+g.name()+" and "
                                +child.group().name()+" statements");
    }

    // The unbound secrets of an extended node cannot be tied to their
    // uses anywhere else in the tree. Repeated occurrences of the same
    // extended node are fine, it is expanded only once per run.
    SecretUses uses;
    for (auto& child : children)
        collectUses(uses, child);
    for (auto& [s, u] : uses) {
        if (u.unbound && u.users.size() > 1)
            throw MalformedStatement("andProof: secret "+s.name()
                +" is not bound in one of the statements that use it");
    }
    std::shared_ptr<const Statement::Node> nd = std::make_shared<Statement::Node>(Statement::Conjunction{children});
    return Statement(nd, g);
}

Statement extendedProof(const std::shared_ptr<const ExtendedStatement>& impl) {
    if (!impl)
        throw MalformedStatement("extendedProof: null statement");
    std::shared_ptr<const Statement::Node> nd = std::make_shared<Statement::Node>(Statement::Extended{impl});
    return Statement(nd, impl->group());
}

std::ostream& Statement::prettyPrint(std::ostream& os, int indent) const {
    std::string pad(2*indent, ' ');
    if (auto lin = std::get_if<Linear>(nd.get())) {
        os << pad << "DLRep[" << grp->name() << "] " << lin->lhs.toHex().substr(0,16) << " =";
        for (size_t i=0; i<lin->expr.size(); i++) {
            auto& t = lin->expr.terms[i];
            os << (i>0? " + " : " ") << t.secret.name() << "*" << t.generator.toHex().substr(0,16);
        }
        os << std::endl;
    }
    else if (auto conj = std::get_if<Conjunction>(nd.get())) {
        os << pad << "And(" << std::endl;
        for (auto& child : conj->children)
            child.prettyPrint(os, indent+1);
        os << pad << ")" << std::endl;
    }
    else
        os << pad << std::get<Extended>(*nd).impl->describe() << std::endl;
    return os;
}

} /* end of namespace SIGMAZK */
