#include <iostream>
#include <memory>
#include "group.hpp"
#include "scalar25519.hpp"
#include "tests.hpp" // define strings SIGMAZK_TESTS::passed and SIGMAZK_TESTS::failed

using namespace CRV25519;

static bool test_Group(const Group& grp) {
    auto& basePoint = grp.generator();
    auto& identityPoint = grp.identity();

    if (!basePoint.isValid() || basePoint.isIdentity())
        return false;
    if (&basePoint.group() != &grp)
        return false;

    auto twoBase = basePoint + basePoint;
    auto two = Scalar().setInteger(2);
    if (twoBase != basePoint*two || twoBase != two*basePoint)
        return false;

    auto r = grp.randomElement();
    if (r-r != identityPoint)
        return false;
    if (r + identityPoint != r || identityPoint + r != r)
        return false;
    if (r * Scalar() != identityPoint || identityPoint * two != identityPoint)
        return false;

    unsigned char buf[10] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    auto r2 = grp.hashToPoint(buf, sizeof buf);
    if (!r2.isValid() || r2 != grp.hashToPoint(buf, sizeof buf))
        return false;
    buf[0]++;
    if (r2 == grp.hashToPoint(buf, sizeof buf))
        return false;

    // check (base*s)*s = base*s^2
    auto s = grp.randomScalar();
    auto r3 = basePoint * s;
    auto r4 = r3 * s;
    auto r5 = basePoint * (s*s);
    if (!r4.isValid() || r4 != r5)
        return false;

    // multiplying by the group order gives the identity
    Scalar l;
    std::memcpy(l.bytes, grp.orderBytes(), sizeof l.bytes);
    if (r3 * l != identityPoint)
        return false;

    // encoding and decoding
    Element r6 = Element::fromBytes(grp, r3.toBytes());
    if (r6 != r3)
        return false;
    if (Element::fromBytes(grp, identityPoint.toBytes()) != identityPoint)
        return false;
    try {
        std::vector<unsigned char> shortEnc(ELEMENT_BYTES-1, 0);
        Element::fromBytes(grp, shortEnc);
        return false;
    } catch (const SIGMAZK::MalformedStatement&) {}

    return true;
}

static bool test_Mixing() {
    const Group& ed = Group::ed25519();
    const Group& ris = Group::ristretto255();
    if (&ed == &ris || ed.name() == ris.name())
        return false;

    Element a = ed.generator(), b = ris.generator();
    if (a == b) // never equal across groups
        return false;
    try {
        Element c = a + b;
        std::cout << "  adding elements of two groups should throw\n";
        return false;
    } catch (const SIGMAZK::GroupMismatch&) {}
    try {
        Element c = a - b;
        return false;
    } catch (const SIGMAZK::GroupMismatch&) {}

    // A default element is the ed25519 identity
    Element d;
    if (d != ed.identity())
        return false;

    // an encoding that is not on the curve
    std::vector<unsigned char> bad(ELEMENT_BYTES, 0xff);
    try {
        Element::fromBytes(ed, bad);
        std::cout << "  decoding garbage should throw\n";
        return false;
    } catch (const SIGMAZK::MalformedStatement&) {}
    return true;
}

int main(int, char**) {
    if (!test_Group(Group::ed25519()) || !test_Group(Group::ristretto255())
        || !test_Mixing()) {
        std::cout << SIGMAZK_TESTS::failed << std::endl;
        return 1;
    }
    std::cout << SIGMAZK_TESTS::passed << std::endl;
    return 0;
}
