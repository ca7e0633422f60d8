// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"

#include "omegafan/IdealIO.hpp"
#include "omegafan/Poly.hpp"
#include "omegafan/PolyRing.hpp"
#include "omegafan/Scanner.hpp"
#include <sstream>
#include <string>
#include <gtest/gtest.h>

using namespace ofan;

TEST(PolyRing, write) {
  std::ostringstream out;
  PolyRing::standard(3)->write(out);
  EXPECT_EQ("Q[x1,x2,x3]", out.str());

  const PolyRing ring({"a", "b"});
  EXPECT_EQ(1u, ring.varIndex("b"));
  EXPECT_EQ(static_cast<PolyRing::VarIndex>(-1), ring.varIndex("c"));
}

TEST(Poly, readWrite) {
  Scanner ringIn("Q[x,y,z]");
  const auto ring = readRing(ringIn);

  Scanner in("5 - 1/3*z + 2*x^2*y");
  const Poly p = readPoly(in, *ring);
  EXPECT_EQ(3u, p.termCount());
  EXPECT_EQ("2*x^2*y - 1/3*z + 5", p.toString());
  EXPECT_FALSE(p.isHomogeneous());
  EXPECT_TRUE(p.termsAreInDescendingOrder());

  Scanner in2("x*y + y*x - 2*x*y + z^2 - x");
  const Poly q = readPoly(in2, *ring);
  EXPECT_EQ("z^2 - x", q.toString());
  EXPECT_FALSE(q.isFreeOf(0));
  EXPECT_TRUE(q.isFreeOf(1));

  Scanner in3("x*y - z^2");
  EXPECT_TRUE(readPoly(in3, *ring).isHomogeneous());
}

TEST(Poly, grevlexOrder) {
  Scanner ringIn("Q[a,b,c]");
  const auto ring = readRing(ringIn);

  // Among monomials of the same degree the one with the smaller power of
  // the last variable is larger.
  Scanner in("a*c + b^2 + a*b + c^2 + a^2");
  EXPECT_EQ("a^2 + a*b + b^2 + a*c + c^2", readPoly(in, *ring).toString());
}

TEST(IdealIO, readWrite) {
  const auto ideal = parseIdeal(
    "Q[x,y] # the ring\n"
    "{\n"
    "  x*y - 1,\n"
    "  x^2 # last\n"
    "}\n"
  );
  EXPECT_EQ(2u, ideal.varCount());
  EXPECT_EQ(2u, ideal.generatorCount());

  std::ostringstream out;
  writeIdeal(out, ideal);
  EXPECT_EQ("Q[x,y]\n{\n  x*y - 1,\n  x^2\n}\n", out.str());

  std::ostringstream display;
  display << ideal;
  EXPECT_EQ("Q[x,y] {x*y - 1, x^2}", display.str());

  // Writing and reading back gives the same text.
  std::ostringstream again;
  writeIdeal(again, parseIdeal(out.str()));
  EXPECT_EQ(out.str(), again.str());
}

TEST(IdealIO, zeroAndUnit) {
  const auto zero = parseIdeal("Q[x] {}");
  EXPECT_TRUE(zero.isZero());
  EXPECT_FALSE(zero.hasUnitGenerator());

  const auto unit = parseIdeal("Q[x] {3/2}");
  EXPECT_FALSE(unit.isZero());
  EXPECT_TRUE(unit.hasUnitGenerator());
}

TEST(IdealIO, syntaxErrors) {
  EXPECT_THROW(parseIdeal("Q[x] {y}"), std::exception);
  EXPECT_THROW(parseIdeal("Q[x,x] {x}"), std::exception);
  EXPECT_THROW(parseIdeal("Q[x] {x"), std::exception);
  EXPECT_THROW(parseIdeal("Q[x] {x} x"), std::exception);
  EXPECT_THROW(parseIdeal("Z[x] {x}"), std::exception);
  EXPECT_THROW(parseIdeal("Q[x] {1/0*x}"), std::exception);
}
