// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "BoundsAction.hpp"

#include "omegafan/BoundIdeals.hpp"
#include "omegafan/IdealIO.hpp"
#include "omegafan/Lineality.hpp"
#include "omegafan/Scanner.hpp"
#include <iostream>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

namespace {
  // Reads whitespace separated integers like "1 0 -2".
  IntVector parseWeight(const std::string& text) {
    Scanner in(text);
    IntVector weight;
    while (!in.matchEOF()) {
      const bool negative = in.match('-');
      const auto value = in.readInteger();
      weight.push_back(negative ? mpz_class(-value) : value);
    }
    return weight;
  }

  void printIdeal(
    const char* title,
    const Ideal& ideal,
    const SymbolicEngine& engine
  ) {
    std::cout << title << ":\n";
    writeIdeal(std::cout, engine.reducedBasis(ideal));
  }
}

BoundsAction::BoundsAction():
  mParams(1, 1),
  mWeight(
    "weight",
    "The weight vector, one integer per variable separated by spaces, "
    "like -weight \"1 0 0 2\".",
    "")
{}

void BoundsAction::directOptions(
  std::vector<std::string> tokens,
  mathic::CliParser& parser
) {
  mParams.directOptions(tokens, parser);
}

void BoundsAction::performAction() {
  mParams.perform();
  const auto ideal = mParams.readInputIdeal(0);
  const auto weight = parseWeight(mWeight.value());
  if (weight.size() != ideal.varCount()) {
    std::ostringstream err;
    err << "The weight has " << weight.size() << " entries but the ring has "
      << ideal.varCount() << " variables.\n";
    mathic::reportError(err.str());
  }

  const SymbolicEngine engine;
  const auto points = pointConfiguration(ideal, engine);
  const auto cells = regularSubdivision(points, weight);
  std::cout << "Maximal cells:\n";
  IncidenceMatrix(points.size(), cells).print(std::cout);

  IntVector negated(weight.size());
  for (size_t i = 0; i < weight.size(); ++i)
    negated[i] = -weight[i];

  const auto initial = engine.initial(ideal, MinValuation, weight);
  const auto lower = idealW(ideal, weight, points, engine);
  printIdeal("\nInitial ideal at w", initial, engine);
  printIdeal("\nLower bound ideal at w", lower, engine);
  std::cout << "\nThe initial ideal at w "
    << (engine.equal(initial, lower) ? "equals" : "differs from")
    << " the lower bound ideal.\n";

  const auto initialNegated = engine.initial(ideal, MinValuation, negated);
  const auto upper = idealUpW(ideal, weight, points, engine);
  printIdeal("\nInitial ideal at -w", initialNegated, engine);
  printIdeal("\nUpper bound ideal at w", upper, engine);
  std::cout << "\nThe initial ideal at -w "
    << (engine.equal(initialNegated, upper) ? "equals" : "differs from")
    << " the upper bound ideal.\n";
}

const char* BoundsAction::staticName() {
  return "bounds";
}

const char* BoundsAction::name() const {
  return staticName();
}

const char* BoundsAction::description() const {
  return "Print the maximal cells of the regular subdivision of the point "
    "configuration of an ideal at a weight, the initial ideals at the "
    "weight and its negative, and the lower and upper bound ideals. The "
    "direct parameter is an ideal file.";
}

const char* BoundsAction::shortDescription() const {
  return "Print the bound ideals at one weight.";
}

void BoundsAction::pushBackParameters(
  std::vector<mathic::CliParameter*>& parameters
) {
  mParams.pushBackParameters(parameters);
  parameters.push_back(&mWeight);
}

OMEGAFAN_NAMESPACE_END
