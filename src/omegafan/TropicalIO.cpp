// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "TropicalIO.hpp"

#include "Errors.hpp"
#include <mathic.h>
#include <algorithm>
#include <cctype>
#include <sstream>

OMEGAFAN_NAMESPACE_BEGIN

namespace {
  enum Section {
    NoSection,
    RaysSection,
    ConesOrbitsSection,
    ConesSection
  };

  bool startsWith(const std::string& line, const char* const prefix) {
    return line.compare(0, std::string(prefix).size(), prefix) == 0;
  }

  void reportLineError(size_t lineNumber, const std::string& msg) {
    std::ostringstream out;
    out << "Syntax error on line " << lineNumber << ": " << msg;
    mathic::reportError(out.str());
  }

  // The <cctype> functions need values of unsigned char.
  bool isDigit(const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  }

  bool isAlpha(const char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
  }

  bool isInteger(const std::string& token) {
    size_t start = token.empty() || token[0] != '-' ? 0 : 1;
    return start < token.size() &&
      std::all_of(token.begin() + start, token.end(),
        isDigit);
  }

  std::vector<mpz_class> readIntegers(
    const std::string& line,
    const size_t lineNumber
  ) {
    std::istringstream in(line);
    std::vector<mpz_class> integers;
    std::string token;
    while (in >> token) {
      if (!isInteger(token))
        reportLineError(lineNumber, "Expected an integer, but got " + token);
      integers.push_back(mpz_class(token, 10));
    }
    return integers;
  }

  IncidenceMatrix::Row readIndices(
    std::string line,
    const size_t lineNumber
  ) {
    line.erase(std::remove(line.begin(), line.end(), '{'), line.end());
    line.erase(std::remove(line.begin(), line.end(), '}'), line.end());
    const auto integers = readIntegers(line, lineNumber);
    IncidenceMatrix::Row row;
    for (auto it = integers.begin(); it != integers.end(); ++it) {
      if (*it < 0 || !it->fits_ulong_p())
        reportLineError(lineNumber, "Expected a ray index.");
      row.push_back(it->get_ui());
    }
    return row;
  }

  void writeVector(std::ostream& out, const IntVector& v) {
    for (size_t i = 0; i < v.size(); ++i)
      out << (i == 0 ? "" : " ") << v[i];
    out << '\n';
  }
}

RaysAndCones parseTropicalFan(
  std::istream& in,
  const bool coneOrbitsGiven,
  const bool negateRays
) {
  std::vector<IntVector> rays;
  std::vector<IncidenceMatrix::Row> cones;
  const auto wantedConeSection =
    coneOrbitsGiven ? ConesOrbitsSection : ConesSection;

  Section section = NoSection;
  size_t lineNumber = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++lineNumber;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty()) {
      section = NoSection;
      continue;
    }
    if (startsWith(line, "RAYS")) {
      section = RaysSection;
      continue;
    }
    if (startsWith(line, "CONES_ORBITS")) {
      section = ConesOrbitsSection;
      continue;
    }
    if (startsWith(line, "CONES")) {
      section = ConesSection;
      continue;
    }

    const auto data = line.substr(0, line.find('#'));
    if (section == RaysSection) {
      auto ray = readIntegers(data, lineNumber);
      if (!rays.empty() && ray.size() != rays.front().size()) {
        std::ostringstream out;
        out << "The ray on line " << lineNumber << " has " << ray.size()
          << " entries but the first ray has " << rays.front().size() << '.';
        throw InconsistentDimensionError(out.str());
      }
      if (negateRays)
        for (auto it = ray.begin(); it != ray.end(); ++it)
          *it = -*it;
      rays.push_back(std::move(ray));
    } else if (section == wantedConeSection)
      cones.push_back(readIndices(data, lineNumber));
  }

  IncidenceMatrix incidence(rays.size(), std::move(cones));
  return RaysAndCones(std::move(rays), std::move(incidence));
}

RaysAndCones parseTropicalFan(
  const std::string& text,
  const bool coneOrbitsGiven,
  const bool negateRays
) {
  std::istringstream in(text);
  return parseTropicalFan(in, coneOrbitsGiven, negateRays);
}

void writeTropicalFan(std::ostream& out, const PolyhedralFan& fan) {
  out << "AMBIENT_DIM\n" << fan.ambientDimension() << "\n\n";
  out << "LINEALITY_DIM\n" << fan.linealityDimension() << "\n\n";
  out << "RAYS\n";
  for (auto it = fan.rays().begin(); it != fan.rays().end(); ++it)
    writeVector(out, *it);
  out << "\nN_RAYS\n" << fan.rayCount() << "\n\n";
  out << "LINEALITY_SPACE\n";
  for (auto it = fan.lineality().begin(); it != fan.lineality().end(); ++it)
    writeVector(out, *it);
  out << "\nCONES\n";
  fan.cones().print(out);
}

std::string padVariableNumbers(const std::string& s) {
  // Find the digits of each token of letters followed by digits.
  std::vector<std::pair<size_t, size_t>> numbers;
  size_t width = 0;
  for (size_t i = 0; i < s.size(); ) {
    if (!isAlpha(s[i])) {
      ++i;
      continue;
    }
    while (i < s.size() && isAlpha(s[i]))
      ++i;
    const auto begin = i;
    while (i < s.size() && isDigit(s[i]))
      ++i;
    if (begin == i)
      continue;
    numbers.push_back(std::make_pair(begin, i));

    auto significant = s.find_first_not_of('0', begin);
    if (significant >= i)
      significant = i - 1; // the number is zero
    width = std::max(width, i - significant);
  }

  std::string padded;
  size_t copied = 0;
  for (auto it = numbers.begin(); it != numbers.end(); ++it) {
    padded.append(s, copied, it->first - copied);
    const auto length = it->second - it->first;
    if (length < width)
      padded.append(width - length, '0');
    padded.append(s, it->first, length);
    copied = it->second;
  }
  padded.append(s, copied, std::string::npos);
  return padded;
}

namespace {
  std::string unpaddedRing(const size_t varCount) {
    std::ostringstream out;
    out << "Q[";
    for (size_t var = 0; var < varCount; ++var)
      out << (var == 0 ? "" : ",") << 'y' << (var + 1);
    out << ']';
    return out.str();
  }
}

std::string ringToGfan(const size_t varCount) {
  return padVariableNumbers(unpaddedRing(varCount));
}

std::string idealToGfan(const Ideal& ideal) {
  if (ideal.isZero())
    return std::string();

  std::vector<std::string> names;
  for (size_t var = 0; var < ideal.varCount(); ++var) {
    std::ostringstream name;
    name << 'y' << (var + 1);
    names.push_back(name.str());
  }

  std::ostringstream gens;
  gens << "{\n";
  for (size_t i = 0; i < ideal.generatorCount(); ++i) {
    if (i > 0)
      gens << ",\n";
    ideal.generator(i).display(gens, names);
  }
  gens << "\n}";
  // Pad ring and generators together so the names agree.
  return padVariableNumbers
    (unpaddedRing(ideal.varCount()) + "\n\n" + gens.str());
}

std::string pointConfigurationToString(const PointConfiguration& points) {
  std::ostringstream out;
  out << '{';
  for (size_t p = 0; p < points.size(); ++p) {
    out << (p == 0 ? "(1" : ", (1");
    for (auto it = points[p].begin(); it != points[p].end(); ++it)
      out << ", " << *it;
    out << ')';
  }
  out << '}';
  return out.str();
}

OMEGAFAN_NAMESPACE_END
