// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "stdinc.h"
#include "Scanner.hpp"

#include <mathic.h>
#include <iterator>
#include <sstream>
#include <cstring>

OMEGAFAN_NAMESPACE_BEGIN

Scanner::Scanner(std::istream& input):
  mLineCount(1),
  mChar(' '),
  mBuffer(
    (std::istreambuf_iterator<char>(input)),
    std::istreambuf_iterator<char>()
  ),
  mBufferPos(mBuffer.begin())
{
  get();
}

Scanner::Scanner(const char* const input):
  mLineCount(1),
  mChar(' '),
  mBuffer(input, input + std::strlen(input)),
  mBufferPos(mBuffer.begin())
{
  get();
}

Scanner::Scanner(const std::string& input):
  mLineCount(1),
  mChar(' '),
  mBuffer(input.begin(), input.end()),
  mBufferPos(mBuffer.begin())
{
  get();
}

int Scanner::get() {
  if (mChar == '\n')
    ++mLineCount;
  const int current = mChar;
  if (mBufferPos == mBuffer.end())
    mChar = EOF;
  else {
    mChar = static_cast<unsigned char>(*mBufferPos);
    ++mBufferPos;
  }
  return current;
}

void Scanner::eatWhite() {
  while (true) {
    if (std::isspace(peek()))
      get();
    else if (peek() == '#') {
      while (peek() != '\n' && peek() != EOF)
        get();
    } else
      break;
  }
}

bool Scanner::match(const char ch) {
  eatWhite();
  if (peek() != ch)
    return false;
  get();
  return true;
}

bool Scanner::match(const char* const str) {
  eatWhite();
  const auto size = std::strlen(str);
  if (size == 0)
    return true;
  if (peek() != str[0])
    return false;
  const auto left = std::distance(mBufferPos, mBuffer.cend());
  if (static_cast<size_t>(left) < size - 1)
    return false;
  if (!std::equal(str + 1, str + size, mBufferPos))
    return false;
  for (size_t i = 0; i < size; ++i)
    get();
  return true;
}

bool Scanner::matchEOF() {
  eatWhite();
  return peek() == EOF;
}

void Scanner::expect(const char ch) {
  eatWhite();
  if (peek() == ch) {
    get();
    return;
  }
  std::ostringstream expected;
  expected << '\'' << ch << '\'';
  reportErrorUnexpectedToken(expected.str(), peek());
}

void Scanner::expect(const char* str) {
  OMEGAFAN_ASSERT(str != 0);
  if (match(str))
    return;

  // Read what is there to improve error message.
  std::ostringstream got;
  if (peek() == EOF)
    got << "no more input";
  else {
    got << '\"';
    while (std::isalnum(peek()))
      got << static_cast<char>(get());
    if (got.str().size() == 1)
      got << static_cast<char>(peek());
    got << '\"';
  }
  reportErrorUnexpectedToken(std::string("\"") + str + '\"', got.str());
}

void Scanner::expectEOF() {
  if (!matchEOF())
    reportErrorUnexpectedToken("no more input", peek());
}

mpz_class Scanner::readInteger() {
  eatWhite();
  if (!std::isdigit(peek()))
    reportErrorUnexpectedToken("an integer", peek());
  std::string digits;
  while (std::isdigit(peek()))
    digits += static_cast<char>(get());
  return mpz_class(digits, 10);
}

std::string Scanner::readIdentifier() {
  eatWhite();
  if (!std::isalpha(peek()))
    reportErrorUnexpectedToken("an identifier", peek());
  std::string identifier;
  while (std::isalnum(peek()) || peek() == '_')
    identifier += static_cast<char>(get());
  return identifier;
}

void Scanner::reportError(const std::string& msg) const {
  std::ostringstream out;
  out << "Syntax error on line " << lineCount() << ": " << msg;
  mathic::reportError(out.str());
}

void Scanner::reportErrorUnexpectedToken(const std::string& expected, int got) {
  std::ostringstream gotDescription;
  if (got == EOF)
    gotDescription << "no more input";
  else
    gotDescription << '\'' << static_cast<char>(got) << '\'';
  reportErrorUnexpectedToken(expected, gotDescription.str());
}

void Scanner::reportErrorUnexpectedToken(
  const std::string& expected,
  const std::string& got
) {
  std::ostringstream errorMsg;
  errorMsg << "Expected " << expected;
  if (got != "")
    errorMsg << ", but got " << got;
  errorMsg << '.';
  reportError(errorMsg.str());
}

OMEGAFAN_NAMESPACE_END
