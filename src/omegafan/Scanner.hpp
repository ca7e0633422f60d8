// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#ifndef OMEGAFAN_SCANNER_GUARD
#define OMEGAFAN_SCANNER_GUARD

#include <gmpxx.h>
#include <istream>
#include <string>
#include <vector>
#include <cstdio>
#include <cctype>

OMEGAFAN_NAMESPACE_BEGIN

/// Tokenizer for the plain text formats read by OmegaFan. White space and
/// comments from # to the end of a line are skipped before every token
/// is read. Errors are reported through mathic::reportError with the
/// current line number.
class Scanner {
public:
  explicit Scanner(std::istream& input);
  explicit Scanner(const char* const input);
  explicit Scanner(const std::string& input);

  /// Returns true and consumes the next non-white character if it is
  /// ch. Otherwise nothing is consumed.
  bool match(char ch);

  /// Returns true and consumes str if the input continues with str after
  /// white space.
  bool match(const char* const str);

  /// Returns true if there is no more input apart from white space.
  bool matchEOF();

  /// Like match, but reports an error if the expected text is not there.
  void expect(char ch);
  void expect(const char* str);
  void expectEOF();

  /// Reads a non-negative integer.
  mpz_class readInteger();

  /// Reads a letter followed by letters, digits and underscores.
  std::string readIdentifier();

  bool peekDigit() {eatWhite(); return std::isdigit(peek()) != 0;}

  /// Returns the next character or EOF. White space is not skipped.
  int peek() const {return mChar;}

  /// Consumes the next character and returns it. White space is not
  /// skipped.
  int get();

  /// Skips white space and comments.
  void eatWhite();

  unsigned long long lineCount() const {return mLineCount;}

  /// Reports an error prefixed with the current line number.
  void reportError(const std::string& msg) const;

private:
  void reportErrorUnexpectedToken(const std::string& expected, int got);
  void reportErrorUnexpectedToken(
    const std::string& expected,
    const std::string& got
  );

  unsigned long long mLineCount;
  int mChar; // next character, or EOF
  std::vector<char> mBuffer;
  std::vector<char>::const_iterator mBufferPos;
};

OMEGAFAN_NAMESPACE_END
#endif
