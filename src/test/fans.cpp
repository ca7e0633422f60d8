// OmegaFan copyright 2026 all rights reserved. OmegaFan comes with ABSOLUTELY
// NO WARRANTY and is licensed as GPL v2.0 or later - see LICENSE.txt.
#include "omegafan/stdinc.h"
#include "test/fans.hpp"

const char* const grassmannian24Ideal =
  "Q[p12,p13,p14,p23,p24,p34]\n"
  "{\n"
  "  p12*p34 - p13*p24 + p14*p23\n"
  "}\n";

// Secondary fan of the point configuration of G(2,4) as computed, that is
// without negating the rays.
const char* const secondaryFan24 =
  "_application fan\n"
  "_version 2.2\n"
  "_type SymmetricFan\n"
  "\n"
  "AMBIENT_DIM\n"
  "6\n"
  "\n"
  "DIM\n"
  "6\n"
  "\n"
  "LINEALITY_DIM\n"
  "4\n"
  "\n"
  "RAYS\n"
  "2 -1 -1 -1 -1 2\t# 0\n"
  "-1 -1 2 2 -1 -1\t# 1\n"
  "-1 2 -1 -1 2 -1\t# 2\n"
  "\n"
  "N_RAYS\n"
  "3\n"
  "\n"
  "LINEALITY_SPACE\n"
  "1 0 0 0 0 -1\n"
  "0 1 0 0 -1 0\n"
  "0 0 1 0 1 1\n"
  "0 0 0 1 1 1\n"
  "\n"
  "ORTH_LINEALITY_SPACE\n"
  "0 1 -1 -1 1 0\n"
  "1 0 -1 -1 0 1\n"
  "\n"
  "F_VECTOR\n"
  "1 3 3\n"
  "\n"
  "CONES\n"
  "{}\t# Dimension 4\n"
  "{0}\t# Dimension 5\n"
  "{1}\t# Dimension 5\n"
  "{2}\t# Dimension 5\n"
  "{0 1}\t# Dimension 6\n"
  "{0 2}\t# Dimension 6\n"
  "{1 2}\t# Dimension 6\n"
  "\n"
  "MAXIMAL_CONES\n"
  "{0 1}\t# Dimension 6\n"
  "{0 2}\t# Dimension 6\n"
  "{1 2}\t# Dimension 6\n";

// Secondary fan of the point configuration of G(2,5) with 723 cones.
const char* const secondaryFan25 =
  "_application fan\n"
  "_version 2.2\n"
  "_type SymmetricFan\n"
  "\n"
  "AMBIENT_DIM\n"
  "10\n"
  "\n"
  "DIM\n"
  "10\n"
  "\n"
  "LINEALITY_DIM\n"
  "5\n"
  "\n"
  "RAYS\n"
  "-1 1 1 -1 -1 -1 3 1 -1 -1\t# 0\n"
  "1 -1 1 -1 -1 1 -1 -1 3 -1\t# 1\n"
  "3 -1 -1 -1 -1 -1 -1 1 1 1\t# 2\n"
  "-1 3 -1 -1 -1 1 1 -1 -1 1\t# 3\n"
  "1 1 -1 -1 -3 1 1 1 1 -1\t# 4\n"
  "-1 1 -1 1 -1 3 -1 -1 1 -1\t# 5\n"
  "1 1 -1 -1 1 -1 -1 -1 -1 3\t# 6\n"
  "1 1 1 -3 -1 -1 1 -1 1 1\t# 7\n"
  "-1 -1 3 -1 1 -1 1 -1 1 -1\t# 8\n"
  "-1 1 1 -1 1 1 -1 -3 1 1\t# 9\n"
  "-1 -1 1 1 3 -1 -1 -1 -1 1\t# 10\n"
  "1 -1 -1 1 -1 -1 1 3 -1 -1\t# 11\n"
  "-1 -1 1 1 -1 1 1 1 1 -3\t# 12\n"
  "-1 -1 -1 3 1 1 -1 1 -1 -1\t# 13\n"
  "1 -3 1 1 1 -1 -1 1 1 -1\t# 14\n"
  "-1 1 -1 1 1 -1 1 1 -3 1\t# 15\n"
  "1 -1 1 -1 1 -3 1 1 -1 1\t# 16\n"
  "1 -1 -1 1 1 1 -3 -1 1 1\t# 17\n"
  "1 1 -3 1 -1 1 -1 1 -1 1\t# 18\n"
  "-3 1 1 1 1 1 1 -1 -1 -1\t# 19\n"
  "\n"
  "N_RAYS\n"
  "20\n"
  "\n"
  "LINEALITY_SPACE\n"
  "1 0 0 0 0 0 0 -1 -1 -1\n"
  "0 1 0 0 0 -1 -1 0 0 -1\n"
  "0 0 1 0 0 1 0 1 0 1\n"
  "0 0 0 1 0 0 1 0 1 1\n"
  "0 0 0 0 1 1 1 1 1 1\n"
  "\n"
  "ORTH_LINEALITY_SPACE\n"
  "0 1 -1 0 -1 1 0 0 0 0\n"
  "0 1 0 -1 -1 0 1 0 0 0\n"
  "1 0 -1 0 -1 0 0 1 0 0\n"
  "1 0 0 -1 -1 0 0 0 1 0\n"
  "1 1 -1 -1 -1 0 0 0 0 1\n"
  "\n"
  "F_VECTOR\n"
  "1 20 105 240 255 102\n"
  "\n"
  "CONES\n"
  "{}\t# Dimension 5\n"
  "{0}\t# Dimension 6\n"
  "{1}\t# Dimension 6\n"
  "{2}\t# Dimension 6\n"
  "{3}\t# Dimension 6\n"
  "{4}\t# Dimension 6\n"
  "{5}\t# Dimension 6\n"
  "{6}\t# Dimension 6\n"
  "{7}\t# Dimension 6\n"
  "{8}\t# Dimension 6\n"
  "{9}\t# Dimension 6\n"
  "{10}\t# Dimension 6\n"
  "{11}\t# Dimension 6\n"
  "{12}\t# Dimension 6\n"
  "{13}\t# Dimension 6\n"
  "{14}\t# Dimension 6\n"
  "{15}\t# Dimension 6\n"
  "{16}\t# Dimension 6\n"
  "{17}\t# Dimension 6\n"
  "{18}\t# Dimension 6\n"
  "{19}\t# Dimension 6\n"
  "{0 1}\t# Dimension 7\n"
  "{0 2}\t# Dimension 7\n"
  "{0 3}\t# Dimension 7\n"
  "{0 4}\t# Dimension 7\n"
  "{0 5}\t# Dimension 7\n"
  "{0 6}\t# Dimension 7\n"
  "{0 7}\t# Dimension 7\n"
  "{0 8}\t# Dimension 7\n"
  "{0 10}\t# Dimension 7\n"
  "{0 11}\t# Dimension 7\n"
  "{0 12}\t# Dimension 7\n"
  "{0 13}\t# Dimension 7\n"
  "{0 15}\t# Dimension 7\n"
  "{0 16}\t# Dimension 7\n"
  "{0 19}\t# Dimension 7\n"
  "{1 2}\t# Dimension 7\n"
  "{1 3}\t# Dimension 7\n"
  "{1 4}\t# Dimension 7\n"
  "{1 5}\t# Dimension 7\n"
  "{1 6}\t# Dimension 7\n"
  "{1 7}\t# Dimension 7\n"
  "{1 8}\t# Dimension 7\n"
  "{1 9}\t# Dimension 7\n"
  "{1 10}\t# Dimension 7\n"
  "{1 11}\t# Dimension 7\n"
  "{1 12}\t# Dimension 7\n"
  "{1 13}\t# Dimension 7\n"
  "{1 14}\t# Dimension 7\n"
  "{1 17}\t# Dimension 7\n"
  "{2 3}\t# Dimension 7\n"
  "{2 4}\t# Dimension 7\n"
  "{2 5}\t# Dimension 7\n"
  "{2 6}\t# Dimension 7\n"
  "{2 7}\t# Dimension 7\n"
  "{2 8}\t# Dimension 7\n"
  "{2 10}\t# Dimension 7\n"
  "{2 11}\t# Dimension 7\n"
  "{2 13}\t# Dimension 7\n"
  "{2 14}\t# Dimension 7\n"
  "{2 16}\t# Dimension 7\n"
  "{2 17}\t# Dimension 7\n"
  "{2 18}\t# Dimension 7\n"
  "{3 4}\t# Dimension 7\n"
  "{3 5}\t# Dimension 7\n"
  "{3 6}\t# Dimension 7\n"
  "{3 7}\t# Dimension 7\n"
  "{3 8}\t# Dimension 7\n"
  "{3 9}\t# Dimension 7\n"
  "{3 10}\t# Dimension 7\n"
  "{3 11}\t# Dimension 7\n"
  "{3 13}\t# Dimension 7\n"
  "{3 15}\t# Dimension 7\n"
  "{3 18}\t# Dimension 7\n"
  "{3 19}\t# Dimension 7\n"
  "{4 5}\t# Dimension 7\n"
  "{4 11}\t# Dimension 7\n"
  "{5 6}\t# Dimension 7\n"
  "{5 8}\t# Dimension 7\n"
  "{5 9}\t# Dimension 7\n"
  "{5 10}\t# Dimension 7\n"
  "{5 11}\t# Dimension 7\n"
  "{5 12}\t# Dimension 7\n"
  "{5 13}\t# Dimension 7\n"
  "{5 17}\t# Dimension 7\n"
  "{5 18}\t# Dimension 7\n"
  "{5 19}\t# Dimension 7\n"
  "{6 7}\t# Dimension 7\n"
  "{6 8}\t# Dimension 7\n"
  "{6 9}\t# Dimension 7\n"
  "{6 10}\t# Dimension 7\n"
  "{6 11}\t# Dimension 7\n"
  "{6 13}\t# Dimension 7\n"
  "{6 15}\t# Dimension 7\n"
  "{6 16}\t# Dimension 7\n"
  "{6 17}\t# Dimension 7\n"
  "{6 18}\t# Dimension 7\n"
  "{7 8}\t# Dimension 7\n"
  "{8 9}\t# Dimension 7\n"
  "{8 10}\t# Dimension 7\n"
  "{8 11}\t# Dimension 7\n"
  "{8 12}\t# Dimension 7\n"
  "{8 13}\t# Dimension 7\n"
  "{8 14}\t# Dimension 7\n"
  "{8 16}\t# Dimension 7\n"
  "{8 19}\t# Dimension 7\n"
  "{9 10}\t# Dimension 7\n"
  "{10 11}\t# Dimension 7\n"
  "{10 13}\t# Dimension 7\n"
  "{10 14}\t# Dimension 7\n"
  "{10 15}\t# Dimension 7\n"
  "{10 16}\t# Dimension 7\n"
  "{10 17}\t# Dimension 7\n"
  "{10 19}\t# Dimension 7\n"
  "{11 12}\t# Dimension 7\n"
  "{11 13}\t# Dimension 7\n"
  "{11 14}\t# Dimension 7\n"
  "{11 15}\t# Dimension 7\n"
  "{11 16}\t# Dimension 7\n"
  "{11 18}\t# Dimension 7\n"
  "{12 13}\t# Dimension 7\n"
  "{13 14}\t# Dimension 7\n"
  "{13 15}\t# Dimension 7\n"
  "{13 17}\t# Dimension 7\n"
  "{13 18}\t# Dimension 7\n"
  "{13 19}\t# Dimension 7\n"
  "{0 1 2}\t# Dimension 8\n"
  "{0 1 3}\t# Dimension 8\n"
  "{0 1 4}\t# Dimension 8\n"
  "{0 1 5}\t# Dimension 8\n"
  "{0 1 7}\t# Dimension 8\n"
  "{0 1 8}\t# Dimension 8\n"
  "{0 1 11}\t# Dimension 8\n"
  "{0 1 12}\t# Dimension 8\n"
  "{0 2 3}\t# Dimension 8\n"
  "{0 2 4}\t# Dimension 8\n"
  "{0 2 6}\t# Dimension 8\n"
  "{0 2 7}\t# Dimension 8\n"
  "{0 2 8}\t# Dimension 8\n"
  "{0 2 11}\t# Dimension 8\n"
  "{0 2 16}\t# Dimension 8\n"
  "{0 3 4}\t# Dimension 8\n"
  "{0 3 5}\t# Dimension 8\n"
  "{0 3 6}\t# Dimension 8\n"
  "{0 3 7}\t# Dimension 8\n"
  "{0 3 8}\t# Dimension 8\n"
  "{0 3 10}\t# Dimension 8\n"
  "{0 3 11}\t# Dimension 8\n"
  "{0 3 13}\t# Dimension 8\n"
  "{0 3 15}\t# Dimension 8\n"
  "{0 3 19}\t# Dimension 8\n"
  "{0 4 5}\t# Dimension 8\n"
  "{0 4 11}\t# Dimension 8\n"
  "{0 5 8}\t# Dimension 8\n"
  "{0 5 11}\t# Dimension 8\n"
  "{0 5 12}\t# Dimension 8\n"
  "{0 5 13}\t# Dimension 8\n"
  "{0 5 19}\t# Dimension 8\n"
  "{0 6 7}\t# Dimension 8\n"
  "{0 6 8}\t# Dimension 8\n"
  "{0 6 10}\t# Dimension 8\n"
  "{0 6 11}\t# Dimension 8\n"
  "{0 6 15}\t# Dimension 8\n"
  "{0 6 16}\t# Dimension 8\n"
  "{0 7 8}\t# Dimension 8\n"
  "{0 8 10}\t# Dimension 8\n"
  "{0 8 11}\t# Dimension 8\n"
  "{0 8 12}\t# Dimension 8\n"
  "{0 8 13}\t# Dimension 8\n"
  "{0 8 16}\t# Dimension 8\n"
  "{0 8 19}\t# Dimension 8\n"
  "{0 10 11}\t# Dimension 8\n"
  "{0 10 13}\t# Dimension 8\n"
  "{0 10 15}\t# Dimension 8\n"
  "{0 10 16}\t# Dimension 8\n"
  "{0 10 19}\t# Dimension 8\n"
  "{0 11 12}\t# Dimension 8\n"
  "{0 11 13}\t# Dimension 8\n"
  "{0 11 15}\t# Dimension 8\n"
  "{0 11 16}\t# Dimension 8\n"
  "{0 12 13}\t# Dimension 8\n"
  "{0 13 15}\t# Dimension 8\n"
  "{0 13 19}\t# Dimension 8\n"
  "{1 2 3}\t# Dimension 8\n"
  "{1 2 4}\t# Dimension 8\n"
  "{1 2 5}\t# Dimension 8\n"
  "{1 2 6}\t# Dimension 8\n"
  "{1 2 7}\t# Dimension 8\n"
  "{1 2 8}\t# Dimension 8\n"
  "{1 2 10}\t# Dimension 8\n"
  "{1 2 11}\t# Dimension 8\n"
  "{1 2 13}\t# Dimension 8\n"
  "{1 2 14}\t# Dimension 8\n"
  "{1 2 17}\t# Dimension 8\n"
  "{1 3 4}\t# Dimension 8\n"
  "{1 3 5}\t# Dimension 8\n"
  "{1 3 6}\t# Dimension 8\n"
  "{1 3 7}\t# Dimension 8\n"
  "{1 3 8}\t# Dimension 8\n"
  "{1 3 9}\t# Dimension 8\n"
  "{1 4 5}\t# Dimension 8\n"
  "{1 4 11}\t# Dimension 8\n"
  "{1 5 6}\t# Dimension 8\n"
  "{1 5 8}\t# Dimension 8\n"
  "{1 5 9}\t# Dimension 8\n"
  "{1 5 10}\t# Dimension 8\n"
  "{1 5 11}\t# Dimension 8\n"
  "{1 5 12}\t# Dimension 8\n"
  "{1 5 13}\t# Dimension 8\n"
  "{1 5 17}\t# Dimension 8\n"
  "{1 6 7}\t# Dimension 8\n"
  "{1 6 8}\t# Dimension 8\n"
  "{1 6 9}\t# Dimension 8\n"
  "{1 6 10}\t# Dimension 8\n"
  "{1 6 17}\t# Dimension 8\n"
  "{1 7 8}\t# Dimension 8\n"
  "{1 8 9}\t# Dimension 8\n"
  "{1 8 10}\t# Dimension 8\n"
  "{1 8 11}\t# Dimension 8\n"
  "{1 8 12}\t# Dimension 8\n"
  "{1 8 13}\t# Dimension 8\n"
  "{1 8 14}\t# Dimension 8\n"
  "{1 9 10}\t# Dimension 8\n"
  "{1 10 13}\t# Dimension 8\n"
  "{1 10 14}\t# Dimension 8\n"
  "{1 10 17}\t# Dimension 8\n"
  "{1 11 12}\t# Dimension 8\n"
  "{1 11 13}\t# Dimension 8\n"
  "{1 11 14}\t# Dimension 8\n"
  "{1 12 13}\t# Dimension 8\n"
  "{1 13 14}\t# Dimension 8\n"
  "{1 13 17}\t# Dimension 8\n"
  "{2 3 4}\t# Dimension 8\n"
  "{2 3 5}\t# Dimension 8\n"
  "{2 3 6}\t# Dimension 8\n"
  "{2 3 7}\t# Dimension 8\n"
  "{2 3 11}\t# Dimension 8\n"
  "{2 3 18}\t# Dimension 8\n"
  "{2 4 5}\t# Dimension 8\n"
  "{2 4 11}\t# Dimension 8\n"
  "{2 5 6}\t# Dimension 8\n"
  "{2 5 11}\t# Dimension 8\n"
  "{2 5 13}\t# Dimension 8\n"
  "{2 5 17}\t# Dimension 8\n"
  "{2 5 18}\t# Dimension 8\n"
  "{2 6 7}\t# Dimension 8\n"
  "{2 6 8}\t# Dimension 8\n"
  "{2 6 10}\t# Dimension 8\n"
  "{2 6 11}\t# Dimension 8\n"
  "{2 6 13}\t# Dimension 8\n"
  "{2 6 16}\t# Dimension 8\n"
  "{2 6 17}\t# Dimension 8\n"
  "{2 6 18}\t# Dimension 8\n"
  "{2 7 8}\t# Dimension 8\n"
  "{2 8 10}\t# Dimension 8\n"
  "{2 8 11}\t# Dimension 8\n"
  "{2 8 14}\t# Dimension 8\n"
  "{2 8 16}\t# Dimension 8\n"
  "{2 10 11}\t# Dimension 8\n"
  "{2 10 13}\t# Dimension 8\n"
  "{2 10 14}\t# Dimension 8\n"
  "{2 10 16}\t# Dimension 8\n"
  "{2 10 17}\t# Dimension 8\n"
  "{2 11 13}\t# Dimension 8\n"
  "{2 11 14}\t# Dimension 8\n"
  "{2 11 16}\t# Dimension 8\n"
  "{2 11 18}\t# Dimension 8\n"
  "{2 13 14}\t# Dimension 8\n"
  "{2 13 17}\t# Dimension 8\n"
  "{2 13 18}\t# Dimension 8\n"
  "{3 4 5}\t# Dimension 8\n"
  "{3 4 11}\t# Dimension 8\n"
  "{3 5 6}\t# Dimension 8\n"
  "{3 5 8}\t# Dimension 8\n"
  "{3 5 9}\t# Dimension 8\n"
  "{3 5 10}\t# Dimension 8\n"
  "{3 5 11}\t# Dimension 8\n"
  "{3 5 13}\t# Dimension 8\n"
  "{3 5 18}\t# Dimension 8\n"
  "{3 5 19}\t# Dimension 8\n"
  "{3 6 7}\t# Dimension 8\n"
  "{3 6 8}\t# Dimension 8\n"
  "{3 6 9}\t# Dimension 8\n"
  "{3 6 10}\t# Dimension 8\n"
  "{3 6 11}\t# Dimension 8\n"
  "{3 6 13}\t# Dimension 8\n"
  "{3 6 15}\t# Dimension 8\n"
  "{3 6 18}\t# Dimension 8\n"
  "{3 7 8}\t# Dimension 8\n"
  "{3 8 9}\t# Dimension 8\n"
  "{3 8 10}\t# Dimension 8\n"
  "{3 8 19}\t# Dimension 8\n"
  "{3 9 10}\t# Dimension 8\n"
  "{3 10 13}\t# Dimension 8\n"
  "{3 10 15}\t# Dimension 8\n"
  "{3 10 19}\t# Dimension 8\n"
  "{3 11 13}\t# Dimension 8\n"
  "{3 11 15}\t# Dimension 8\n"
  "{3 11 18}\t# Dimension 8\n"
  "{3 13 15}\t# Dimension 8\n"
  "{3 13 18}\t# Dimension 8\n"
  "{3 13 19}\t# Dimension 8\n"
  "{4 5 11}\t# Dimension 8\n"
  "{5 6 9}\t# Dimension 8\n"
  "{5 6 10}\t# Dimension 8\n"
  "{5 6 13}\t# Dimension 8\n"
  "{5 6 17}\t# Dimension 8\n"
  "{5 6 18}\t# Dimension 8\n"
  "{5 8 9}\t# Dimension 8\n"
  "{5 8 10}\t# Dimension 8\n"
  "{5 8 12}\t# Dimension 8\n"
  "{5 8 13}\t# Dimension 8\n"
  "{5 8 19}\t# Dimension 8\n"
  "{5 9 10}\t# Dimension 8\n"
  "{5 10 13}\t# Dimension 8\n"
  "{5 10 17}\t# Dimension 8\n"
  "{5 10 19}\t# Dimension 8\n"
  "{5 11 12}\t# Dimension 8\n"
  "{5 11 13}\t# Dimension 8\n"
  "{5 11 18}\t# Dimension 8\n"
  "{5 12 13}\t# Dimension 8\n"
  "{5 13 17}\t# Dimension 8\n"
  "{5 13 18}\t# Dimension 8\n"
  "{5 13 19}\t# Dimension 8\n"
  "{6 7 8}\t# Dimension 8\n"
  "{6 8 9}\t# Dimension 8\n"
  "{6 8 10}\t# Dimension 8\n"
  "{6 8 16}\t# Dimension 8\n"
  "{6 9 10}\t# Dimension 8\n"
  "{6 10 11}\t# Dimension 8\n"
  "{6 10 13}\t# Dimension 8\n"
  "{6 10 15}\t# Dimension 8\n"
  "{6 10 16}\t# Dimension 8\n"
  "{6 10 17}\t# Dimension 8\n"
  "{6 11 13}\t# Dimension 8\n"
  "{6 11 15}\t# Dimension 8\n"
  "{6 11 16}\t# Dimension 8\n"
  "{6 11 18}\t# Dimension 8\n"
  "{6 13 15}\t# Dimension 8\n"
  "{6 13 17}\t# Dimension 8\n"
  "{6 13 18}\t# Dimension 8\n"
  "{8 9 10}\t# Dimension 8\n"
  "{8 10 11}\t# Dimension 8\n"
  "{8 10 13}\t# Dimension 8\n"
  "{8 10 14}\t# Dimension 8\n"
  "{8 10 16}\t# Dimension 8\n"
  "{8 10 19}\t# Dimension 8\n"
  "{8 11 12}\t# Dimension 8\n"
  "{8 11 13}\t# Dimension 8\n"
  "{8 11 14}\t# Dimension 8\n"
  "{8 11 16}\t# Dimension 8\n"
  "{8 12 13}\t# Dimension 8\n"
  "{8 13 14}\t# Dimension 8\n"
  "{8 13 19}\t# Dimension 8\n"
  "{10 11 13}\t# Dimension 8\n"
  "{10 11 14}\t# Dimension 8\n"
  "{10 11 15}\t# Dimension 8\n"
  "{10 11 16}\t# Dimension 8\n"
  "{10 13 14}\t# Dimension 8\n"
  "{10 13 15}\t# Dimension 8\n"
  "{10 13 17}\t# Dimension 8\n"
  "{10 13 19}\t# Dimension 8\n"
  "{11 12 13}\t# Dimension 8\n"
  "{11 13 14}\t# Dimension 8\n"
  "{11 13 15}\t# Dimension 8\n"
  "{11 13 18}\t# Dimension 8\n"
  "{0 1 2 3}\t# Dimension 9\n"
  "{0 1 2 4}\t# Dimension 9\n"
  "{0 1 2 7}\t# Dimension 9\n"
  "{0 1 2 8}\t# Dimension 9\n"
  "{0 1 2 11}\t# Dimension 9\n"
  "{0 1 3 4}\t# Dimension 9\n"
  "{0 1 3 5}\t# Dimension 9\n"
  "{0 1 3 7}\t# Dimension 9\n"
  "{0 1 3 8}\t# Dimension 9\n"
  "{0 1 4 5}\t# Dimension 9\n"
  "{0 1 4 11}\t# Dimension 9\n"
  "{0 1 5 8}\t# Dimension 9\n"
  "{0 1 5 11}\t# Dimension 9\n"
  "{0 1 5 12}\t# Dimension 9\n"
  "{0 1 7 8}\t# Dimension 9\n"
  "{0 1 8 11}\t# Dimension 9\n"
  "{0 1 8 12}\t# Dimension 9\n"
  "{0 1 11 12}\t# Dimension 9\n"
  "{0 2 3 4}\t# Dimension 9\n"
  "{0 2 3 6}\t# Dimension 9\n"
  "{0 2 3 7}\t# Dimension 9\n"
  "{0 2 3 11}\t# Dimension 9\n"
  "{0 2 4 11}\t# Dimension 9\n"
  "{0 2 6 7}\t# Dimension 9\n"
  "{0 2 6 8}\t# Dimension 9\n"
  "{0 2 6 11}\t# Dimension 9\n"
  "{0 2 6 16}\t# Dimension 9\n"
  "{0 2 7 8}\t# Dimension 9\n"
  "{0 2 8 11}\t# Dimension 9\n"
  "{0 2 8 16}\t# Dimension 9\n"
  "{0 2 11 16}\t# Dimension 9\n"
  "{0 3 4 5}\t# Dimension 9\n"
  "{0 3 4 11}\t# Dimension 9\n"
  "{0 3 5 8}\t# Dimension 9\n"
  "{0 3 5 11}\t# Dimension 9\n"
  "{0 3 5 13}\t# Dimension 9\n"
  "{0 3 5 19}\t# Dimension 9\n"
  "{0 3 6 7}\t# Dimension 9\n"
  "{0 3 6 8}\t# Dimension 9\n"
  "{0 3 6 10}\t# Dimension 9\n"
  "{0 3 6 11}\t# Dimension 9\n"
  "{0 3 6 15}\t# Dimension 9\n"
  "{0 3 7 8}\t# Dimension 9\n"
  "{0 3 8 10}\t# Dimension 9\n"
  "{0 3 8 19}\t# Dimension 9\n"
  "{0 3 10 13}\t# Dimension 9\n"
  "{0 3 10 15}\t# Dimension 9\n"
  "{0 3 10 19}\t# Dimension 9\n"
  "{0 3 11 13}\t# Dimension 9\n"
  "{0 3 11 15}\t# Dimension 9\n"
  "{0 3 13 15}\t# Dimension 9\n"
  "{0 3 13 19}\t# Dimension 9\n"
  "{0 4 5 11}\t# Dimension 9\n"
  "{0 5 8 12}\t# Dimension 9\n"
  "{0 5 8 13}\t# Dimension 9\n"
  "{0 5 8 19}\t# Dimension 9\n"
  "{0 5 11 12}\t# Dimension 9\n"
  "{0 5 11 13}\t# Dimension 9\n"
  "{0 5 12 13}\t# Dimension 9\n"
  "{0 5 13 19}\t# Dimension 9\n"
  "{0 6 7 8}\t# Dimension 9\n"
  "{0 6 8 10}\t# Dimension 9\n"
  "{0 6 8 16}\t# Dimension 9\n"
  "{0 6 10 11}\t# Dimension 9\n"
  "{0 6 10 15}\t# Dimension 9\n"
  "{0 6 10 16}\t# Dimension 9\n"
  "{0 6 11 15}\t# Dimension 9\n"
  "{0 6 11 16}\t# Dimension 9\n"
  "{0 8 10 11}\t# Dimension 9\n"
  "{0 8 10 13}\t# Dimension 9\n"
  "{0 8 10 16}\t# Dimension 9\n"
  "{0 8 10 19}\t# Dimension 9\n"
  "{0 8 11 12}\t# Dimension 9\n"
  "{0 8 11 13}\t# Dimension 9\n"
  "{0 8 11 16}\t# Dimension 9\n"
  "{0 8 12 13}\t# Dimension 9\n"
  "{0 8 13 19}\t# Dimension 9\n"
  "{0 10 11 13}\t# Dimension 9\n"
  "{0 10 11 15}\t# Dimension 9\n"
  "{0 10 11 16}\t# Dimension 9\n"
  "{0 10 13 15}\t# Dimension 9\n"
  "{0 10 13 19}\t# Dimension 9\n"
  "{0 11 12 13}\t# Dimension 9\n"
  "{0 11 13 15}\t# Dimension 9\n"
  "{1 2 3 4}\t# Dimension 9\n"
  "{1 2 3 5}\t# Dimension 9\n"
  "{1 2 3 6}\t# Dimension 9\n"
  "{1 2 3 7}\t# Dimension 9\n"
  "{1 2 4 5}\t# Dimension 9\n"
  "{1 2 4 11}\t# Dimension 9\n"
  "{1 2 5 6}\t# Dimension 9\n"
  "{1 2 5 11}\t# Dimension 9\n"
  "{1 2 5 13}\t# Dimension 9\n"
  "{1 2 5 17}\t# Dimension 9\n"
  "{1 2 6 7}\t# Dimension 9\n"
  "{1 2 6 8}\t# Dimension 9\n"
  "{1 2 6 10}\t# Dimension 9\n"
  "{1 2 6 17}\t# Dimension 9\n"
  "{1 2 7 8}\t# Dimension 9\n"
  "{1 2 8 10}\t# Dimension 9\n"
  "{1 2 8 11}\t# Dimension 9\n"
  "{1 2 8 14}\t# Dimension 9\n"
  "{1 2 10 13}\t# Dimension 9\n"
  "{1 2 10 14}\t# Dimension 9\n"
  "{1 2 10 17}\t# Dimension 9\n"
  "{1 2 11 13}\t# Dimension 9\n"
  "{1 2 11 14}\t# Dimension 9\n"
  "{1 2 13 14}\t# Dimension 9\n"
  "{1 2 13 17}\t# Dimension 9\n"
  "{1 3 4 5}\t# Dimension 9\n"
  "{1 3 5 6}\t# Dimension 9\n"
  "{1 3 5 8}\t# Dimension 9\n"
  "{1 3 5 9}\t# Dimension 9\n"
  "{1 3 6 7}\t# Dimension 9\n"
  "{1 3 6 8}\t# Dimension 9\n"
  "{1 3 6 9}\t# Dimension 9\n"
  "{1 3 7 8}\t# Dimension 9\n"
  "{1 3 8 9}\t# Dimension 9\n"
  "{1 4 5 11}\t# Dimension 9\n"
  "{1 5 6 9}\t# Dimension 9\n"
  "{1 5 6 10}\t# Dimension 9\n"
  "{1 5 6 17}\t# Dimension 9\n"
  "{1 5 8 9}\t# Dimension 9\n"
  "{1 5 8 10}\t# Dimension 9\n"
  "{1 5 8 12}\t# Dimension 9\n"
  "{1 5 8 13}\t# Dimension 9\n"
  "{1 5 9 10}\t# Dimension 9\n"
  "{1 5 10 13}\t# Dimension 9\n"
  "{1 5 10 17}\t# Dimension 9\n"
  "{1 5 11 12}\t# Dimension 9\n"
  "{1 5 11 13}\t# Dimension 9\n"
  "{1 5 12 13}\t# Dimension 9\n"
  "{1 5 13 17}\t# Dimension 9\n"
  "{1 6 7 8}\t# Dimension 9\n"
  "{1 6 8 9}\t# Dimension 9\n"
  "{1 6 8 10}\t# Dimension 9\n"
  "{1 6 9 10}\t# Dimension 9\n"
  "{1 6 10 17}\t# Dimension 9\n"
  "{1 8 9 10}\t# Dimension 9\n"
  "{1 8 10 13}\t# Dimension 9\n"
  "{1 8 10 14}\t# Dimension 9\n"
  "{1 8 11 12}\t# Dimension 9\n"
  "{1 8 11 13}\t# Dimension 9\n"
  "{1 8 11 14}\t# Dimension 9\n"
  "{1 8 12 13}\t# Dimension 9\n"
  "{1 8 13 14}\t# Dimension 9\n"
  "{1 10 13 14}\t# Dimension 9\n"
  "{1 10 13 17}\t# Dimension 9\n"
  "{1 11 12 13}\t# Dimension 9\n"
  "{1 11 13 14}\t# Dimension 9\n"
  "{2 3 4 5}\t# Dimension 9\n"
  "{2 3 4 11}\t# Dimension 9\n"
  "{2 3 5 6}\t# Dimension 9\n"
  "{2 3 5 11}\t# Dimension 9\n"
  "{2 3 5 18}\t# Dimension 9\n"
  "{2 3 6 7}\t# Dimension 9\n"
  "{2 3 6 11}\t# Dimension 9\n"
  "{2 3 6 18}\t# Dimension 9\n"
  "{2 3 11 18}\t# Dimension 9\n"
  "{2 4 5 11}\t# Dimension 9\n"
  "{2 5 6 13}\t# Dimension 9\n"
  "{2 5 6 17}\t# Dimension 9\n"
  "{2 5 6 18}\t# Dimension 9\n"
  "{2 5 11 13}\t# Dimension 9\n"
  "{2 5 11 18}\t# Dimension 9\n"
  "{2 5 13 17}\t# Dimension 9\n"
  "{2 5 13 18}\t# Dimension 9\n"
  "{2 6 7 8}\t# Dimension 9\n"
  "{2 6 8 10}\t# Dimension 9\n"
  "{2 6 8 16}\t# Dimension 9\n"
  "{2 6 10 11}\t# Dimension 9\n"
  "{2 6 10 13}\t# Dimension 9\n"
  "{2 6 10 16}\t# Dimension 9\n"
  "{2 6 10 17}\t# Dimension 9\n"
  "{2 6 11 13}\t# Dimension 9\n"
  "{2 6 11 16}\t# Dimension 9\n"
  "{2 6 11 18}\t# Dimension 9\n"
  "{2 6 13 17}\t# Dimension 9\n"
  "{2 6 13 18}\t# Dimension 9\n"
  "{2 8 10 11}\t# Dimension 9\n"
  "{2 8 10 14}\t# Dimension 9\n"
  "{2 8 10 16}\t# Dimension 9\n"
  "{2 8 11 14}\t# Dimension 9\n"
  "{2 8 11 16}\t# Dimension 9\n"
  "{2 10 11 13}\t# Dimension 9\n"
  "{2 10 11 14}\t# Dimension 9\n"
  "{2 10 11 16}\t# Dimension 9\n"
  "{2 10 13 14}\t# Dimension 9\n"
  "{2 10 13 17}\t# Dimension 9\n"
  "{2 11 13 14}\t# Dimension 9\n"
  "{2 11 13 18}\t# Dimension 9\n"
  "{3 4 5 11}\t# Dimension 9\n"
  "{3 5 6 9}\t# Dimension 9\n"
  "{3 5 6 10}\t# Dimension 9\n"
  "{3 5 6 13}\t# Dimension 9\n"
  "{3 5 6 18}\t# Dimension 9\n"
  "{3 5 8 9}\t# Dimension 9\n"
  "{3 5 8 10}\t# Dimension 9\n"
  "{3 5 8 19}\t# Dimension 9\n"
  "{3 5 9 10}\t# Dimension 9\n"
  "{3 5 10 13}\t# Dimension 9\n"
  "{3 5 10 19}\t# Dimension 9\n"
  "{3 5 11 13}\t# Dimension 9\n"
  "{3 5 11 18}\t# Dimension 9\n"
  "{3 5 13 18}\t# Dimension 9\n"
  "{3 5 13 19}\t# Dimension 9\n"
  "{3 6 7 8}\t# Dimension 9\n"
  "{3 6 8 9}\t# Dimension 9\n"
  "{3 6 8 10}\t# Dimension 9\n"
  "{3 6 9 10}\t# Dimension 9\n"
  "{3 6 10 13}\t# Dimension 9\n"
  "{3 6 10 15}\t# Dimension 9\n"
  "{3 6 11 13}\t# Dimension 9\n"
  "{3 6 11 15}\t# Dimension 9\n"
  "{3 6 11 18}\t# Dimension 9\n"
  "{3 6 13 15}\t# Dimension 9\n"
  "{3 6 13 18}\t# Dimension 9\n"
  "{3 8 9 10}\t# Dimension 9\n"
  "{3 8 10 19}\t# Dimension 9\n"
  "{3 10 13 15}\t# Dimension 9\n"
  "{3 10 13 19}\t# Dimension 9\n"
  "{3 11 13 15}\t# Dimension 9\n"
  "{3 11 13 18}\t# Dimension 9\n"
  "{5 6 9 10}\t# Dimension 9\n"
  "{5 6 10 13}\t# Dimension 9\n"
  "{5 6 10 17}\t# Dimension 9\n"
  "{5 6 13 17}\t# Dimension 9\n"
  "{5 6 13 18}\t# Dimension 9\n"
  "{5 8 9 10}\t# Dimension 9\n"
  "{5 8 10 13}\t# Dimension 9\n"
  "{5 8 10 19}\t# Dimension 9\n"
  "{5 8 12 13}\t# Dimension 9\n"
  "{5 8 13 19}\t# Dimension 9\n"
  "{5 10 13 17}\t# Dimension 9\n"
  "{5 10 13 19}\t# Dimension 9\n"
  "{5 11 12 13}\t# Dimension 9\n"
  "{5 11 13 18}\t# Dimension 9\n"
  "{6 8 9 10}\t# Dimension 9\n"
  "{6 8 10 16}\t# Dimension 9\n"
  "{6 10 11 13}\t# Dimension 9\n"
  "{6 10 11 15}\t# Dimension 9\n"
  "{6 10 11 16}\t# Dimension 9\n"
  "{6 10 13 15}\t# Dimension 9\n"
  "{6 10 13 17}\t# Dimension 9\n"
  "{6 11 13 15}\t# Dimension 9\n"
  "{6 11 13 18}\t# Dimension 9\n"
  "{8 10 11 13}\t# Dimension 9\n"
  "{8 10 11 14}\t# Dimension 9\n"
  "{8 10 11 16}\t# Dimension 9\n"
  "{8 10 13 14}\t# Dimension 9\n"
  "{8 10 13 19}\t# Dimension 9\n"
  "{8 11 12 13}\t# Dimension 9\n"
  "{8 11 13 14}\t# Dimension 9\n"
  "{10 11 13 14}\t# Dimension 9\n"
  "{10 11 13 15}\t# Dimension 9\n"
  "{0 1 2 3 4}\t# Dimension 10\n"
  "{0 1 2 3 7}\t# Dimension 10\n"
  "{0 1 2 4 11}\t# Dimension 10\n"
  "{0 1 2 7 8}\t# Dimension 10\n"
  "{0 1 2 8 11}\t# Dimension 10\n"
  "{0 1 3 4 5}\t# Dimension 10\n"
  "{0 1 3 5 8}\t# Dimension 10\n"
  "{0 1 3 7 8}\t# Dimension 10\n"
  "{0 1 4 5 11}\t# Dimension 10\n"
  "{0 1 5 8 12}\t# Dimension 10\n"
  "{0 1 5 11 12}\t# Dimension 10\n"
  "{0 1 8 11 12}\t# Dimension 10\n"
  "{0 2 3 4 11}\t# Dimension 10\n"
  "{0 2 3 6 7}\t# Dimension 10\n"
  "{0 2 3 6 11}\t# Dimension 10\n"
  "{0 2 6 7 8}\t# Dimension 10\n"
  "{0 2 6 8 16}\t# Dimension 10\n"
  "{0 2 6 11 16}\t# Dimension 10\n"
  "{0 2 8 11 16}\t# Dimension 10\n"
  "{0 3 4 5 11}\t# Dimension 10\n"
  "{0 3 5 8 19}\t# Dimension 10\n"
  "{0 3 5 11 13}\t# Dimension 10\n"
  "{0 3 5 13 19}\t# Dimension 10\n"
  "{0 3 6 7 8}\t# Dimension 10\n"
  "{0 3 6 8 10}\t# Dimension 10\n"
  "{0 3 6 10 15}\t# Dimension 10\n"
  "{0 3 6 11 15}\t# Dimension 10\n"
  "{0 3 8 10 19}\t# Dimension 10\n"
  "{0 3 10 13 15}\t# Dimension 10\n"
  "{0 3 10 13 19}\t# Dimension 10\n"
  "{0 3 11 13 15}\t# Dimension 10\n"
  "{0 5 8 12 13}\t# Dimension 10\n"
  "{0 5 8 13 19}\t# Dimension 10\n"
  "{0 5 11 12 13}\t# Dimension 10\n"
  "{0 6 8 10 16}\t# Dimension 10\n"
  "{0 6 10 11 15}\t# Dimension 10\n"
  "{0 6 10 11 16}\t# Dimension 10\n"
  "{0 8 10 11 13}\t# Dimension 10\n"
  "{0 8 10 11 16}\t# Dimension 10\n"
  "{0 8 10 13 19}\t# Dimension 10\n"
  "{0 8 11 12 13}\t# Dimension 10\n"
  "{0 10 11 13 15}\t# Dimension 10\n"
  "{1 2 3 4 5}\t# Dimension 10\n"
  "{1 2 3 5 6}\t# Dimension 10\n"
  "{1 2 3 6 7}\t# Dimension 10\n"
  "{1 2 4 5 11}\t# Dimension 10\n"
  "{1 2 5 6 17}\t# Dimension 10\n"
  "{1 2 5 11 13}\t# Dimension 10\n"
  "{1 2 5 13 17}\t# Dimension 10\n"
  "{1 2 6 7 8}\t# Dimension 10\n"
  "{1 2 6 8 10}\t# Dimension 10\n"
  "{1 2 6 10 17}\t# Dimension 10\n"
  "{1 2 8 10 14}\t# Dimension 10\n"
  "{1 2 8 11 14}\t# Dimension 10\n"
  "{1 2 10 13 14}\t# Dimension 10\n"
  "{1 2 10 13 17}\t# Dimension 10\n"
  "{1 2 11 13 14}\t# Dimension 10\n"
  "{1 3 5 6 9}\t# Dimension 10\n"
  "{1 3 5 8 9}\t# Dimension 10\n"
  "{1 3 6 7 8}\t# Dimension 10\n"
  "{1 3 6 8 9}\t# Dimension 10\n"
  "{1 5 6 9 10}\t# Dimension 10\n"
  "{1 5 6 10 17}\t# Dimension 10\n"
  "{1 5 8 9 10}\t# Dimension 10\n"
  "{1 5 8 10 13}\t# Dimension 10\n"
  "{1 5 8 12 13}\t# Dimension 10\n"
  "{1 5 10 13 17}\t# Dimension 10\n"
  "{1 5 11 12 13}\t# Dimension 10\n"
  "{1 6 8 9 10}\t# Dimension 10\n"
  "{1 8 10 13 14}\t# Dimension 10\n"
  "{1 8 11 12 13}\t# Dimension 10\n"
  "{1 8 11 13 14}\t# Dimension 10\n"
  "{2 3 4 5 11}\t# Dimension 10\n"
  "{2 3 5 6 18}\t# Dimension 10\n"
  "{2 3 5 11 18}\t# Dimension 10\n"
  "{2 3 6 11 18}\t# Dimension 10\n"
  "{2 5 6 13 17}\t# Dimension 10\n"
  "{2 5 6 13 18}\t# Dimension 10\n"
  "{2 5 11 13 18}\t# Dimension 10\n"
  "{2 6 8 10 16}\t# Dimension 10\n"
  "{2 6 10 11 13}\t# Dimension 10\n"
  "{2 6 10 11 16}\t# Dimension 10\n"
  "{2 6 10 13 17}\t# Dimension 10\n"
  "{2 6 11 13 18}\t# Dimension 10\n"
  "{2 8 10 11 14}\t# Dimension 10\n"
  "{2 8 10 11 16}\t# Dimension 10\n"
  "{2 10 11 13 14}\t# Dimension 10\n"
  "{3 5 6 9 10}\t# Dimension 10\n"
  "{3 5 6 10 13}\t# Dimension 10\n"
  "{3 5 6 13 18}\t# Dimension 10\n"
  "{3 5 8 9 10}\t# Dimension 10\n"
  "{3 5 8 10 19}\t# Dimension 10\n"
  "{3 5 10 13 19}\t# Dimension 10\n"
  "{3 5 11 13 18}\t# Dimension 10\n"
  "{3 6 8 9 10}\t# Dimension 10\n"
  "{3 6 10 13 15}\t# Dimension 10\n"
  "{3 6 11 13 15}\t# Dimension 10\n"
  "{3 6 11 13 18}\t# Dimension 10\n"
  "{5 6 10 13 17}\t# Dimension 10\n"
  "{5 8 10 13 19}\t# Dimension 10\n"
  "{6 10 11 13 15}\t# Dimension 10\n"
  "{8 10 11 13 14}\t# Dimension 10\n"
  "\n"
  "MAXIMAL_CONES\n"
  "{0 1 2 3 4}\t# Dimension 10\n"
  "{0 1 2 3 7}\t# Dimension 10\n"
  "{0 1 2 4 11}\t# Dimension 10\n"
  "{0 1 2 7 8}\t# Dimension 10\n"
  "{0 1 2 8 11}\t# Dimension 10\n"
  "{0 1 3 4 5}\t# Dimension 10\n"
  "{0 1 3 5 8}\t# Dimension 10\n"
  "{0 1 3 7 8}\t# Dimension 10\n"
  "{0 1 4 5 11}\t# Dimension 10\n"
  "{0 1 5 8 12}\t# Dimension 10\n"
  "{0 1 5 11 12}\t# Dimension 10\n"
  "{0 1 8 11 12}\t# Dimension 10\n"
  "{0 2 3 4 11}\t# Dimension 10\n"
  "{0 2 3 6 7}\t# Dimension 10\n"
  "{0 2 3 6 11}\t# Dimension 10\n"
  "{0 2 6 7 8}\t# Dimension 10\n"
  "{0 2 6 8 16}\t# Dimension 10\n"
  "{0 2 6 11 16}\t# Dimension 10\n"
  "{0 2 8 11 16}\t# Dimension 10\n"
  "{0 3 4 5 11}\t# Dimension 10\n"
  "{0 3 5 8 19}\t# Dimension 10\n"
  "{0 3 5 11 13}\t# Dimension 10\n"
  "{0 3 5 13 19}\t# Dimension 10\n"
  "{0 3 6 7 8}\t# Dimension 10\n"
  "{0 3 6 8 10}\t# Dimension 10\n"
  "{0 3 6 10 15}\t# Dimension 10\n"
  "{0 3 6 11 15}\t# Dimension 10\n"
  "{0 3 8 10 19}\t# Dimension 10\n"
  "{0 3 10 13 15}\t# Dimension 10\n"
  "{0 3 10 13 19}\t# Dimension 10\n"
  "{0 3 11 13 15}\t# Dimension 10\n"
  "{0 5 8 12 13}\t# Dimension 10\n"
  "{0 5 8 13 19}\t# Dimension 10\n"
  "{0 5 11 12 13}\t# Dimension 10\n"
  "{0 6 8 10 16}\t# Dimension 10\n"
  "{0 6 10 11 15}\t# Dimension 10\n"
  "{0 6 10 11 16}\t# Dimension 10\n"
  "{0 8 10 11 13}\t# Dimension 10\n"
  "{0 8 10 11 16}\t# Dimension 10\n"
  "{0 8 10 13 19}\t# Dimension 10\n"
  "{0 8 11 12 13}\t# Dimension 10\n"
  "{0 10 11 13 15}\t# Dimension 10\n"
  "{1 2 3 4 5}\t# Dimension 10\n"
  "{1 2 3 5 6}\t# Dimension 10\n"
  "{1 2 3 6 7}\t# Dimension 10\n"
  "{1 2 4 5 11}\t# Dimension 10\n"
  "{1 2 5 6 17}\t# Dimension 10\n"
  "{1 2 5 11 13}\t# Dimension 10\n"
  "{1 2 5 13 17}\t# Dimension 10\n"
  "{1 2 6 7 8}\t# Dimension 10\n"
  "{1 2 6 8 10}\t# Dimension 10\n"
  "{1 2 6 10 17}\t# Dimension 10\n"
  "{1 2 8 10 14}\t# Dimension 10\n"
  "{1 2 8 11 14}\t# Dimension 10\n"
  "{1 2 10 13 14}\t# Dimension 10\n"
  "{1 2 10 13 17}\t# Dimension 10\n"
  "{1 2 11 13 14}\t# Dimension 10\n"
  "{1 3 5 6 9}\t# Dimension 10\n"
  "{1 3 5 8 9}\t# Dimension 10\n"
  "{1 3 6 7 8}\t# Dimension 10\n"
  "{1 3 6 8 9}\t# Dimension 10\n"
  "{1 5 6 9 10}\t# Dimension 10\n"
  "{1 5 6 10 17}\t# Dimension 10\n"
  "{1 5 8 9 10}\t# Dimension 10\n"
  "{1 5 8 10 13}\t# Dimension 10\n"
  "{1 5 8 12 13}\t# Dimension 10\n"
  "{1 5 10 13 17}\t# Dimension 10\n"
  "{1 5 11 12 13}\t# Dimension 10\n"
  "{1 6 8 9 10}\t# Dimension 10\n"
  "{1 8 10 13 14}\t# Dimension 10\n"
  "{1 8 11 12 13}\t# Dimension 10\n"
  "{1 8 11 13 14}\t# Dimension 10\n"
  "{2 3 4 5 11}\t# Dimension 10\n"
  "{2 3 5 6 18}\t# Dimension 10\n"
  "{2 3 5 11 18}\t# Dimension 10\n"
  "{2 3 6 11 18}\t# Dimension 10\n"
  "{2 5 6 13 17}\t# Dimension 10\n"
  "{2 5 6 13 18}\t# Dimension 10\n"
  "{2 5 11 13 18}\t# Dimension 10\n"
  "{2 6 8 10 16}\t# Dimension 10\n"
  "{2 6 10 11 13}\t# Dimension 10\n"
  "{2 6 10 11 16}\t# Dimension 10\n"
  "{2 6 10 13 17}\t# Dimension 10\n"
  "{2 6 11 13 18}\t# Dimension 10\n"
  "{2 8 10 11 14}\t# Dimension 10\n"
  "{2 8 10 11 16}\t# Dimension 10\n"
  "{2 10 11 13 14}\t# Dimension 10\n"
  "{3 5 6 9 10}\t# Dimension 10\n"
  "{3 5 6 10 13}\t# Dimension 10\n"
  "{3 5 6 13 18}\t# Dimension 10\n"
  "{3 5 8 9 10}\t# Dimension 10\n"
  "{3 5 8 10 19}\t# Dimension 10\n"
  "{3 5 10 13 19}\t# Dimension 10\n"
  "{3 5 11 13 18}\t# Dimension 10\n"
  "{3 6 8 9 10}\t# Dimension 10\n"
  "{3 6 10 13 15}\t# Dimension 10\n"
  "{3 6 11 13 15}\t# Dimension 10\n"
  "{3 6 11 13 18}\t# Dimension 10\n"
  "{5 6 10 13 17}\t# Dimension 10\n"
  "{5 8 10 13 19}\t# Dimension 10\n"
  "{6 10 11 13 15}\t# Dimension 10\n"
  "{8 10 11 13 14}\t# Dimension 10\n";
