/**
 ** DRAGEN Open Source Software
 ** Copyright (c) 2019-2020 Illumina, Inc.
 ** All rights reserved.
 **
 ** This software is provided under the terms and conditions of the
 ** GNU GENERAL PUBLIC LICENSE Version 3
 **
 ** You should have received a copy of the GNU GENERAL PUBLIC LICENSE Version 3
 ** along with this program. If not, see
 ** <https://github.com/illumina/licenses/>.
 **
 **/

#include <algorithm>
#include <cctype>

#include "sequences/ReadPair.hpp"

namespace seqio {
namespace sequences {

namespace {

bool isSpace(char c)
{
  return std::isspace(static_cast<unsigned char>(c));
}

std::string firstWord(const std::string& name)
{
  const auto begin = std::find_if_not(name.begin(), name.end(), isSpace);
  const auto end   = std::find_if(begin, name.end(), isSpace);
  return std::string(begin, end);
}

bool isMateSuffix(const std::string& word)
{
  return !word.empty() && ('1' == word.back() || '2' == word.back());
}

}  // namespace

bool sequenceNamesMatch(const std::string& name1, const std::string& name2)
{
  std::string word1 = firstWord(name1);
  std::string word2 = firstWord(name2);
  if (isMateSuffix(word1) && isMateSuffix(word2)) {
    word1.pop_back();
    word2.pop_back();
  }
  return word1 == word2;
}

}  // namespace sequences
}  // namespace seqio
