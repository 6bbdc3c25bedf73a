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

#ifndef OPTIONS_SEQIO_OPTIONS_HPP
#define OPTIONS_SEQIO_OPTIONS_HPP

#include <string>

#include "common/Program.hpp"
#include "common/SystemCompatibility.hpp"

namespace seqio {
namespace options {

class SeqioOptions : public common::Options {
public:
  SeqioOptions();

private:
  std::string usagePrefix() const
  {
    return "seqio-convert -1 <input> [-2 <input2>] [-o <output>] [optional arguments]";
  }
  void        postProcess(boost::program_options::variables_map& vm);

public:
  std::string inputFile1_;
  std::string inputFile2_;
  std::string qualityFile_;
  std::string inputFormat_;

  bool colorspace_      = false;
  bool interleaved_     = false;
  int  singleInputRead_ = 0;  // 0 = both mates

  std::string outputFile1_ = STDIN_FILE_NAME;  // "-" is stdout for outputs
  std::string outputFile2_;
  std::string outputFormat_;
  bool        interleavedOutput_ = false;
  std::size_t lineLength_        = 0;

  bool verbose_ = false;

  bool pairedInput() const { return !inputFile2_.empty() || interleaved_; }
  bool pairedOutput() const { return !outputFile2_.empty() || interleavedOutput_; }
};

}  // namespace options
}  // namespace seqio

#endif  // #ifndef OPTIONS_SEQIO_OPTIONS_HPP
