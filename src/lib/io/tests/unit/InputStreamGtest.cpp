#include "gtest/gtest.h"

#include <fstream>
#include <iterator>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "common/Exceptions.hpp"
#include "io/InputStream.hpp"

namespace bfs = boost::filesystem;

namespace {

const std::string CONTENT(">r1\nACGT\n>r2\nGG\n");

class InputStreamTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    dir_ = bfs::temp_directory_path() / bfs::unique_path("seqio-input-%%%%-%%%%");
    bfs::create_directories(dir_);
  }
  void TearDown() override { bfs::remove_all(dir_); }

  template <typename Compressor>
  std::string write(const std::string& name, Compressor compressor)
  {
    const std::string path = (dir_ / name).string();
    std::ofstream     file(path, std::ios_base::out | std::ios_base::binary);
    {
      boost::iostreams::filtering_ostream out;
      out.push(compressor);
      out.push(file);
      out << CONTENT;
    }
    return path;
  }

  std::string writePlain(const std::string& name)
  {
    const std::string path = (dir_ / name).string();
    std::ofstream(path) << CONTENT;
    return path;
  }

  static std::string readAll(seqio::io::InputStream& input)
  {
    return std::string(
        std::istreambuf_iterator<char>(input.stream()), std::istreambuf_iterator<char>());
  }

  bfs::path dir_;
};

}  // namespace

TEST_F(InputStreamTest, Plain)
{
  auto input = seqio::io::openInput(writePlain("reads.fa"));
  ASSERT_EQ((dir_ / "reads.fa").string(), input->name());
  ASSERT_EQ(CONTENT, readAll(*input));
  ASSERT_FALSE(input->closed());
  input->close();
  ASSERT_TRUE(input->closed());
  input->close();
}

TEST_F(InputStreamTest, Gzip)
{
  auto input = seqio::io::openInput(write("reads.fa.gz", boost::iostreams::gzip_compressor()));
  ASSERT_EQ(CONTENT, readAll(*input));
}

TEST_F(InputStreamTest, Bzip2)
{
  auto input = seqio::io::openInput(write("reads.fa.bz2", boost::iostreams::bzip2_compressor()));
  ASSERT_EQ(CONTENT, readAll(*input));
}

TEST_F(InputStreamTest, MissingFile)
{
  ASSERT_THROW(seqio::io::openInput((dir_ / "missing.fa").string()), seqio::common::IoException);
}

TEST(InputStream, IsCompressed)
{
  ASSERT_TRUE(seqio::io::isCompressed("a.fq.gz"));
  ASSERT_TRUE(seqio::io::isCompressed("a.fq.bz2"));
  ASSERT_TRUE(seqio::io::isCompressed("a.fq.xz"));
  ASSERT_FALSE(seqio::io::isCompressed("a.fq"));
}
