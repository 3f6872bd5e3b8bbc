/************************************************
 * VVPlay Project - Adaptive Volumetric Video Streaming
 * ---------------------------------------------
 * 
 * Copyright (c) 2025 VVPlay Contributors
 * All rights reserved.
 * 
 * This source code is part of the VVPlay project, an adaptive
 * streaming and playback engine for volumetric video.
 * 
 * License:
 * This software is licensed under the BSD-3-Clause License.
 * You may use, modify, and distribute this software under
 * the conditions stated in the LICENSE file provided in the
 * project root.
 * 
 * Warranty Disclaimer:
 * This software is provided "AS IS," without any warranties
 * or guarantees, either expressed or implied, including but
 * not limited to fitness for a particular purpose.
 * 
 * Contributions:
 * Contributions to this project are welcome. By submitting 
 * code, you agree to license your contributions under the 
 * same BSD-3-Clause terms.
 * 
 * See LICENSE file for full details.
 ************************************************/

#include <gtest/gtest.h>
#include <libvvplay/utils/cmd-line/parser.hpp>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using libvvplay::utils::cmdline::CmdLineParser;

namespace
{

// Keeps the argument strings alive for the char* view the parser takes
struct Argv
{
  std::vector<std::string> storage;
  std::vector<char*>       ptrs;

  Argv(std::initializer_list<std::string> args) : storage(args)
  {
    for (auto& s : storage)
      ptrs.push_back(s.data());
  }

  auto parser() -> CmdLineParser { return CmdLineParser(std::span<char* const>(ptrs)); }
};

} // namespace

TEST(CmdLineParserTest, ReadsTypedValuesAndFlags)
{
  Argv argv{"vvplay", "--manifest=http://host/a.mpd", "--maxInFlight=3", "--fps=29.97",
            "--insecure"};
  auto parser = argv.parser();

  EXPECT_EQ(parser.get<std::string>("manifest").value(), "http://host/a.mpd");
  EXPECT_EQ(parser.get<std::size_t>("maxInFlight").value(), 3u);
  EXPECT_DOUBLE_EQ(parser.get<double>("fps").value(), 29.97);
  EXPECT_TRUE(parser.get_bool("insecure"));
  EXPECT_FALSE(parser.get_bool("verbose"));
  EXPECT_FALSE(parser.get<std::string>("trace").has_value());
  EXPECT_EQ(parser.get_or<std::size_t>("workers", 2), 2u);
}

TEST(CmdLineParserTest, BadValueNamesTheKey)
{
  Argv argv{"vvplay", "--maxInFlight=three"};
  auto parser = argv.parser();

  try
  {
    (void)parser.get<std::size_t>("maxInFlight");
    FAIL() << "expected std::invalid_argument";
  }
  catch (const std::invalid_argument& e)
  {
    EXPECT_NE(std::string(e.what()).find("--maxInFlight"), std::string::npos);
  }
}

TEST(CmdLineParserTest, RejectsPositionalArguments)
{
  Argv argv{"vvplay", "segments/"};
  EXPECT_THROW(argv.parser(), std::invalid_argument);
}

TEST(CmdLineParserTest, ReportsArgumentsNobodyAskedFor)
{
  Argv argv{"vvplay", "--manifest=a.mpd", "--maxInFlihgt=2"};
  auto parser = argv.parser();

  (void)parser.get<std::string>("manifest");
  EXPECT_FALSE(parser.warn_unknown_args());

  Argv clean{"vvplay", "--manifest=a.mpd"};
  auto clean_parser = clean.parser();
  (void)clean_parser.get<std::string>("manifest");
  EXPECT_TRUE(clean_parser.warn_unknown_args());
}

TEST(CmdLineParserTest, HelpIsAlwaysRecognised)
{
  Argv argv{"vvplay", "-h"};
  auto parser = argv.parser();
  EXPECT_TRUE(parser.has("help"));
}
