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
#include <libvvplay/common/error.hpp>
#include <libvvplay/sim/network_trace.hpp>
#include <sstream>

using namespace libvvplay;
using namespace libvvplay::sim;
using namespace std::chrono_literals;

TEST(NetworkTraceTest, ParsesSamplesSkippingCommentsAndBlanks)
{
  std::istringstream in("# 4G drive trace, KB/s\n\n  120\n80.5\n\t# outage\n0\n");
  const auto         trace = NetworkTrace::parse(in);

  ASSERT_EQ(trace.samples().size(), 3u);
  EXPECT_DOUBLE_EQ(trace.samples()[1], 80.5);
  EXPECT_EQ(trace.duration(), 3s);
}

TEST(NetworkTraceTest, MalformedInputIsRejected)
{
  std::istringstream garbage("100\nfast\n");
  EXPECT_THROW(NetworkTrace::parse(garbage), Error);

  std::istringstream two_columns("100 200\n");
  EXPECT_THROW(NetworkTrace::parse(two_columns), Error);

  std::istringstream empty("# nothing\n");
  EXPECT_THROW(NetworkTrace::parse(empty), Error);

  EXPECT_THROW(NetworkTrace({-1.0}), Error);
  EXPECT_THROW(NetworkTrace::load("/nonexistent/trace.txt"), Error);
}

TEST(NetworkTraceTest, BandwidthIsPiecewiseConstantAndHoldsTheLastSample)
{
  const NetworkTrace trace({100, 300});

  EXPECT_DOUBLE_EQ(trace.bandwidthAt(0ms), 100'000.0);
  EXPECT_DOUBLE_EQ(trace.bandwidthAt(999ms), 100'000.0);
  EXPECT_DOUBLE_EQ(trace.bandwidthAt(1s), 300'000.0);
  EXPECT_DOUBLE_EQ(trace.bandwidthAt(1h), 300'000.0);
}

TEST(NetworkTraceTest, ConstantTraceFromBitrate)
{
  const auto trace = NetworkTrace::constant(8'000'000);
  EXPECT_DOUBLE_EQ(trace.bandwidthAt(42s), 1'000'000.0);
  EXPECT_EQ(trace.transferFinish(0ms, 500'000), MediaTime(500ms));
}

TEST(NetworkTraceTest, TransferSpansSampleBoundaries)
{
  const NetworkTrace trace({100, 300});

  // 50 kB fit before the boundary, the remaining 150 kB take half a second
  EXPECT_EQ(trace.transferFinish(500ms, 200'000), MediaTime(1500ms));
}

TEST(NetworkTraceTest, TransferWaitsOutAnOutage)
{
  const NetworkTrace trace({250, 0, 0, 250});
  EXPECT_EQ(trace.transferFinish(500ms, 250'000), MediaTime(3500ms));
}

TEST(NetworkTraceTest, ZeroTailNeverDelivers)
{
  const NetworkTrace trace({250, 0});
  EXPECT_FALSE(trace.transferFinish(1500ms, 1).has_value());
  EXPECT_EQ(trace.transferFinish(0ms, 0), MediaTime(0ms));
}
