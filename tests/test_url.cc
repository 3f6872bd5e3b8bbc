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
#include <libvvplay/utils/web/parser.hpp>
#include <stdexcept>

using namespace libvvplay::utils::web;

TEST(UrlParserTest, SplitsHostPortAndTarget)
{
  const auto url = parseUrl("https://cdn.example.org:8443/vv/longdress.mpd?token=1");

  EXPECT_EQ(url.scheme, "https");
  EXPECT_EQ(url.host, "cdn.example.org");
  EXPECT_EQ(url.port, "8443");
  EXPECT_EQ(url.target, "/vv/longdress.mpd?token=1");
  EXPECT_TRUE(url.isNetwork());
  EXPECT_TRUE(url.isSecure());
}

TEST(UrlParserTest, DefaultPortsFollowScheme)
{
  EXPECT_EQ(parseUrl("http://host/a").port, "80");
  EXPECT_EQ(parseUrl("https://host/a").port, "443");
  EXPECT_EQ(parseUrl("http://host").target, "/");
}

TEST(UrlParserTest, FileUrlsAndBarePathsAreLocal)
{
  const auto file = parseUrl("file:///data/seg_0001.vvs");
  EXPECT_FALSE(file.isNetwork());
  EXPECT_EQ(file.target, "/data/seg_0001.vvs");

  const auto bare = parseUrl("segments/seg_0001.vvs");
  EXPECT_FALSE(bare.isNetwork());
  EXPECT_TRUE(bare.scheme.empty());
  EXPECT_EQ(bare.target, "segments/seg_0001.vvs");
}

TEST(UrlParserTest, EmptyHostIsRejected)
{
  EXPECT_THROW(parseUrl("http:///nohost"), std::invalid_argument);
}

TEST(UrlResolveTest, RelativeRefsJoinTheManifestDirectory)
{
  EXPECT_EQ(resolveUrl("http://h/vv/stream.mpd", "q1/seg_1.vvs"), "http://h/vv/q1/seg_1.vvs");
  EXPECT_EQ(resolveUrl("http://h/vv/", "seg.vvs"), "http://h/vv/seg.vvs");
  EXPECT_EQ(resolveUrl("/srv/vv/stream.mpd", "seg.vvs"), "/srv/vv/seg.vvs");
}

TEST(UrlResolveTest, AbsoluteAndHostRelativeRefs)
{
  EXPECT_EQ(resolveUrl("http://h/vv/stream.mpd", "https://other/x.vvs"), "https://other/x.vvs");
  EXPECT_EQ(resolveUrl("http://h:8080/vv/stream.mpd", "/root/x.vvs"), "http://h:8080/root/x.vvs");
  EXPECT_EQ(resolveUrl("", "seg.vvs"), "seg.vvs");
}

TEST(UrlResolveTest, BaseDropsQueryAndFileName)
{
  EXPECT_EQ(baseOf("http://h/a/b/c.mpd?x=/y"), "http://h/a/b/");
  EXPECT_EQ(baseOf("http://h"), "http://h/");
  EXPECT_EQ(baseOf("stream.mpd"), "");
}

TEST(UrlResolveTest, LocalPathOf)
{
  EXPECT_EQ(localPathOf("file:///tmp/a.vvs"), "/tmp/a.vvs");
  EXPECT_EQ(localPathOf("/tmp/a.vvs"), "/tmp/a.vvs");
  EXPECT_THROW(localPathOf("http://h/a.vvs"), std::invalid_argument);
}
