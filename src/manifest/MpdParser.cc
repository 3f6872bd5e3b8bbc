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

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/regex.hpp>
#include <cmath>
#include <fmt/format.h>
#include <libvvplay/common/macros.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <libvvplay/utils/web/parser.hpp>
#include <sstream>

/*
 * MPD PARSER
 *
 * Understands the subset of DASH that a segmented point-cloud stream needs:
 *
 *   MPD@mediaPresentationDuration
 *    └─ Period (first one only)
 *        ├─ BaseURL
 *        └─ AdaptationSet@frameRate (first one carrying Representations)
 *            ├─ SegmentTemplate            (inherited by every Representation)
 *            └─ Representation@id@bandwidth
 *                ├─ SegmentTemplate@media@timescale@duration@startNumber
 *                │   └─ SegmentTimeline/S@t@d@r
 *                └─ SegmentList@timescale@duration/SegmentURL@media
 */

namespace libvvplay::manifest
{

namespace
{

namespace pt = boost::property_tree;

using Ticks = ui64;

struct TemplateInfo
{
  std::string media;
  ui64        timescale    = 1;
  Ticks       duration     = 0;
  ui64        start_number = 1;

  // (start, duration) pairs when a SegmentTimeline is present
  std::vector<std::pair<Ticks, Ticks>> timeline;
};

auto attr(const pt::ptree& node, const std::string& name) -> std::optional<std::string>
{
  if (auto value = node.get_optional<std::string>("<xmlattr>." + name))
    return *value;
  return std::nullopt;
}

template <typename T> auto attrAs(const pt::ptree& node, const std::string& name) -> std::optional<T>
{
  auto raw = attr(node, name);
  if (!raw)
    return std::nullopt;
  try
  {
    return node.get<T>("<xmlattr>." + name);
  }
  catch (const pt::ptree_bad_data&)
  {
    throw ManifestError("Attribute '" + name + "' has an invalid value '" + *raw + "'");
  }
}

// ISO-8601 duration, e.g. "PT10S", "PT1M2.5S", "P1DT2H"
auto parseIsoDuration(const std::string& text) -> MediaDuration
{
  static const boost::regex iso(
    R"(^P(?:(\d+(?:\.\d+)?)D)?(?:T(?:(\d+(?:\.\d+)?)H)?(?:(\d+(?:\.\d+)?)M)?(?:(\d+(?:\.\d+)?)S)?)?$)");

  boost::smatch match;
  if (!boost::regex_match(text, match, iso) || text == "P" || text == "PT")
    throw ManifestError("Invalid ISO-8601 duration '" + text + "'");

  auto part = [&](int i) { return match[i].matched ? std::stod(match[i].str()) : 0.0; };

  const double seconds = part(1) * 86400.0 + part(2) * 3600.0 + part(3) * 60.0 + part(4);
  return std::chrono::duration_cast<MediaDuration>(std::chrono::duration<double>(seconds));
}

// "30", "29.97" or "30000/1001"
auto parseFrameRate(const std::string& text) -> double
{
  try
  {
    size_t slash = text.find('/');
    if (slash == std::string::npos)
      return std::stod(text);
    const double num = std::stod(text.substr(0, slash));
    const double den = std::stod(text.substr(slash + 1));
    if (den == 0.0)
      throw ManifestError("Frame rate with zero denominator '" + text + "'");
    return num / den;
  }
  catch (const std::logic_error&)
  {
    throw ManifestError("Invalid frame rate '" + text + "'");
  }
}

auto ticksToMicros(Ticks ticks, ui64 timescale) -> MediaDuration
{
  if (timescale == 0)
    throw ManifestError("Timescale must be positive");
  const long double micros = static_cast<long double>(ticks) * 1'000'000.0L / timescale;
  return MediaDuration{static_cast<i64>(std::llround(micros))};
}

// "%d" or "%0<width>d", the only formats DASH allows in a template identifier.
// Returns the zero-padded width, 0 for none.
auto parseNumberFormat(const std::string& format) -> std::size_t
{
  static const boost::regex allowed(R"(^%(?:0(\d{1,2}))?d$)");

  boost::smatch match;
  if (!boost::regex_match(format, match, allowed))
    throw ManifestError("Unsupported template format '" + format + "'");
  return match[1].matched ? std::stoul(match[1].str()) : 0;
}

// $RepresentationID$, $Number$, $Number%05d$, $Bandwidth$, $Time$, $$
auto expandTemplate(const std::string& media, const Representation& rep, ui64 number, Ticks time)
  -> Url
{
  Url    out;
  size_t pos = 0;
  while (pos < media.size())
  {
    size_t open = media.find('$', pos);
    if (open == std::string::npos)
    {
      out += media.substr(pos);
      break;
    }
    out += media.substr(pos, open - pos);

    size_t close = media.find('$', open + 1);
    if (close == std::string::npos)
      throw ManifestError("Unterminated template identifier in '" + media + "'");

    const std::string ident = media.substr(open + 1, close - open - 1);
    pos                     = close + 1;

    if (ident.empty())
    {
      out += '$';
      continue;
    }

    std::string name  = ident;
    std::size_t width = 0;
    if (size_t pct = ident.find('%'); pct != std::string::npos)
    {
      name = ident.substr(0, pct);
      width = parseNumberFormat(ident.substr(pct));
    }

    auto formatNumber = [width](ui64 value) { return fmt::format("{:0{}}", value, width); };

    if (name == "RepresentationID")
      out += rep.id;
    else if (name == "Number")
      out += formatNumber(number);
    else if (name == "Bandwidth")
      out += formatNumber(rep.bandwidth);
    else if (name == "Time")
      out += formatNumber(time);
    else
      throw ManifestError("Unknown template identifier '$" + ident + "$'");
  }
  return out;
}

auto readTemplate(const pt::ptree& node, const TemplateInfo& inherited) -> TemplateInfo
{
  TemplateInfo info = inherited;

  if (auto media = attr(node, "media"))
    info.media = *media;
  if (auto ts = attrAs<ui64>(node, "timescale"))
    info.timescale = *ts;
  if (auto dur = attrAs<Ticks>(node, "duration"))
    info.duration = *dur;
  if (auto sn = attrAs<ui64>(node, "startNumber"))
    info.start_number = *sn;

  if (auto timeline = node.get_child_optional("SegmentTimeline"))
  {
    info.timeline.clear();
    Ticks cursor = 0;
    for (const auto& [tag, s] : *timeline)
    {
      if (tag != "S")
        continue;

      auto d = attrAs<Ticks>(s, "d");
      if (!d || *d == 0)
        throw ManifestError("SegmentTimeline entry without a positive 'd'");
      if (auto t = attrAs<Ticks>(s, "t"))
        cursor = *t;

      const i64 repeat = attrAs<i64>(s, "r").value_or(0);
      if (repeat < 0)
        throw ManifestError("Open-ended SegmentTimeline repeats (r=-1) are not supported");

      for (i64 i = 0; i <= repeat; ++i)
      {
        info.timeline.emplace_back(cursor, *d);
        cursor += *d;
      }
    }
  }

  return info;
}

void buildFromTemplate(Representation& rep, const TemplateInfo& info, const Url& base,
                       std::optional<MediaDuration> total)
{
  if (info.media.empty())
    throw ManifestError("SegmentTemplate of '" + rep.id + "' has no media attribute");

  std::vector<std::pair<Ticks, Ticks>> entries = info.timeline;

  if (entries.empty())
  {
    if (info.duration == 0)
      throw ManifestError("SegmentTemplate of '" + rep.id + "' has neither duration nor timeline");
    if (!total)
      throw ManifestError("A duration-based SegmentTemplate needs mediaPresentationDuration");

    const long double total_ticks =
      std::chrono::duration<long double>(*total).count() * static_cast<long double>(info.timescale);
    const auto all   = static_cast<Ticks>(std::llround(total_ticks));
    const auto count = (all + info.duration - 1) / info.duration;

    for (Ticks i = 0; i < count; ++i)
    {
      const Ticks start = i * info.duration;
      entries.emplace_back(start, std::min<Ticks>(info.duration, all - start));
    }
  }

  for (size_t i = 0; i < entries.size(); ++i)
  {
    SegmentReference ref;
    ref.index    = i;
    ref.number   = info.start_number + i;
    ref.duration = ticksToMicros(entries[i].second, info.timescale);
    ref.url =
      utils::web::resolveUrl(base, expandTemplate(info.media, rep, ref.number, entries[i].first));
    rep.segments.push_back(std::move(ref));
  }
}

void buildFromList(Representation& rep, const pt::ptree& list, const TemplateInfo& inherited,
                   const Url& base)
{
  const ui64  timescale = attrAs<ui64>(list, "timescale").value_or(inherited.timescale);
  const Ticks duration  = attrAs<Ticks>(list, "duration").value_or(inherited.duration);
  if (duration == 0)
    throw ManifestError("SegmentList of '" + rep.id + "' has no duration");

  const ui64 start_number = attrAs<ui64>(list, "startNumber").value_or(inherited.start_number);

  SegmentIndex i = 0;
  for (const auto& [tag, seg] : list)
  {
    if (tag != "SegmentURL")
      continue;

    auto media = attr(seg, "media");
    if (!media)
      throw ManifestError("SegmentURL without media in '" + rep.id + "'");

    SegmentReference ref;
    ref.index    = i;
    ref.number   = start_number + i;
    ref.duration = ticksToMicros(duration, timescale);
    ref.url      = utils::web::resolveUrl(base, *media);
    rep.segments.push_back(std::move(ref));
    ++i;
  }
}

} // namespace

auto Manifest::parse(const ManifestData& raw, const Url& manifest_url) -> Manifest
{
  pt::ptree tree;
  try
  {
    std::istringstream iss(raw);
    pt::read_xml(iss, tree, pt::xml_parser::trim_whitespace);
  }
  catch (const pt::xml_parser_error& e)
  {
    throw ManifestError(std::string("Manifest is not well-formed XML: ") + e.what());
  }

  auto mpd = tree.get_child_optional("MPD");
  if (!mpd)
    throw ManifestError("Document has no <MPD> root");

  std::optional<MediaDuration> total;
  if (auto text = attr(*mpd, "mediaPresentationDuration"))
    total = parseIsoDuration(*text);

  auto period = mpd->get_child_optional("Period");
  if (!period)
    throw EmptyManifestError();

  if (auto period_duration = attr(*period, "duration"))
    total = parseIsoDuration(*period_duration);

  Url base = utils::web::baseOf(manifest_url);
  if (auto mpd_base = mpd->get_optional<std::string>("BaseURL"))
    base = utils::web::resolveUrl(base, *mpd_base);
  if (auto period_base = period->get_optional<std::string>("BaseURL"))
    base = utils::web::resolveUrl(base, *period_base);

  std::vector<Representation> reps;
  double                      fps = VVPLAY_DEFAULT_FPS;
  bool                        adaptation_used = false;

  for (const auto& [tag, set] : *period)
  {
    if (tag != "AdaptationSet")
      continue;

    if (adaptation_used)
    {
      log::WARN<log::MANIFEST>("Ignoring additional AdaptationSet, only one object per stream");
      continue;
    }

    if (auto rate = attr(set, "frameRate"))
      fps = parseFrameRate(*rate);

    Url set_base = base;
    if (auto set_url = set.get_optional<std::string>("BaseURL"))
      set_base = utils::web::resolveUrl(base, *set_url);

    TemplateInfo set_template;
    const bool   has_set_template = set.get_child_optional("SegmentTemplate").has_value();
    if (has_set_template)
      set_template = readTemplate(set.get_child("SegmentTemplate"), set_template);

    for (const auto& [rep_tag, rep_node] : set)
    {
      if (rep_tag != "Representation")
        continue;

      Representation rep;
      auto           id = attr(rep_node, "id");
      if (!id || id->empty())
        throw ManifestError("Representation without an id");
      rep.id = *id;

      auto bandwidth = attrAs<Bitrate>(rep_node, "bandwidth");
      if (!bandwidth)
        throw ManifestError("Representation '" + rep.id + "' has no bandwidth");
      rep.bandwidth = *bandwidth;

      if (auto rate = attr(rep_node, "frameRate"); rate && parseFrameRate(*rate) != fps)
        throw InconsistentTimelineError("Representation '" + rep.id +
                                        "' declares a different frame rate");

      Url rep_base = set_base;
      if (auto rep_url = rep_node.get_optional<std::string>("BaseURL"))
        rep_base = utils::web::resolveUrl(set_base, *rep_url);

      if (auto list = rep_node.get_child_optional("SegmentList"))
        buildFromList(rep, *list, set_template, rep_base);
      else if (auto tmpl = rep_node.get_child_optional("SegmentTemplate"))
        buildFromTemplate(rep, readTemplate(*tmpl, set_template), rep_base, total);
      else if (has_set_template)
        buildFromTemplate(rep, set_template, rep_base, total);
      else
        throw ManifestError("Representation '" + rep.id + "' has no segment addressing");

      log::DBG<log::MANIFEST>("Representation '{}' @ {} bps with {} segment(s)", rep.id,
                              rep.bandwidth, rep.segments.size());
      reps.push_back(std::move(rep));
    }

    adaptation_used = !reps.empty();
  }

  log::INFO<log::MANIFEST>("Parsed manifest with {} Representation(s) at {} fps", reps.size(),
                           fps);
  return {std::move(reps), fps};
}

} // namespace libvvplay::manifest
