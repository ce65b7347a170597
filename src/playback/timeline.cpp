// src/playback/timeline.cpp
// Pick the timeline strategy for a file and log what was opened.

#include "playback/timeline.hpp"

#include "common/logger.hpp"
#include "io/io.hpp"
#include "midi/smf.hpp"
#include "playback/buffered_timeline.hpp"
#include "playback/streamed_timeline.hpp"

namespace playback {

std::unique_ptr<Timeline> open_timeline(const std::filesystem::path &path,
                                        MidiLoading loading,
                                        const TimelineOptions &options) {
  if (loading == MidiLoading::Ram) {
    std::vector<std::uint8_t> bytes;
    try {
      bytes = io::read_all(path);
    } catch (const std::runtime_error &e) {
      throw midi::LoadError(e.what());
    }
    auto timeline = std::make_unique<BufferedTimeline>(
        midi::parse_smf(bytes), options);
    logging::info("Loaded %s into memory: %llu notes, %.2f s",
                  path.filename().string().c_str(),
                  static_cast<unsigned long long>(timeline->total_notes()),
                  timeline->length().value_or(0.0));
    return timeline;
  }

  std::unique_ptr<io::FileSource> source;
  try {
    source = std::make_unique<io::FileSource>(path);
  } catch (const std::runtime_error &e) {
    throw midi::LoadError(e.what());
  }
  auto timeline = std::make_unique<StreamedTimeline>(std::move(source), options);
  if (const std::optional<double> length = timeline->length()) {
    logging::info("Streaming %s: %llu notes, %.2f s",
                  path.filename().string().c_str(),
                  static_cast<unsigned long long>(timeline->total_notes()),
                  *length);
  } else {
    logging::info("Streaming %s: %llu notes, unknown length",
                  path.filename().string().c_str(),
                  static_cast<unsigned long long>(timeline->total_notes()));
  }
  return timeline;
}

} // namespace playback
