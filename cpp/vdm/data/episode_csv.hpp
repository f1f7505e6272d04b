#pragma once
/*
================================================================================
Fragment 4.2 - Data: Episode Corpus CSV
FILE: cpp/vdm/data/episode_csv.hpp

Purpose:
  - Read recorded vehicle logs (one episode per file, one sample per row)
    and write episodes back out in the same layout.

Format:
  - Header row: time,<state channels...>,<control channels...>
    With a header, columns are matched by name (order and extra columns
    are free). Without one, columns are positional in that order.
  - Blank lines and lines starting with '#' are skipped.
  - Values are written with round-trip precision.

Errors:
  - Readers throw IOError (file) or ValidationError (content, with line).
  - Writers return false on I/O failure.
================================================================================
*/

#include "vdm/data/episode.hpp"
#include "vdm/model/signals.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace vdm::data {

struct CsvOptions {
  char delimiter = ',';
  bool header = true;
  std::string time_column = "time";
};

Episode parse_episode_csv(std::istream& in, const model::ChannelLayout& layout,
                          const std::string& id, const CsvOptions& opt = CsvOptions());

// Episode id is the file name without directory and extension.
Episode read_episode_csv(const std::string& path, const model::ChannelLayout& layout,
                         const CsvOptions& opt = CsvOptions());

// Every *.csv / *.txt file in `dir`, sorted by file name.
std::vector<Episode> read_corpus_folder(const std::string& dir, const model::ChannelLayout& layout,
                                        const CsvOptions& opt = CsvOptions());

std::string episode_to_csv(const Episode& e, const model::ChannelLayout& layout,
                           const CsvOptions& opt = CsvOptions());

bool write_episode_csv(const Episode& e, const model::ChannelLayout& layout,
                       const std::string& path, const CsvOptions& opt = CsvOptions());

}  // namespace vdm::data
