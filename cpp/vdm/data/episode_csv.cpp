#include "vdm/data/episode_csv.hpp"

#include "vdm/core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace vdm::data {

namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> split(const std::string& line, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : line) {
    if (c == delim) {
      out.push_back(trim(cur));
      cur.clear();
    } else {
      cur += c;
    }
  }
  out.push_back(trim(cur));
  return out;
}

std::string at_line(const std::string& id, std::size_t line) {
  std::ostringstream oss;
  oss << "episode '" << id << "' line " << line << ": ";
  return oss.str();
}

double parse_cell(const std::string& cell, const std::string& where) {
  VDM_REQUIRE(!cell.empty(), ValidationError, where + "empty cell");
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(cell.c_str(), &end);
  VDM_REQUIRE(end != cell.c_str() && *end == '\0' && errno != ERANGE, ValidationError,
              where + "not a number: '" + cell + "'");
  return v;
}

std::string csv_double(double x) {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << x;
  return oss.str();
}

}  // namespace

Episode parse_episode_csv(std::istream& in, const model::ChannelLayout& layout,
                          const std::string& id, const CsvOptions& opt) {
  layout.validate();
  const std::size_t nx = layout.state_dim();
  const std::size_t nu = layout.control_dim();

  // column[j] = position of (time, signal channel j-1) in a row.
  std::vector<std::size_t> column(1 + layout.signal_dim());
  for (std::size_t j = 0; j < column.size(); ++j) column[j] = j;
  bool have_header = !opt.header;

  std::vector<Sample> samples;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;
    const std::vector<std::string> cells = split(t, opt.delimiter);

    if (!have_header) {
      for (std::size_t j = 0; j < column.size(); ++j) {
        const std::string& want = (j == 0) ? opt.time_column : layout.channel_name(j - 1);
        auto it = std::find(cells.begin(), cells.end(), want);
        VDM_REQUIRE(it != cells.end(), ValidationError, at_line(id, line_no) + "missing column '" + want + "'");
        column[j] = static_cast<std::size_t>(it - cells.begin());
      }
      have_header = true;
      continue;
    }

    const std::string where = at_line(id, line_no);
    Sample s;
    s.x.resize(static_cast<Eigen::Index>(nx));
    s.u.resize(static_cast<Eigen::Index>(nu));
    for (std::size_t j = 0; j < column.size(); ++j) {
      VDM_REQUIRE(column[j] < cells.size(), ValidationError, where + "too few columns");
      const double v = parse_cell(cells[column[j]], where);
      if (j == 0) {
        s.t = v;
      } else if (j - 1 < nx) {
        s.x(static_cast<Eigen::Index>(j - 1)) = v;
      } else {
        s.u(static_cast<Eigen::Index>(j - 1 - nx)) = v;
      }
    }
    samples.push_back(std::move(s));
  }

  VDM_REQUIRE(!samples.empty(), ValidationError, "episode '" + id + "': no data rows");
  return Episode(id, std::move(samples));
}

Episode read_episode_csv(const std::string& path, const model::ChannelLayout& layout, const CsvOptions& opt) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    throw IOError("cannot open episode file: " + path);
  }
  return parse_episode_csv(ifs, layout, std::filesystem::path(path).stem().string(), opt);
}

std::vector<Episode> read_corpus_folder(const std::string& dir, const model::ChannelLayout& layout,
                                        const CsvOptions& opt) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw IOError("corpus folder not found: " + dir);
  }

  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) continue;
    const std::string ext = entry.path().extension().string();
    if (ext == ".csv" || ext == ".txt") files.push_back(entry.path().string());
  }
  if (ec) {
    throw IOError("cannot list corpus folder: " + dir + " (" + ec.message() + ")");
  }
  std::sort(files.begin(), files.end());

  std::vector<Episode> out;
  out.reserve(files.size());
  for (const auto& f : files) out.push_back(read_episode_csv(f, layout, opt));
  return out;
}

std::string episode_to_csv(const Episode& e, const model::ChannelLayout& layout, const CsvOptions& opt) {
  VDM_REQUIRE(e.state_dim() == layout.state_dim() && e.control_dim() == layout.control_dim(), ValidationError,
              "episode_to_csv: episode dimensions do not match the channel layout");
  const char d = opt.delimiter;
  std::ostringstream oss;
  if (opt.header) {
    oss << opt.time_column;
    for (std::size_t j = 0; j < layout.signal_dim(); ++j) oss << d << layout.channel_name(j);
    oss << "\n";
  }
  for (const auto& s : e.samples()) {
    oss << csv_double(s.t);
    for (Eigen::Index i = 0; i < s.x.size(); ++i) oss << d << csv_double(s.x(i));
    for (Eigen::Index i = 0; i < s.u.size(); ++i) oss << d << csv_double(s.u(i));
    oss << "\n";
  }
  return oss.str();
}

bool write_episode_csv(const Episode& e, const model::ChannelLayout& layout,
                       const std::string& path, const CsvOptions& opt) {
  std::ofstream ofs(path);
  if (!ofs.is_open()) return false;
  ofs << episode_to_csv(e, layout, opt);
  return ofs.good();
}

}  // namespace vdm::data
