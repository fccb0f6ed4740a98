#include "gymbridge/data/data_sample.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace gymbridge {

namespace {

// Mean / std / min / max over one column. std is the population deviation.
template <typename Getter>
nlohmann::json columnStats(const std::vector<Bar>& bars, Getter get) {
  nlohmann::json j;
  double sum = 0.0;
  double lo = get(bars.front());
  double hi = lo;
  for (const auto& bar : bars) {
    double v = get(bar);
    sum += v;
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  }
  double mean = sum / static_cast<double>(bars.size());
  double sq = 0.0;
  for (const auto& bar : bars) {
    double d = get(bar) - mean;
    sq += d * d;
  }
  j["mean"] = mean;
  j["std"] = std::sqrt(sq / static_cast<double>(bars.size()));
  j["min"] = lo;
  j["max"] = hi;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
DataSample::DataSample(std::string filename, std::vector<Bar> bars,
                       nlohmann::json metadata, double train_ratio,
                       std::uint64_t seed)
    : filename_(std::move(filename)),
      bars_(std::move(bars)),
      metadata_(metadata.is_object() ? std::move(metadata)
                                     : nlohmann::json::object()),
      train_ratio_(train_ratio),
      seed_(seed),
      rng_(seed) {
  if (!(train_ratio_ >= 0.0 && train_ratio_ <= 1.0)) {
    throw std::invalid_argument("DataSample: train_ratio must be in [0, 1]");
  }
}

// -----------------------------------------------------------------------------
// describe()
// -----------------------------------------------------------------------------
nlohmann::json DataSample::describe() const {
  nlohmann::json j;
  j["count"] = bars_.size();
  if (bars_.empty()) {
    return j;
  }
  j["first_timestamp"] = bars_.front().timestamp_ms;
  j["last_timestamp"] = bars_.back().timestamp_ms;
  j["close"] = columnStats(bars_, [](const Bar& b) { return b.close; });
  j["volume"] = columnStats(bars_, [](const Bar& b) { return b.volume; });
  return j;
}

void DataSample::reset() {
  sample_count_ = 0;
  rng_.seed(seed_);
}

std::size_t DataSample::splitRow() const {
  return static_cast<std::size_t>(
      std::llround(static_cast<double>(bars_.size()) * train_ratio_));
}

// -----------------------------------------------------------------------------
// sample(): cut a child sample out of the selected section
// -----------------------------------------------------------------------------
std::unique_ptr<DataSample> DataSample::sample(const SampleConfig& config) {
  config.validate();

  std::size_t split = std::min(splitRow(), bars_.size());
  std::size_t section_begin = (config.sample_type == 0) ? 0 : split;
  std::size_t section_end = (config.sample_type == 0) ? split : bars_.size();
  std::size_t section_size = section_end - section_begin;

  if (section_size == 0) {
    throw std::invalid_argument(
        "DataSample: " + filename_ + " has no " +
        (config.sample_type == 0 ? "train" : "test") + " rows");
  }

  std::size_t length = (config.length == 0) ? section_size : config.length;
  if (length > section_size) {
    throw std::invalid_argument(
        "DataSample: requested length " + std::to_string(length) +
        " exceeds section of " + std::to_string(section_size) + " rows in " +
        filename_);
  }

  std::size_t last_start = section_end - length;
  std::size_t start = section_begin;

  if (config.timestamp) {
    auto first = bars_.begin() + static_cast<std::ptrdiff_t>(section_begin);
    auto last = bars_.begin() + static_cast<std::ptrdiff_t>(section_end);
    auto it = std::find_if(first, last, [&](const Bar& b) {
      return b.timestamp_ms >= *config.timestamp;
    });
    std::size_t found = static_cast<std::size_t>(it - bars_.begin());
    if (it == last || found > last_start) {
      throw std::invalid_argument(
          "DataSample: no room for " + std::to_string(length) +
          " rows at/after timestamp " + std::to_string(*config.timestamp) +
          " in " + filename_);
    }
    start = found;
  } else {
    start = drawBetaIndex(section_begin, last_start, config.b_alpha,
                          config.b_beta, rng_);
  }

  std::vector<Bar> slice(
      bars_.begin() + static_cast<std::ptrdiff_t>(start),
      bars_.begin() + static_cast<std::ptrdiff_t>(start + length));

  ++sample_count_;

  nlohmann::json meta;
  meta["type"] = config.sample_type;
  meta["sample_num"] = sample_count_;
  meta["first_row"] = start;
  meta["length"] = length;
  meta["parent"] = filename_;
  meta["first_timestamp"] = slice.front().timestamp_ms;
  meta["last_timestamp"] = slice.back().timestamp_ms;

  // Children keep the parent's split ratio so a trial drawn from the test
  // section still has a test section of its own.
  std::uint64_t child_seed = rng_();
  return std::make_unique<DataSample>(
      filename_ + "#" + std::to_string(sample_count_), std::move(slice),
      std::move(meta), train_ratio_, child_seed);
}

// -----------------------------------------------------------------------------
// toJson() / fromJson()
// -----------------------------------------------------------------------------
nlohmann::json DataSample::toJson() const {
  nlohmann::json j;
  j["filename"] = filename_;
  j["metadata"] = metadata_;
  j["train_ratio"] = train_ratio_;
  j["seed"] = seed_;
  j["bars"] = bars_;
  return j;
}

std::unique_ptr<DataSample> DataSample::fromJson(const nlohmann::json& j) {
  return std::make_unique<DataSample>(
      j.at("filename").get<std::string>(),
      j.at("bars").get<std::vector<Bar>>(),
      j.value("metadata", nlohmann::json::object()),
      j.value("train_ratio", 1.0), j.value("seed", std::uint64_t{0}));
}

// -----------------------------------------------------------------------------
// drawBetaIndex(): Beta(alpha, beta) via two Gamma draws
// -----------------------------------------------------------------------------
std::size_t drawBetaIndex(std::size_t first, std::size_t last, double alpha,
                          double beta, std::mt19937_64& rng) {
  if (last <= first) {
    return first;
  }
  std::gamma_distribution<double> gx(alpha, 1.0);
  std::gamma_distribution<double> gy(beta, 1.0);
  double x = gx(rng);
  double y = gy(rng);
  double ratio = (x + y > 0.0) ? x / (x + y) : 0.5;
  double span = static_cast<double>(last - first);
  auto offset = static_cast<std::size_t>(std::llround(ratio * span));
  return first + std::min(offset, last - first);
}

// -----------------------------------------------------------------------------
// loadCsvSample(): timestamp_ms,open,high,low,close,volume
// -----------------------------------------------------------------------------
std::unique_ptr<DataSample> loadCsvSample(const std::string& path,
                                          double train_ratio,
                                          std::uint64_t seed) {
  std::ifstream infile(path);
  if (!infile.is_open()) {
    throw std::runtime_error("Failed to open data file: " + path);
  }

  std::vector<Bar> bars;
  std::size_t skipped = 0;
  std::string line;
  bool first_line = true;

  while (std::getline(infile, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) continue;
    if (first_line) {
      first_line = false;
      if (line.find("timestamp") != std::string::npos) continue;
    }

    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
      fields.push_back(token);
    }

    if (fields.size() != 6) {
      ++skipped;
      continue;
    }

    try {
      Bar bar;
      bar.timestamp_ms = std::stoll(fields[0]);
      bar.open = std::stod(fields[1]);
      bar.high = std::stod(fields[2]);
      bar.low = std::stod(fields[3]);
      bar.close = std::stod(fields[4]);
      bar.volume = std::stod(fields[5]);
      bars.push_back(bar);
    } catch (const std::logic_error&) {
      // std::stod / std::stoll throw invalid_argument or out_of_range.
      ++skipped;
    }
  }

  if (bars.empty()) {
    throw std::runtime_error("No usable rows in data file: " + path);
  }

  nlohmann::json meta;
  meta["source"] = path;
  meta["skipped_rows"] = skipped;
  return std::make_unique<DataSample>(path, std::move(bars), std::move(meta),
                                      train_ratio, seed);
}

}  // namespace gymbridge
