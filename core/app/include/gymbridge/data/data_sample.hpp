#pragma once

#include "gymbridge/data/bar.hpp"
#include "gymbridge/data/sample_config.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace gymbridge {

// -----------------------------------------------------------------------------
// DataSample - a contiguous slice of OHLCV bars
// -----------------------------------------------------------------------------
//
// @brief  The unit of data the server works with. The data provider ships a
//         trial sample; the server cuts one episode sample out of it per
//         episode and feeds that to the engine.
//
// @details
// The same type serves all three levels:
//   dataset  - everything the data provider loaded from CSV
//   trial    - sample() of the dataset, shipped over the data channel
//   episode  - sample() of the trial, converted with toFeed()
//
// Train / test split:
//   Rows [0, split) form the train section and rows [split, size()) the test
//   section, where split = round(size() * train_ratio). SampleConfig's
//   sample_type selects the section a narrower sample is drawn from. The
//   split ratio is inherited by every child sample.
//
// Start position:
//   Drawn from Beta(b_alpha, b_beta) scaled over the admissible start rows
//   of the section, or located from SampleConfig::timestamp when set.
//
// Randomness:
//   Each sample owns a std::mt19937_64 seeded from `seed`. reset() rewinds
//   both the RNG and the sample counter, so the sequence of episodes drawn
//   after a reset is reproducible.
//
// Thread model:
//   Not thread-safe. Owned by one session (or by the data server thread).
// -----------------------------------------------------------------------------
class DataSample {
 public:
  DataSample(std::string filename, std::vector<Bar> bars,
             nlohmann::json metadata = nlohmann::json::object(),
             double train_ratio = 1.0, std::uint64_t seed = 0);

  const std::string& filename() const { return filename_; }
  const nlohmann::json& metadata() const { return metadata_; }
  const std::vector<Bar>& bars() const { return bars_; }
  std::size_t size() const { return bars_.size(); }
  double trainRatio() const { return train_ratio_; }
  std::size_t samplesDrawn() const { return sample_count_; }

  // -------------------------------------------------------------------------
  // describe()
  // -------------------------------------------------------------------------
  // @brief  Descriptive statistics: row count, first/last timestamp, and
  //         mean / std / min / max for the close and volume columns.
  // -------------------------------------------------------------------------
  nlohmann::json describe() const;

  // Rewinds the sample counter and reseeds the RNG.
  void reset();

  // -------------------------------------------------------------------------
  // sample(config)
  // -------------------------------------------------------------------------
  // @brief  Draws a narrower sample from the section config.sample_type
  //         selects.
  //
  // @throws std::invalid_argument if the section is empty, config.length is
  //         longer than the section, or config.timestamp lies past the last
  //         admissible start row.
  // -------------------------------------------------------------------------
  std::unique_ptr<DataSample> sample(const SampleConfig& config);

  // Bars in the form the engine consumes.
  std::vector<Bar> toFeed() const { return bars_; }

  nlohmann::json toJson() const;

  // Throws nlohmann::json::exception on a malformed document.
  static std::unique_ptr<DataSample> fromJson(const nlohmann::json& j);

 private:
  std::size_t splitRow() const;

  std::string filename_;
  std::vector<Bar> bars_;
  nlohmann::json metadata_;
  double train_ratio_;
  std::uint64_t seed_;
  std::mt19937_64 rng_;
  std::size_t sample_count_{0};
};

// -----------------------------------------------------------------------------
// drawBetaIndex(first, last, alpha, beta, rng)
// -----------------------------------------------------------------------------
// @brief  Index in [first, last] distributed as first + Beta(alpha, beta) *
//         (last - first), rounded to the nearest row.
// -----------------------------------------------------------------------------
std::size_t drawBetaIndex(std::size_t first, std::size_t last, double alpha,
                          double beta, std::mt19937_64& rng);

// -----------------------------------------------------------------------------
// loadCsvSample(path, train_ratio, seed)
// -----------------------------------------------------------------------------
// @brief  Reads "timestamp_ms,open,high,low,close,volume" rows into a
//         DataSample named after the file.
//
// @details
// A first line containing "timestamp" is treated as a header. Rows with the
// wrong field count or unparsable numbers are skipped and counted in
// metadata["skipped_rows"].
//
// @throws std::runtime_error if the file cannot be opened or yields no rows.
// -----------------------------------------------------------------------------
std::unique_ptr<DataSample> loadCsvSample(const std::string& path,
                                          double train_ratio = 1.0,
                                          std::uint64_t seed = 0);

}  // namespace gymbridge
