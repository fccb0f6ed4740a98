#include "gymbridge/sim/bar_backtest_engine.hpp"
#include "gymbridge/log/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace gymbridge {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
BarBacktestEngine::BarBacktestEngine(EngineParams params)
    : params_(params), broker_(params.start_cash, params.commission) {
  params_.validate();
}

// -----------------------------------------------------------------------------
// clone(): configuration only; data and run state start empty
// -----------------------------------------------------------------------------
std::unique_ptr<IBacktestEngine> BarBacktestEngine::clone() const {
  auto copy = std::make_unique<BarBacktestEngine>(params_);
  copy->log_ = log_;
  copy->params_json_ = params_json_;
  for (const auto& observer : observers_) {
    copy->observers_.emplace_back(observer.kind());
  }
  for (const auto& [name, analyzer] : analyzers_) {
    copy->analyzers_.emplace_back(name, analyzer->clone());
  }
  return copy;
}

void BarBacktestEngine::addData(std::vector<Bar> feed, std::string name) {
  feed_ = std::move(feed);
  feed_name_ = std::move(name);
}

bool BarBacktestEngine::hasObserver(ObserverKind kind) const {
  return std::any_of(observers_.begin(), observers_.end(),
                     [kind](const Observer& o) { return o.kind() == kind; });
}

void BarBacktestEngine::addObserver(ObserverKind kind) {
  observers_.emplace_back(kind);
}

// -----------------------------------------------------------------------------
// addAnalyzer(): names are unique
// -----------------------------------------------------------------------------
void BarBacktestEngine::addAnalyzer(const std::string& name,
                                    std::unique_ptr<IAnalyzer> analyzer) {
  if (!analyzer) {
    throw std::invalid_argument("BarBacktestEngine: null analyzer " + name);
  }
  for (const auto& entry : analyzers_) {
    if (entry.first == name) {
      throw std::invalid_argument(
          "BarBacktestEngine: analyzer already registered: " + name);
    }
  }
  analyzers_.emplace_back(name, std::move(analyzer));
}

std::vector<std::string> BarBacktestEngine::analyzerNames() const {
  std::vector<std::string> names;
  names.reserve(analyzers_.size());
  for (const auto& entry : analyzers_) {
    names.push_back(entry.first);
  }
  return names;
}

nlohmann::json BarBacktestEngine::analysis(const std::string& name) const {
  for (const auto& entry : analyzers_) {
    if (entry.first == name) {
      return entry.second->analysis();
    }
  }
  throw std::out_of_range("BarBacktestEngine: no analyzer named " + name);
}

void BarBacktestEngine::setStrategyParam(const std::string& key,
                                         nlohmann::json value) {
  params_json_[key] = std::move(value);
}

void BarBacktestEngine::resetRunState() {
  broker_ = Broker(params_.start_cash, params_.commission);
  values_.clear();
  values_.reserve(feed_.size());
  peak_value_ = params_.start_cash;
  current_ = 0;
  length_ = 0;
  iteration_ = 1;
  pending_action_ = "hold";
  last_action_ = "hold";
  broker_message_ = "-";
  stop_requested_ = false;
  for (auto& observer : observers_) {
    observer = Observer(observer.kind());
  }
}

// -----------------------------------------------------------------------------
// run(): replay the feed, one analyzer pass per tick after warm-up
// -----------------------------------------------------------------------------
std::size_t BarBacktestEngine::run() {
  if (feed_.empty()) {
    throw std::logic_error("BarBacktestEngine: run() without data");
  }

  resetRunState();

  for (auto& entry : analyzers_) {
    entry.second->start(*this);
  }

  for (std::size_t i = 0; i < feed_.size(); ++i) {
    current_ = i;
    length_ = i + 1;
    const Bar& bar = feed_[i];

    if (i + 1 < params_.state_window) {
      broker_.markToMarket(bar.close);
      values_.push_back(broker_.value());
      continue;
    }

    broker_message_ = broker_.execute(pending_action_, params_.stake, bar.open);
    pending_action_ = "hold";

    broker_.markToMarket(bar.close);
    values_.push_back(broker_.value());
    peak_value_ = std::max(peak_value_, broker_.value());

    ObserverInput input;
    input.broker_value = broker_.value();
    input.start_cash = params_.start_cash;
    input.position = broker_.position().net_quantity;
    input.reward = reward();
    for (auto& observer : observers_) {
      observer.next(input);
    }

    for (auto& entry : analyzers_) {
      entry.second->next(*this);
    }

    if (stop_requested_ || isDone()) {
      break;
    }
    ++iteration_;
  }

  for (auto& entry : analyzers_) {
    entry.second->stop(*this);
  }

  if (log_ != nullptr) {
    log_->debug("Engine run finished after " + std::to_string(length_) +
                " bars, value " + std::to_string(broker_.value()));
  }
  return length_;
}

nlohmann::json BarBacktestEngine::observerSummary() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& observer : observers_) {
    j[observerName(observer.kind())] = observer.summary();
  }
  return j;
}

double BarBacktestEngine::drawdown() const {
  return peak_value_ > 0.0 ? (peak_value_ - broker_.value()) / peak_value_
                           : 0.0;
}

// -----------------------------------------------------------------------------
// isDone(): termination flag queried by the step hook every tick
// -----------------------------------------------------------------------------
bool BarBacktestEngine::isDone() const {
  if (stop_requested_) return true;
  if (feed_.empty() || current_ + 1 >= feed_.size()) return true;
  if (broker_.value() <= 0.0) return true;
  return drawdown() >= params_.drawdown_call;
}

nlohmann::json BarBacktestEngine::info() const {
  nlohmann::json j;
  j["step"] = iteration_;
  j["time"] = feed_.empty() ? 0 : feed_[current_].timestamp_ms;
  j["action"] = last_action_;
  j["broker_message"] = broker_message_;
  j["broker_cash"] = broker_.cash();
  j["broker_value"] = broker_.value();
  j["position"] = broker_.position().net_quantity;
  j["realized_pnl"] = broker_.position().realized_pnl;
  j["closed_trades"] = broker_.closedTrades();
  j["drawdown"] = drawdown();
  return j;
}

nlohmann::json BarBacktestEngine::rawState() const {
  nlohmann::json rows = nlohmann::json::array();
  if (feed_.empty()) {
    return rows;
  }
  std::size_t first =
      (current_ + 1 >= params_.state_window) ? current_ + 1 - params_.state_window
                                             : 0;
  for (std::size_t i = first; i <= current_; ++i) {
    const Bar& b = feed_[i];
    rows.push_back({b.open, b.high, b.low, b.close, b.volume});
  }
  return rows;
}

nlohmann::json BarBacktestEngine::state() const {
  nlohmann::json out = nlohmann::json::array();
  if (feed_.empty()) {
    return out;
  }

  double last_close = feed_[current_].close;
  double scale = last_close != 0.0 ? last_close : 1.0;
  auto stat = params_json_.find("episode_stat");
  if (stat != params_json_.end() && stat->is_object()) {
    auto close = stat->find("close");
    if (close != stat->end() && close->is_object()) {
      double std = close->value("std", 0.0);
      if (std > 0.0) {
        scale = std;
      }
    }
  }

  std::size_t first =
      (current_ + 1 >= params_.state_window) ? current_ + 1 - params_.state_window
                                             : 0;
  for (std::size_t i = first; i <= current_; ++i) {
    out.push_back((feed_[i].close - last_close) / scale);
  }
  return out;
}

double BarBacktestEngine::reward() const {
  if (values_.empty()) {
    return 0.0;
  }
  auto skip = static_cast<std::size_t>(params_.skip_frame);
  std::size_t back = values_.size() > skip ? values_.size() - 1 - skip : 0;
  return (values_.back() - values_[back]) / params_.start_cash;
}

}  // namespace gymbridge
