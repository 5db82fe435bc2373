#include "warden/observability/factory.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/log_observer.hpp"
#include "warden/observability/multi_observer.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace warden::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &name, const LogLevel level) {
  if (name == "log") {
    return std::make_unique<LogObserver>(level);
  }
  if (name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

std::vector<std::string> backend_names(const std::string &backend) {
  std::vector<std::string> names;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    std::string name = common::to_lower(common::trim(part));
    if (name == "none") {
      name = "noop";
    }
    if (name != "log" && name != "noop") {
      continue;
    }
    if (std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const LogLevel level = log_level_from_string(config.log_level);
  if (common::trim(config.backend).empty()) {
    return std::make_unique<NoopObserver>();
  }

  const auto names = backend_names(config.backend);
  if (names.empty()) {
    return std::make_unique<LogObserver>(level);
  }
  if (names.size() == 1) {
    return make_backend(names.front(), level);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    (void)multi->add(make_backend(name, level));
  }
  return multi;
}

} // namespace warden::observability
