#pragma once

#include "talekeeper/config/schema.hpp"
#include "talekeeper/observability/observer.hpp"

#include <memory>

namespace talekeeper::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace talekeeper::observability
