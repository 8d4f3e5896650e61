#pragma once

#include "shellguard/config/schema.hpp"
#include "shellguard/observability/observer.hpp"

#include <memory>

namespace shellguard::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace shellguard::observability
