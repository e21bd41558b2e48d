#pragma once

#include "server/settings.hpp"
#include "util/cancel_token.hpp"

// Runs the collector until `cancel` fires.
// Returns 0 after a clean shutdown, 1 on a FatalStartupError or any other
// startup failure (logged).
int run_collector_service(const ServiceSettings& settings, const CancelToken& cancel);
