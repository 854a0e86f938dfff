#pragma once

#include "config.hpp"
#include "provider.hpp"
#include "worker_pool.hpp"

#include <expected>
#include <memory>
#include <string>

// Builds the provider named by config.provider with its production
// collaborators. `pool` must outlive the returned provider.
std::expected<std::unique_ptr<TranscriptionProvider>, std::string>
make_provider(const Config& config, WorkerPool& pool, bool verbose = false);
