#pragma once

#include "core/config.hpp"
#include "engine.hpp"

#include <expected>
#include <memory>

// Builds the backend named by config.engine.type. The returned engine is
// not yet open.
std::expected<std::unique_ptr<EngineAdapter>, Error> make_engine(const Config& config);
