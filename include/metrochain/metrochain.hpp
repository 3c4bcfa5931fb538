#pragma once
#include <metrochain/core/acceptance.hpp>
#include <metrochain/core/errors.hpp>
#include <metrochain/core/output.hpp>
#include <metrochain/core/sampler.hpp>
#include <metrochain/core/state.hpp>
#include <metrochain/log/logger.hpp>
#include <metrochain/math/rng.hpp>
