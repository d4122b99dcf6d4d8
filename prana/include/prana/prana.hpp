#pragma once
// Prana: an agent's self-regulation loop
//
// - Orchestrator: staged phases, admission control, rollback
// - Health: error log, diagnosis, recovery strategies
// - Emotion/Incentive: reward and penalty feedback on eight channels
// - Memory: probabilistic store the recovery engine repairs
// - Agent: everything wired together
// - Ticker: background driver for the orchestrator

#include "types.hpp"
#include "log.hpp"
#include "version.hpp"
#include "emotion.hpp"
#include "incentive.hpp"
#include "memory.hpp"
#include "resource.hpp"
#include "health.hpp"
#include "diversity.hpp"
#include "orchestrator.hpp"
#include "config.hpp"
#include "agent.hpp"
#include "ticker.hpp"
