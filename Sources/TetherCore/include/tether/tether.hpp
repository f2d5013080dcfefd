#pragma once

#include "configuration.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "network.hpp"
#include "observation.hpp"
#include "record.hpp"
#include "repository.hpp"
#include "scheduler.hpp"
#include "session.hpp"
#include "timer.hpp"
