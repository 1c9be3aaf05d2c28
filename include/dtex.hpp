#pragma once

#include "dtex/config.hpp"
#include "dtex/driver.hpp"
#include "dtex/error.hpp"
#include "dtex/finalizer.hpp"
#include "dtex/format.hpp"
#include "dtex/session.hpp"
#include "dtex/tracker.hpp"
#include "dtex/utils.hpp"
#include "dtex/workspace.hpp"
