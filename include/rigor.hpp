#pragma once

#include "rigor/config.hpp"
#include "rigor/diagnostics.hpp"
#include "rigor/errors.hpp"
#include "rigor/format.hpp"
#include "rigor/harness.hpp"
#include "rigor/process.hpp"
#include "rigor/runfiles.hpp"
#include "rigor/utils.hpp"
#include "rigor/workspace.hpp"
