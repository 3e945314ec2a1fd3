#pragma once

#include "plotgate/check.hpp"
#include "plotgate/config.hpp"
#include "plotgate/figure.hpp"
#include "plotgate/format.hpp"
#include "plotgate/process.hpp"
#include "plotgate/result.hpp"
#include "plotgate/runner.hpp"
#include "plotgate/toolkit.hpp"
#include "plotgate/utils.hpp"
