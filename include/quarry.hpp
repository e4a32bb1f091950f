#pragma once

#include "quarry/address.hpp"
#include "quarry/analysis.hpp"
#include "quarry/cli.hpp"
#include "quarry/config.hpp"
#include "quarry/database.hpp"
#include "quarry/document.hpp"
#include "quarry/format.hpp"
#include "quarry/memory_program.hpp"
#include "quarry/mutation.hpp"
#include "quarry/program.hpp"
#include "quarry/toolchain.hpp"
#include "quarry/utils.hpp"
