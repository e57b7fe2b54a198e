#pragma once

#include "configuration.h"
#include "csvparser.h"
#include "jsonparser.h"
#include "poco.h"

/// @brief ITHIM input files parsing and model parameters creation namespace
namespace ithim::input {}
