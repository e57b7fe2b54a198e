#pragma once

#include "dose_response.h"
#include "disease_burden.h"
#include "model.h"
#include "model_comparator.h"
#include "mtrandom.h"

/// \brief Top-level namespace for ITHIM C++ API
namespace ithim {}
