// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "nfd/core/Error.hpp"

#include "nfd/core/Global.hpp"
#include "nfd/core/TextProcessing.hpp"

#include <string>

namespace nfd {

construction_error::construction_error(int Width, int Height, long long NumValues):
  field_error(error_code::CONSTRUCTION, core::StringPrint("nfd::construction_error: %s cannot "
    "store a field with %i columns and %i rows.", core::FormatNumber(NumValues, "values", "value"),
    Width, Height)),
  Width_(Width),
  Height_(Height),
  NumValues_(NumValues)
{}

dimension_mismatch_error::dimension_mismatch_error(int Width, int Height, int OtherWidth, int
  OtherHeight):
  field_error(error_code::DIMENSION_MISMATCH, core::StringPrint("nfd::dimension_mismatch_error: "
    "field of size %ix%i cannot be combined with field of size %ix%i.", Width, Height, OtherWidth,
    OtherHeight)),
  Width_(Width),
  Height_(Height),
  OtherWidth_(OtherWidth),
  OtherHeight_(OtherHeight)
{}

}
