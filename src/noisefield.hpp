// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NOISEFIELD_HPP_INCLUDED
#define NOISEFIELD_HPP_INCLUDED

#include <nfd/core/Debug.hpp>
#include <nfd/core/Error.hpp>
#include <nfd/core/Field.hpp>
#include <nfd/core/FieldOps.hpp>
#include <nfd/core/Global.hpp>
#include <nfd/core/Logger.hpp>
#include <nfd/core/TextProcessing.hpp>

#endif
