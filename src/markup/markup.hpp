#pragma once

// Everything needed to build markup from untrusted values.

#include "markup/Escapable.hpp"
#include "markup/Escaper.hpp"
#include "markup/Formatter.hpp"
#include "markup/SafeString.hpp"
#include "markup/Value.hpp"
#include "markup/entities.hpp"
#include "markup/escape.hpp"
