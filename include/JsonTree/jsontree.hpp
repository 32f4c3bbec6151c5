#pragma once

#include "parser.hpp"
#include "decoder.hpp"
#include "registry.hpp"
#include "encoding.hpp"
#include "stream.hpp"
#include "error_formatting.hpp"
