#pragma once

#include "misc.hpp"
#include "logging.hpp"
#include "files.hpp"
#include "xwrap.hpp"
#include "stream.hpp"
