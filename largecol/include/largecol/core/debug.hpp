/*
 * File: debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-01-12
 * License: MIT
 */


#pragma once

#ifndef LARGECOL_ASSERT
#include <cassert>
#define LARGECOL_ASSERT(cond, msg) do { static_cast<void>(msg); assert(cond); } while(0)
#endif

#ifdef LARGECOL_ENABLE_PRIVATE_TESTS
#define PRIVATE_TESTABLE public
#else
#define PRIVATE_TESTABLE private
#endif
