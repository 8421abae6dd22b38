// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef GLYPHTEXT_DEFS_HH
#define GLYPHTEXT_DEFS_HH

#include <config.hh>

#define TO_S(x) #x

#define GLYPHTEXT_DO_CAT(a, b) a ## b
#define GLYPHTEXT_CAT(a, b) GLYPHTEXT_DO_CAT(a, b)

#include <boost/assert.hpp>

#define GLYPHTEXT_ASSERT BOOST_ASSERT
#define ASSERT GLYPHTEXT_ASSERT

#endif // GLYPHTEXT_DEFS_HH
