// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef GLYPHTEXT_CONFIG_HH
#define GLYPHTEXT_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "glyphtext"
#define PACKAGE_NAME "glyphtext"
#define PACKAGE_STRING "glyphtext 0.1.0"
#define PACKAGE_TARNAME "glyphtext"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "0.1.0"
#define VERSION "0.1.0"

//------------------------------------------------------------------------
// configuration files
//------------------------------------------------------------------------

// per-user file, looked up in the home directory
#define GLYPHTEXT_RC ".glyphtextrc"

// system-wide file
#ifndef GLYPHTEXT_SYSTEM_RC
#define GLYPHTEXT_SYSTEM_RC "/etc/glyphtextrc"
#endif

// environment variable naming an explicit configuration file
#define GLYPHTEXT_RC_ENV "GLYPHTEXTRC"

//------------------------------------------------------------------------
// cache sizing
//------------------------------------------------------------------------

// object cache entries reserved per requested page when no capacity is set
#define GLYPHTEXT_OBJECT_CACHE_PER_PAGE 10

// ceiling for the object cache capacity derived from the page count
#define GLYPHTEXT_OBJECT_CACHE_CEILING 5000

// default font cache capacity
#define GLYPHTEXT_FONT_CACHE_CAPACITY 1000

// default number of resident pages in the lazy page manager
#define GLYPHTEXT_RESIDENT_PAGES 10

//------------------------------------------------------------------------
// worker pool
//------------------------------------------------------------------------

// upper bound for the worker count derived from the hardware
#define GLYPHTEXT_MAX_DEFAULT_WORKERS 4

#endif // GLYPHTEXT_CONFIG_HH
