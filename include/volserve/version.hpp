#pragma once

// The build defines VOLSERVE_VERSION_STRING from project(VERSION)
#ifndef VOLSERVE_VERSION_STRING
#define VOLSERVE_VERSION_STRING "0.0.0+dev"
#endif
