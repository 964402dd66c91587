#pragma once

// Define version components
#define VERSION_MAJOR 0
#define VERSION_MINOR 1
#define VERSION_PATCH 0

// Helper macros for string conversion
#define MIRROR_STRINGIFY(x) #x
#define MIRROR_TOSTRING(x) MIRROR_STRINGIFY(x)

// Version as string in format "MAJOR.MINOR.PATCH"
#define VERSION_STRING MIRROR_TOSTRING(VERSION_MAJOR) "." MIRROR_TOSTRING(VERSION_MINOR) "." MIRROR_TOSTRING(VERSION_PATCH)
