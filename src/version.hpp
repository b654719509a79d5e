#pragma once

// Keep in sync with the project version in CMakeLists.txt
#define GRADER_VERSION_MAJOR 0
#define GRADER_VERSION_MINOR 1
#define GRADER_VERSION_PATCH 0
#define GRADER_VERSION_STRING "0.1.0"
