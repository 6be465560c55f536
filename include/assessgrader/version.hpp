#pragma once

#define ASSESSGRADER_VERSION_MAJOR 0
#define ASSESSGRADER_VERSION_MINOR 3
#define ASSESSGRADER_VERSION_PATCH 0

#define ASSESSGRADER_VERSION_STRING "0.3.0"
