#pragma once

#define HEALTHWATCH_VERSION "1.1.0"
#define HEALTHWATCH_BANNER "healthwatch v" HEALTHWATCH_VERSION " - endpoint health monitor"
