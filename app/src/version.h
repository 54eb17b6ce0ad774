#pragma once

// ==============================================================================
// Version Information
// ==============================================================================
// Reported by the application delegate and the About box.
// Keep in sync with CMakeLists.txt project version.
// ==============================================================================

#define VERNIER_MAJOR_VERSION_STR "1"
#define VERNIER_MAJOR_VERSION_INT 1

#define VERNIER_SUB_VERSION_STR "0"
#define VERNIER_SUB_VERSION_INT 0

#define VERNIER_RELEASE_NUMBER_STR "0"
#define VERNIER_RELEASE_NUMBER_INT 0

#define VERNIER_VERSION_STR VERNIER_MAJOR_VERSION_STR "." VERNIER_SUB_VERSION_STR "." VERNIER_RELEASE_NUMBER_STR

#define VERNIER_APP_NAME "Vernier"
#define VERNIER_APP_IDENTIFIER "com.vernier.parameterpanel"
