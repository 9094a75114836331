#pragma once

#ifndef ASKILLS_VERSION
#define ASKILLS_VERSION "1.3.0"
#endif

// Bundle location used when neither --bundle nor AGENTIC_SKILLS_BUNDLE is set
#ifndef ASKILLS_DEFAULT_BUNDLE_DIR
#define ASKILLS_DEFAULT_BUNDLE_DIR "/usr/local/share/agentic-skills"
#endif
