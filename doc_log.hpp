// doc_log.hpp
#ifndef DOC_LOG_HPP
#define DOC_LOG_HPP

#include <cstdio>
#include <string>

// Compile-time log filter: 0 errors, 1 +warnings, 2 +info, 3 +debug.
// Define DOCTREE_LOG_LEVEL before including this header to override.
#ifndef DOCTREE_LOG_LEVEL
#define DOCTREE_LOG_LEVEL 1
#endif

inline void doctree_log(const char *level, const std::string &msg) {
  std::fprintf(stderr, "doctree: %-7s %s\n", level, msg.c_str());
}

#define DOCTREE_LOG_ERROR(msg) doctree_log("ERROR", (msg))

#if DOCTREE_LOG_LEVEL >= 1
#define DOCTREE_LOG_WARN(msg) doctree_log("WARNING", (msg))
#else
#define DOCTREE_LOG_WARN(msg) ((void)0)
#endif

#if DOCTREE_LOG_LEVEL >= 2
#define DOCTREE_LOG_INFO(msg) doctree_log("INFO", (msg))
#else
#define DOCTREE_LOG_INFO(msg) ((void)0)
#endif

#if DOCTREE_LOG_LEVEL >= 3
#define DOCTREE_LOG_DEBUG(msg) doctree_log("DEBUG", (msg))
#else
#define DOCTREE_LOG_DEBUG(msg) ((void)0)
#endif

#endif // DOC_LOG_HPP
