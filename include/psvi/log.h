#pragma once

// Scope-managed logging.  Every branch() opened through a Log instance is closed when the instance goes out of scope.
// Set the PSVI_VLOG CMake option for trace output in release builds.

#include <psvi/main.h>

namespace psvi {

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-zero-length"

class Log { // C++ wrapper for the PSVI log functionality
   private:
      int branches;
      CSTRING header;

   public:
      Log() : branches(0), header(nullptr) { }
      Log(CSTRING Header) : branches(0), header(Header) { }

      ~Log() {
         while (branches > 0) { branches--; LogReturn(); }
      }

      void branch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::API|VLF::BRANCH, header, Message, arg);
         va_end(arg);
         branches++;
      }

      #if !defined(NDEBUG) or defined(PSVI_VLOG)
      void traceBranch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::TRACE|VLF::BRANCH, header, Message, arg);
         va_end(arg);
         branches++;
      }
      #else
      void traceBranch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) { }
      #endif

      void msg(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) { // Defaults to API level
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::API, header, Message, arg);
         va_end(arg);
      }

      void detail(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) { // '--log-detail' to view
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::DETAIL, header, Message, arg);
         va_end(arg);
      }

      void warning(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::WARNING, header, Message, arg);
         va_end(arg);
      }

      void error(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) { // NB: Use for messages intended for the user, not the developer
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::ERROR, header, Message, arg);
         va_end(arg);
      }

      inline ERR error(ERR Code) { // Technically a warning
         FuncError(header, Code);
         return Code;
      }

      inline ERR warning(ERR Code) {
         FuncError(header, Code);
         return Code;
      }

      void trace(CSTRING Message, ...) {
         #if !defined(NDEBUG) or defined(PSVI_VLOG)
            va_list arg;
            va_start(arg, Message);
            VLogF(VLF::TRACE, header, Message, arg);
            va_end(arg);
         #endif
      }
};

#pragma GCC diagnostic pop

class LogLevel {
   private:
      int level;
   public:
      LogLevel(int Level) : level(Level) {
         AdjustLogLevel(Level);
      }

      ~LogLevel() {
         AdjustLogLevel(-level);
      }
};

} // namespace
