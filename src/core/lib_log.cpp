/*********************************************************************************************************************

The source code of the PSVI library is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

This file contains all logging functions.

Log levels are:

0  Logging disabled, critical messages only.
1  ERROR Major errors that should be displayed to the user.
2  WARN Any error suitable for display to a developer or technically minded user (default).
3  Application log message, level 1
4  INFO Application log message, level 2
5  API Top-level API messages, e.g. function entry points
6  DETAIL Detailed API messages.  For messages within functions, and entry-points for minor functions.
8  TRACE Extremely detailed API messages suitable for intensive debugging only.
9  Noisy debug messages that will appear frequently, e.g. being used in inner loops.

*********************************************************************************************************************/

#include <stdio.h>
#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>

#include <psvi/main.h>

namespace psvi {

static void fmsg(CSTRING, STRING, int8_t);

static const int COLUMN1 = 30;

enum { MS_NONE, MS_FUNCTION, MS_MSG };

static std::atomic<int16_t> glLogLevel(2);
static std::atomic<bool> glLogThreads(false);
static std::mutex glmPrint;
static thread_local int tlDepth = 0;
static thread_local int tlBaseLine = 0;

namespace {

struct PreparedLogLine {
   std::array<char, COLUMN1+1> Header{};
   std::string Message;
   int Level = 0;
   VLF Flags = VLF::NIL;
   bool Highlight = false;
   bool PrintThread = false;
   int ThreadId = 0;
};

struct TerminalSink {
   TerminalSink();
   void operator()(const PreparedLogLine &Line) const;

   bool SupportsColour;
};

using SinkType = TerminalSink;
static std::array<SinkType, 1> glLogSinks { SinkType{} };

static constexpr std::array<VLF, 10> LOG_LEVELS = {
   VLF::CRITICAL,
   VLF::ERROR|VLF::CRITICAL,
   VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL
};

static void dispatch_to_sinks(const PreparedLogLine &Line)
{
   auto sinks = std::span<const SinkType>(glLogSinks);
   for (const auto &sink : sinks) sink(Line);
}

TerminalSink::TerminalSink()
{
#ifdef _WIN32
   SupportsColour = false;
#else
   SupportsColour = true;
#endif
}

void TerminalSink::operator()(const PreparedLogLine &Line) const
{
   if (Line.PrintThread) fprintf(stderr, "%.4d ", Line.ThreadId);

   if (Line.Highlight) {
      if (SupportsColour) fprintf(stderr, "\033[1m");
      else fputc('!', stderr);
   }

   fprintf(stderr, "%s", Line.Header.data());
   fprintf(stderr, "%s", Line.Message.c_str());

   if (Line.Highlight and SupportsColour) fprintf(stderr, "\033[0m");

   fprintf(stderr, "\n");
}

static int get_thread_id()
{
   return int(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 10000);
}

static std::string format_legacy_message(CSTRING Message, va_list Args)
{
   if (!Message) return std::string();

   va_list copy;
   va_copy(copy, Args);
   int required = vsnprintf(nullptr, 0, Message, copy);
   va_end(copy);

   if (required <= 0) return std::string();

   std::string buffer;
   buffer.resize(required);
   va_copy(copy, Args);
   vsnprintf(buffer.data(), buffer.size()+1, Message, copy);
   va_end(copy);

   return buffer;
}

static PreparedLogLine prepare_line(VLF Flags, CSTRING Header, std::string &&Message, int Level)
{
   PreparedLogLine line;
   line.Flags = Flags;
   line.Level = Level;
   line.Message = std::move(Message);
   line.PrintThread = glLogThreads.load(std::memory_order_relaxed);
   if (line.PrintThread) line.ThreadId = get_thread_id();

   bool highlight = (glLogLevel.load(std::memory_order_relaxed) > 2) and ((Flags & (VLF::ERROR|VLF::WARNING)) != VLF::NIL);
   if ((Flags & VLF::CRITICAL) != VLF::NIL) highlight = true;
   line.Highlight = highlight;

   if ((Header) and (!*Header)) Header = nullptr;
   if (!Header) Header = "PSVI";

   auto msgstate = ((Flags & (VLF::BRANCH|VLF::FUNCTION)) != VLF::NIL) ? MS_FUNCTION : MS_MSG;
   fmsg(Header, line.Header.data(), msgstate);
   return line;
}

static bool iequals(std::string_view A, std::string_view B)
{
   if (A.size() != B.size()) return false;
   for (size_t i=0; i < A.size(); i++) {
      auto a = A[i], b = B[i];
      if ((a >= 'A') and (a <= 'Z')) a = a - 'A' + 'a';
      if ((b >= 'A') and (b <= 'Z')) b = b - 'A' + 'a';
      if (a != b) return false;
   }
   return true;
}

} // namespace

/*********************************************************************************************************************

-FUNCTION-
AdjustLogLevel: Adjusts the base-line of all log messages.

This function adjusts the detail level of all outgoing log messages.  To illustrate, setting the `Delta`
value to 1 would result in level 5 (API) log messages being bumped to level 6.  If the user's maximum log level
output is 5, no further API messages will be output until the base-line is reduced to normal.

Adjustments to the base-line are accumulative and apply to the calling thread only.  To revert logging to the
previous base-line, call this function again with a negation of the previously passed value.

-INPUT-
int Delta: The level of adjustment to make to new log messages.  Zero is no change.  The maximum level is +/- 6.

-RESULT-
int: Returns the absolute base-line value that was active prior to calling this function.

*********************************************************************************************************************/

int AdjustLogLevel(int Delta)
{
   if (glLogLevel.load(std::memory_order_relaxed) >= 9) return tlBaseLine; // Do nothing if trace logging is active.
   int old_level = tlBaseLine;
   if ((Delta >= -6) and (Delta <= 6)) tlBaseLine += Delta;
   return old_level;
}

//********************************************************************************************************************

void SetLogLevel(int Level)
{
   if (Level < 0) Level = 0;
   else if (Level > 9) Level = 9;
   glLogLevel.store(int16_t(Level), std::memory_order_relaxed);
}

int GetLogLevel(void)
{
   return glLogLevel.load(std::memory_order_relaxed);
}

/*********************************************************************************************************************

-FUNCTION-
ProcessLogArgs: Configures logging from command-line arguments.

Scans the argument list for the `--log-*` switches and applies them.  Arguments that are not recognised as logging
switches are copied to `Remaining` if it is provided.  The first entry of `Args` is the program name and is skipped.

   --log-none     Disable all output other than critical messages.
   --log-error    Errors only.
   --log-warn     Warnings and errors (default).
   --log-info     Application messages.
   --log-api      API messages.
   --log-detail   Detailed API messages.
   --log-trace    Everything.
   --log-threads  Prefix each message with the thread ID.

-RESULT-
Okay
NullArgs
Args: A `--log-` switch was not recognised.  It is still copied to `Remaining`.

*********************************************************************************************************************/

ERR ProcessLogArgs(int ArgCount, CSTRING *Args, std::vector<std::string> *Remaining)
{
   if ((ArgCount > 0) and (!Args)) return ERR::NullArgs;

   auto error = ERR::Okay;
   for (int i=1; i < ArgCount; i++) {
      std::string_view arg(Args[i] ? Args[i] : "");
      if (!arg.starts_with("--log-")) {
         if (Remaining) Remaining->emplace_back(arg);
         continue;
      }

      arg.remove_prefix(2); // Skip '--'

      if (iequals(arg, "log-threads"))      glLogThreads = true;
      else if (iequals(arg, "log-none"))    SetLogLevel(0);
      else if (iequals(arg, "log-error"))   SetLogLevel(1);
      else if (iequals(arg, "log-warn"))    SetLogLevel(2);
      else if (iequals(arg, "log-warning")) SetLogLevel(2);
      else if (iequals(arg, "log-info"))    SetLogLevel(4); // Levels 3/4 are for applications (no internal detail)
      else if (iequals(arg, "log-api"))     SetLogLevel(5);
      else if (iequals(arg, "log-detail"))  SetLogLevel(6);
      else if (iequals(arg, "log-trace"))   SetLogLevel(9);
      else if (iequals(arg, "log-all"))     SetLogLevel(9); // 9 is the absolute maximum
      else {
         if (Remaining) Remaining->emplace_back(Args[i]);
         error = ERR::Args;
      }
   }

   return error;
}

/*********************************************************************************************************************

-FUNCTION-
VLogF: Sends formatted messages to the standard log.

This function manages the output of log messages by sending them through a log filter.  If the filter is not
passed, the function does nothing.  Log message formatting follows the same guidelines as the `printf()` function.

-INPUT-
int(VLF) Flags: Optional flags
cstr Header: A short name for the first column.  Typically function names are placed here, so that the origin of the message is obvious.
cstr Message: A formatted message to print.
va_list Args: A `va_list` corresponding to the arguments referenced in `Message`.

*********************************************************************************************************************/

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args)
{
   auto log_setting = glLogLevel.load(std::memory_order_relaxed);

   if ((Flags & VLF::CRITICAL) != VLF::NIL) {
      auto message = format_legacy_message(Message ? Message : "", Args);
      std::lock_guard lock(glmPrint);
      dispatch_to_sinks(prepare_line(Flags, Header, std::move(message), 0));
      if ((Flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
      return;
   }

   int level = log_setting - tlBaseLine;
   if (level > 9) level = 9;
   else if (level < 0) level = 0;

   bool should_log = ((LOG_LEVELS[level] & Flags) != VLF::NIL);
   if ((!should_log) and (log_setting > 1) and ((Flags & (VLF::WARNING|VLF::ERROR|VLF::CRITICAL)) != VLF::NIL)) should_log = true;

   if (should_log) {
      auto message = format_legacy_message(Message ? Message : "", Args);
      std::lock_guard lock(glmPrint);
      dispatch_to_sinks(prepare_line(Flags, Header, std::move(message), level));
      fflush(stderr);
   }

   if ((Flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
}

/*********************************************************************************************************************

-FUNCTION-
FuncError: Sends basic error messages to the application log.

This function outputs the message for an error code to the log.  The following example `FuncError("merge", ERR::Exists)`
would produce output such as `merge: The item already exists.`

-INPUT-
cstr Header: A short string that names the function that is making the call.
error Error: An error code from the ERR enumeration.

-RESULT-
error: Returns the same code that was specified in the `Error` parameter.

*********************************************************************************************************************/

ERR FuncError(CSTRING Header, ERR Code)
{
   if (glLogLevel.load(std::memory_order_relaxed) < 2) return Code;
   if (!Header) Header = "Function";

   char msgheader[COLUMN1+1];
   CSTRING histart = "", hiend = "";

   if (glLogLevel.load(std::memory_order_relaxed) > 2) {
      #ifdef _WIN32
         histart = "!";
      #else
         histart = "\033[1m";
         hiend = "\033[0m";
      #endif
   }

   std::lock_guard lock(glmPrint);
   fmsg(Header, msgheader, MS_MSG);
   fprintf(stderr, "%s%s%s%s\n", histart, msgheader, GetErrorMsg(Code), hiend);
   return Code;
}

/*********************************************************************************************************************

-FUNCTION-
LogReturn: Revert to the previous branch in the logging tree.
Status: Internal

Use LogReturn() to reverse any previous log message that created an indented branch.  Clients must use the
scope-managed `psvi::Log` class for branched log output.

*********************************************************************************************************************/

void LogReturn(void)
{
   if ((--tlDepth) < 0) tlDepth = 0;
}

//********************************************************************************************************************

static void fmsg(CSTRING Header, STRING Buffer, int8_t Colon) // Buffer must be COLUMN1+1 in size
{
   if (!Header) Header = "";

   int16_t pos = 0;
   int16_t depth;
   int16_t col = COLUMN1;
   auto log_setting = glLogLevel.load(std::memory_order_relaxed);

   if (log_setting < 3) depth = 0;
   else if (tlDepth > col) depth = col;
   else depth = tlDepth;

   if (log_setting >= 3) {
      while ((depth > 0) and (pos < col)) {
         Buffer[pos++] = ' ';
         depth--;
      }
   }

   if ((pos < col) and (Header[0])) { // Print as many function letters as possible.
      int16_t len;
      for (len=0; (Header[len]) and (pos < col); len++) Buffer[pos++] = Header[len];
      if (Colon IS MS_MSG) {
         if ((Header[len-1] != ':') and (Header[len-1] != ')') and (pos < col)) Buffer[pos++] = ':';
      }
      else if (Colon IS MS_FUNCTION) {
         if ((Header[len-1] != ':') and (Header[len-1] != ')') and (pos < col-1)) {
            Buffer[pos++] = '(';
            Buffer[pos++] = ')';
         }
      }
      if (log_setting >= 3) while (pos < col) Buffer[pos++] = ' '; // Add any extra spaces
      else if (pos < col) Buffer[pos++] = ' ';
   }

   Buffer[pos] = 0; // NB: Buffer is col + 1, so there is always room for the null byte.
}

} // namespace psvi
