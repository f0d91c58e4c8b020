#pragma once

// Core definitions shared by all PSVI modules: basic types, result codes, log flags and the logging back-end.

#include <stdarg.h>
#include <stdint.h>
#include <string>
#include <vector>

#ifndef IS
#define IS ==
#endif

typedef const char * CSTRING;
typedef char * STRING;

#ifndef DEFINE_ENUM_FLAG_OPERATORS
template <size_t S> struct _ENUM_FLAG_INTEGER_FOR_SIZE;
template <> struct _ENUM_FLAG_INTEGER_FOR_SIZE<1> { typedef int8_t type; };
template <> struct _ENUM_FLAG_INTEGER_FOR_SIZE<2> { typedef int16_t type; };
template <> struct _ENUM_FLAG_INTEGER_FOR_SIZE<4> { typedef int type; };
template <> struct _ENUM_FLAG_INTEGER_FOR_SIZE<8> { typedef int64_t type; };
// used as an approximation of std::underlying_type<T>
template <class T> struct _ENUM_FLAG_SIZED_INTEGER { typedef typename _ENUM_FLAG_INTEGER_FOR_SIZE<sizeof(T)>::type type; };

#define DEFINE_ENUM_FLAG_OPERATORS(ENUMTYPE) \
inline constexpr ENUMTYPE operator | (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)a) | ((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)b)); } \
inline constexpr ENUMTYPE operator & (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)a) & ((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)b)); } \
inline constexpr ENUMTYPE operator ~ (ENUMTYPE a) { return ENUMTYPE(~((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)a)); } \
inline constexpr ENUMTYPE operator ^ (ENUMTYPE a, ENUMTYPE b) { return ENUMTYPE(((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)a) ^ ((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)b)); } \
inline ENUMTYPE &operator |= (ENUMTYPE &a, ENUMTYPE b) { return (ENUMTYPE &)(((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type &)a) |= ((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)b)); } \
inline ENUMTYPE &operator &= (ENUMTYPE &a, ENUMTYPE b) { return (ENUMTYPE &)(((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type &)a) &= ((_ENUM_FLAG_SIZED_INTEGER<ENUMTYPE>::type)b)); }
#endif

// Result codes.  Okay is always zero; the order must match the message table in lib_errors.cpp.

enum class ERR : int {
   Okay = 0,
   False,
   NothingDone,
   Failed,
   NullArgs,
   Args,
   NoData,
   NotFound,
   Exists,
   Mismatch,
   OutOfRange,
   InvalidData,
   InvalidValue,
   NoSupport,
   ReadOnly,
   Read,
   Write,
   NotSerialisable,
   END
};

// Log flags

enum class VLF : uint32_t {
   NIL = 0,
   BRANCH = 0x00000001,
   ERROR = 0x00000002,
   WARNING = 0x00000004,
   CRITICAL = 0x00000008,
   INFO = 0x00000010,
   API = 0x00000020,
   DETAIL = 0x00000040,
   TRACE = 0x00000080,
   FUNCTION = 0x00000100,
};

DEFINE_ENUM_FLAG_OPERATORS(VLF)

namespace psvi {

// Logging back-end.  Clients should use the scope-managed psvi::Log class in <psvi/log.h> rather than calling these
// functions directly.

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args);
ERR FuncError(CSTRING Header, ERR Code);
void LogReturn(void);
int AdjustLogLevel(int Delta);

// Log configuration.  Levels follow a 0 - 9 scale: 0 none, 1 error, 2 warning, 4 info, 5 API, 6 detail, 9 trace.

void SetLogLevel(int Level);
[[nodiscard]] int GetLogLevel(void);
ERR ProcessLogArgs(int ArgCount, CSTRING *Args, std::vector<std::string> *Remaining = nullptr);

[[nodiscard]] CSTRING GetErrorMsg(ERR Code);

} // namespace
