#ifndef SPVBIN_SYSTEM_HPP
#define SPVBIN_SYSTEM_HPP

#include <cstdarg>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////
// LOGGING MACROS
#define FATAL(...) \
  do { \
    sys::message_for_level(2, __VA_ARGS__); \
    sys::fatal_exit(); \
  } while (0)

#define WARNING(...) \
  sys::message_for_level(1,__VA_ARGS__)
#define VERBOSE(...) \
  sys::message_for_level(-1,__VA_ARGS__)
#define DEBUG(...) \
  sys::message_for_level(-2,__VA_ARGS__)

namespace sys {
  // messages below this level are dropped; -v sets this to -1, -v2 to -2
  extern int desired_message_verbosity;
}

///////////////////////////////////////////////////////////////////////////////
// STRING COMPARISON HELPERS
static inline bool streq(const char *s1, const char *s2) {
  return
    s1 == s2 ||
    (s1 != nullptr && s2 != nullptr && strcmp(s1, s2) == 0);
}
static inline bool strpfx(const char *pfx, const char *str) {
  return strncmp(pfx,str,strlen(pfx)) == 0;
}
static inline bool strpfx(const char *pfx, std::string str) {
  return strpfx(pfx, str.c_str());
}

namespace sys
{
  using bits = std::vector<uint8_t>;

  //////////////////////////////////////////////////////////////////////////////
  // SYSTEM ERROR SPECIFICS
  //
  // returns GetLastError() or errno
  int last_error();
  // strerror or FormatMessage
  std::string format_last_error(int e);

  // a status value for various operations that lead to system call
  struct status {
    bool          failed = false;
    std::string   context; // e.g. the file path
    const char   *api = nullptr; // system call or whatever
    int           api_code = 0; // GetLastError or errno()
    std::string   extended;

    status() { }
    status(const char *_in) : context(_in == nullptr ? "" : _in) { }

    // status st;
    // ...
    // if (st) something_went_wrong();
    //
    operator bool() const {return has_error();}
    bool has_error() const {return failed;}

    void sys_error(const char *api, int api_code = last_error());
    void other_error(const std::string &msg);

    void        str(std::ostream &os) const;
    std::string str() const;
  };

  // fatal_exit will terminate the process with a with an non-zero exit code
  // or a signal some sort depending on platform.  If a debugger is attached,
  // this will trigger a breakpoint first.
  [[noreturn]]
  void               fatal_exit();
  void               debug_break();

  //////////////////////////////////////////////////////////////////////////////
  // LOGGING AND EXIT
  //
  // this_level:  2 fatal, 1 warning, 0 normal, -1 verbose, -2 debug
  void               message_for_level(int this_level, const char *patt, ...);
  bool               is_tty(std::ostream &os);

  //////////////////////////////////////////////////////////////////////////////
  // FILE SYSTEM
  bool               file_exists(const std::string &path);
  std::string        take_file(std::string path); // a/foo/bar.spv -> bar.spv

  // the first fatals on error; the second reports through st
  bits               read_file_binary(std::string fname);
  bits               read_file_binary(std::string fname, status &st);
} // sys::

#endif
