#include "system.hpp"
#include "text.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <iterator>
#include <sstream>

#ifdef _WIN32
#include <Windows.h>
#include <io.h>
#define IS_STDERR_TTY (_isatty(_fileno(stderr)) != 0)
#define IS_STDOUT_TTY (_isatty(_fileno(stdout)) != 0)
#else
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <signal.h>
#include <errno.h>
#include <string.h> // strerror
#define IS_STDERR_TTY (isatty(STDERR_FILENO) != 0)
#define IS_STDOUT_TTY (isatty(STDOUT_FILENO) != 0)
#endif


using namespace sys;

///////////////////////////////////////////////////////////////////////////////
// SYSTEM ERROR HANDLING
#ifdef _WIN32

int sys::last_error() {return (int)GetLastError();}
std::string sys::format_last_error(int e)
{
  LPVOID msgBuf;
  FormatMessageA(
    FORMAT_MESSAGE_ALLOCATE_BUFFER |
      FORMAT_MESSAGE_FROM_SYSTEM |
      FORMAT_MESSAGE_IGNORE_INSERTS,
    nullptr,
    (DWORD)e,
    MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
    (LPSTR)&msgBuf,
    0, nullptr);
  std::string s((const char *)msgBuf);
  LocalFree(msgBuf);
  return s;
}
#else // !_WIN32

int sys::last_error() {return (int)errno;}

std::string sys::format_last_error(int e)
{
  const char *err_cstr = strerror(e);
  if (err_cstr != nullptr)
    return err_cstr;
  return "?";
}
#endif // !_WIN32

void sys::status::sys_error(const char *_api, int _code)
{
  failed = true;
  api = _api;
  api_code = _code;
}

void sys::status::other_error(const std::string &msg)
{
  failed = true;
  extended = msg;
}

void sys::status::str(std::ostream &os) const
{
  bool wrote_something = false;
  if (!context.empty()) {
    os << context << ": ";
    wrote_something = true;
  }
  if (api) {
    wrote_something = true;
    os << api << " returned 0x" << text::hex(api_code, 0) <<
      " (" << format_last_error(api_code) << ")";
  }
  if (!extended.empty()) {
    if (wrote_something)
      os << "; ";
    os << extended;
  }
}
std::string sys::status::str() const
{
  std::stringstream ss; str(ss); return ss.str();
}

///////////////////////////////////////////////////////////////////////////////
// COLORED TEXT
bool sys::is_tty(std::ostream &os) {
  return &os == &std::cerr ? IS_STDERR_TTY :
         &os == &std::cout ? IS_STDOUT_TTY :
        false;
}

///////////////////////////////////////////////////////////////////////////////
// LOGGING AND EXIT
void sys::debug_break() {
#ifdef _WIN32
  DebugBreak();
#else
  raise(SIGTRAP);
#endif
}

int sys::desired_message_verbosity = 0;

void sys::message_for_level(int this_level, const char *patt, ...)
{
  if (this_level < desired_message_verbosity) {
    return;
  }

  va_list va;
  va_start(va, patt);
  std::stringstream ss;
  text::printf_to(ss, patt, va);
  va_end(va);
  std::string msg = ss.str();
  if (msg.empty() || msg.back() != '\n')
    msg += '\n';

#ifdef _WIN32
  if (this_level > 0)
   OutputDebugStringA(msg.c_str());
#endif

  if (is_tty(std::cerr)) {
    if (this_level >= 2)
      std::cerr << text::ANSI_RED;
    else if (this_level == 1)
      std::cerr << text::ANSI_YELLOW;
    else if (this_level < 0)
      std::cerr << text::ansi_literal("\033[38;2;64;64;64m");
    std::cerr << msg;
    std::cerr << text::ANSI_RESET;
  } else {
    std::cerr << msg;
  }
}

void sys::fatal_exit()
{
#ifdef _WIN32
  if (IsDebuggerPresent()) {
      sys::debug_break();
  }
  exit(-1);
#else
  exit(EXIT_FAILURE);
#endif
}

///////////////////////////////////////////////////////////////////////////////
// FILE SYSTEM
bool sys::file_exists(const std::string &path)
{
#ifdef _WIN32
  DWORD dwAttrib = GetFileAttributesA(path.c_str());
  return (dwAttrib != INVALID_FILE_ATTRIBUTES &&
         !(dwAttrib & FILE_ATTRIBUTE_DIRECTORY));
#else
  struct stat sb = {0};
  if (stat(path.c_str(), &sb)) {
      return false;
  }
  return S_ISREG(sb.st_mode);
#endif
}

std::string sys::take_file(std::string path)
{
  auto last_slash = path.find_last_of("/\\");
  if (last_slash == std::string::npos)
    return path;
  return path.substr(last_slash + 1);
}

bits sys::read_file_binary(std::string fname)
{
  status st(fname.c_str());
  bits bytes = read_file_binary(fname, st);
  if (st)
    FATAL("%s", st.str().c_str());
  return bytes;
}

bits sys::read_file_binary(std::string fname, status &st)
{
  bits bytes;
  std::ifstream file(fname, std::ios::binary);
  if (!file.good()) {
    st.sys_error("open");
    return bytes;
  }
  bytes.assign(
    std::istreambuf_iterator<char>(file),
    std::istreambuf_iterator<char>());
  if (file.bad()) {
    st.other_error("error reading file");
    bytes.clear();
  }
  return bytes;
}
