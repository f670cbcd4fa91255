#ifndef SPVBIN_OPTS_HPP
#define SPVBIN_OPTS_HPP

#include "system.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// A small command line parser.
//
//   opts::CmdlineSpec<my_opts> cmdspec("title", "exe", "examples...");
//   cmdspec.defineFlag("q", "quiet", "run quietly", nullptr, opts::NONE,
//     [](const char *, const opts::ErrorHandler &, my_opts &o) {...});
//   cmdspec.defineOpt("n", "count", "INT", "...", nullptr, opts::NONE, o.n);
//   cmdspec.defineArg("FILE", "inputs", nullptr, opts::ALLOW_MULTI, o.files);
//   cmdspec.parse(argc, argv, o);
//
// Options may be given as -k=v, -k v, --key=v or --key v.
namespace opts
{
  static bool readDecInt(const char *str, int &val)
  {
    if (!str || !*str)
      return false;
    char *end = nullptr;
    val       = (int)strtol(str, &end, 10);
    return end == str + strlen(str);
  }

  // reports a command line error (with optional usage) and exits
  struct ErrorHandler {
    const char *exeName;

    ErrorHandler(const char *exe) : exeName(exe) {}

    [[noreturn]] void operator()(const std::string &msg) const
    {
      std::cerr << exeName << ": " << msg << "\n";
      exit(EXIT_FAILURE);
    }
    [[noreturn]] void operator()(
      const std::string &msg, const std::string &usage) const
    {
      std::cerr << exeName << ": " << msg << "\n";
      std::cerr << usage;
      exit(EXIT_FAILURE);
    }
  };

  // sets a value in the options set
  template<typename O>
  using Setter = std::function<void(const char *, const ErrorHandler &, O &)>;

  enum OptAttrs {
    NONE        = 0x00,
    ALLOW_MULTI = 0x01, // option can be specified multiple times
    REQUIRED    = 0x02, // an error if never given
    FLAG        = 0x04, // option takes no argument (setValue passed "")
    FLAG_VALUE  = 0x08, // the flag may take a value: -v or -v=2
  };

  template<typename O>
  struct Opt {
    const char *shortName;
    const char *longName;
    const char *typeName;
    const char *description;
    const char *extendedDescription;
    OptAttrs    attributes;
    Setter<O>   setValue;
    int         timesMatched = 0;

    Opt(const char *s,
        const char *l,
        const char *t,
        const char *d,
        const char *xd,
        int         attrs, // OptAttrs
        Setter<O>   setVal)
        : shortName(s),
          longName(l),
          typeName(t),
          description(d),
          extendedDescription(xd),
          attributes((OptAttrs)attrs),
          setValue(setVal)
    {
    }

    bool hasAttribute(enum OptAttrs attr) const {
      return (attributes & attr) != 0;
    }

    // arguments have both null long and short names
    bool isArg() const { return !shortName && !longName; }
    bool isOpt() const { return !isArg(); }

    std::string optName() const
    {
      if (isArg())
        return std::string("argument ") + (typeName ? typeName : "");
      if (longName)
        return std::string("option --") + longName;
      return std::string("option -") + shortName;
    }

    bool tryMatch(
      int                 argc,
      const char **       argv,
      int &               argIx,
      const ErrorHandler &errHandler,
      O &                 opts)
    {
      const char *token = argv[argIx];
      const char *value = nullptr;
      auto raiseMatchError = [&](const char *msg) {
        std::stringstream ss;
        ss << token << ": invalid " << (isOpt() ? "option" : "argument") <<
          ": " << msg;
        errHandler(ss.str(), makeHelpMessage());
      };

      if (isOpt()) {
        if (token[0] != '-')
          return false;
        if (longName && token[1] == '-' && strpfx(longName, token + 2)) {
          value = token + 2 + strlen(longName);
        } else if (shortName && token[1] != '-' &&
          strpfx(shortName, token + 1))
        {
          value = token + 1 + strlen(shortName);
        } else {
          return false;
        }

        if (*value == 0) {
          if (hasAttribute(FLAG) || hasAttribute(FLAG_VALUE)) {
            value = "";
          } else if (argIx == argc - 1) {
            raiseMatchError("unexpected end of command line");
          } else {
            // -key value
            argIx++;
            value = argv[argIx];
          }
        } else if (*value == '=') {
          if (hasAttribute(FLAG) && !hasAttribute(FLAG_VALUE))
            raiseMatchError("option is a flag");
          value++;
        } else {
          // e.g. this option is "--foo" and the token is "--food"
          return false;
        }

        if (timesMatched > 0 && !hasAttribute(ALLOW_MULTI))
          raiseMatchError("respecification");
      } else {
        if (timesMatched > 0 && !hasAttribute(ALLOW_MULTI))
          return false;
        value = token;
      }

      setValue(value, errHandler, opts);
      timesMatched++;
      argIx++;
      return true;
    }

    void appendHelpMessage(
        std::ostream &os,
        int           sCw,
        int           lCw,
        int           tCw,
        bool          appendExtDesc) const
    {
      if (isOpt()) {
        os << std::setw(3 + sCw) << std::left <<
          (shortName ? std::string("  -") + shortName : std::string(""));
        os << "  ";
        os << std::setw(4 + lCw) << std::left <<
          (longName ? std::string("  --") + longName : std::string(""));
      }
      std::string typeNameStr = typeName ? typeName : "";
      if (isArg() && hasAttribute(ALLOW_MULTI))
        typeNameStr += (hasAttribute(REQUIRED) ? '+' : '*');
      os << "  " << std::setw(tCw) << std::left << typeNameStr;
      if (description)
        os << "  " << description;
      if (appendExtDesc && extendedDescription) {
        os << "\n";
        // crude wrapping at column 72
        size_t col = 1, slen = strlen(extendedDescription);
        for (size_t i = 0; i < slen; i++, col++) {
          char c = extendedDescription[i];
          if (col > 72 && c == ' ') {
            col = 0;
            os << "\n";
          } else {
            if (c == '\n')
              col = 0;
            os << c;
          }
        }
      }
    }

    std::string makeHelpMessage() const
    {
      std::stringstream ss;
      appendHelpMessage(ss, 4, 8, 8, true);
      ss << "\n";
      return ss.str();
    }
  }; // Opt

  template<typename O>
  class CmdlineSpec {
    const char *            exeTitle;
    const char *            exeName;
    const char *            examples;
    std::vector<Opt<O>>     opts; // command line options
    std::vector<Opt<O>>     args; // command line arguments

  public:
    CmdlineSpec(
        const char *title,
        const char *exe,
        const char *examps = "")
        : exeTitle(title), exeName(exe), examples(examps)
    {
      defineFlag(
        "h",
        "help",
        "shows help on an option",
        "Without any argument -h prints help on all options.  "
        "With an argument (e.g. -h=verbosity) it prints the long help "
        "for that option.",
        OptAttrs::FLAG_VALUE,
        [this](const char *inp, const ErrorHandler &err, O &) {
          handleHelpArgument(inp, err);
        });
    }

    ///////////////////////////////////////////////////////////////////////////
    // FLAGS
    void defineFlag(
        const char *sNm,
        const char *lNm,
        const char *desc,
        const char *extDesc,
        int         attrs, // OptAttrs
        Setter<O>   setter)
    {
      ensureUnique(sNm, lNm);
      opts.emplace_back(sNm, lNm, "", desc, extDesc, attrs | FLAG, setter);
    }
    void defineFlag(
        const char *sNm,
        const char *lNm,
        const char *desc,
        const char *extDesc,
        int         attrs, // OptAttrs
        bool&       boolValue)
    {
      defineFlag(sNm, lNm, desc, extDesc, attrs,
        [&boolValue](const char *value, const ErrorHandler &, O &) {
          boolValue = !(value && streq(value, "false"));
        });
    }

    ///////////////////////////////////////////////////////////////////////////
    // OPTIONS
    void defineOpt(
        const char *sNm,
        const char *lNm,
        const char *type,
        const char *desc,
        const char *extDesc,
        int         attrs, // OptAttrs
        Setter<O>   setter)
    {
      ensureUnique(sNm, lNm);
      opts.emplace_back(sNm, lNm, type, desc, extDesc, attrs, setter);
    }
    void defineOpt(
        const char *sNm,
        const char *lNm,
        const char *type,
        const char *desc,
        const char *extDesc,
        int         attrs, // OptAttrs
        int&        val)
    {
      defineOpt(sNm, lNm, type, desc, extDesc, attrs,
        [&val, sNm, lNm](const char *value, const ErrorHandler &eh, O &) {
          if (!readDecInt(value, val)) {
            std::stringstream ss;
            if (sNm)
              ss << "-" << sNm;
            else
              ss << "--" << lNm;
            ss << ": malformed argument (integer)";
            eh(ss.str());
          }
        });
    }

    ///////////////////////////////////////////////////////////////////////////
    // ARGUMENTS
    void defineArg(
        const char *type,
        const char *desc,
        const char *extDesc,
        int         attrs, // OptAttrs
        Setter<O>   setter)
    {
      args.emplace_back(nullptr, nullptr, type, desc, extDesc, attrs, setter);
    }
    void defineArg(
        const char *              type,
        const char *              desc,
        const char *              extDesc,
        int                       attrs, // OptAttrs
        std::vector<std::string> &vals)
    {
      defineArg(type, desc, extDesc, attrs,
        [&vals](const char *value, const ErrorHandler &, O &) {
          vals.emplace_back(value);
        });
    }

    ///////////////////////////////////////////////////////////////////////////
    bool parse(int argc, const char **argv, O &optVal)
    {
      ErrorHandler errHandler(exeName);

      // no arguments given ==> -h
      if (argc <= 1) {
        handleHelpArgument("", errHandler);
        return false;
      }

      int argIx = 1;
      while (argIx < argc) {
        bool matched = false;
        for (auto &o : opts) {
          if (o.tryMatch(argc, argv, argIx, errHandler, optVal)) {
            matched = true;
            break;
          }
        }
        if (!matched && argv[argIx][0] == '-' && argv[argIx][1] != 0) {
          errHandler(
            std::string(argv[argIx]) + ": unmatched program option");
        }
        if (!matched) {
          for (auto &a : args) {
            if (a.tryMatch(argc, argv, argIx, errHandler, optVal)) {
              matched = true;
              break;
            }
          }
        }
        if (!matched) {
          errHandler(
            std::string(argv[argIx]) + ": unmatched program argument");
        }
      }

      auto checkRequired = [&](const std::vector<Opt<O>> &os) {
        for (const auto &o : os) {
          if (o.timesMatched == 0 && o.hasAttribute(REQUIRED))
            errHandler(o.optName() + " undefined", o.makeHelpMessage());
        }
      };
      checkRequired(opts);
      checkRequired(args);
      return true;
    }

  private:
    void ensureUnique(const char *sNm, const char *lNm) {
      for (const auto &o : opts) {
        if ((sNm && o.shortName && streq(sNm, o.shortName)) ||
          (lNm && o.longName && streq(lNm, o.longName)))
        {
          std::cerr << "INTERNAL ERROR: invalid CmdlineSpec (opts.hpp): " <<
            (sNm ? sNm : lNm) << ": option defined twice\n";
          sys::fatal_exit();
        }
      }
    }

    [[noreturn]]
    void handleHelpArgument(const char *inp, const ErrorHandler &err) {
      if (!inp || !*inp) {
        if (exeTitle)
          std::cout << exeTitle << "\n\n";
        appendUsage(std::cout);
        exit(EXIT_SUCCESS);
      }
      for (const auto &o : opts) {
        if ((o.longName && streq(inp, o.longName)) ||
          (o.shortName && streq(inp, o.shortName)))
        {
          o.appendHelpMessage(std::cout, 0, 0, 0, true);
          std::cout << "\n";
          exit(EXIT_SUCCESS);
        }
      }
      err(std::string("-h option: unknown option ") + inp);
    }

    void appendUsage(std::ostream &os) const
    {
      os << "usage: " << exeName << " OPTIONS ARGS\n";
      os << "where OPTIONS:\n";
      int sCw = 4, lCw = 8, tCw = 8;
      for (const auto &o : opts) {
        auto updateMax = [&](int cw, const char *str) {
          return str ? std::max(cw, (int)strlen(str)) : cw;
        };
        sCw = updateMax(sCw, o.shortName);
        lCw = updateMax(lCw, o.longName);
        tCw = updateMax(tCw, o.typeName);
      }
      for (const auto &o : opts) {
        o.appendHelpMessage(os, sCw, lCw, tCw, false);
        os << "\n";
      }
      if (!args.empty()) {
        os << "\n";
        os << " and where ARGS:\n";
        for (const auto &a : args) {
          a.appendHelpMessage(os, 0, 0, tCw, false);
          os << "\n";
        }
      }
      if (examples && *examples) {
        os << "\nEXAMPLES:\n" << examples;
      }
    }
  }; // class CmdlineSpec
} // namespace opts

#endif
