#include "CommandLine.hpp"
#include "Errors.hpp"
#include <cctype>
#include <getopt.h>
#include <map>
#include <stdexcept>
#include <vector>

namespace danfetch {

namespace {

using Positionals = std::vector<std::string>;
using CommandFactory = Command (*)(const Positionals &, bool md5);

Command makePostCommand(const Positionals &args, bool md5) {
  if (md5)
    throw UsageError("--md5 applies to pool mode only");
  if (args.empty())
    throw UsageError("post: at least one post id is required");
  PostCommand command;
  for (const auto &arg : args)
    command.ids.push_back(parsePositiveId(arg));
  return command;
}

Command makePoolCommand(const Positionals &args, bool md5) {
  if (args.size() != 1)
    throw UsageError("pool: exactly one pool id is required");
  return PoolCommand{parsePositiveId(args.front()), md5};
}

Command makeTagsCommand(const Positionals &args, bool md5) {
  if (md5)
    throw UsageError("--md5 applies to pool mode only");
  if (args.empty())
    throw UsageError("tags: at least one tag is required");
  return TagsCommand{args};
}

const std::map<std::string, CommandFactory> &modes() {
  static const std::map<std::string, CommandFactory> table = {
      {"post", &makePostCommand},
      {"pool", &makePoolCommand},
      {"tags", &makeTagsCommand},
  };
  return table;
}

} // namespace

int64_t parsePositiveId(const std::string &text) {
  // stoll alone would take " 12" and "+12"
  if (text.empty() || !isdigit(static_cast<unsigned char>(text[0])))
    throw UsageError("not a valid id: " + text);

  std::size_t consumed = 0;
  long long id = 0;
  try {
    id = std::stoll(text, &consumed);
  } catch (const std::logic_error &) {
    throw UsageError("not a valid id: " + text);
  }
  if (consumed != text.size() || id <= 0)
    throw UsageError("not a valid id: " + text);
  return id;
}

std::string usageText(const std::string &program) {
  return "Usage:\n"
         "  " + program + " post [options] <id> [<id>]...\n"
         "  " + program + " pool [options] [--md5] <id>\n"
         "  " + program + " tags [options] <tag> [<tag>]...\n"
         "\n"
         "Options:\n"
         "  -d, --output-dir=DIR  save files to DIR, created if missing "
         "(default: .)\n"
         "  -v, --verbose         print progress; repeat for debug output\n"
         "      --md5             name pool files by MD5 checksum instead of\n"
         "                        their zero-padded position in the pool\n"
         "  -h, --help            show this help\n"
         "\n"
         "Put -- before negated tags such as -rating:e.\n"
         "Set DANBOORU_AUTH=login:api_key to authenticate.\n";
}

ParsedCommandLine parseCommandLine(int argc, char *argv[]) {
  ParsedCommandLine parsed;
  if (argc < 2)
    throw UsageError("missing mode");

  std::string mode = argv[1];
  if (mode == "-h" || mode == "--help") {
    parsed.help = true;
    return parsed;
  }
  auto factory = modes().find(mode);
  if (factory == modes().end())
    throw UsageError("unrecognized mode " + mode);

  // getopt_long permutes its argv, so hand it a copy without the mode
  std::vector<char *> args;
  args.push_back(argv[0]);
  for (int i = 2; i < argc; ++i)
    args.push_back(argv[i]);
  args.push_back(nullptr);
  int nargs = static_cast<int>(args.size()) - 1;

  enum { kMd5Option = 256 };
  static const struct option long_options[] = {
      {"output-dir", required_argument, nullptr, 'd'},
      {"verbose", no_argument, nullptr, 'v'},
      {"md5", no_argument, nullptr, kMd5Option},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  bool md5 = false;
  optind = 0;
  opterr = 0;
  int c;
  while ((c = getopt_long(nargs, args.data(), ":d:vh", long_options,
                          nullptr)) != -1) {
    switch (c) {
    case 'd':
      parsed.options.outputDir = optarg;
      break;
    case 'v':
      ++parsed.options.verbosity;
      break;
    case kMd5Option:
      md5 = true;
      break;
    case 'h':
      parsed.help = true;
      return parsed;
    case ':':
      throw UsageError(std::string("option ") + args[optind - 1] +
                       " requires an argument");
    default:
      if (optopt != 0 && optopt < kMd5Option)
        throw UsageError(std::string("unrecognized option -") +
                         static_cast<char>(optopt));
      throw UsageError(std::string("unrecognized option ") +
                       args[optind - 1]);
    }
  }

  Positionals positionals;
  for (int i = optind; i < nargs; ++i)
    positionals.emplace_back(args[i]);

  parsed.options.command = factory->second(positionals, md5);
  return parsed;
}

} // namespace danfetch
