#include "csumattr.hh"

#include <unordered_map>

namespace {
  bool select_action(options& opts, action what, std::ostream& err) {
    if(opts.action_count++ > 0) {
      err << "Only one of --add, --check, --remove, --update and --print "
        "may be given\n";
      return false;
    }
    opts.what = what;
    return true;
  }
}

void print_usage(std::ostream& out, const std::string& name) {
  out << "Usage: " << name << " <action> [options] <path>\n"
    "Actions (exactly one):\n"
    "  -a, --add: Add checksums to the files that do not have them yet\n"
    "  -c, --check: Compare the stored checksum with the SHA256 hash of the "
    "file\n"
    "  -d, --remove: Remove the checksum attribute from the files\n"
    "  -u, --update: Replace stored checksums that no longer match the file\n"
    "  -p, --print: Print the stored checksums in sha256sum format (names\n"
    "holding a backslash or newline are escaped the way sha256sum does)\n"
    "Options:\n"
    "  -v, --verbose: Report each checksum added, removed or updated\n"
    "  -n, --dry-run: Don't actually modify any attribute\n"
    "  -h, --help: Print this help\n"
    "\n"
    "The SHA256 checksums are stored in the " << checksum_attr_name
      << " extended file\n"
    "attribute. If <path> is a directory it is traversed recursively, "
    "without leaving\n"
    "its filesystem. Empty files are skipped.\n"
    "Exit status: 0 ok, 1 checksum attribute missing, 2 path not found, "
    "3 checksum\n"
    "mismatch, " << exit_usage << " bad command line.\n";
}

bool parse_command_line(int argc, char* argv[], options& opts,
                        std::ostream& err) {
  bool valid = true;
  opts.name = argc > 0 ? argv[0] : "csumattr";
  std::unordered_map<std::string, std::function<bool()>> flags ={
    {"--add", [&]{ return select_action(opts, action::add, err); }},
    {"--check", [&]{ return select_action(opts, action::check, err); }},
    {"--remove", [&]{ return select_action(opts, action::remove, err); }},
    {"--update", [&]{ return select_action(opts, action::update, err); }},
    {"--print", [&]{ return select_action(opts, action::print, err); }},
    {"--verbose", [&]{ opts.verbose = true; return true; }},
    {"--dry-run", [&]{ opts.dry_run = true; return true; }},
    {"--help", [&]{ opts.help = true; return true; }},
  };
  std::unordered_map<char, std::string> short_flags ={
    {'a', "--add"}, {'c', "--check"}, {'d', "--remove"}, {'u', "--update"},
    {'p', "--print"}, {'v', "--verbose"}, {'n', "--dry-run"}, {'h', "--help"},
  };
  std::vector<std::string> paths;
  int n = 1;
  while(n < argc) {
    std::string arg = argv[n++];
    if(arg.size() >= 2 && arg[0] == '-') {
      if(arg == "--") break;
      else if(arg[1] == '-') {
        auto flag = flags.find(arg);
        if(flag != flags.end())
          valid = flag->second() && valid;
        else {
          err << "Unknown option: " << arg << "\n";
          valid = false;
        }
      }
      else {
        // clustered short options, e.g. -cv
        for(size_t i = 1; i < arg.size(); ++i) {
          auto alias = short_flags.find(arg[i]);
          if(alias != short_flags.end())
            valid = flags[alias->second]() && valid;
          else {
            err << "Unknown option: -" << arg[i] << "\n";
            valid = false;
          }
        }
      }
    }
    else {
      paths.emplace_back(std::move(arg));
    }
  }
  while(n < argc) {
    paths.emplace_back(argv[n++]);
  }
  if(opts.help) return valid;
  if(opts.action_count == 0) {
    err << "One of --add, --check, --remove, --update or --print must be "
      "given\n";
    valid = false;
  }
  if(paths.size() > 1) {
    err << "Only one path may be given\n";
    valid = false;
  }
  else if(paths.size() == 1) {
    opts.path = paths[0];
  }
  return valid;
}
