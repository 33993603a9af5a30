#include "csumattr.hh"

#include <cstdlib>

int main(int argc, char* argv[]) {
  options opts;
  bool valid = parse_command_line(argc, argv, opts, std::cerr);
  if(opts.help) {
    print_usage(std::cout, opts.name);
    return EXIT_SUCCESS;
  }
  if(!valid) {
    std::cerr << "\n";
    print_usage(std::cerr, opts.name);
    return exit_usage;
  }
  xattr_attribute_store store;
  sha256_digest_provider digester;
  run_context ctx{std::cout, std::cerr, opts.verbose, opts.dry_run};
  return run(opts.what, opts.path, store, digester, ctx);
}
