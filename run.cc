#include "csumattr.hh"

outcome worst(outcome a, outcome b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

int run(action what,
        const std::string& target,
        attribute_store& store,
        digest_provider& digester,
        run_context& ctx) {
  struct stat st;
  if(classify_target(target, st) == target_kind::missing) {
    ctx.err << "Error: file not found: " << target << "\n";
    return exit_not_found;
  }
  outcome result = outcome::success;
  select_files(target, st, [&](const candidate_file& file) {
      result = worst(result,
                     apply_action(what, file.path, store, digester, ctx));
    });
  return static_cast<int>(result);
}
