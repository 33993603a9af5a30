#include "csumattr.hh"

namespace {
  void v_notice(run_context& ctx, const std::string& message) {
    if(ctx.verbose) ctx.err << message << "\n";
  }
  void attribute_not_found(run_context& ctx, const std::string& path) {
    ctx.err << path << ": Checksum attribute not found\n";
  }
  void checksum_mismatch(run_context& ctx, const std::string& path) {
    ctx.err << path << ": Checksum mismatch\n";
  }
  /* sha256sum's convention: a name holding a backslash or newline gets
     them escaped and the whole line a leading backslash */
  void print_line(std::ostream& out, const std::string& digest,
                  const std::string& path) {
    if(path.find_first_of("\\\n") == std::string::npos) {
      out << digest << "  " << path << "\n";
      return;
    }
    out << '\\' << digest << "  ";
    for(auto c : path) {
      if(c == '\\') out << "\\\\";
      else if(c == '\n') out << "\\n";
      else out << c;
    }
    out << "\n";
  }
  /* true with the stored value if there is one; an absent attribute is
     reported here */
  bool fetch_stored(const std::string& path, attribute_store& store,
                    run_context& ctx, std::string& stored) {
    switch(store.get(path, stored)) {
    case attribute_store::status::present:
      return true;
    case attribute_store::status::absent:
      attribute_not_found(ctx, path);
      return false;
    case attribute_store::status::failed:
      // the store already said why
      return false;
    }
    return false;
  }
  outcome add_checksum(const std::string& path, attribute_store& store,
                       digest_provider& digester, run_context& ctx) {
    std::string stored;
    switch(store.get(path, stored)) {
    case attribute_store::status::present:
      ctx.err << path << ": Checksum attribute found: Skipping\n";
      return outcome::success;
    case attribute_store::status::failed:
      // there may be a value we could not read; leave it alone
      return outcome::attribute_missing;
    case attribute_store::status::absent:
      break;
    }
    std::string sum;
    if(!digester.digest(path, sum)) return outcome::attribute_missing;
    v_notice(ctx, "Adding checksum to '" + path + "'");
    if(!ctx.dry_run && !store.set(path, sum, true))
      return outcome::attribute_missing;
    return outcome::success;
  }
  outcome check_checksum(const std::string& path, attribute_store& store,
                         digest_provider& digester, run_context& ctx) {
    std::string stored;
    if(!fetch_stored(path, store, ctx, stored))
      return outcome::attribute_missing;
    if(!is_valid_digest(stored)) {
      checksum_mismatch(ctx, path);
      return outcome::checksum_mismatch;
    }
    std::string sum;
    if(!digester.digest(path, sum) || sum != stored) {
      checksum_mismatch(ctx, path);
      return outcome::checksum_mismatch;
    }
    v_notice(ctx, path + ": OK");
    return outcome::success;
  }
  outcome remove_checksum(const std::string& path, attribute_store& store,
                          run_context& ctx) {
    v_notice(ctx, "Removing checksum from '" + path + "'");
    if(!ctx.dry_run && !store.remove(path))
      ctx.err << path << ": Checksum attribute left in place\n";
    return outcome::success;
  }
  outcome update_checksum(const std::string& path, attribute_store& store,
                          digest_provider& digester, run_context& ctx) {
    std::string stored;
    if(!fetch_stored(path, store, ctx, stored))
      return outcome::attribute_missing;
    std::string sum;
    if(!digester.digest(path, sum)) return outcome::attribute_missing;
    if(sum != stored) {
      v_notice(ctx, "Updating checksum of '" + path + "'");
      if(!ctx.dry_run && !store.set(path, sum, false))
        return outcome::attribute_missing;
    }
    return outcome::success;
  }
  outcome print_checksum(const std::string& path, attribute_store& store,
                         run_context& ctx) {
    std::string stored;
    // nothing to list is not a failure
    if(!fetch_stored(path, store, ctx, stored)) return outcome::success;
    print_line(ctx.out, stored, path);
    return outcome::success;
  }
}

outcome apply_action(action what,
                     const std::string& path,
                     attribute_store& store,
                     digest_provider& digester,
                     run_context& ctx) {
  switch(what) {
  case action::add: return add_checksum(path, store, digester, ctx);
  case action::check: return check_checksum(path, store, digester, ctx);
  case action::remove: return remove_checksum(path, store, ctx);
  case action::update: return update_checksum(path, store, digester, ctx);
  case action::print: return print_checksum(path, store, ctx);
  }
  return outcome::success;
}
